/**
 * @file RandomBuffer.hpp
 * @brief Random and keyed byte streams for pattern passes
 */

#ifndef STORAGE_ERASER_UTIL_RANDOM_BUFFER_HPP
#define STORAGE_ERASER_UTIL_RANDOM_BUFFER_HPP

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <random>
#include <span>

namespace util {

/**
 * @class RandomBufferGenerator
 * @brief Helper class for efficient random buffer generation
 */
class RandomBufferGenerator {
public:
    /**
     * @brief Fills a buffer with random bytes using a 64-bit generator for efficiency
     * @param buffer The buffer to fill
     */
    static void fill(std::span<uint8_t> buffer) {
        // Use thread_local engine to avoid initialization overhead on every call
        thread_local std::mt19937_64 generator{std::random_device{}()};

        size_t size = buffer.size();
        size_t u64_count = size / sizeof(uint64_t);

        for (size_t i = 0; i < u64_count; ++i) {
            uint64_t val = generator();
            std::memcpy(buffer.data() + i * sizeof(uint64_t), &val, sizeof(uint64_t));
        }

        size_t remaining = size % sizeof(uint64_t);
        if (remaining > 0) {
            uint64_t last_chunk = generator();
            std::memcpy(buffer.data() + u64_count * sizeof(uint64_t), &last_chunk, remaining);
        }
    }

    /**
     * @brief Fills a buffer with the keyed stream for absolute offset @p offset
     *
     * Byte i of the stream depends only on (seed, i), so any range can be
     * regenerated independently of what was produced before it.
     */
    static void fill_keyed(uint64_t seed, uint64_t offset, std::span<uint8_t> buffer) {
        size_t produced = 0;
        while (produced < buffer.size()) {
            const uint64_t position = offset + produced;
            const uint64_t block = position / sizeof(uint64_t);
            const size_t skip = static_cast<size_t>(position % sizeof(uint64_t));

            // Little-endian on every host so a seed names the same stream everywhere
            const uint64_t word = mix(seed ^ (block * 0x9E3779B97F4A7C15ULL));
            uint8_t bytes[sizeof(uint64_t)];
            for (size_t i = 0; i < sizeof(uint64_t); ++i) {
                bytes[i] = static_cast<uint8_t>(word >> (8 * i));
            }

            const size_t take = std::min(sizeof(uint64_t) - skip, buffer.size() - produced);
            std::memcpy(buffer.data() + produced, bytes + skip, take);
            produced += take;
        }
    }

private:
    // splitmix64 finalizer
    static constexpr auto mix(uint64_t z) noexcept -> uint64_t {
        z += 0x9E3779B97F4A7C15ULL;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }
};

} // namespace util

#endif // STORAGE_ERASER_UTIL_RANDOM_BUFFER_HPP
