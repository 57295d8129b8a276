/**
 * @file PatternSource.cpp
 * @brief CPU pattern source implementation
 */

#include "patterns/PatternSource.hpp"

#include "util/RandomBuffer.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <format>

namespace {

constexpr std::string_view BYTE_PREFIX = "byte:";
constexpr std::string_view HEX_PREFIX = "hex:";
constexpr std::string_view PRNG_PREFIX = "prng:";

// Upper bound keeps a repeat unit in cache while filling
constexpr size_t MAX_HEX_PATTERN_BYTES = 4096;

auto invalid_descriptor(std::string_view descriptor, std::string_view reason) -> util::Error {
    return util::Error{util::ErrorKind::InvalidArgument,
                       std::format("invalid pattern '{}': {}", descriptor, reason)};
}

auto parse_hex(std::string_view text) -> std::expected<std::vector<uint8_t>, std::string> {
    if (text.empty() || text.size() % 2 != 0) {
        return std::unexpected("hex pattern needs an even, non-zero number of digits");
    }
    if (text.size() / 2 > MAX_HEX_PATTERN_BYTES) {
        return std::unexpected(std::format("hex pattern longer than {} bytes",
                                           MAX_HEX_PATTERN_BYTES));
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        uint8_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data() + i, text.data() + i + 2, value, 16);
        if (ec != std::errc{} || ptr != text.data() + i + 2) {
            return std::unexpected(std::format("'{}' is not a hex byte", text.substr(i, 2)));
        }
        bytes.push_back(value);
    }
    return bytes;
}

}  // namespace

auto PatternSource::parse(std::string_view descriptor) -> std::expected<Pattern, util::Error> {
    if (descriptor == "zero") {
        return Pattern{.kind = Pattern::Kind::Repeat, .bytes = {0x00}, .seed = 0};
    }
    if (descriptor == "ones") {
        return Pattern{.kind = Pattern::Kind::Repeat, .bytes = {0xFF}, .seed = 0};
    }
    if (descriptor == "random") {
        return Pattern{.kind = Pattern::Kind::Random, .bytes = {}, .seed = 0};
    }
    if (descriptor.starts_with(BYTE_PREFIX)) {
        auto bytes = parse_hex(descriptor.substr(BYTE_PREFIX.size()));
        if (!bytes || bytes->size() != 1) {
            return std::unexpected(invalid_descriptor(descriptor, "expected byte:XX"));
        }
        return Pattern{.kind = Pattern::Kind::Repeat, .bytes = std::move(*bytes), .seed = 0};
    }
    if (descriptor.starts_with(HEX_PREFIX)) {
        auto bytes = parse_hex(descriptor.substr(HEX_PREFIX.size()));
        if (!bytes) {
            return std::unexpected(invalid_descriptor(descriptor, bytes.error()));
        }
        return Pattern{.kind = Pattern::Kind::Repeat, .bytes = std::move(*bytes), .seed = 0};
    }
    if (descriptor.starts_with(PRNG_PREFIX)) {
        auto text = descriptor.substr(PRNG_PREFIX.size());
        uint64_t seed = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seed);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
            return std::unexpected(invalid_descriptor(descriptor, "expected prng:<decimal seed>"));
        }
        return Pattern{.kind = Pattern::Kind::Keyed, .bytes = {}, .seed = seed};
    }
    return std::unexpected(invalid_descriptor(descriptor, "unknown descriptor"));
}

void PatternSource::fill_repeating(const std::vector<uint8_t>& unit, uint64_t offset,
                                   std::span<uint8_t> out) {
    if (out.empty()) {
        return;
    }
    if (unit.size() == 1) {
        std::memset(out.data(), unit.front(), out.size());
        return;
    }

    // Seed one phase-aligned period, then double it until the buffer is full
    const size_t period = unit.size();
    const size_t phase = static_cast<size_t>(offset % period);
    const size_t seed_len = std::min(period, out.size());
    for (size_t i = 0; i < seed_len; ++i) {
        out[i] = unit[(phase + i) % period];
    }

    size_t filled = seed_len;
    while (filled < out.size()) {
        const size_t copy = std::min(filled, out.size() - filled);
        std::memcpy(out.data() + filled, out.data(), copy);
        filled += copy;
    }
}

auto PatternSource::generate(const std::string& descriptor, uint64_t offset,
                             std::span<uint8_t> out) -> std::expected<void, util::Error> {
    auto pattern = parse(descriptor);
    if (!pattern) {
        return std::unexpected(pattern.error());
    }

    switch (pattern->kind) {
        case Pattern::Kind::Repeat:
            fill_repeating(pattern->bytes, offset, out);
            break;
        case Pattern::Kind::Random:
            util::RandomBufferGenerator::fill(out);
            break;
        case Pattern::Kind::Keyed:
            util::RandomBufferGenerator::fill_keyed(pattern->seed, offset, out);
            break;
    }
    return {};
}

auto PatternSource::is_deterministic(const std::string& descriptor) const -> bool {
    auto pattern = parse(descriptor);
    return pattern && pattern->kind != Pattern::Kind::Random;
}

auto PatternSource::validate(const std::string& descriptor) const
    -> std::expected<void, util::Error> {
    auto pattern = parse(descriptor);
    if (!pattern) {
        return std::unexpected(pattern.error());
    }
    return {};
}
