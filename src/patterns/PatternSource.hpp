/**
 * @file PatternSource.hpp
 * @brief CPU pattern source for every built-in descriptor
 *
 * Descriptors:
 * - "zero", "ones"       single byte 0x00 / 0xFF
 * - "byte:XX"            single byte given in hex
 * - "hex:XXYYZZ..."      repeating multi-byte pattern, phase anchored at offset 0
 * - "random"             OS-seeded random bytes, not reproducible
 * - "prng:<seed>"        keyed stream, reproducible at any offset
 */

#pragma once

#include "patterns/IPatternSource.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

class PatternSource : public IPatternSource {
public:
    auto generate(const std::string& descriptor, uint64_t offset, std::span<uint8_t> out)
        -> std::expected<void, util::Error> override;

    [[nodiscard]] auto is_deterministic(const std::string& descriptor) const -> bool override;

    [[nodiscard]] auto validate(const std::string& descriptor) const
        -> std::expected<void, util::Error> override;

private:
    struct Pattern {
        enum class Kind { Repeat, Random, Keyed };
        Kind kind = Kind::Repeat;
        std::vector<uint8_t> bytes;  ///< Repeat unit
        uint64_t seed = 0;           ///< Keyed stream seed
    };

    [[nodiscard]] static auto parse(std::string_view descriptor)
        -> std::expected<Pattern, util::Error>;

    static void fill_repeating(const std::vector<uint8_t>& unit, uint64_t offset,
                               std::span<uint8_t> out);
};
