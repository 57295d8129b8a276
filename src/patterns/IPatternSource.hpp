/**
 * @file IPatternSource.hpp
 * @brief Interface for pass pattern generation
 */

#pragma once

#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>

/**
 * @class IPatternSource
 * @brief Produces the bytes a pass writes at a given offset
 *
 * Deterministic descriptors must produce identical bytes for the same
 * (descriptor, offset) pair on every call, in every process. Resume and
 * verification rely on it.
 */
class IPatternSource {
public:
    virtual ~IPatternSource() = default;

    /**
     * @brief Fill @p out with the bytes of [offset, offset + out.size())
     * @param descriptor Pattern descriptor, e.g. "zero", "byte:55", "hex:924924"
     * @param offset Absolute byte offset of out[0] within the pass
     */
    virtual auto generate(const std::string& descriptor, uint64_t offset, std::span<uint8_t> out)
        -> std::expected<void, util::Error> = 0;

    /**
     * @brief Whether regenerating a range reproduces the same bytes
     */
    [[nodiscard]] virtual auto is_deterministic(const std::string& descriptor) const -> bool = 0;

    /**
     * @brief Check that @p descriptor is well formed
     */
    [[nodiscard]] virtual auto validate(const std::string& descriptor) const
        -> std::expected<void, util::Error> = 0;
};
