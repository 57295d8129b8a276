/**
 * @file ConfigLoader.hpp
 * @brief INI-style configuration loading through GKeyFile
 *
 * Every key is optional. Sizes accept a binary suffix ("512K", "10MiB", "1G").
 *
 * @code
 * [engine]
 * min_chunk_size = 1MiB
 * sync_interval_chunks = 4
 *
 * [verification]
 * level = full
 * algorithms = sha256;sha512
 * @endcode
 */

#pragma once

#include "config/EngineConfig.hpp"
#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>

namespace config {

/**
 * @brief Load configuration from @p path
 *
 * A missing file yields the defaults. A malformed file, an unknown value or
 * an out-of-range setting is an InvalidArgument error.
 */
[[nodiscard]] auto load_config(const std::filesystem::path& path)
    -> std::expected<EngineConfig, util::Error>;

/**
 * @brief Load configuration from in-memory key file text
 */
[[nodiscard]] auto load_config_from_data(std::string_view data)
    -> std::expected<EngineConfig, util::Error>;

/**
 * @brief Check cross-field constraints (chunk bounds, fractions, algorithms)
 */
[[nodiscard]] auto validate(const EngineConfig& config) -> std::expected<void, util::Error>;

/**
 * @brief Parse "4096", "512K", "10MiB" or "2G" into bytes
 */
[[nodiscard]] auto parse_size(std::string_view text) -> std::expected<uint64_t, util::Error>;

}  // namespace config
