/**
 * @file DigestAlgorithm.hpp
 * @brief Mapping between algorithm names and GChecksum types
 */

#pragma once

#include <glib.h>

#include <optional>
#include <string_view>

namespace verification {

[[nodiscard]] inline auto checksum_type(std::string_view name) -> std::optional<GChecksumType> {
    if (name == "sha256") {
        return G_CHECKSUM_SHA256;
    }
    if (name == "sha512") {
        return G_CHECKSUM_SHA512;
    }
    if (name == "sha384") {
        return G_CHECKSUM_SHA384;
    }
    if (name == "sha1") {
        return G_CHECKSUM_SHA1;
    }
    if (name == "md5") {
        return G_CHECKSUM_MD5;
    }
    return std::nullopt;
}

[[nodiscard]] inline auto is_supported_algorithm(std::string_view name) -> bool {
    return checksum_type(name).has_value();
}

}  // namespace verification
