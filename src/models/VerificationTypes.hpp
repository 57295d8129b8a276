/**
 * @file VerificationTypes.hpp
 * @brief Data types for before/after wipe verification
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @enum VerificationLevel
 * @brief How much of the target the verifier reads
 */
enum class VerificationLevel {
    None,      ///< No verification
    Sample,    ///< Seeded random windows covering the configured sample fraction
    Standard,  ///< Seeded random windows covering the standard fraction
    Full       ///< Every window of the target
};

struct VerificationRequest {
    VerificationLevel level = VerificationLevel::Standard;
    std::vector<std::string> algorithms;  ///< e.g. "sha256", "sha512"

    [[nodiscard]] auto enabled() const -> bool {
        return level != VerificationLevel::None && !algorithms.empty();
    }

    auto operator==(const VerificationRequest&) const -> bool = default;
};

/**
 * @struct DigestSet
 * @brief Digests of the sampled windows of a target at one point in time
 *
 * window_digests holds, per algorithm, the first 8 bytes of each window's
 * digest in the order of @ref windows. combined holds the hex digest of all
 * sampled bytes per algorithm.
 */
struct DigestSet {
    uint64_t window_size = 0;
    std::vector<uint64_t> windows;  ///< Window indices, ascending
    std::map<std::string, std::vector<uint64_t>> window_digests;
    std::map<std::string, std::string> combined;

    [[nodiscard]] auto empty() const -> bool { return windows.empty(); }

    auto operator==(const DigestSet&) const -> bool = default;
};

struct AlgorithmVerdict {
    std::string before;  ///< Combined hex digest before the first pass
    std::string after;   ///< Combined hex digest after the last pass
    bool verified = false;
    uint64_t unchanged_windows = 0;

    auto operator==(const AlgorithmVerdict&) const -> bool = default;
};

/**
 * @struct VerificationResult
 * @brief Outcome of comparing the before and after digests of a job
 *
 * verified is the AND of every algorithm's verdict and is false when no
 * algorithm could be evaluated.
 */
struct VerificationResult {
    VerificationLevel level = VerificationLevel::None;
    std::map<std::string, AlgorithmVerdict> algorithms;
    uint64_t windows_checked = 0;
    bool verified = false;
    std::string note;

    auto operator==(const VerificationResult&) const -> bool = default;
};

[[nodiscard]] inline auto verification_level_to_string(VerificationLevel level)
    -> std::string_view {
    switch (level) {
        case VerificationLevel::None:
            return "none";
        case VerificationLevel::Sample:
            return "sample";
        case VerificationLevel::Standard:
            return "standard";
        case VerificationLevel::Full:
            return "full";
    }
    return "none";
}

[[nodiscard]] inline auto verification_level_from_string(std::string_view name)
    -> std::optional<VerificationLevel> {
    for (auto level : {VerificationLevel::None, VerificationLevel::Sample,
                       VerificationLevel::Standard, VerificationLevel::Full}) {
        if (verification_level_to_string(level) == name) {
            return level;
        }
    }
    return std::nullopt;
}
