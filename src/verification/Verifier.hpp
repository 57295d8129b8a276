/**
 * @file Verifier.hpp
 * @brief Before/after digest capture over sampled windows
 */

#pragma once

#include "config/EngineConfig.hpp"
#include "models/VerificationTypes.hpp"
#include "targets/ITargetHandle.hpp"
#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace verification {

/**
 * @brief Number of windows of @p window_size needed to cover @p target_size bytes
 */
[[nodiscard]] auto window_count(uint64_t target_size, uint64_t window_size) -> uint64_t;

/**
 * @brief Seed derived from the job id and level (64-bit FNV-1a)
 */
[[nodiscard]] auto sampling_seed(const std::string& job_id, VerificationLevel level) -> uint64_t;

/**
 * @class Verifier
 * @brief Captures and compares window digests of a target
 *
 * The windows to read are a pure function of (job id, level, target size,
 * window size), so an audit can reproduce them. Digests stream through one
 * window-sized buffer; the target is never loaded whole.
 */
class Verifier {
public:
    explicit Verifier(const config::VerificationSettings& settings);

    /**
     * @brief Window indices to read, ascending
     *
     * Full selects every window; Sample and Standard select a seeded subset
     * covering their configured fraction (at least one window).
     */
    [[nodiscard]] auto plan_windows(const std::string& job_id, VerificationLevel level,
                                    uint64_t target_size, uint64_t window_size) const
        -> std::vector<uint64_t>;

    /**
     * @brief Hash the given windows of @p target with every algorithm
     */
    [[nodiscard]] auto capture(ITargetHandle& target, const std::vector<std::string>& algorithms,
                               uint64_t window_size, const std::vector<uint64_t>& windows) const
        -> std::expected<DigestSet, util::Error>;

    /**
     * @brief Capture before the first pass, planning windows for the job
     */
    [[nodiscard]] auto capture_before(ITargetHandle& target, const std::string& job_id,
                                      const VerificationRequest& request,
                                      uint64_t window_size) const
        -> std::expected<DigestSet, util::Error>;

    /**
     * @brief Capture after the last pass over the windows read before
     */
    [[nodiscard]] auto capture_after(ITargetHandle& target, const DigestSet& before) const
        -> std::expected<DigestSet, util::Error>;

    /**
     * @brief An algorithm verifies only if every sampled window changed
     */
    [[nodiscard]] static auto compare(const DigestSet& before, const DigestSet& after,
                                      VerificationLevel level) -> VerificationResult;

private:
    config::VerificationSettings settings_;
};

}  // namespace verification
