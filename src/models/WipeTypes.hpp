/**
 * @file WipeTypes.hpp
 * @brief Progress reporting types for running jobs
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

/**
 * @struct WipeProgress
 * @brief Progress of one job, emitted per chunk
 *
 * Best effort: consumers must not derive durable state from it.
 */
struct WipeProgress {
    std::string job_id;
    uint32_t current_pass = 0;   ///< 1-based pass number
    uint32_t total_passes = 0;
    uint64_t bytes_done = 0;     ///< Bytes written in the current pass
    uint64_t pass_bytes = 0;     ///< Size of one pass
    uint64_t speed_bytes_per_sec = 0;          ///< Rolling average write speed
    int64_t estimated_seconds_remaining = -1;  ///< ETA over the remaining passes, -1 if unknown
    std::string state;                         ///< Job state name at emission time

    [[nodiscard]] auto percentage() const -> double {
        if (total_passes == 0 || pass_bytes == 0) {
            return 0.0;
        }
        const double done_passes = current_pass > 0 ? current_pass - 1 : 0;
        const double fraction =
            (done_passes + static_cast<double>(bytes_done) / static_cast<double>(pass_bytes)) /
            total_passes;
        return fraction * 100.0;
    }

    auto operator==(const WipeProgress&) const -> bool = default;
};

/**
 * @brief Callback type for progress reporting
 */
using ProgressCallback = std::function<void(const WipeProgress&)>;
