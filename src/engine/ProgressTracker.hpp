/**
 * @file ProgressTracker.hpp
 * @brief Rate-limited progress reporting with rolling speed and ETA
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <chrono>
#include <cstdint>
#include <deque>

/**
 * @brief Progress tracker that calculates speed and ETA
 *
 * Wraps a progress callback to add speed and ETA calculations
 * using a rolling average of recent write speeds. The ETA covers the rest
 * of the current pass and every remaining pass.
 *
 * @note Not thread-safe; owned by the engine run that reports through it.
 */
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressTracker(ProgressCallback callback);

    /**
     * @brief Fill in speed and ETA, then forward to the callback
     * @param progress Progress with bytes_done counted from the start of the pass
     */
    void report(WipeProgress progress);

    /**
     * @brief Same as report() with an explicit timestamp
     */
    void report_at(WipeProgress progress, Clock::time_point now);

private:
    static constexpr size_t MAX_SAMPLES = 10;               // Rolling average window
    static constexpr int64_t MIN_UPDATE_INTERVAL_MS = 100;  // Minimum ms between speed samples

    [[nodiscard]] auto average_speed() const -> uint64_t;

    ProgressCallback callback_;
    bool started_ = false;
    Clock::time_point last_update_time_;
    uint64_t last_total_bytes_ = 0;
    std::deque<uint64_t> speed_samples_;
};
