/**
 * @file ProgressTracker.cpp
 * @brief Rate-limited progress reporting with rolling speed and ETA
 */

#include "engine/ProgressTracker.hpp"

#include <numeric>

ProgressTracker::ProgressTracker(ProgressCallback callback) : callback_(std::move(callback)) {}

void ProgressTracker::report(WipeProgress progress) {
    report_at(std::move(progress), Clock::now());
}

auto ProgressTracker::average_speed() const -> uint64_t {
    if (speed_samples_.empty()) {
        return 0;
    }
    return std::accumulate(speed_samples_.begin(), speed_samples_.end(), uint64_t{0}) /
           speed_samples_.size();
}

void ProgressTracker::report_at(WipeProgress progress, Clock::time_point now) {
    if (!callback_) {
        return;
    }

    // Bytes across passes, so a pass boundary does not look like a rewind
    const uint64_t completed_passes = progress.current_pass > 0 ? progress.current_pass - 1 : 0;
    const uint64_t total_bytes = completed_passes * progress.pass_bytes + progress.bytes_done;

    if (!started_ || total_bytes < last_total_bytes_) {
        started_ = true;
        last_update_time_ = now;
        last_total_bytes_ = total_bytes;
    } else {
        const auto elapsed_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - last_update_time_).count();
        if (elapsed_ms >= MIN_UPDATE_INTERVAL_MS && total_bytes > last_total_bytes_) {
            const double seconds = static_cast<double>(elapsed_ms) / 1000.0;
            speed_samples_.push_back(static_cast<uint64_t>(
                static_cast<double>(total_bytes - last_total_bytes_) / seconds));
            if (speed_samples_.size() > MAX_SAMPLES) {
                speed_samples_.pop_front();
            }
            last_update_time_ = now;
            last_total_bytes_ = total_bytes;
        }
    }

    progress.speed_bytes_per_sec = average_speed();
    if (progress.speed_bytes_per_sec > 0 && progress.pass_bytes >= progress.bytes_done) {
        uint64_t remaining_bytes = progress.pass_bytes - progress.bytes_done;
        // Account for remaining passes
        if (progress.total_passes > progress.current_pass) {
            remaining_bytes +=
                progress.pass_bytes *
                static_cast<uint64_t>(progress.total_passes - progress.current_pass);
        }
        progress.estimated_seconds_remaining =
            static_cast<int64_t>(remaining_bytes / progress.speed_bytes_per_sec);
    }

    callback_(progress);
}
