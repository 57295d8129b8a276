/**
 * @file ProgressDisplay.hpp
 * @brief Terminal progress display for watched jobs
 */

#pragma once

#include "models/JobTypes.hpp"
#include "models/WipeTypes.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>

namespace cli {

/**
 * @class ProgressDisplay
 * @brief One-line progress bar for a job followed with --watch
 *
 * The header names the job, its target and plan; a job picked up from a
 * checkpoint also shows where it resumes. Each update() redraws the status
 * line in place on a terminal and appends a line otherwise.
 */
class ProgressDisplay {
public:
    /**
     * @param job Snapshot taken when watching started
     * @param out Stream to draw on
     * @param interactive Redraw in place with ANSI codes and colors
     */
    ProgressDisplay(const JobSnapshot& job, std::ostream& out, bool interactive);

    void update(const WipeProgress& progress);

    /**
     * @brief Print the final status of a job that reached a terminal state
     */
    void complete(bool success, const std::string& message);

    /**
     * @brief Report a job that stopped at a checkpoint and can be resumed
     */
    void paused(const std::string& message);

    /**
     * @brief Whether stdout is a terminal
     */
    [[nodiscard]] static auto is_terminal() -> bool;

    /**
     * @brief Format bytes as human-readable string (e.g., "245.0 MB")
     */
    [[nodiscard]] static auto format_bytes(uint64_t bytes) -> std::string;

    [[nodiscard]] static auto format_speed(uint64_t bytes_per_sec) -> std::string;

    /**
     * @brief Format duration as human-readable string (e.g., "12:34"), "--:--" if unknown
     */
    [[nodiscard]] static auto format_duration(int64_t seconds) -> std::string;

    /**
     * @brief Status line for one progress report, without color codes
     */
    [[nodiscard]] static auto status_line(const WipeProgress& progress) -> std::string;

private:
    void print_header();
    void finish(const char* color, const char* tag, const std::string& message);
    [[nodiscard]] auto progress_bar(double percentage) const -> std::string;

    std::string job_id_;
    std::string target_location_;
    uint64_t target_size_bytes_;
    std::string plan_name_;
    uint32_t total_passes_;
    Checkpoint resume_point_;
    std::ostream& out_;
    bool interactive_;
    bool header_printed_ = false;

    static constexpr int BAR_WIDTH = 30;
};

}  // namespace cli
