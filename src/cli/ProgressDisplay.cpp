/**
 * @file ProgressDisplay.cpp
 * @brief Terminal progress display implementation
 */

#include "cli/ProgressDisplay.hpp"

#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <ostream>

namespace cli {

namespace {

// ANSI color codes
constexpr auto RESET = "\033[0m";
constexpr auto BOLD = "\033[1m";
constexpr auto GREEN = "\033[32m";
constexpr auto RED = "\033[31m";
constexpr auto YELLOW = "\033[33m";
constexpr auto CLEAR_LINE = "\r\033[K";

}  // namespace

ProgressDisplay::ProgressDisplay(const JobSnapshot& job, std::ostream& out, bool interactive)
    : job_id_(job.record.id), target_location_(target_location(job.record.target)),
      target_size_bytes_(job.record.target_size), plan_name_(job.record.plan_name),
      total_passes_(static_cast<uint32_t>(job.record.passes.size())),
      resume_point_(job.record.checkpoint), out_(out), interactive_(interactive) {}

auto ProgressDisplay::is_terminal() -> bool {
    return isatty(STDOUT_FILENO) != 0;
}

void ProgressDisplay::print_header() {
    out_ << "\n";
    if (interactive_) {
        out_ << BOLD;
    }
    out_ << "Erasing " << target_location_ << " (" << format_bytes(target_size_bytes_) << ")\n";
    out_ << "Job: " << job_id_ << "\n";
    out_ << "Plan: " << plan_name_ << " (" << total_passes_ << " pass"
         << (total_passes_ != 1 ? "es" : "") << ")\n";
    if (resume_point_.pass_index > 0 || resume_point_.byte_offset > 0) {
        out_ << std::format("Resuming at pass {}, {} already written\n",
                            resume_point_.pass_index + 1, format_bytes(resume_point_.byte_offset));
    }
    if (interactive_) {
        out_ << RESET;
    }
    out_ << std::flush;
    header_printed_ = true;
}

auto ProgressDisplay::status_line(const WipeProgress& progress) -> std::string {
    std::string line = std::format("Pass {}/{}: {:5.1f}%  {} / {}", progress.current_pass,
                                   progress.total_passes, progress.percentage(),
                                   format_bytes(progress.bytes_done),
                                   format_bytes(progress.pass_bytes));
    if (progress.speed_bytes_per_sec > 0) {
        line += "  |  " + format_speed(progress.speed_bytes_per_sec);
    }
    if (progress.estimated_seconds_remaining > 0) {
        line += "  |  ETA: " + format_duration(progress.estimated_seconds_remaining);
    }
    return line;
}

void ProgressDisplay::update(const WipeProgress& progress) {
    if (!header_printed_) {
        print_header();
    }

    if (interactive_) {
        out_ << CLEAR_LINE << progress_bar(progress.percentage()) << " " << status_line(progress)
             << std::flush;
    } else {
        out_ << status_line(progress) << "\n";
    }
}

void ProgressDisplay::finish(const char* color, const char* tag, const std::string& message) {
    if (interactive_) {
        out_ << CLEAR_LINE << "\n" << color << BOLD << tag << message << RESET;
    } else {
        out_ << tag << message;
    }
    out_ << "\n" << std::endl;
}

void ProgressDisplay::complete(bool success, const std::string& message) {
    finish(success ? GREEN : RED, success ? "[OK] " : "[FAILED] ", message);
}

void ProgressDisplay::paused(const std::string& message) {
    finish(YELLOW, "[PAUSED] ", message);
}

auto ProgressDisplay::format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;
    constexpr uint64_t TB = GB * 1024;

    auto scaled = [bytes](uint64_t unit, const char* suffix) {
        return std::format("{:.1f} {}", static_cast<double>(bytes) / static_cast<double>(unit),
                           suffix);
    };

    if (bytes >= TB) {
        return scaled(TB, "TB");
    }
    if (bytes >= GB) {
        return scaled(GB, "GB");
    }
    if (bytes >= MB) {
        return scaled(MB, "MB");
    }
    if (bytes >= KB) {
        return scaled(KB, "KB");
    }
    return std::format("{} B", bytes);
}

auto ProgressDisplay::format_speed(uint64_t bytes_per_sec) -> std::string {
    return format_bytes(bytes_per_sec) + "/s";
}

auto ProgressDisplay::format_duration(int64_t seconds) -> std::string {
    if (seconds < 0) {
        return "--:--";
    }

    const int64_t hours = seconds / 3600;
    const int64_t minutes = (seconds % 3600) / 60;
    const int64_t secs = seconds % 60;

    if (hours > 0) {
        return std::format("{}:{:02d}:{:02d}", hours, minutes, secs);
    }
    return std::format("{:02d}:{:02d}", minutes, secs);
}

auto ProgressDisplay::progress_bar(double percentage) const -> std::string {
    const int filled = std::clamp(static_cast<int>(std::round(percentage / 100.0 * BAR_WIDTH)),
                                  0, BAR_WIDTH);

    std::string bar = "[";
    bar += GREEN;
    for (int i = 0; i < filled; ++i) {
        bar += "█";
    }
    bar += RESET;
    for (int i = filled; i < BAR_WIDTH; ++i) {
        bar += "░";
    }
    bar += "]";
    return bar;
}

}  // namespace cli
