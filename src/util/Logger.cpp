/**
 * @file Logger.cpp
 * @brief Thread-safe logging utility implementation
 */

#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace util {

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger instance;
    return instance;
}

auto Logger::initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                        LogLevel min_level, LogRotationPolicy policy) -> bool {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    log_dir_ = log_dir;
    app_name_ = app_name;
    min_level_ = min_level;
    policy_ = policy;
    current_file_size_ = 0;
    initialized_ = false;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << "Logger: Failed to create log directory: " << log_dir_ << " - "
                  << ec.message() << std::endl;
        return false;
    }

    if (!open_log_file()) {
        return false;
    }

    initialized_ = true;

    file_ << std::format("{}[INFO ] [Logger] Logger initialized: app={} dir={} level={} "
                         "max_size={} max_files={}\n",
                         get_timestamp(), app_name_, log_dir_.string(),
                         level_to_string(min_level_), policy_.max_file_size_bytes,
                         policy_.max_files);
    file_.flush();

    return true;
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto Logger::open_log_file() -> bool {
    auto log_path = log_dir_ / (app_name_ + ".log");

    file_.open(log_path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Logger: Failed to open log file: " << log_path << std::endl;
        return false;
    }

    std::error_code ec;
    current_file_size_ = std::filesystem::file_size(log_path, ec);
    if (ec) {
        current_file_size_ = 0;
    }

    return true;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::string log_line = std::format("{}[{}] [{:08x}] [{}] {}\n", get_timestamp(),
                                       level_to_string(level), thread_tag(), component, message);

    if (initialized_ && file_.is_open()) {
        check_and_rotate();
        file_ << log_line;
        file_.flush();
        current_file_size_ += log_line.size();
    }

    if (console_output_) {
        std::cerr << log_line;
    }

    if (sink_) {
        sink_(level, log_line);
    }
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::WARNING, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::ERROR, component, message);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

auto Logger::get_min_level() const -> LogLevel {
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enable) {
    std::lock_guard lock(mutex_);
    console_output_ = enable;
}

void Logger::set_sink(Sink sink) {
    std::lock_guard lock(mutex_);
    sink_ = std::move(sink);
}

auto Logger::get_log_file_path() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return {};
    }
    return log_dir_ / (app_name_ + ".log");
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);

    if (initialized_ && file_.is_open()) {
        file_ << get_timestamp() << "[INFO ] [Logger] Logger shutting down" << std::endl;
        file_.close();
    }

    initialized_ = false;
}

auto Logger::parse_level(std::string_view name) -> std::optional<LogLevel> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevel::DEBUG;
    }
    if (lower == "info") {
        return LogLevel::INFO;
    }
    if (lower == "warning" || lower == "warn") {
        return LogLevel::WARNING;
    }
    if (lower == "error") {
        return LogLevel::ERROR;
    }
    return std::nullopt;
}

auto Logger::get_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << "Z ";

    return oss.str();
}

auto Logger::thread_tag() -> uint32_t {
    return static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
}

auto Logger::level_to_string(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

void Logger::check_and_rotate() {
    if (current_file_size_ >= policy_.max_file_size_bytes) {
        rotate_logs();
    }
}

void Logger::rotate_logs() {
    if (file_.is_open()) {
        file_.close();
    }

    auto base_path = log_dir_ / (app_name_ + ".log");
    std::error_code ec;

    std::filesystem::remove(log_dir_ / std::format("{}.{}.log", app_name_, policy_.max_files), ec);

    // n-1 -> n, ..., 1 -> 2
    for (int i = policy_.max_files - 1; i >= 1; --i) {
        auto old_path = log_dir_ / std::format("{}.{}.log", app_name_, i);
        if (std::filesystem::exists(old_path, ec)) {
            std::filesystem::rename(old_path,
                                    log_dir_ / std::format("{}.{}.log", app_name_, i + 1), ec);
        }
    }

    std::filesystem::rename(base_path, log_dir_ / std::format("{}.1.log", app_name_), ec);

    if (!open_log_file()) {
        initialized_ = false;
        return;
    }

    file_ << get_timestamp() << "[INFO ] [Logger] Log file rotated" << std::endl;
}

}  // namespace util
