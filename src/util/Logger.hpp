/**
 * @file Logger.hpp
 * @brief Thread-safe logging utility with file rotation
 *
 * Structured log lines: ISO 8601 UTC timestamp, level, calling thread,
 * component tag and message. Output goes to a rotating file, optionally
 * echoed to stderr, and optionally mirrored to a sink (used by tests).
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-chunk and per-sample detail
    INFO,     ///< Job lifecycle events
    WARNING,  ///< Retries, finalize problems, recoverable conditions
    ERROR     ///< Job failures and store errors
};

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 10 * 1024 * 1024;  ///< Max size before rotation
    int max_files = 7;                               ///< Number of rotated files to keep
};

/**
 * @class Logger
 * @brief Process-wide logger shared by the helper, the CLI and the tests
 *
 * Usage:
 * @code
 * util::Logger::instance().initialize("/var/log/storage-eraser", "storage-eraser-helper");
 * LOG_INFO("Scheduler", std::format("Dispatching job {}", id));
 * @endcode
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel level, std::string_view line)>;

    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Open {log_dir}/{app_name}.log, creating the directory if needed
     * @return true if the log file could be opened
     *
     * Rotated files are named {app_name}.1.log, {app_name}.2.log, ...
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO,
                    LogRotationPolicy policy = {}) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool;

    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void flush();

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Also write every line to stderr
     */
    void set_console_output(bool enable);

    /**
     * @brief Mirror every emitted line to @p sink (pass nullptr to remove)
     *
     * The sink is called with the logger mutex held and must not log.
     */
    void set_sink(Sink sink);

    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    void shutdown();

    /**
     * @brief Parse "debug", "info", "warning"/"warn" or "error" (case-insensitive)
     */
    [[nodiscard]] static auto parse_level(std::string_view name) -> std::optional<LogLevel>;

    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] static auto get_timestamp() -> std::string;
    [[nodiscard]] static auto thread_tag() -> uint32_t;

    void check_and_rotate();
    void rotate_logs();
    auto open_log_file() -> bool;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    bool initialized_ = false;
    bool console_output_ = false;
    size_t current_file_size_ = 0;
    Sink sink_;
};

#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
