/**
 * @file Logger.hpp
 * @brief Process-wide logger with console and rotating file output
 *
 * Every line carries an ISO 8601 timestamp, a level and a component tag.
 * Console output goes to stderr so it never mixes with metric lines
 * printed in dry-run mode.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-metric details
    INFO,     ///< Run progress
    WARNING,  ///< Skipped records
    ERROR     ///< Environment failures
};

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 1024 * 1024;  ///< Max size before rotation (1MB default)
    int max_files = 5;                         ///< Number of rotated files to keep
};

/**
 * @class Logger
 * @brief Singleton logger with optional file output and rotation
 *
 * Usage:
 * @code
 * auto& log = util::Logger::instance();
 * log.set_console_output(true);
 * log.initialize("/var/log/disktemp", "disktemp-exporter");
 * LOG_INFO("Collector", std::format("Processed {} disks", count));
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to the global logger
     */
    static auto instance() -> Logger&;

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Start writing log lines to a file
     * @param log_dir Directory for log files (created if doesn't exist)
     * @param app_name Application name used in log filename
     * @param policy Rotation policy
     * @return true if the log file was opened
     *
     * Log files are named: {app_name}.log
     * Rotated files: {app_name}.1.log, {app_name}.2.log, etc.
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogRotationPolicy policy = {}) -> bool;

    /**
     * @brief Log a message with specified level and component
     * @param level Log level
     * @param component Component/module name (e.g., "SectionParser")
     * @param message Log message
     */
    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    /**
     * @brief Set minimum log level
     */
    void set_min_level(LogLevel level);

    /**
     * @brief Enable/disable console output (stderr)
     */
    void set_console_output(bool enable);

    /**
     * @brief Get the current log file path
     * @return Path to the active log file, or empty if not initialized
     */
    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    /**
     * @brief Flush and close the log file; console output is unaffected
     */
    void shutdown();

    /**
     * @brief Format one log line (without trailing newline)
     */
    [[nodiscard]] static auto format_line(std::string_view timestamp, LogLevel level,
                                          std::string_view component, std::string_view message)
        -> std::string;

private:
    Logger() = default;
    ~Logger();

    /**
     * @brief Get ISO 8601 timestamp string
     * @return Formatted timestamp (e.g., "2026-01-22T14:32:45.123Z")
     */
    [[nodiscard]] static auto get_timestamp() -> std::string;

    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

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
};

// Convenience macros for component-based logging
#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
