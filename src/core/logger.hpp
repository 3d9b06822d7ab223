#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace sqlgraph::core {

enum class LogLevel {
    TRACE,   // Parameter values, fetched rows
    DEBUG,   // Command text, connection ownership, branch decisions
    INFO,    // Resource cleanup
    WARN,    // Cancellation escalation, skipped operations
    ERROR,   // Failures during cleanup
    FATAL
};

/**
 * @brief Process-wide logger of the data-access layer
 *
 * Lines go to the console (stderr from ERROR up) and, when set, to a log
 * file. Every line carries the time, level, thread, source location and
 * function. Async operations may be polled from any thread, so writes are
 * serialized.
 *
 * Usage:
 *   Logger::instance().set_level(LogLevel::DEBUG);
 *   Logger::instance().set_output("sqlgraph.log");
 *
 *   LOG_DEBUG("SQL: " + sql);
 *   LOG_IF(owns_connection, "Opened connection", "Connection already open");
 */
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) noexcept { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel level() const noexcept { return min_level_.load(std::memory_order_relaxed); }
    bool enabled(LogLevel level) const noexcept { return level >= this->level(); }

    /**
     * @brief Append to `filename` (empty closes the current file)
     * @return false if the file could not be opened
     */
    bool set_output(std::string_view filename);

    void set_console_enabled(bool enabled);

    void log(LogLevel level, std::string_view file, int line,
             std::string_view function, std::string_view message);

    /**
     * @brief Log a branch decision at DEBUG
     * @param false_msg Message if condition is false (optional)
     */
    void log_branch(bool condition, std::string_view file, int line,
                    std::string_view function,
                    std::string_view true_msg,
                    std::string_view false_msg = "");

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    bool console_enabled_ = true;
    std::ofstream file_stream_;
    std::mutex mutex_;
};

const char* level_name(LogLevel level) noexcept;

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "fatal")
 * @return std::nullopt for an unknown name
 */
std::optional<LogLevel> parse_log_level(std::string_view name);

} // namespace sqlgraph::core

#define SQLGRAPH_LOG(level, msg) \
    do { \
        if (sqlgraph::core::Logger::instance().enabled(level)) { \
            sqlgraph::core::Logger::instance().log(level, __FILE__, __LINE__, __func__, msg); \
        } \
    } while (0)

#define LOG_TRACE(msg) SQLGRAPH_LOG(sqlgraph::core::LogLevel::TRACE, msg)
#define LOG_DEBUG(msg) SQLGRAPH_LOG(sqlgraph::core::LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  SQLGRAPH_LOG(sqlgraph::core::LogLevel::INFO, msg)
#define LOG_WARN(msg)  SQLGRAPH_LOG(sqlgraph::core::LogLevel::WARN, msg)
#define LOG_ERROR(msg) SQLGRAPH_LOG(sqlgraph::core::LogLevel::ERROR, msg)
#define LOG_FATAL(msg) SQLGRAPH_LOG(sqlgraph::core::LogLevel::FATAL, msg)

// Log branch decisions (IF statements)
#define LOG_IF(condition, true_msg, ...) \
    sqlgraph::core::Logger::instance().log_branch( \
        (condition), __FILE__, __LINE__, __func__, \
        true_msg, ##__VA_ARGS__)
