#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace sqlgraph::core {

namespace {

std::string_view base_name(std::string_view path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
}

bool Logger::set_output(std::string_view filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    if (filename.empty()) {
        return true;
    }
    file_stream_.clear();
    file_stream_.open(std::string(filename), std::ios::app);
    return file_stream_.is_open();
}

void Logger::set_console_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

void Logger::log(LogLevel level, std::string_view file, int line,
                 std::string_view function, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    // [TIMESTAMP] [LEVEL] [thread] [file:line] [function] message
    std::ostringstream oss;
    oss << "[" << timestamp() << "] "
        << "[" << std::setw(5) << level_name(level) << "] "
        << "[" << std::this_thread::get_id() << "] "
        << "[" << base_name(file) << ":" << line << "] "
        << "[" << function << "] "
        << message;
    std::string formatted = oss.str();

    std::lock_guard<std::mutex> lock(mutex_);
    if (console_enabled_) {
        (level >= LogLevel::ERROR ? std::cerr : std::clog) << formatted << std::endl;
    }
    if (file_stream_.is_open()) {
        file_stream_ << formatted << std::endl;
    }
}

void Logger::log_branch(bool condition, std::string_view file, int line,
                        std::string_view function,
                        std::string_view true_msg,
                        std::string_view false_msg) {
    if (!enabled(LogLevel::DEBUG)) {
        return;
    }

    std::string message = condition ? "BRANCH: TRUE - " : "BRANCH: FALSE - ";
    if (condition) {
        message += true_msg;
    } else {
        message += false_msg.empty() ? std::string_view("condition false") : false_msg;
    }
    log(LogLevel::DEBUG, file, line, function, message);
}

const char* level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "?????";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

} // namespace sqlgraph::core
