#include "utils/Logger.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <stdexcept>

namespace BgcNet {
namespace Utils {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : use_color_(isatty(fileno(stdout)) != 0) {}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

bool Logger::set_log_file(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }

    std::filesystem::path p(filename);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    log_file_.open(filename, std::ios::app);
    return log_file_.is_open();
}

void Logger::close_log_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

const char* Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG: return "DEBUG";
        case LogLevel::LOG_INFO:  return "INFO ";
        case LogLevel::LOG_WARN:  return "WARN ";
        case LogLevel::LOG_ERROR: return "ERROR";
        default: return "UNK  ";
    }
}

const char* Logger::color_code(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG: return "\033[36m";  // Cyan
        case LogLevel::LOG_INFO:  return "\033[32m";  // Green
        case LogLevel::LOG_WARN:  return "\033[33m";  // Yellow
        case LogLevel::LOG_ERROR: return "\033[31m";  // Red
        default: return "";
    }
}

LogLevel Logger::string_to_level(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "error") return LogLevel::LOG_ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::LOG_WARN;
    if (lower == "info") return LogLevel::LOG_INFO;
    if (lower == "debug") return LogLevel::LOG_DEBUG;

    throw std::invalid_argument("Unknown log level: " + str);
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    // Verbosity ordering: ERROR(0) < WARN < INFO < DEBUG(3)
    if (static_cast<int>(level) > static_cast<int>(current_level_)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    struct tm time_info;
    localtime_r(&now_time, &time_info);

    std::stringstream ss;
    ss << "[" << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3)
       << ms.count() << "]";

#ifdef _OPENMP
    ss << "[T" << omp_get_thread_num() << "]";
#endif

    ss << "[" << level_to_string(level) << "] " << message;

    if (file && (level == LogLevel::LOG_DEBUG || level == LogLevel::LOG_ERROR)) {
        std::filesystem::path p(file);
        ss << " (" << p.filename().string() << ":" << line << ")";
    }
    ss << '\n';

    std::lock_guard<std::mutex> lock(mutex_);

    if (console_enabled_) {
        if (use_color_) {
            std::cout << color_code(level) << ss.str() << "\033[0m" << std::flush;
        } else {
            std::cout << ss.str() << std::flush;
        }
    }

    if (log_file_.is_open()) {
        log_file_ << ss.str() << std::flush;
    }
}

void Logger::debug(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_DEBUG, msg, file, line);
}

void Logger::info(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_INFO, msg, file, line);
}

void Logger::warning(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_WARN, msg, file, line);
}

void Logger::error(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_ERROR, msg, file, line);
}

// ScopedLogger Implementation
ScopedLogger::ScopedLogger(const std::string& action_name, LogLevel level)
    : action_name_(action_name), level_(level), start_time_(std::chrono::steady_clock::now()) {
    Logger::instance().log(level_, "START: " + action_name_);
}

ScopedLogger::~ScopedLogger() {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time_).count();
    Logger::instance().log(level_, "DONE : " + action_name_ + " (" + std::to_string(duration) + " ms)");
}

}  // namespace Utils
}  // namespace BgcNet
