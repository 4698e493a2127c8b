#pragma once

#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include "core/Types.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace BgcNet {
namespace Utils {

/**
 * @brief Process-wide logger shared by the pipeline and all worker threads.
 *
 * Lines look like `[2024-01-01 12:00:00.123][T0][INFO ] message`. Console
 * output is colored when stdout is a terminal; the optional log file always
 * receives plain lines.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const { return current_level_; }

    /**
     * @brief Opens (append mode) a log file, creating its parent directory.
     * @return false if the file could not be opened.
     */
    bool set_log_file(const std::string& filename);
    void close_log_file();

    void set_console_output(bool enabled);

    // Core logging function
    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

    /**
     * @brief Parse "error", "warn"/"warning", "info" or "debug" (case-insensitive).
     * @throws std::invalid_argument for anything else.
     */
    static LogLevel string_to_level(const std::string& str);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_INFO;
    bool console_enabled_ = true;
    bool use_color_ = false;
    std::ofstream log_file_;
    std::mutex mutex_;

    static const char* level_to_string(LogLevel level);
    static const char* color_code(LogLevel level);
};

/**
 * @brief Logs START/DONE lines with the elapsed time of a pipeline stage.
 */
class ScopedLogger {
public:
    explicit ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace BgcNet

#define LOG_DEBUG(msg) BgcNet::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) BgcNet::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) BgcNet::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) BgcNet::Utils::Logger::error(msg, __FILE__, __LINE__)
