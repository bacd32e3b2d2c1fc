#include "logger.h"
#include <iostream>
#include <ctime>
#include <cstdlib>
#include <unistd.h>

Logger::Logger()
    : min_log_level_(LogLevel::INFO)
    , console_output_enabled_(true)
    , file_output_enabled_(false)
    , stdout_color_(isatty(STDOUT_FILENO) != 0)
    , stderr_color_(isatty(STDERR_FILENO) != 0)
    , log_file_(nullptr) {
}

Logger::~Logger() {
    is_destructing_ = true;
    if (log_file_ && log_file_->is_open()) {
        log_file_->close();
    }
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_log_level_ = level;
}

void Logger::set_log_file(const std::string& filename) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (log_file_ && log_file_->is_open()) {
        log_file_->close();
    }

    log_filename_ = filename;
    log_file_ = std::make_unique<std::ofstream>(filename, std::ios::app);

    if (log_file_->is_open()) {
        file_output_enabled_ = true;
        *log_file_ << "\n=== harmony-bridge log session started at " << get_timestamp() << " ===\n";
        log_file_->flush();
    } else {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        file_output_enabled_ = false;
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level >= min_log_level_) {
        write_log(level, message);
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::level_to_string(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

const char* Logger::level_color(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
        default: return "\033[0m";
    }
}

void Logger::write_log(LogLevel level, const std::string& message) {
    // Don't try to log if we're being destroyed (prevents mutex errors during static destruction)
    if (is_destructing_) {
        return;
    }

    std::lock_guard<std::mutex> lock(log_mutex_);

    std::string timestamp = get_timestamp();
    std::string level_str = level_to_string(level);

    // Format: [TIMESTAMP] [LEVEL] MESSAGE
    std::string plain = "[" + timestamp + "] [" + level_str + "] " + message;

    if (console_output_enabled_) {
        // WARN, ERROR, and FATAL go to stderr so stdout stays clean
        bool to_stderr = level >= LogLevel::WARN;
        bool color = to_stderr ? stderr_color_ : stdout_color_;
        std::string line = color
            ? "[" + timestamp + "] [" + level_color(level) + level_str + "\033[0m] " + message + "\n"
            : plain + "\n";
        if (to_stderr) {
            std::cerr << line << std::flush;
        } else {
            std::cout << line << std::flush;
        }
    }

    if (file_output_enabled_ && log_file_ && log_file_->is_open()) {
        *log_file_ << plain << std::endl;
        log_file_->flush();
    }
}
