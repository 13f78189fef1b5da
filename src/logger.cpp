#include "logger.h"
#include <iostream>
#include <unistd.h>
#include <cstdlib>
#include <syslog.h>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <vector>

namespace gymface {

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Service deployments point GYMFACE_LOG_FILE at a file; CLI and tests log to stderr
    const char* log_path = std::getenv("GYMFACE_LOG_FILE");
    if (log_path != nullptr && log_path[0] != '\0') {
        setLogFile(log_path);
    }
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (log_file_.is_open()) {
        log_file_.close();
    }

    log_file_path_ = path;
    log_file_.open(path, std::ios::app);
    if (log_file_.is_open()) {
        console_output_ = false;
    } else {
        console_output_ = true;
        std::cerr << "Warning: Could not open log file " << path
                  << ", falling back to console output" << std::endl;
    }
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_output_ = enabled;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::setMaxLogLines(size_t max_lines) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_log_lines_ = max_lines;
}

std::string Logger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

void Logger::rotateLogIfNeeded() {
    // Only perform rotation check periodically (every 100 writes)
    if (log_counter_ < 100) {
        log_counter_++;
        return;
    }
    log_counter_ = 0;

    if (log_file_path_.empty() || console_output_) {
        return;
    }

    std::ifstream infile(log_file_path_);
    if (!infile.is_open()) {
        return;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(infile, line)) {
        lines.push_back(line);
    }
    infile.close();

    if (lines.size() <= max_log_lines_) {
        return;
    }

    // Keep only the newest max_log_lines_ lines
    size_t start_index = lines.size() - max_log_lines_;

    if (log_file_.is_open()) {
        log_file_.close();
    }

    std::ofstream outfile(log_file_path_, std::ios::trunc);
    if (outfile.is_open()) {
        for (size_t i = start_index; i < lines.size(); ++i) {
            outfile << lines[i] << '\n';
        }
        outfile.close();
    }

    log_file_.open(log_file_path_, std::ios::app);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::stringstream ss;
    ss << "[" << getCurrentTimestamp() << "] "
       << "[" << levelToString(level) << "] "
       << "[PID:" << getpid() << "] "
       << message << std::endl;

    if (console_output_) {
        std::cerr << ss.str();
    } else if (log_file_.is_open()) {
        log_file_ << ss.str();
        log_file_.flush();
    } else {
        int syslog_level = LOG_INFO;
        switch (level) {
            case LogLevel::DEBUG:   syslog_level = LOG_DEBUG; break;
            case LogLevel::INFO:    syslog_level = LOG_INFO; break;
            case LogLevel::WARNING: syslog_level = LOG_WARNING; break;
            case LogLevel::ERROR:   syslog_level = LOG_ERR; break;
        }
        syslog(syslog_level, "%s", message.c_str());
    }

    rotateLogIfNeeded();
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::auditAttempt(const std::string& subject, const std::string& operation) {
    std::stringstream ss;
    ss << "AUTH_ATTEMPT subject=" << (subject.empty() ? "-" : subject)
       << " operation=" << operation;
    info(ss.str());
}

void Logger::auditSuccess(const std::string& subject, const std::string& operation, double duration_ms) {
    std::stringstream ss;
    ss << "AUTH_SUCCESS subject=" << (subject.empty() ? "-" : subject)
       << " operation=" << operation
       << " duration=" << std::fixed << std::setprecision(2) << duration_ms << "ms";
    info(ss.str());
}

void Logger::auditFailure(const std::string& subject, const std::string& operation, const std::string& reason) {
    std::stringstream ss;
    ss << "AUTH_FAILURE subject=" << (subject.empty() ? "-" : subject)
       << " operation=" << operation
       << " reason=" << reason;
    warning(ss.str());
}

} // namespace gymface
