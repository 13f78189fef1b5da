#ifndef GYMFACE_LOGGER_H
#define GYMFACE_LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <cstddef>

namespace gymface {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Parse "debug" / "info" / "warning" / "error" (case-insensitive); INFO on anything else
LogLevel parseLogLevel(const std::string& name);

class Logger {
public:
    static Logger& getInstance();

    void setLogFile(const std::string& path);
    void setConsoleOutput(bool enabled);
    void setLogLevel(LogLevel level);
    void setMaxLogLines(size_t max_lines);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Audit trail for biometric operations
    void auditAttempt(const std::string& subject, const std::string& operation);
    void auditSuccess(const std::string& subject, const std::string& operation, double duration_ms);
    void auditFailure(const std::string& subject, const std::string& operation, const std::string& reason);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string getCurrentTimestamp();
    std::string levelToString(LogLevel level);
    void rotateLogIfNeeded();

    std::ofstream log_file_;
    std::mutex mutex_;
    LogLevel min_level_ = LogLevel::INFO;
    bool console_output_ = true;
    std::string log_file_path_;
    size_t max_log_lines_ = 5000;
    size_t log_counter_ = 0;
};

} // namespace gymface

#endif // GYMFACE_LOGGER_H
