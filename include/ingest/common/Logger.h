#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <ostream>
#include <sstream>

namespace ingest {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }
    // Case-insensitive; unknown names map to INFO.
    static LogLevel ParseLevel(const std::string& levelStr);

    // Redirect output (default std::cout). The stream must outlive the logger usage.
    void SetStream(std::ostream* os);
    void SetColored(bool on);

    // Line format: [time] [level] [thread] [file:line] message
    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::ostream* os_ = nullptr;
    bool colored_ = true;
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace ingest

#define LOG_DEBUG \
    if (ingest::common::LogLevel::DEBUG >= ingest::common::Logger::Instance().GetLevel()) \
    ingest::common::LogStream(ingest::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (ingest::common::LogLevel::INFO >= ingest::common::Logger::Instance().GetLevel()) \
    ingest::common::LogStream(ingest::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (ingest::common::LogLevel::WARN >= ingest::common::Logger::Instance().GetLevel()) \
    ingest::common::LogStream(ingest::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (ingest::common::LogLevel::ERROR >= ingest::common::Logger::Instance().GetLevel()) \
    ingest::common::LogStream(ingest::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (ingest::common::LogLevel::FATAL >= ingest::common::Logger::Instance().GetLevel()) \
    ingest::common::LogStream(ingest::common::LogLevel::FATAL, __FILE__, __LINE__)
