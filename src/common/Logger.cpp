#include "ingest/common/Logger.h"

#include <iostream>
#include <chrono>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <ctime>
#include <thread>

namespace ingest {
namespace common {

namespace {

std::string FormatNow() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmBuf;
    localtime_r(&in_time_t, &tmBuf);
    std::stringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

const char* LevelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
        default: return "\033[0m";
    }
}

// __FILE__ carries the full build path; keep the part below src/ or tests/.
const char* ShortFileName(const char* file) {
    const char* p = std::strstr(file, "src/");
    if (!p) p = std::strstr(file, "tests/");
    return p ? p : file;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

LogLevel Logger::ParseLevel(const std::string& name) {
    std::string levelStr(name);
    for (auto& c : levelStr) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (levelStr == "DEBUG") return LogLevel::DEBUG;
    if (levelStr == "INFO") return LogLevel::INFO;
    if (levelStr == "WARN") return LogLevel::WARN;
    if (levelStr == "ERROR") return LogLevel::ERROR;
    if (levelStr == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

void Logger::SetStream(std::ostream* os) {
    std::lock_guard<std::mutex> lock(mutex_);
    os_ = os;
}

void Logger::SetColored(bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    colored_ = on;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = os_ ? *os_ : std::cout;

    if (colored_) out << LevelToColor(level);
    out << "[" << FormatNow() << "] "
        << "[" << LevelToString(level) << "] "
        << "[" << std::this_thread::get_id() << "] "
        << "[" << ShortFileName(file) << ":" << line << "] "
        << msg;
    if (colored_) out << "\033[0m";
    out << std::endl;
}

} // namespace common
} // namespace ingest
