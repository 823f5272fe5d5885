#pragma once

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace backend {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Process-wide sink for the LOG_* macros. Lines look like
// [2026-01-02 03:04:05.678] [INFO ] [File.cpp:42] text
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return threshold_; }
    // Case-insensitive level name; anything unknown maps to INFO.
    LogLevel ParseLevel(const std::string& name);

    // nullptr goes back to stdout. The stream must outlive its use.
    void SetOutput(std::ostream* sink);
    void SetColor(bool on);

    void Log(LogLevel level, const char* file, int line, const std::string& text);

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex lock_;
    LogLevel threshold_;
    std::ostream* sink_;
    bool ansi_;
};

// Collects one record and hands it to the Logger when it goes out of scope.
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}
    ~LogStream() { Logger::Instance().Log(level_, file_, line_, text_.str()); }

    template <typename T>
    LogStream& operator<<(const T& value) {
        text_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::ostringstream text_;
};

} // namespace common
} // namespace backend

// The operands after << are not evaluated when the level is filtered out.
#define BACKEND_LOG_AT(lvl)                                                   \
    if (backend::common::LogLevel::lvl <                                      \
        backend::common::Logger::Instance().GetLevel()) {                     \
    } else                                                                    \
        backend::common::LogStream(backend::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG BACKEND_LOG_AT(DEBUG)
#define LOG_INFO BACKEND_LOG_AT(INFO)
#define LOG_WARN BACKEND_LOG_AT(WARN)
#define LOG_ERROR BACKEND_LOG_AT(ERROR)
#define LOG_FATAL BACKEND_LOG_AT(FATAL)
