#include "backend/common/Logger.h"

#include <unistd.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iostream>

namespace backend {
namespace common {

namespace {

struct LevelStyle {
    const char* tag;
    const char* ansi;
};

// Indexed by LogLevel. Tags are padded to one width.
const LevelStyle kStyles[] = {
    {"DEBUG", "\033[36m"},
    {"INFO ", "\033[32m"},
    {"WARN ", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"FATAL", "\033[35m"},
};

const char* const kAnsiReset = "\033[0m";

void Timestamp(char* out, size_t len) {
    using namespace std::chrono;
    const system_clock::time_point now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const long millis = static_cast<long>(
        duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm parts;
    ::localtime_r(&secs, &parts);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &parts);
    std::snprintf(out, len, "%s.%03ld", date, millis);
}

} // namespace

Logger& Logger::Instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : threshold_(LogLevel::INFO),
      sink_(&std::cout),
      ansi_(::isatty(STDOUT_FILENO) != 0) {
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> guard(lock_);
    threshold_ = level;
}

LogLevel Logger::ParseLevel(const std::string& name) {
    std::string upper(name);
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    static const LogLevel kAll[] = {
        LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR, LogLevel::FATAL,
    };
    for (LogLevel level : kAll) {
        const char* tag = kStyles[static_cast<int>(level)].tag;
        // Compare against the tag without its padding.
        const size_t len = std::strcspn(tag, " ");
        if (upper.size() == len && upper.compare(0, len, tag, len) == 0) {
            return level;
        }
    }
    return LogLevel::INFO;
}

void Logger::SetOutput(std::ostream* sink) {
    std::lock_guard<std::mutex> guard(lock_);
    sink_ = sink != nullptr ? sink : &std::cout;
}

void Logger::SetColor(bool on) {
    std::lock_guard<std::mutex> guard(lock_);
    ansi_ = on;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& text) {
    const LevelStyle& style = kStyles[static_cast<int>(level)];
    const char* slash = std::strrchr(file, '/');
    const char* base = slash != nullptr ? slash + 1 : file;
    char stamp[48];
    Timestamp(stamp, sizeof(stamp));

    std::lock_guard<std::mutex> guard(lock_);
    std::ostream& os = *sink_;
    if (ansi_) {
        os << style.ansi;
    }
    os << '[' << stamp << "] [" << style.tag << "] [" << base << ':' << line << "] " << text;
    if (ansi_) {
        os << kAnsiReset;
    }
    os << '\n';
    os.flush();
}

} // namespace common
} // namespace backend
