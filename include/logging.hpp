#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>

namespace drtp {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR, OFF };

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    void set_stream(std::FILE* out);
    void log(LogLevel lvl, const char* fmt, ...);
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    std::FILE* out_ = stderr;
    const char* level_str(LogLevel lvl);
};

} // namespace drtp
