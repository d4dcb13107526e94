#pragma once
#include <cstdio>
#include <cstdarg>
#include <functional>
#include <mutex>

namespace btflash {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    void set_output(FILE* out);
    // Called under the lock right before a line is written.
    void set_prelude(std::function<void()> fn);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    FILE* out_ = nullptr;
    std::function<void()> prelude_;
    const char* level_str(LogLevel lvl);
};

LogLevel level_for_verbosity(int verbose);

} // namespace btflash
