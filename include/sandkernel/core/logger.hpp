/*
 * sandkernel C++ - Logger
 *
 * Colored, timestamped diagnostics on stderr. stdout is reserved for
 * protocol responses and is never written to from here.
 */
#ifndef sandkernel_CORE_LOGGER_HPP
#define sandkernel_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <atomic>
#include <mutex>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace sandkernel {

#ifdef __GNUC__
#  define SANDKERNEL_API __attribute__((visibility("default")))
#else
#  define SANDKERNEL_API
#endif

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class SANDKERNEL_API Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // "debug", "info", "warn" or "error"; anything else maps to INFO
    static LogLevel parse_level(const std::string& name);

    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    std::atomic<LogLevel> level_;
    std::mutex write_mutex_;
};

#define LOG_DEBUG(...) sandkernel::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  sandkernel::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  sandkernel::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) sandkernel::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace sandkernel

#endif // sandkernel_CORE_LOGGER_HPP
