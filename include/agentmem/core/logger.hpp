#ifndef AGENTMEM_CORE_LOGGER_HPP
#define AGENTMEM_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>
#include <atomic>

namespace agentmem {

// Visibility attribute for exported symbols
#ifdef __GNUC__
#  define AGENTMEM_API __attribute__((visibility("default")))
#else
#  define AGENTMEM_API
#endif

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive)
LogLevel parse_log_level(const std::string& name, LogLevel def = LogLevel::INFO);
const char* log_level_name(LogLevel level);

class AGENTMEM_API Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* fmt, va_list args);

    std::atomic<LogLevel> level_;
    std::mutex write_mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) agentmem::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  agentmem::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  agentmem::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) agentmem::Logger::instance().error(__VA_ARGS__)

} // namespace agentmem

#endif // AGENTMEM_CORE_LOGGER_HPP
