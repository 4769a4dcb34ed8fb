#include <sandkernel/core/logger.hpp>

namespace sandkernel {

static const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m";
        case LogLevel::INFO: return "\033[32m";
        case LogLevel::WARN: return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        default: return "\033[0m";
    }
}

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

// "void sandkernel::KernelManager::sweep_idle()" -> {"KernelManager", "sweep_idle"}
static std::pair<std::string, std::string> split_pretty_function(const char* pretty_function) {
    std::string pf = pretty_function;

    size_t paren_pos = pf.find('(');
    if (paren_pos == std::string::npos) {
        return {"", pf};
    }
    std::string signature = pf.substr(0, paren_pos);

    size_t last_colon = signature.rfind("::");
    if (last_colon == std::string::npos) {
        size_t space_pos = signature.rfind(' ');
        return {"", space_pos != std::string::npos ? signature.substr(space_pos + 1) : signature};
    }

    std::string func_name = signature.substr(last_colon + 2);
    std::string scope = signature.substr(0, last_colon);
    size_t space_pos = scope.rfind(' ');
    if (space_pos != std::string::npos) {
        scope = scope.substr(space_pos + 1);
    }

    size_t template_pos = scope.find('<');
    if (template_pos != std::string::npos) {
        scope = scope.substr(0, template_pos);
    }
    if (!scope.empty() && (scope[0] == '*' || scope[0] == '&')) {
        scope = scope.substr(1);
    }

    static const std::string ns_prefix = "sandkernel::";
    if (scope.compare(0, ns_prefix.size(), ns_prefix) == 0) {
        scope = scope.substr(ns_prefix.size());
    } else if (scope == "sandkernel") {
        scope.clear();
    }

    return {scope, func_name};
}

#ifdef __GNUC__
__attribute__((visibility("default")))
#endif
Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(LogLevel::INFO) {}

void Logger::set_level(LogLevel level) { level_.store(level); }

LogLevel Logger::level() const { return level_.load(); }

LogLevel Logger::parse_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level() > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level() > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level() > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level() > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, file, line, func, fmt, args);
    va_end(args);
}

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    char message[4096];
    vsnprintf(message, sizeof(message), fmt, args);

    // One fprintf per record so lines from worker threads never interleave
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (level_.load() == LogLevel::DEBUG) {
        std::pair<std::string, std::string> where = split_pretty_function(func);
        fprintf(stderr, "[%s] %s[%s]\033[0m \033[36m(%s%s%s)\033[0m at \033[33m%s:%d\033[0m %s\n",
                timestamp, level_color(level), level_name(level),
                where.first.c_str(), where.first.empty() ? "" : "::", where.second.c_str(),
                file, line, message);
    } else {
        fprintf(stderr, "[%s] %s[%s]\033[0m %s\n", timestamp, level_color(level), level_name(level), message);
    }
    fflush(stderr);
}

} // namespace sandkernel
