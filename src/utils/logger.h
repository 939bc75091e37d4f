#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

#ifdef ERROR
#undef ERROR
#endif

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
bool parseLogLevel(const std::string& name, LogLevel& out);

class Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel level() const { return level_; }
    bool setLogFile(const std::string& path);
    void close();

    void log(LogLevel level, const char* module, const char* fmt, ...);

    // Thread-local context tag printed on every line: the HTTP request id
    // inside handlers, the task id inside job workers.
    static void setContext(const std::string& id);
    static void clearContext();
    static const std::string& context();

    // Sets the context for the current scope, restores the previous one on exit.
    class ScopedContext {
    public:
        explicit ScopedContext(const std::string& id) : saved_(Logger::context()) {
            Logger::setContext(id);
        }
        ~ScopedContext() { Logger::setContext(saved_); }
        ScopedContext(const ScopedContext&) = delete;
        ScopedContext& operator=(const ScopedContext&) = delete;
    private:
        std::string saved_;
    };

    // RAII performance timer
    struct Timer {
        const char* module;
        const char* label;
        std::chrono::steady_clock::time_point start;

        Timer(const char* mod, const char* lbl)
            : module(mod), label(lbl), start(std::chrono::steady_clock::now()) {}

        ~Timer() {
            Logger::instance().log(LogLevel::INFO, module, "%s took %.1f ms", label, elapsedMs());
        }

        double elapsedMs() const {
            auto now = std::chrono::steady_clock::now();
            return std::chrono::duration<double, std::milli>(now - start).count();
        }
    };

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex mutex_;
    LogLevel level_ = LogLevel::INFO;
    FILE* file_ = nullptr;

    static thread_local std::string context_;

    void writeEntry(LogLevel lv, const char* module, const char* msg);
    static const char* levelStr(LogLevel lv);
    static std::string formatTimestamp();
};

#define LOG_DEBUG(mod, ...) Logger::instance().log(LogLevel::DEBUG, mod, __VA_ARGS__)
#define LOG_INFO(mod, ...)  Logger::instance().log(LogLevel::INFO,  mod, __VA_ARGS__)
#define LOG_WARN(mod, ...)  Logger::instance().log(LogLevel::WARN,  mod, __VA_ARGS__)
#define LOG_ERROR(mod, ...) Logger::instance().log(LogLevel::ERROR, mod, __VA_ARGS__)

#define LOG_CONCAT_INNER(a, b) a##b
#define LOG_CONCAT(a, b) LOG_CONCAT_INNER(a, b)
#define LOG_TIMER(mod, label) Logger::Timer LOG_CONCAT(_ltimer_, __COUNTER__)(mod, label)
