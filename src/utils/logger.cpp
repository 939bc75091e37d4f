#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <ctime>

thread_local std::string Logger::context_;

bool parseLogLevel(const std::string& name, LogLevel& out) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    if (s == "debug") { out = LogLevel::DEBUG; return true; }
    if (s == "info")  { out = LogLevel::INFO;  return true; }
    if (s == "warn" || s == "warning") { out = LogLevel::WARN; return true; }
    if (s == "error") { out = LogLevel::ERROR; return true; }
    return false;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    close();
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        fclose(file_);
        file_ = nullptr;
    }
    if (path.empty()) return true;
    file_ = fopen(path.c_str(), "a");
    return file_ != nullptr;
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        fclose(file_);
        file_ = nullptr;
    }
}

void Logger::setContext(const std::string& id) {
    context_ = id;
}

void Logger::clearContext() {
    context_.clear();
}

const std::string& Logger::context() {
    return context_;
}

void Logger::log(LogLevel level, const char* module, const char* fmt, ...) {
    if (level < level_) return;

    char buf[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    writeEntry(level, module, buf);
}

void Logger::writeEntry(LogLevel lv, const char* module, const char* msg) {
    std::string ts = formatTimestamp();

    char line[2560];
    if (context_.empty()) {
        snprintf(line, sizeof(line), "[%s] [%-5s] [%s] %s\n", ts.c_str(), levelStr(lv), module, msg);
    } else {
        snprintf(line, sizeof(line), "[%s] [%-5s] [%s] [%s] %s\n",
                 ts.c_str(), levelStr(lv), module, context_.c_str(), msg);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    fputs(line, stderr);
    if (file_) {
        fputs(line, file_);
        fflush(file_);
    }
}

const char* Logger::levelStr(LogLevel lv) {
    switch (lv) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "???";
}

std::string Logger::formatTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm = {};
    localtime_r(&tt, &tm);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
             tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
             tm.tm_hour, tm.tm_min, tm.tm_sec, (int)ms.count());
    return buf;
}
