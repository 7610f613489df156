#include "utils/logger.hpp"
#include "utils/time.hpp"
#include <cstdio>
#include <iostream>

namespace sync_http_client {
namespace utils {

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

bool string_to_log_level(const std::string& str, LogLevel* level) {
    if (str == "DEBUG") { *level = LogLevel::DEBUG; return true; }
    if (str == "INFO")  { *level = LogLevel::INFO;  return true; }
    if (str == "WARN")  { *level = LogLevel::WARN;  return true; }
    if (str == "ERROR") { *level = LogLevel::ERROR; return true; }
    return false;
}

// 库默认只输出告警及以上，避免调用方未配置时刷屏
Logger::Logger()
    : level_(LogLevel::WARN)
    , console_enabled_(true)
    , format_("[%time] [%level] [%module] %message")
{
}

Logger::~Logger() {
    shutdown();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

int Logger::init(LogLevel level, const std::string& file) {
    level_ = level;
    return set_file(file);
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

LogLevel Logger::get_level() const {
    return level_.load();
}

int Logger::set_file(const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }
    if (file.empty()) {
        return 0;
    }

    file_.open(file, std::ios::out | std::ios::app);
    return file_.is_open() ? 0 : -1;
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

void Logger::set_format(const std::string& format) {
    std::lock_guard<std::mutex> lock(mutex_);
    format_ = format;
}

bool Logger::is_level_enabled(LogLevel level) const {
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(level_.load());
}

void Logger::log(LogLevel level, const char* module, const char* fmt, ...) {
    if (!is_level_enabled(level)) {
        return;
    }

    va_list args;
    va_start(args, fmt);
    logv(level, module, fmt, args);
    va_end(args);
}

void Logger::logv(LogLevel level, const char* module, const char* fmt, va_list args) {
    char buffer[4096];
    vsnprintf(buffer, sizeof(buffer), fmt, args);

    std::lock_guard<std::mutex> lock(mutex_);
    format_and_write(level, module, buffer);
}

namespace {

void replace_placeholder(std::string* text, const char* placeholder, const std::string& value) {
    size_t pos = text->find(placeholder);
    if (pos != std::string::npos) {
        text->replace(pos, std::char_traits<char>::length(placeholder), value);
    }
}

} // namespace

void Logger::format_and_write(LogLevel level, const char* module, const char* message) {
    std::string result = format_;

    replace_placeholder(&result, "%time", format_current_time("%Y-%m-%d %H:%M:%S"));
    replace_placeholder(&result, "%level", log_level_to_string(level));
    replace_placeholder(&result, "%module", module ? module : "unknown");
    // message放在最后替换，避免消息内容里的占位符被二次展开
    replace_placeholder(&result, "%message", message);

    result += "\n";

    if (console_enabled_) {
        if (level >= LogLevel::WARN) {
            std::cerr << result;
        } else {
            std::cout << result;
        }
    }

    if (file_.is_open()) {
        file_ << result;
        if (level >= LogLevel::WARN) {
            file_.flush();
        }
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
    std::cout.flush();
    std::cerr.flush();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

} // namespace utils
} // namespace sync_http_client
