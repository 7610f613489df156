#pragma once

#include <cstdint>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstdarg>

namespace sync_http_client {
namespace utils {

// 日志级别枚举
enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// 日志级别转字符串
const char* log_level_to_string(LogLevel level);

// 字符串转日志级别
// return: true-识别成功，false-未知级别（level保持不变）
bool string_to_log_level(const std::string& str, LogLevel* level);

class Logger {
public:
    // 获取单例
    static Logger& instance();

    // ========== 初始化与配置 ==========

    // 初始化日志系统
    // level: 日志级别
    // file: 日志文件路径，为空则只输出到控制台
    // return: 0-成功，-1-打开文件失败
    int init(LogLevel level, const std::string& file = "");

    // 设置日志级别
    void set_level(LogLevel level);

    // 获取当前日志级别
    LogLevel get_level() const;

    // 设置日志文件，为空关闭文件输出
    // return: 0-成功
    int set_file(const std::string& file);

    // 启用/禁用控制台输出
    void set_console_output(bool enabled);

    // 设置日志格式
    // 支持占位符: %time %level %module %message
    // 默认格式: "[%time] [%level] [%module] %message"
    void set_format(const std::string& format);

    // ========== 日志输出 ==========

    // printf风格输出
    void log(LogLevel level, const char* module, const char* fmt, ...);

    // 检查某级别是否启用
    bool is_level_enabled(LogLevel level) const;

    // 刷新日志
    void flush();

    // 关闭文件输出
    void shutdown();

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void logv(LogLevel level, const char* module, const char* fmt, va_list args);
    void format_and_write(LogLevel level, const char* module, const char* message);

    std::atomic<LogLevel> level_;
    std::mutex mutex_;
    std::ofstream file_;
    bool console_enabled_;
    std::string format_;
};

} // namespace utils
} // namespace sync_http_client

// ========== 便捷宏 ==========

#define SHC_LOG_AT(lvl, module, fmt, ...) \
    do { \
        auto& shc_logger_ = ::sync_http_client::utils::Logger::instance(); \
        if (shc_logger_.is_level_enabled(lvl)) { \
            shc_logger_.log(lvl, module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(module, fmt, ...) \
    SHC_LOG_AT(::sync_http_client::utils::LogLevel::DEBUG, module, fmt, ##__VA_ARGS__)

#define LOG_INFO(module, fmt, ...) \
    SHC_LOG_AT(::sync_http_client::utils::LogLevel::INFO, module, fmt, ##__VA_ARGS__)

#define LOG_WARN(module, fmt, ...) \
    SHC_LOG_AT(::sync_http_client::utils::LogLevel::WARN, module, fmt, ##__VA_ARGS__)

#define LOG_ERROR(module, fmt, ...) \
    SHC_LOG_AT(::sync_http_client::utils::LogLevel::ERROR, module, fmt, ##__VA_ARGS__)
