#pragma once

#include <cstdint>
#include <string>

namespace sync_http_client {
namespace utils {

// 获取单调时间戳（毫秒，不受系统时间修改影响）
uint64_t get_monotonic_time_ms();

// 格式化当前时间为字符串
// format: strftime格式字符串
std::string format_current_time(const char* format = "%Y-%m-%d %H:%M:%S");

// 超时检测器
// timeout_ms为0表示不限时：is_timeout()恒为false，remaining_ms()恒为UINT64_MAX
class TimeoutChecker {
public:
    explicit TimeoutChecker(uint64_t timeout_ms);
    ~TimeoutChecker() = default;

    // 是否启用了超时
    bool is_enabled() const { return timeout_ms_ != 0; }

    // 检查是否超时
    bool is_timeout() const;

    // 获取剩余时间（毫秒），返回0表示已超时
    uint64_t remaining_ms() const;

    // 以poll()可接受的形式返回剩余时间：-1表示无限等待
    int remaining_poll_ms() const;

    // 重置起始时间
    void reset();

private:
    uint64_t timeout_ms_;
    uint64_t start_time_ms_;
};

} // namespace utils
} // namespace sync_http_client
