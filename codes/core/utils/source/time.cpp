#include "utils/time.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace sync_http_client {
namespace utils {

uint64_t get_monotonic_time_ms() {
    auto now = std::chrono::steady_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::string format_current_time(const char* format) {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

TimeoutChecker::TimeoutChecker(uint64_t timeout_ms)
    : timeout_ms_(timeout_ms)
    , start_time_ms_(get_monotonic_time_ms())
{
}

bool TimeoutChecker::is_timeout() const {
    if (!is_enabled()) {
        return false;
    }
    return remaining_ms() == 0;
}

uint64_t TimeoutChecker::remaining_ms() const {
    if (!is_enabled()) {
        return std::numeric_limits<uint64_t>::max();
    }
    uint64_t elapsed = get_monotonic_time_ms() - start_time_ms_;
    if (elapsed >= timeout_ms_) {
        return 0;
    }
    return timeout_ms_ - elapsed;
}

int TimeoutChecker::remaining_poll_ms() const {
    if (!is_enabled()) {
        return -1;
    }
    uint64_t remaining = remaining_ms();
    if (remaining > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(remaining);
}

void TimeoutChecker::reset() {
    start_time_ms_ = get_monotonic_time_ms();
}

} // namespace utils
} // namespace sync_http_client
