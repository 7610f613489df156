// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: status_code.hpp
//  描述: HTTP状态码值类型
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <cstdint>

namespace sync_http_client {
namespace protocol {

// 状态码分类，由首位数字决定
enum class StatusClass : uint8_t {
    INFORMATIONAL = 1,
    SUCCESS = 2,
    REDIRECTION = 3,
    CLIENT_ERROR = 4,
    SERVER_ERROR = 5
};

const char* status_class_to_string(StatusClass status_class);

// ==================== 状态码类 ====================
// 取值范围[100, 599]，创建后不可修改
class StatusCode {
public:
    static constexpr uint16_t MIN_CODE = 100;
    static constexpr uint16_t MAX_CODE = 599;

    /**
     * @brief 默认构造为200 OK
     */
    StatusCode();

    /**
     * @brief 从整数创建状态码
     * @param code 状态码
     * @return 超出[100, 599]时返回INVALID_STATUS_CODE
     */
    static utils::Result<StatusCode> from(int code);

    uint16_t code() const { return code_; }

    StatusClass status_class() const;

    bool is_informational() const { return status_class() == StatusClass::INFORMATIONAL; }
    bool is_success() const { return status_class() == StatusClass::SUCCESS; }
    bool is_redirection() const { return status_class() == StatusClass::REDIRECTION; }
    bool is_client_error() const { return status_class() == StatusClass::CLIENT_ERROR; }
    bool is_server_error() const { return status_class() == StatusClass::SERVER_ERROR; }

    /**
     * @brief 标准原因短语，未登记的状态码返回空字符串
     */
    const char* canonical_reason() const;

    bool operator==(const StatusCode& other) const { return code_ == other.code_; }
    bool operator!=(const StatusCode& other) const { return code_ != other.code_; }

private:
    explicit StatusCode(uint16_t code);

    uint16_t code_;
};

} // namespace protocol
} // namespace sync_http_client

// 文件结束
