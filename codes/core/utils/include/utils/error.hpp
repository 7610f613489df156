// =============================================================================
//  Sync HTTP Client - Utils Module
//  文件: error.hpp
//  描述: 统一错误码定义与Result返回值包装
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace sync_http_client {
namespace utils {

// 统一错误码定义
enum class ErrorCode : int32_t {
    // 通用错误 (0-999)
    SUCCESS = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    OPERATION_FAILED = 3,
    TIMEOUT = 4,

    // IO错误 (1000-1999)
    IO_ERROR = 1000,
    FILE_NOT_FOUND = 1001,

    // 配置错误 (2000-2999)
    CONFIG_PARSE_ERROR = 2000,
    CONFIG_INVALID_VALUE = 2001,
    CONFIG_INVALID_LOG_LEVEL = 2002,

    // 请求构建错误 (3000-3999)，不会发生任何IO
    INVALID_URI = 3000,
    INVALID_METHOD = 3001,
    INVALID_HEADER_NAME = 3002,
    INVALID_HEADER_VALUE = 3003,
    AMBIGUOUS_BODY_FRAMING = 3004,

    // 网络错误 (4000-4999)
    NETWORK_CONNECT_ERROR = 4000,
    NETWORK_CLOSED = 4001,

    // 协议错误 (5000-5999)
    INVALID_STATUS_CODE = 5000,
    MALFORMED_STATUS_LINE = 5001,
    MALFORMED_HEADER_LINE = 5002,
    MALFORMED_CHUNK_SIZE = 5003,
    INVALID_CONTENT_LENGTH = 5004,
    UNEXPECTED_EOF = 5005,
};

// 错误分类：输入/配置错误（未发生IO）、传输错误（发生过IO）、协议错误（收到无法解释的字节）
enum class ErrorCategory : uint8_t {
    NONE = 0,
    INPUT = 1,
    TRANSPORT = 2,
    PROTOCOL = 3
};

// 错误码转字符串
const char* error_code_to_string(ErrorCode code);

// 错误码转描述
const char* error_code_to_description(ErrorCode code);

// 错误码所属分类
ErrorCategory get_error_category(ErrorCode code);

// 错误分类转字符串
const char* error_category_to_string(ErrorCategory category);

// 判断是否成功
inline bool is_success(ErrorCode code) {
    return code == ErrorCode::SUCCESS;
}

// 判断是否失败
inline bool is_error(ErrorCode code) {
    return code != ErrorCode::SUCCESS;
}

// 错误结果类（带错误码的返回值包装）
// 注意：T 需要可默认构造
template<typename T>
class Result {
public:
    // 成功构造
    explicit Result(const T& value)
        : code_(ErrorCode::SUCCESS)
        , value_(value)
        , has_value_(true)
    {}

    explicit Result(T&& value)
        : code_(ErrorCode::SUCCESS)
        , value_(std::move(value))
        , has_value_(true)
    {}

    // 失败构造
    explicit Result(ErrorCode code)
        : code_(code)
        , message_(error_code_to_description(code))
        , value_()
        , has_value_(false)
    {}

    Result(ErrorCode code, const std::string& message)
        : code_(code)
        , message_(message)
        , value_()
        , has_value_(false)
    {}

    Result(ErrorCode code, std::string&& message)
        : code_(code)
        , message_(std::move(message))
        , value_()
        , has_value_(false)
    {}

    bool is_ok() const { return has_value_; }
    bool is_err() const { return !has_value_; }

    // 获取值（必须确保成功）
    const T& value() const { return value_; }
    T& value() { return value_; }

    // 取走值（调用后Result中的值处于moved-from状态）
    T take_value() { return std::move(value_); }

    // 获取值，带默认值
    const T& value_or(const T& default_value) const {
        return has_value_ ? value_ : default_value;
    }

    // 获取错误码
    ErrorCode error_code() const { return code_; }

    // 获取错误消息
    const std::string& error_message() const {
        return message_;
    }

private:
    ErrorCode code_;
    std::string message_;
    T value_;
    bool has_value_;
};

// 特化void版本
template<>
class Result<void> {
public:
    Result() : code_(ErrorCode::SUCCESS) {}

    explicit Result(ErrorCode code)
        : code_(code)
        , message_(error_code_to_description(code))
    {}

    Result(ErrorCode code, const std::string& message)
        : code_(code)
        , message_(message)
    {}

    Result(ErrorCode code, std::string&& message)
        : code_(code)
        , message_(std::move(message))
    {}

    bool is_ok() const { return code_ == ErrorCode::SUCCESS; }
    bool is_err() const { return code_ != ErrorCode::SUCCESS; }

    ErrorCode error_code() const { return code_; }

    const std::string& error_message() const {
        return message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// 辅助函数创建成功结果
template<typename T>
Result<typename std::decay<T>::type> make_ok(T&& value) {
    return Result<typename std::decay<T>::type>(std::forward<T>(value));
}

inline Result<void> make_ok() {
    return Result<void>();
}

// 辅助函数创建错误结果
template<typename T>
Result<T> make_err(ErrorCode code) {
    return Result<T>(code);
}

template<typename T>
Result<T> make_err(ErrorCode code, const std::string& message) {
    return Result<T>(code, message);
}

inline Result<void> make_err(ErrorCode code) {
    return Result<void>(code);
}

inline Result<void> make_err(ErrorCode code, const std::string& message) {
    return Result<void>(code, message);
}

// 错误透传：把一个失败结果转换为另一种返回类型
template<typename T, typename U>
Result<T> forward_err(const Result<U>& failed) {
    return Result<T>(failed.error_code(), failed.error_message());
}

} // namespace utils
} // namespace sync_http_client
