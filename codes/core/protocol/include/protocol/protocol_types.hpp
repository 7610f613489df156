// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: protocol_types.hpp
//  描述: Protocol模块类型定义、枚举、常量
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <cstdint>
#include <cstddef>
#include <string>

namespace sync_http_client {
namespace protocol {

// ==================== HTTP解析相关常量 ====================
constexpr size_t MAX_LINE_LEN = 8192;          // 状态行/头部行/分块长度行的最大长度（不含CRLF）
constexpr size_t MAX_HEADERS = 100;
constexpr size_t BODY_CHUNK_SIZE = 16 * 1024;  // 文件body流式发送的分块大小
constexpr uint16_t DEFAULT_HTTP_PORT = 80;

// ==================== 请求方法枚举 ====================
// DELETE_ 带下划线以避开部分平台上的 DELETE 宏
enum class Method : uint8_t {
    GET = 0,
    HEAD = 1,
    POST = 2,
    PUT = 3,
    DELETE_ = 4,
    PATCH = 5,
    OPTIONS = 6,
    CONNECT = 7,
    TRACE = 8
};

// ==================== 协议版本枚举 ====================
enum class Version : uint8_t {
    HTTP_1_0 = 0,
    HTTP_1_1 = 1
};

// ==================== 解析结果枚举 ====================
enum class ParseResult {
    OK = 0,         // 响应已完整
    NEED_MORE = 1   // 需要更多数据
};

// 方法转大写token
const char* method_to_string(Method method);

// token转方法（大小写敏感）
utils::Result<Method> string_to_method(const std::string& token);

// 版本转字符串: "HTTP/1.0" / "HTTP/1.1"
const char* version_to_string(Version version);

// 解析版本token，仅支持HTTP/1.0与HTTP/1.1
utils::Result<Version> parse_version(const std::string& token);

} // namespace protocol
} // namespace sync_http_client

// 文件结束
