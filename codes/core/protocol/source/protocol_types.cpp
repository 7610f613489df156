// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: protocol_types.cpp
//  描述: 方法/版本与字符串之间的转换
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/protocol_types.hpp"

namespace sync_http_client {
namespace protocol {

namespace {

struct MethodEntry {
    Method method;
    const char* token;
};

const MethodEntry kMethodTable[] = {
    { Method::GET,     "GET" },
    { Method::HEAD,    "HEAD" },
    { Method::POST,    "POST" },
    { Method::PUT,     "PUT" },
    { Method::DELETE_, "DELETE" },
    { Method::PATCH,   "PATCH" },
    { Method::OPTIONS, "OPTIONS" },
    { Method::CONNECT, "CONNECT" },
    { Method::TRACE,   "TRACE" },
};

} // namespace

const char* method_to_string(Method method) {
    for (const auto& entry : kMethodTable) {
        if (entry.method == method) {
            return entry.token;
        }
    }
    return "GET";
}

utils::Result<Method> string_to_method(const std::string& token) {
    for (const auto& entry : kMethodTable) {
        if (token == entry.token) {
            return utils::make_ok(entry.method);
        }
    }
    return utils::make_err<Method>(utils::ErrorCode::INVALID_METHOD, "Unknown method: " + token);
}

const char* version_to_string(Version version) {
    return version == Version::HTTP_1_0 ? "HTTP/1.0" : "HTTP/1.1";
}

utils::Result<Version> parse_version(const std::string& token) {
    if (token == "HTTP/1.1") {
        return utils::make_ok(Version::HTTP_1_1);
    }
    if (token == "HTTP/1.0") {
        return utils::make_ok(Version::HTTP_1_0);
    }
    return utils::make_err<Version>(utils::ErrorCode::MALFORMED_STATUS_LINE,
                                    "HTTP version not supported: " + token);
}

} // namespace protocol
} // namespace sync_http_client

// 文件结束
