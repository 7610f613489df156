// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: status_code.cpp
//  描述: StatusCode类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/status_code.hpp"
#include <string>

namespace sync_http_client {
namespace protocol {

constexpr uint16_t StatusCode::MIN_CODE;
constexpr uint16_t StatusCode::MAX_CODE;

const char* status_class_to_string(StatusClass status_class) {
    switch (status_class) {
        case StatusClass::INFORMATIONAL: return "INFORMATIONAL";
        case StatusClass::SUCCESS: return "SUCCESS";
        case StatusClass::REDIRECTION: return "REDIRECTION";
        case StatusClass::CLIENT_ERROR: return "CLIENT_ERROR";
        case StatusClass::SERVER_ERROR: return "SERVER_ERROR";
        default: return "UNKNOWN";
    }
}

StatusCode::StatusCode()
    : code_(200)
{
}

StatusCode::StatusCode(uint16_t code)
    : code_(code)
{
}

utils::Result<StatusCode> StatusCode::from(int code) {
    if (code < MIN_CODE || code > MAX_CODE) {
        return utils::make_err<StatusCode>(utils::ErrorCode::INVALID_STATUS_CODE,
                                           "Status code out of range: " + std::to_string(code));
    }
    return utils::make_ok(StatusCode(static_cast<uint16_t>(code)));
}

StatusClass StatusCode::status_class() const {
    return static_cast<StatusClass>(code_ / 100);
}

const char* StatusCode::canonical_reason() const {
    switch (code_) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 102: return "Processing";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 203: return "Non Authoritative Information";
        case 204: return "No Content";
        case 205: return "Reset Content";
        case 206: return "Partial Content";
        case 207: return "Multi-Status";
        case 208: return "Already Reported";
        case 226: return "IM Used";
        case 300: return "Multiple Choices";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 305: return "Use Proxy";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 402: return "Payment Required";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 406: return "Not Acceptable";
        case 407: return "Proxy Authentication Required";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 411: return "Length Required";
        case 412: return "Precondition Failed";
        case 413: return "Payload Too Large";
        case 414: return "URI Too Long";
        case 415: return "Unsupported Media Type";
        case 416: return "Range Not Satisfiable";
        case 417: return "Expectation Failed";
        case 418: return "I'm a teapot";
        case 421: return "Misdirected Request";
        case 422: return "Unprocessable Entity";
        case 423: return "Locked";
        case 424: return "Failed Dependency";
        case 426: return "Upgrade Required";
        case 428: return "Precondition Required";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 451: return "Unavailable For Legal Reasons";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        case 506: return "Variant Also Negotiates";
        case 507: return "Insufficient Storage";
        case 508: return "Loop Detected";
        case 510: return "Not Extended";
        case 511: return "Network Authentication Required";
        default: return "";
    }
}

} // namespace protocol
} // namespace sync_http_client

// 文件结束
