// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: url.cpp
//  描述: URI解析实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/url.hpp"
#include "protocol/protocol_types.hpp"
#include "protocol/protocol_utils.hpp"
#include <utility>

namespace sync_http_client {
namespace protocol {

namespace {

utils::Result<Url> invalid_uri(const std::string& input, const std::string& reason) {
    return utils::make_err<Url>(utils::ErrorCode::INVALID_URI,
                                "Invalid URI '" + input + "': " + reason);
}

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_scheme_char(char c) {
    return is_alpha(c) || is_digit(c) || c == '+' || c == '-' || c == '.';
}

// reg-name: unreserved / pct-encoded / sub-delims
bool is_reg_name_char(char c) {
    if (is_alpha(c) || is_digit(c)) {
        return true;
    }
    switch (c) {
        case '-': case '.': case '_': case '~': case '%':
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=':
            return true;
        default:
            return false;
    }
}

bool is_ipv6_char(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F') ||
           c == ':' || c == '.';
}

} // namespace

Url::Url()
    : scheme()
    , host()
    , port(DEFAULT_HTTP_PORT)
    , has_explicit_port(false)
    , is_ipv6_literal(false)
    , path()
    , query()
    , has_query(false)
{
}

std::string Url::request_target() const {
    std::string target = path.empty() ? "/" : path;
    if (has_query) {
        target += "?";
        target += query;
    }
    return target;
}

std::string Url::host_header() const {
    std::string value = is_ipv6_literal ? "[" + host + "]" : host;
    if (port != DEFAULT_HTTP_PORT) {
        value += ":" + std::to_string(port);
    }
    return value;
}

std::string Url::to_string() const {
    std::string out = scheme + "://";
    out += is_ipv6_literal ? "[" + host + "]" : host;
    if (has_explicit_port) {
        out += ":" + std::to_string(port);
    }
    out += request_target();
    return out;
}

utils::Result<Url> parse_url(const std::string& input) {
    if (input.empty()) {
        return invalid_uri(input, "empty");
    }
    for (char c : input) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f) {
            return invalid_uri(input, "contains whitespace or control character");
        }
    }

    // 1. scheme
    size_t sep = input.find("://");
    if (sep == std::string::npos || sep == 0) {
        return invalid_uri(input, "not an absolute URI");
    }
    if (!is_alpha(input[0])) {
        return invalid_uri(input, "bad scheme");
    }
    for (size_t i = 1; i < sep; ++i) {
        if (!is_scheme_char(input[i])) {
            return invalid_uri(input, "bad scheme");
        }
    }

    Url url;
    url.scheme.reserve(sep);
    for (size_t i = 0; i < sep; ++i) {
        url.scheme += AsciiToLower(input[i]);
    }
    if (url.scheme != "http") {
        return invalid_uri(input, "unsupported scheme '" + url.scheme + "'");
    }

    // 2. authority
    size_t auth_begin = sep + 3;
    size_t auth_end = input.find_first_of("/?#", auth_begin);
    if (auth_end == std::string::npos) {
        auth_end = input.size();
    }
    std::string authority = input.substr(auth_begin, auth_end - auth_begin);
    if (authority.empty()) {
        return invalid_uri(input, "missing host");
    }
    if (authority.find('@') != std::string::npos) {
        return invalid_uri(input, "userinfo is not supported");
    }

    std::string port_text;
    bool has_port_sep = false;
    if (authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return invalid_uri(input, "unterminated IPv6 literal");
        }
        url.host = authority.substr(1, close - 1);
        if (url.host.empty()) {
            return invalid_uri(input, "empty IPv6 literal");
        }
        for (char c : url.host) {
            if (!is_ipv6_char(c)) {
                return invalid_uri(input, "bad IPv6 literal");
            }
        }
        url.is_ipv6_literal = true;
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return invalid_uri(input, "garbage after IPv6 literal");
            }
            has_port_sep = true;
            port_text = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            has_port_sep = true;
            port_text = authority.substr(colon + 1);
            url.host = authority.substr(0, colon);
        } else {
            url.host = authority;
        }
        if (url.host.empty()) {
            return invalid_uri(input, "missing host");
        }
        for (char c : url.host) {
            if (!is_reg_name_char(c)) {
                return invalid_uri(input, "bad host character");
            }
        }
    }

    // "host:" 与省略端口等价
    if (has_port_sep && !port_text.empty()) {
        if (port_text.size() > 5) {
            return invalid_uri(input, "port out of range");
        }
        uint32_t port = 0;
        for (char c : port_text) {
            if (!is_digit(c)) {
                return invalid_uri(input, "bad port");
            }
            port = port * 10 + static_cast<uint32_t>(c - '0');
        }
        if (port == 0 || port > 65535) {
            return invalid_uri(input, "port out of range");
        }
        url.port = static_cast<uint16_t>(port);
        url.has_explicit_port = true;
    }

    // 3. path / query，丢弃fragment
    size_t fragment = input.find('#', auth_end);
    size_t tail_end = (fragment == std::string::npos) ? input.size() : fragment;
    size_t question = input.find('?', auth_end);
    if (question != std::string::npos && question < tail_end) {
        url.path = input.substr(auth_end, question - auth_end);
        url.query = input.substr(question + 1, tail_end - question - 1);
        url.has_query = true;
    } else {
        url.path = input.substr(auth_end, tail_end - auth_end);
    }

    return utils::make_ok(std::move(url));
}

} // namespace protocol
} // namespace sync_http_client

// 文件结束
