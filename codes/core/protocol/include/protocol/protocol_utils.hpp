// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: protocol_utils.hpp
//  描述: Protocol模块公共工具函数
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstddef>
#include <string>

namespace sync_http_client {
namespace protocol {

inline char AsciiToLower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// 大小写不敏感相等（长度不同直接返回false，允许内嵌'\0'）
inline bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (AsciiToLower(a[i]) != AsciiToLower(b[i])) {
            return false;
        }
    }
    return true;
}

// RFC 7230 tchar
inline bool IsTokenChar(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'':
        case '*': case '+': case '-': case '.': case '^': case '_':
        case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

inline bool IsValidHeaderName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        if (!IsTokenChar(c)) {
            return false;
        }
    }
    return true;
}

// 头部值不能包含CR、LF、NUL
inline bool IsValidHeaderValue(const std::string& value) {
    for (char c : value) {
        if (c == '\r' || c == '\n' || c == '\0') {
            return false;
        }
    }
    return true;
}

// 去除首尾的空格与水平制表符(OWS)
inline std::string TrimOws(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && (s[begin] == ' ' || s[begin] == '\t')) {
        begin++;
    }
    while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t')) {
        end--;
    }
    return s.substr(begin, end - begin);
}

// 逗号分隔的列表值中是否包含指定元素（大小写不敏感）
// 例: ListContainsToken("gzip, Chunked", "chunked") == true
inline bool ListContainsToken(const std::string& list, const std::string& token) {
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) {
            comma = list.size();
        }
        std::string item = TrimOws(list.substr(start, comma - start));
        // 忽略参数部分，如 "chunked;q=1"
        size_t semi = item.find(';');
        if (semi != std::string::npos) {
            item = TrimOws(item.substr(0, semi));
        }
        if (EqualsIgnoreCase(item, token)) {
            return true;
        }
        start = comma + 1;
    }
    return false;
}

} // namespace protocol
} // namespace sync_http_client

// 文件结束
