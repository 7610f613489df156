// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: url.hpp
//  描述: 绝对URI解析（仅http）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <cstdint>
#include <string>

namespace sync_http_client {
namespace protocol {

// http://host[:port][/path][?query][#fragment]
struct Url {
    std::string scheme;         // 小写，目前只有"http"
    std::string host;           // IPv6字面量不含方括号
    uint16_t port;
    bool has_explicit_port;
    bool is_ipv6_literal;
    std::string path;           // 原样保存，可能为空
    std::string query;          // 不含'?'
    bool has_query;

    Url();

    // 请求行中的目标: 空path写作"/"，带上"?query"
    std::string request_target() const;

    // Host头部值: 非80端口时附加":port"
    std::string host_header() const;

    std::string to_string() const;
};

/**
 * @brief 解析绝对URI
 * @param input URI字符串
 * @return 语法错误、非http scheme、含userinfo或端口非法时返回INVALID_URI
 * @note 片段(#...)被丢弃，不会发送
 */
utils::Result<Url> parse_url(const std::string& input);

} // namespace protocol
} // namespace sync_http_client

// 文件结束
