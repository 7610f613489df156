// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: http_message.hpp
//  描述: HttpRequest、RequestBuilder和HttpResponse类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include "protocol/status_code.hpp"
#include "protocol/header_map.hpp"
#include "protocol/body.hpp"
#include "protocol/url.hpp"
#include <string>
#include <utility>
#include <vector>

namespace sync_http_client {
namespace protocol {

class RequestBuilder;
class ResponseParser;

// ==================== HTTP请求类 ====================
// 只能由RequestBuilder创建，创建后只读
class HttpRequest {
public:
    Method method() const { return method_; }
    const Url& url() const { return url_; }
    Version version() const { return version_; }
    const HeaderMap& headers() const { return headers_; }
    const Body& body() const { return body_; }

    /**
     * @brief 消耗当前请求，返回追加了一条头部的请求
     * @note 仅在头部不存在时追加，供客户端补充默认头部；body随请求移动
     */
    utils::Result<HttpRequest> with_default_header(const std::string& name,
                                                   const std::string& value) &&;

private:
    friend class RequestBuilder;
    // Result<T>失败时需要占位值
    friend class utils::Result<HttpRequest>;

    // 默认构造: GET http://localhost/，不对外开放
    HttpRequest();

    Method method_;
    Url url_;
    Version version_;
    HeaderMap headers_;
    Body body_;
};

// ==================== 请求构建器 ====================
// 先累积字段，所有校验推迟到body()时进行
class RequestBuilder {
public:
    RequestBuilder();

    RequestBuilder& method(Method method);
    RequestBuilder& uri(const std::string& uri);
    RequestBuilder& version(Version version);

    // 追加一条头部
    RequestBuilder& header(const std::string& name, const std::string& value);

    // 追加一组头部，保持原顺序
    RequestBuilder& headers(const HeaderMap& headers);

    /**
     * @brief 设置body并完成构建
     * @return 未设置方法返回INVALID_METHOD；未设置URI或URI非法返回INVALID_URI；
     *         头部非法返回INVALID_HEADER_NAME / INVALID_HEADER_VALUE
     */
    utils::Result<HttpRequest> body(Body body);

    // 以空body完成构建
    utils::Result<HttpRequest> build();

private:
    bool has_method_;
    Method method_;
    bool has_uri_;
    std::string uri_;
    Version version_;
    std::vector<HeaderField> pending_headers_;
};

// ==================== HTTP响应类 ====================
// 由ResponseParser填充，对调用方只读
class HttpResponse {
public:
    HttpResponse();

    Version version() const { return version_; }
    const StatusCode& status() const { return status_; }
    uint16_t status_code() const { return status_.code(); }
    const std::string& reason() const { return reason_; }
    const HeaderMap& headers() const { return headers_; }
    const Body& body() const { return body_; }

    // 便捷访问
    std::string text() const { return body_.text(); }

    /**
     * @brief 对端是否要求关闭连接
     * @note "Connection: close"；HTTP/1.0下没有"Connection: keep-alive"也视为关闭
     */
    bool connection_close() const;

private:
    friend class ResponseParser;

    Version version_;
    StatusCode status_;
    std::string reason_;
    HeaderMap headers_;
    Body body_;
};

} // namespace protocol
} // namespace sync_http_client

// 文件结束
