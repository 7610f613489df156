// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: http_message.cpp
//  描述: HttpRequest、RequestBuilder和HttpResponse类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_message.hpp"
#include "protocol/protocol_utils.hpp"

namespace sync_http_client {
namespace protocol {

// ==================== HttpRequest实现 ====================

HttpRequest::HttpRequest()
    : method_(Method::GET)
    , url_()
    , version_(Version::HTTP_1_1)
    , headers_()
    , body_()
{
    url_.scheme = "http";
    url_.host = "localhost";
}

utils::Result<HttpRequest> HttpRequest::with_default_header(const std::string& name,
                                                            const std::string& value) && {
    if (headers_.contains(name)) {
        return utils::make_ok(std::move(*this));
    }
    utils::Result<void> ret = headers_.append(name, value);
    if (ret.is_err()) {
        return utils::forward_err<HttpRequest>(ret);
    }
    return utils::make_ok(std::move(*this));
}

// ==================== RequestBuilder实现 ====================

RequestBuilder::RequestBuilder()
    : has_method_(false)
    , method_(Method::GET)
    , has_uri_(false)
    , uri_()
    , version_(Version::HTTP_1_1)
    , pending_headers_()
{
}

RequestBuilder& RequestBuilder::method(Method method) {
    method_ = method;
    has_method_ = true;
    return *this;
}

RequestBuilder& RequestBuilder::uri(const std::string& uri) {
    uri_ = uri;
    has_uri_ = true;
    return *this;
}

RequestBuilder& RequestBuilder::version(Version version) {
    version_ = version;
    return *this;
}

RequestBuilder& RequestBuilder::header(const std::string& name, const std::string& value) {
    pending_headers_.emplace_back(name, value);
    return *this;
}

RequestBuilder& RequestBuilder::headers(const HeaderMap& headers) {
    for (const auto& field : headers) {
        pending_headers_.push_back(field);
    }
    return *this;
}

utils::Result<HttpRequest> RequestBuilder::body(Body body) {
    if (!has_method_) {
        return utils::make_err<HttpRequest>(utils::ErrorCode::INVALID_METHOD,
                                            "Request method was not set");
    }
    if (!has_uri_) {
        return utils::make_err<HttpRequest>(utils::ErrorCode::INVALID_URI,
                                            "Request URI was not set");
    }

    utils::Result<Url> url = parse_url(uri_);
    if (url.is_err()) {
        return utils::forward_err<HttpRequest>(url);
    }

    HttpRequest request;
    request.method_ = method_;
    request.url_ = url.take_value();
    request.version_ = version_;
    for (const auto& field : pending_headers_) {
        utils::Result<void> ret = request.headers_.append(field.name, field.value);
        if (ret.is_err()) {
            return utils::forward_err<HttpRequest>(ret);
        }
    }
    // 有效的Host只能有一个
    if (request.headers_.get_all("Host").size() > 1) {
        return utils::make_err<HttpRequest>(utils::ErrorCode::INVALID_HEADER_VALUE,
                                            "Request carries more than one Host header");
    }
    request.body_ = std::move(body);
    return utils::make_ok(std::move(request));
}

utils::Result<HttpRequest> RequestBuilder::build() {
    return body(Body::empty());
}

// ==================== HttpResponse实现 ====================

HttpResponse::HttpResponse()
    : version_(Version::HTTP_1_1)
    , status_()
    , reason_()
    , headers_()
    , body_()
{
}

bool HttpResponse::connection_close() const {
    bool keep_alive = false;
    for (const auto& value : headers_.get_all("Connection")) {
        if (ListContainsToken(value, "close")) {
            return true;
        }
        if (ListContainsToken(value, "keep-alive")) {
            keep_alive = true;
        }
    }
    return version_ == Version::HTTP_1_0 && !keep_alive;
}

} // namespace protocol
} // namespace sync_http_client

// 文件结束
