// =============================================================================
//  Sync HTTP Client - Client Module
//  文件: http_client.cpp
//  描述: HttpClient类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "client/http_client.hpp"
#include "protocol/http_encoder.hpp"
#include "protocol/http_parser.hpp"
#include "utils/buffer.hpp"
#include "utils/logger.hpp"
#include <memory>
#include <utility>

namespace sync_http_client {
namespace client {

namespace {

// 失败日志，带错误码名称
void log_failure(const HttpRequest& request, const char* stage, utils::ErrorCode code,
                 const std::string& message) {
    LOG_WARN("Client", "%s %s failed at %s: %s (%s)",
             protocol::method_to_string(request.method()),
             request.url().to_string().c_str(), stage,
             utils::error_code_to_string(code), message.c_str());
}

} // namespace

HttpClient::HttpClient()
    : config_()
    , tcp_options_(connection::TcpOptions::from_config(config_.get_connection()))
    , version_(protocol::Version::HTTP_1_1)
{
}

utils::Result<HttpClient> HttpClient::from_config(const utils::Config& config) {
    utils::Result<void> ret = config.validate();
    if (ret.is_err()) {
        return utils::forward_err<HttpClient>(ret);
    }
    utils::Result<protocol::Version> version = protocol::parse_version(config.get_request().version);
    if (version.is_err()) {
        return utils::make_err<HttpClient>(utils::ErrorCode::CONFIG_INVALID_VALUE,
                                           "Invalid request.version: " +
                                           config.get_request().version);
    }
    ret = config.apply_logging();
    if (ret.is_err()) {
        return utils::forward_err<HttpClient>(ret);
    }

    HttpClient client;
    client.config_ = config;
    client.tcp_options_ = connection::TcpOptions::from_config(config.get_connection());
    client.version_ = version.value();
    return utils::make_ok(std::move(client));
}

utils::Result<HttpRequest> HttpClient::apply_defaults(HttpRequest request) const {
    const utils::RequestConfig& cfg = config_.get_request();

    if (!cfg.user_agent.empty()) {
        utils::Result<HttpRequest> with_agent =
            std::move(request).with_default_header("User-Agent", cfg.user_agent);
        if (with_agent.is_err()) {
            return with_agent;
        }
        request = with_agent.take_value();
    }
    // 每次交换后都会关闭连接
    if (cfg.connection_close) {
        return std::move(request).with_default_header("Connection", "close");
    }
    return utils::make_ok(std::move(request));
}

utils::Result<HttpResponse> HttpClient::send(HttpRequest original) const {
    // 1. 补充默认头部并编码请求头，输入错误在任何I/O之前返回
    protocol::Method method = original.method();
    std::string target = original.url().to_string();
    utils::Result<HttpRequest> prepared = apply_defaults(std::move(original));
    if (prepared.is_err()) {
        LOG_WARN("Client", "%s %s failed at build: %s (%s)",
                 protocol::method_to_string(method), target.c_str(),
                 utils::error_code_to_string(prepared.error_code()),
                 prepared.error_message().c_str());
        return utils::forward_err<HttpResponse>(prepared);
    }
    const HttpRequest& request = prepared.value();

    utils::Buffer head;
    utils::Result<protocol::FramingMode> mode = protocol::HttpEncoder::encode_head(request, &head);
    if (mode.is_err()) {
        log_failure(request, "encode", mode.error_code(), mode.error_message());
        return utils::forward_err<HttpResponse>(mode);
    }

    LOG_INFO("Client", "%s %s (%s framing)",
             protocol::method_to_string(request.method()),
             request.url().to_string().c_str(),
             protocol::framing_mode_to_string(mode.value()));

    // 2. 建立连接，conn离开作用域时关闭
    utils::Result<std::unique_ptr<connection::Connection>> connected =
        connection::Connection::connect(request.url().host, request.url().port, tcp_options_);
    if (connected.is_err()) {
        log_failure(request, "connect", connected.error_code(), connected.error_message());
        return utils::forward_err<HttpResponse>(connected);
    }
    std::unique_ptr<connection::Connection> conn = connected.take_value();

    // 3. 发送请求头和body
    utils::Result<void> ret = conn->send_all(head.read_ptr(), head.readable_bytes());
    if (ret.is_err()) {
        log_failure(request, "send", ret.error_code(), ret.error_message());
        return utils::forward_err<HttpResponse>(ret);
    }
    connection::ConnectionSink sink(*conn);
    ret = protocol::HttpEncoder::encode_body(request, mode.value(), sink);
    if (ret.is_err()) {
        // 部分写入后连接不可再用
        log_failure(request, "send body", ret.error_code(), ret.error_message());
        return utils::forward_err<HttpResponse>(ret);
    }

    // 4. 读取响应
    protocol::ResponseParser parser(request.method());
    ret = conn->receive_until_framed(&parser, tcp_options_.read_timeout_ms);
    if (ret.is_err()) {
        log_failure(request, "receive", ret.error_code(), ret.error_message());
        return utils::forward_err<HttpResponse>(ret);
    }
    conn->close();

    HttpResponse response = parser.take_response();
    LOG_INFO("Client", "%s %s -> %u %s (%zu body bytes)",
             protocol::method_to_string(request.method()),
             request.url().to_string().c_str(),
             static_cast<unsigned>(response.status_code()),
             response.reason().c_str(),
             response.body().bytes().size());
    return utils::make_ok(std::move(response));
}

utils::Result<HttpResponse> HttpClient::send_request(Method method, const std::string& url,
                                                     const HeaderMap& headers, Body body) const {
    utils::Result<HttpRequest> request = protocol::RequestBuilder()
        .method(method)
        .uri(url)
        .version(version_)
        .headers(headers)
        .body(std::move(body));
    if (request.is_err()) {
        LOG_WARN("Client", "Invalid request %s %s: %s (%s)",
                 protocol::method_to_string(method), url.c_str(),
                 utils::error_code_to_string(request.error_code()),
                 request.error_message().c_str());
        return utils::forward_err<HttpResponse>(request);
    }
    return send(request.take_value());
}

// ========== 便捷调用 ==========

utils::Result<HttpResponse> HttpClient::request(Method method, const std::string& url,
                                                const HeaderMap& headers, Body body) {
    return HttpClient().send_request(method, url, headers, std::move(body));
}

utils::Result<HttpResponse> HttpClient::get(const std::string& url, const HeaderMap& headers) {
    return request(Method::GET, url, headers, Body::empty());
}

utils::Result<HttpResponse> HttpClient::post(const std::string& url, const HeaderMap& headers,
                                             Body body) {
    return request(Method::POST, url, headers, std::move(body));
}

utils::Result<HttpResponse> HttpClient::put(const std::string& url, const HeaderMap& headers,
                                            Body body) {
    return request(Method::PUT, url, headers, std::move(body));
}

utils::Result<HttpResponse> HttpClient::patch(const std::string& url, const HeaderMap& headers,
                                              Body body) {
    return request(Method::PATCH, url, headers, std::move(body));
}

utils::Result<HttpResponse> HttpClient::del(const std::string& url, const HeaderMap& headers) {
    return request(Method::DELETE_, url, headers, Body::empty());
}

utils::Result<HttpResponse> HttpClient::head(const std::string& url, const HeaderMap& headers) {
    return request(Method::HEAD, url, headers, Body::empty());
}

utils::Result<HttpResponse> HttpClient::options(const std::string& url, const HeaderMap& headers) {
    return request(Method::OPTIONS, url, headers, Body::empty());
}

utils::Result<HttpResponse> HttpClient::connect(const std::string& url, const HeaderMap& headers) {
    return request(Method::CONNECT, url, headers, Body::empty());
}

utils::Result<HttpResponse> HttpClient::trace(const std::string& url, const HeaderMap& headers) {
    return request(Method::TRACE, url, headers, Body::empty());
}

} // namespace client
} // namespace sync_http_client
