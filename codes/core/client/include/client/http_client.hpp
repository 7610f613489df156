// =============================================================================
//  Sync HTTP Client - Client Module
//  文件: http_client.hpp
//  描述: HttpClient类定义 - 一次调用完成一次请求/响应交换
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <string>
#include "utils/config.hpp"
#include "utils/error.hpp"
#include "protocol/http_message.hpp"
#include "connection/connection.hpp"

namespace sync_http_client {
namespace client {

using protocol::Body;
using protocol::HeaderMap;
using protocol::HttpRequest;
using protocol::HttpResponse;
using protocol::Method;

// 同步HTTP客户端
// 每次请求新建连接，交换结束后关闭；不同线程可各自使用独立的HttpClient
class HttpClient {
public:
    /**
     * @brief 使用默认配置构造
     */
    HttpClient();

    /**
     * @brief 由配置创建客户端，并按logging段设置全局Logger
     * @param config 配置对象
     * @return 配置校验失败或日志文件无法打开时返回对应错误码
     */
    static utils::Result<HttpClient> from_config(const utils::Config& config);

    const utils::Config& get_config() const { return config_; }

    /**
     * @brief 发送已构建的请求
     * @return 输入错误不会产生任何I/O；传输与协议错误时连接已释放
     * @note 缺少User-Agent和Connection时按配置补充；请求(包括body)被移入本次交换
     */
    utils::Result<HttpResponse> send(HttpRequest request) const;

    /**
     * @brief 构建并发送请求
     */
    utils::Result<HttpResponse> send_request(Method method, const std::string& url,
                                             const HeaderMap& headers, Body body) const;

    // ========== 使用默认配置的便捷调用 ==========

    static utils::Result<HttpResponse> request(Method method, const std::string& url,
                                               const HeaderMap& headers, Body body);

    static utils::Result<HttpResponse> get(const std::string& url,
                                           const HeaderMap& headers = HeaderMap());
    static utils::Result<HttpResponse> post(const std::string& url, const HeaderMap& headers,
                                            Body body);
    static utils::Result<HttpResponse> put(const std::string& url, const HeaderMap& headers,
                                           Body body);
    static utils::Result<HttpResponse> patch(const std::string& url, const HeaderMap& headers,
                                             Body body);
    static utils::Result<HttpResponse> del(const std::string& url,
                                           const HeaderMap& headers = HeaderMap());
    static utils::Result<HttpResponse> head(const std::string& url,
                                            const HeaderMap& headers = HeaderMap());
    static utils::Result<HttpResponse> options(const std::string& url,
                                               const HeaderMap& headers = HeaderMap());
    static utils::Result<HttpResponse> connect(const std::string& url,
                                               const HeaderMap& headers = HeaderMap());
    static utils::Result<HttpResponse> trace(const std::string& url,
                                             const HeaderMap& headers = HeaderMap());

private:
    utils::Result<HttpRequest> apply_defaults(HttpRequest request) const;

    utils::Config config_;
    connection::TcpOptions tcp_options_;
    protocol::Version version_;
};

} // namespace client
} // namespace sync_http_client
