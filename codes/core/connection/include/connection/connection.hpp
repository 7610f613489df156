#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <sys/socket.h>
#include "utils/error.hpp"
#include "utils/config.hpp"
#include "utils/time.hpp"
#include "protocol/body.hpp"
#include "protocol/http_parser.hpp"

namespace sync_http_client {
namespace connection {

// 连接状态枚举
enum class ConnectionState : uint8_t {
    CONNECTING = 1,
    CONNECTED = 2,
    SENDING = 3,
    RECEIVING = 4,
    CLOSED = 5
};

const char* connection_state_to_string(ConnectionState state);

// TCP连接参数，0表示使用系统默认/不限时
struct TcpOptions {
    uint64_t connect_timeout_ms;
    uint64_t read_timeout_ms;
    bool nodelay;
    bool reuse_address;
    std::string local_address;  // 为空时不绑定
    uint32_t ttl;
    uint32_t send_buffer_size;
    uint32_t recv_buffer_size;
    bool keepalive;

    TcpOptions();

    static TcpOptions from_config(const utils::ConnectionConfig& cfg);
};

// 单次请求/响应交换使用的阻塞TCP连接
// 析构时关闭socket
class Connection {
public:
    // 解析host并依次尝试每个地址
    // DNS失败、拒绝、不可达返回NETWORK_CONNECT_ERROR，超过connect_timeout_ms返回TIMEOUT
    static utils::Result<std::unique_ptr<Connection>> connect(const std::string& host,
                                                              uint16_t port,
                                                              const TcpOptions& options);

    // 接管已连接的socket（持有所有权）
    Connection(int fd, const std::string& peer);

    // 析构函数
    ~Connection();

    // 禁止拷贝
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // ========== 基本属性 ==========

    int get_fd() const { return fd_; }
    ConnectionState get_state() const { return state_; }
    const std::string& get_peer() const { return peer_; }
    bool is_open() const { return fd_ >= 0; }

    uint64_t get_bytes_sent() const { return bytes_sent_; }
    uint64_t get_bytes_received() const { return bytes_received_; }

    // ========== 数据收发 ==========

    // 阻塞写入全部数据，部分写入时继续重试
    // return: 失败返回IO_ERROR，连接已关闭返回NETWORK_CLOSED
    utils::Result<void> send_all(const uint8_t* data, size_t len);
    utils::Result<void> send_all(const std::string& data);

    // 读取数据并交给parser，直到响应完整
    // timeout_ms: 整个读取过程的时限，0表示不限时
    // return: 响应头完整前对端关闭返回NETWORK_CLOSED，超时返回TIMEOUT，
    //         读取失败返回IO_ERROR，解析错误原样返回
    utils::Result<void> receive_until_framed(protocol::ResponseParser* parser,
                                             uint64_t timeout_ms);

    // ========== 连接管理 ==========

    // 关闭连接（可重复调用）
    void close();

private:
    Connection(int fd, const std::string& peer, ConnectionState initial_state);

    utils::Result<void> apply_options(int family, const TcpOptions& options);
    utils::Result<void> connect_with_timeout(const struct sockaddr* addr, socklen_t addr_len,
                                             const utils::TimeoutChecker& deadline);
    void transition_to(ConnectionState new_state);

    int fd_;
    std::string peer_;
    ConnectionState state_;
    uint64_t bytes_sent_;
    uint64_t bytes_received_;
};

// 将Body/编码器的输出直接写入连接
class ConnectionSink : public protocol::ByteSink {
public:
    explicit ConnectionSink(Connection& connection)
        : connection_(connection)
    {}

    utils::Result<void> write(const uint8_t* data, size_t len) override {
        return connection_.send_all(data, len);
    }

private:
    Connection& connection_;
};

} // namespace connection
} // namespace sync_http_client
