#include "connection/connection.hpp"
#include "utils/logger.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace sync_http_client {
namespace connection {

namespace {

constexpr size_t RECV_CHUNK_SIZE = 16 * 1024;

bool set_blocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return false;
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) != -1;
}

bool set_int_option(int fd, int level, int name, int value) {
    return setsockopt(fd, level, name, &value, sizeof(value)) == 0;
}

std::string errno_string(int err) {
    return std::string(strerror(err));
}

// "ip:port" / "[ip]:port"
std::string format_address(const struct addrinfo* ai) {
    char ip[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;
    if (ai->ai_family == AF_INET) {
        const auto* sin = reinterpret_cast<const struct sockaddr_in*>(ai->ai_addr);
        inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip));
        port = ntohs(sin->sin_port);
        return std::string(ip) + ":" + std::to_string(port);
    }
    const auto* sin6 = reinterpret_cast<const struct sockaddr_in6*>(ai->ai_addr);
    inet_ntop(AF_INET6, &sin6->sin6_addr, ip, sizeof(ip));
    port = ntohs(sin6->sin6_port);
    return "[" + std::string(ip) + "]:" + std::to_string(port);
}

} // namespace

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::CONNECTED: return "CONNECTED";
        case ConnectionState::SENDING: return "SENDING";
        case ConnectionState::RECEIVING: return "RECEIVING";
        case ConnectionState::CLOSED: return "CLOSED";
        default: return "UNKNOWN";
    }
}

// TcpOptions
TcpOptions::TcpOptions()
    : connect_timeout_ms(0)
    , read_timeout_ms(0)
    , nodelay(false)
    , reuse_address(false)
    , local_address()
    , ttl(0)
    , send_buffer_size(0)
    , recv_buffer_size(0)
    , keepalive(false)
{
}

TcpOptions TcpOptions::from_config(const utils::ConnectionConfig& cfg) {
    TcpOptions options;
    options.connect_timeout_ms = cfg.connect_timeout_ms;
    options.read_timeout_ms = cfg.read_timeout_ms;
    options.nodelay = cfg.nodelay;
    options.reuse_address = cfg.reuse_address;
    options.local_address = cfg.local_address;
    options.ttl = cfg.ttl;
    options.send_buffer_size = cfg.send_buffer_size;
    options.recv_buffer_size = cfg.recv_buffer_size;
    options.keepalive = cfg.keepalive;
    return options;
}

// Connection
utils::Result<std::unique_ptr<Connection>> Connection::connect(const std::string& host,
                                                               uint16_t port,
                                                               const TcpOptions& options) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    std::string service = std::to_string(port);
    struct addrinfo* addrs = nullptr;
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &addrs);
    if (rc != 0) {
        LOG_WARN("Connection", "DNS lookup failed for %s: %s", host.c_str(), gai_strerror(rc));
        return utils::make_err<std::unique_ptr<Connection>>(
            utils::ErrorCode::NETWORK_CONNECT_ERROR,
            "Failed to resolve '" + host + "': " + gai_strerror(rc));
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addrs_guard(addrs, freeaddrinfo);

    utils::TimeoutChecker deadline(options.connect_timeout_ms);
    utils::ErrorCode last_code = utils::ErrorCode::NETWORK_CONNECT_ERROR;
    std::string last_message = "No address for '" + host + "'";

    for (const struct addrinfo* ai = addrs; ai != nullptr; ai = ai->ai_next) {
        if (deadline.is_timeout()) {
            last_code = utils::ErrorCode::TIMEOUT;
            last_message = "Connect to '" + host + "' timed out";
            break;
        }

        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_message = "Failed to create socket: " + errno_string(errno);
            continue;
        }
        // 从这里开始由Connection负责关闭fd
        std::unique_ptr<Connection> conn(
            new Connection(fd, format_address(ai), ConnectionState::CONNECTING));

        utils::Result<void> ret = conn->apply_options(ai->ai_family, options);
        if (ret.is_ok()) {
            ret = conn->connect_with_timeout(ai->ai_addr, ai->ai_addrlen, deadline);
        }
        if (ret.is_ok()) {
            conn->transition_to(ConnectionState::CONNECTED);
            LOG_DEBUG("Connection", "Connected to %s (%s)", host.c_str(), conn->get_peer().c_str());
            return utils::make_ok(std::move(conn));
        }

        LOG_DEBUG("Connection", "Connect to %s failed: %s",
                  conn->get_peer().c_str(), ret.error_message().c_str());
        last_code = ret.error_code();
        last_message = ret.error_message();
        if (last_code == utils::ErrorCode::TIMEOUT) {
            break;
        }
    }

    LOG_WARN("Connection", "Failed to connect to %s:%u: %s",
             host.c_str(), static_cast<unsigned>(port), last_message.c_str());
    return utils::make_err<std::unique_ptr<Connection>>(last_code, last_message);
}

Connection::Connection(int fd, const std::string& peer)
    : Connection(fd, peer, ConnectionState::CONNECTED)
{
}

Connection::Connection(int fd, const std::string& peer, ConnectionState initial_state)
    : fd_(fd)
    , peer_(peer)
    , state_(initial_state)
    , bytes_sent_(0)
    , bytes_received_(0)
{
}

Connection::~Connection() {
    close();
}

utils::Result<void> Connection::apply_options(int family, const TcpOptions& options) {
    if (options.nodelay && !set_int_option(fd_, IPPROTO_TCP, TCP_NODELAY, 1)) {
        return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                               "Failed to set TCP_NODELAY: " + errno_string(errno));
    }
    if (options.reuse_address && !set_int_option(fd_, SOL_SOCKET, SO_REUSEADDR, 1)) {
        return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                               "Failed to set SO_REUSEADDR: " + errno_string(errno));
    }
    if (options.keepalive && !set_int_option(fd_, SOL_SOCKET, SO_KEEPALIVE, 1)) {
        return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                               "Failed to set SO_KEEPALIVE: " + errno_string(errno));
    }
    if (options.send_buffer_size > 0 &&
        !set_int_option(fd_, SOL_SOCKET, SO_SNDBUF, static_cast<int>(options.send_buffer_size))) {
        return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                               "Failed to set SO_SNDBUF: " + errno_string(errno));
    }
    if (options.recv_buffer_size > 0 &&
        !set_int_option(fd_, SOL_SOCKET, SO_RCVBUF, static_cast<int>(options.recv_buffer_size))) {
        return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                               "Failed to set SO_RCVBUF: " + errno_string(errno));
    }
    if (options.ttl > 0) {
        bool ok = (family == AF_INET6)
            ? set_int_option(fd_, IPPROTO_IPV6, IPV6_UNICAST_HOPS, static_cast<int>(options.ttl))
            : set_int_option(fd_, IPPROTO_IP, IP_TTL, static_cast<int>(options.ttl));
        if (!ok) {
            return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                                   "Failed to set TTL: " + errno_string(errno));
        }
    }

    if (!options.local_address.empty()) {
        struct sockaddr_storage local;
        std::memset(&local, 0, sizeof(local));
        socklen_t local_len = 0;
        if (family == AF_INET6) {
            auto* sin6 = reinterpret_cast<struct sockaddr_in6*>(&local);
            sin6->sin6_family = AF_INET6;
            if (inet_pton(AF_INET6, options.local_address.c_str(), &sin6->sin6_addr) != 1) {
                return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                                       "Local address is not IPv6: " + options.local_address);
            }
            local_len = sizeof(struct sockaddr_in6);
        } else {
            auto* sin = reinterpret_cast<struct sockaddr_in*>(&local);
            sin->sin_family = AF_INET;
            if (inet_pton(AF_INET, options.local_address.c_str(), &sin->sin_addr) != 1) {
                return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                                       "Local address is not IPv4: " + options.local_address);
            }
            local_len = sizeof(struct sockaddr_in);
        }
        if (bind(fd_, reinterpret_cast<struct sockaddr*>(&local), local_len) < 0) {
            return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                                   "Failed to bind " + options.local_address + ": " +
                                   errno_string(errno));
        }
    }
    return utils::make_ok();
}

utils::Result<void> Connection::connect_with_timeout(const struct sockaddr* addr,
                                                     socklen_t addr_len,
                                                     const utils::TimeoutChecker& deadline) {
    if (!set_blocking(fd_, false)) {
        return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                               "Failed to set non-blocking: " + errno_string(errno));
    }

    if (::connect(fd_, addr, addr_len) < 0) {
        if (errno != EINPROGRESS) {
            return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                                   "Connect to " + peer_ + " failed: " + errno_string(errno));
        }

        while (true) {
            struct pollfd pfd;
            pfd.fd = fd_;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            int n = poll(&pfd, 1, deadline.remaining_poll_ms());
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                                       "poll failed: " + errno_string(errno));
            }
            if (n == 0) {
                return utils::make_err(utils::ErrorCode::TIMEOUT,
                                       "Connect to " + peer_ + " timed out");
            }
            break;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                                   "getsockopt(SO_ERROR) failed: " + errno_string(errno));
        }
        if (so_error != 0) {
            return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                                   "Connect to " + peer_ + " failed: " + errno_string(so_error));
        }
    }

    if (!set_blocking(fd_, true)) {
        return utils::make_err(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                               "Failed to restore blocking mode: " + errno_string(errno));
    }
    return utils::make_ok();
}

utils::Result<void> Connection::send_all(const uint8_t* data, size_t len) {
    if (fd_ < 0) {
        return utils::make_err(utils::ErrorCode::NETWORK_CLOSED, "Connection is closed");
    }
    transition_to(ConnectionState::SENDING);

    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("Connection", "Send to %s failed: %s", peer_.c_str(), strerror(errno));
            return utils::make_err(utils::ErrorCode::IO_ERROR,
                                   "Send to " + peer_ + " failed: " + errno_string(errno));
        }
        sent += static_cast<size_t>(n);
    }
    bytes_sent_ += len;
    return utils::make_ok();
}

utils::Result<void> Connection::send_all(const std::string& data) {
    return send_all(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

utils::Result<void> Connection::receive_until_framed(protocol::ResponseParser* parser,
                                                     uint64_t timeout_ms) {
    if (parser == nullptr) {
        return utils::make_err(utils::ErrorCode::INVALID_ARGUMENT, "parser is null");
    }
    if (fd_ < 0) {
        return utils::make_err(utils::ErrorCode::NETWORK_CLOSED, "Connection is closed");
    }
    transition_to(ConnectionState::RECEIVING);

    utils::TimeoutChecker deadline(timeout_ms);
    std::vector<uint8_t> chunk(RECV_CHUNK_SIZE);

    while (!parser->is_complete()) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int n = poll(&pfd, 1, deadline.remaining_poll_ms());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return utils::make_err(utils::ErrorCode::IO_ERROR, "poll failed: " + errno_string(errno));
        }
        if (n == 0) {
            LOG_WARN("Connection", "Read from %s timed out after %llu ms",
                     peer_.c_str(), static_cast<unsigned long long>(timeout_ms));
            return utils::make_err(utils::ErrorCode::TIMEOUT,
                                   "Read from " + peer_ + " timed out after " +
                                   std::to_string(timeout_ms) + " ms");
        }

        ssize_t received = ::recv(fd_, chunk.data(), chunk.size(), 0);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            // 发完响应后直接RST的对端按关闭处理
            if (errno != ECONNRESET) {
                return utils::make_err(utils::ErrorCode::IO_ERROR,
                                       "Read from " + peer_ + " failed: " + errno_string(errno));
            }
            received = 0;
        }

        if (received == 0) {
            if (!parser->headers_complete()) {
                return utils::make_err(utils::ErrorCode::NETWORK_CLOSED,
                                       "Connection closed by " + peer_ +
                                       " before the response head was complete");
            }
            utils::Result<protocol::ParseResult> ret = parser->finish();
            if (ret.is_err()) {
                return utils::forward_err<void>(ret);
            }
            break;
        }

        bytes_received_ += static_cast<uint64_t>(received);
        utils::Result<protocol::ParseResult> ret =
            parser->feed(chunk.data(), static_cast<size_t>(received));
        if (ret.is_err()) {
            return utils::forward_err<void>(ret);
        }
    }
    return utils::make_ok();
}

void Connection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
        LOG_DEBUG("Connection", "Closed connection to %s (sent=%llu, received=%llu)",
                  peer_.c_str(), static_cast<unsigned long long>(bytes_sent_),
                  static_cast<unsigned long long>(bytes_received_));
    }
    transition_to(ConnectionState::CLOSED);
}

void Connection::transition_to(ConnectionState new_state) {
    if (state_ == new_state || state_ == ConnectionState::CLOSED) {
        return;
    }
    state_ = new_state;
}

} // namespace connection
} // namespace sync_http_client
