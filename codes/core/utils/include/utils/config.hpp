#pragma once

#include <cstdint>
#include <string>
#include "utils/error.hpp"

namespace sync_http_client {
namespace utils {

// ========== 配置数据结构 ==========

// TCP连接参数，0表示使用系统默认/不限时
struct ConnectionConfig {
    uint32_t connect_timeout_ms = 0;
    uint32_t read_timeout_ms = 0;
    bool nodelay = false;
    bool reuse_address = false;
    std::string local_address;
    uint32_t ttl = 64;
    uint32_t send_buffer_size = 0;
    uint32_t recv_buffer_size = 0;
    bool keepalive = false;
};

struct RequestConfig {
    std::string user_agent = "sync-http-client/1.0";
    std::string version = "HTTP/1.1";
    bool connection_close = true;
};

struct LoggingConfig {
    std::string level = "WARN";
    std::string file;
    bool console_output = true;
};

// ========== Config主类（防腐层） ==========
// 注意：头文件不包含nlohmann/json.hpp，完全隔离外部依赖

class Config {
public:
    Config();
    ~Config();

    Config(const Config&) = default;
    Config& operator=(const Config&) = default;

    // 从JSON文件加载配置，未出现的字段保持默认值
    Result<void> load_from_file(const std::string& file_path);

    // 从JSON字符串加载配置
    Result<void> load_from_string(const std::string& json_str);

    // 验证配置合法性
    Result<void> validate() const;

    // 按logging段初始化全局Logger
    Result<void> apply_logging() const;

    // ========== 获取配置项 ==========

    const ConnectionConfig& get_connection() const { return connection_; }
    const RequestConfig& get_request() const { return request_; }
    const LoggingConfig& get_logging() const { return logging_; }

    // ========== 设置配置项 ==========

    void set_connection(const ConnectionConfig& cfg) { connection_ = cfg; }
    void set_request(const RequestConfig& cfg) { request_ = cfg; }
    void set_logging(const LoggingConfig& cfg) { logging_ = cfg; }

    // 导出为JSON字符串
    Result<std::string> to_json_string() const;

private:
    ConnectionConfig connection_;
    RequestConfig request_;
    LoggingConfig logging_;
};

} // namespace utils
} // namespace sync_http_client
