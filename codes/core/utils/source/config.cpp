#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <stdexcept>

// 仅在cpp文件中包含nlohmann/json，头文件不暴露
#include <nlohmann/json.hpp>

namespace sync_http_client {
namespace utils {

using json = nlohmann::json;

namespace details {

template<typename T>
void read_field(const json& section, const char* key, T* out) {
    if (section.contains(key)) {
        *out = section.at(key).get<T>();
    }
}

// 解析json到配置结构体，类型不匹配时抛出json::type_error，由调用方统一转换
void parse_json_to_config(const json& j,
                          ConnectionConfig& connection,
                          RequestConfig& request,
                          LoggingConfig& logging) {
    if (!j.is_object()) {
        throw std::invalid_argument("config root must be a JSON object");
    }

    if (j.contains("connection")) {
        const auto& c = j["connection"];
        read_field(c, "connect_timeout_ms", &connection.connect_timeout_ms);
        read_field(c, "read_timeout_ms", &connection.read_timeout_ms);
        read_field(c, "nodelay", &connection.nodelay);
        read_field(c, "reuse_address", &connection.reuse_address);
        read_field(c, "local_address", &connection.local_address);
        read_field(c, "ttl", &connection.ttl);
        read_field(c, "send_buffer_size", &connection.send_buffer_size);
        read_field(c, "recv_buffer_size", &connection.recv_buffer_size);
        read_field(c, "keepalive", &connection.keepalive);
    }

    if (j.contains("request")) {
        const auto& r = j["request"];
        read_field(r, "user_agent", &request.user_agent);
        read_field(r, "version", &request.version);
        read_field(r, "connection_close", &request.connection_close);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        read_field(l, "level", &logging.level);
        read_field(l, "file", &logging.file);
        read_field(l, "console_output", &logging.console_output);
    }
}

} // namespace details

Config::Config() = default;
Config::~Config() = default;

Result<void> Config::load_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_err(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + file_path);
    }

    try {
        json j;
        file >> j;
        details::parse_json_to_config(j, connection_, request_, logging_);
        return make_ok();
    } catch (const json::parse_error& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("JSON parse error: ") + e.what());
    } catch (const json::exception& e) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, std::string("JSON type error: ") + e.what());
    } catch (const std::exception& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("Failed to load config: ") + e.what());
    }
}

Result<void> Config::load_from_string(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        details::parse_json_to_config(j, connection_, request_, logging_);
        return make_ok();
    } catch (const json::parse_error& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("JSON parse error: ") + e.what());
    } catch (const json::exception& e) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, std::string("JSON type error: ") + e.what());
    } catch (const std::exception& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("Failed to load config: ") + e.what());
    }
}

Result<void> Config::validate() const {
    if (connection_.ttl == 0 || connection_.ttl > 255) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "Invalid ttl: " + std::to_string(connection_.ttl));
    }

    if (request_.version != "HTTP/1.0" && request_.version != "HTTP/1.1") {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "Invalid HTTP version: " + request_.version);
    }

    // User-Agent会原样写入请求头
    if (request_.user_agent.find_first_of("\r\n") != std::string::npos) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "User-Agent must not contain CR or LF");
    }

    LogLevel level;
    if (!string_to_log_level(logging_.level, &level)) {
        return make_err(ErrorCode::CONFIG_INVALID_LOG_LEVEL, "Invalid log level: " + logging_.level);
    }

    return make_ok();
}

Result<void> Config::apply_logging() const {
    LogLevel level;
    if (!string_to_log_level(logging_.level, &level)) {
        return make_err(ErrorCode::CONFIG_INVALID_LOG_LEVEL, "Invalid log level: " + logging_.level);
    }

    Logger& logger = Logger::instance();
    logger.set_console_output(logging_.console_output);
    if (logger.init(level, logging_.file) != 0) {
        return make_err(ErrorCode::IO_ERROR, "Cannot open log file: " + logging_.file);
    }
    return make_ok();
}

Result<std::string> Config::to_json_string() const {
    try {
        json j;
        j["connection"]["connect_timeout_ms"] = connection_.connect_timeout_ms;
        j["connection"]["read_timeout_ms"] = connection_.read_timeout_ms;
        j["connection"]["nodelay"] = connection_.nodelay;
        j["connection"]["reuse_address"] = connection_.reuse_address;
        j["connection"]["local_address"] = connection_.local_address;
        j["connection"]["ttl"] = connection_.ttl;
        j["connection"]["send_buffer_size"] = connection_.send_buffer_size;
        j["connection"]["recv_buffer_size"] = connection_.recv_buffer_size;
        j["connection"]["keepalive"] = connection_.keepalive;

        j["request"]["user_agent"] = request_.user_agent;
        j["request"]["version"] = request_.version;
        j["request"]["connection_close"] = request_.connection_close;

        j["logging"]["level"] = logging_.level;
        j["logging"]["file"] = logging_.file;
        j["logging"]["console_output"] = logging_.console_output;

        return make_ok(j.dump(4));
    } catch (const json::exception& e) {
        return make_err<std::string>(ErrorCode::OPERATION_FAILED,
                                     std::string("Failed to serialize config to JSON: ") + e.what());
    }
}

} // namespace utils
} // namespace sync_http_client
