// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: http_parser.hpp
//  描述: ResponseParser类定义 - HTTP/1.x响应增量解析状态机
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include "protocol/http_message.hpp"
#include "utils/buffer.hpp"
#include <string>
#include <vector>

namespace sync_http_client {
namespace protocol {

// ==================== 响应解析器类 ====================
// 数据可以任意切分后多次feed，解析结果与一次性输入相同
class ResponseParser {
public:
    enum class State : uint8_t {
        STATUS_LINE = 0,
        HEADERS,
        BODY_LENGTH,        // Content-Length定长body
        CHUNK_SIZE,
        CHUNK_DATA,
        CHUNK_DATA_CRLF,
        TRAILERS,
        BODY_UNTIL_CLOSE,   // 读到连接关闭为止
        COMPLETE,
        FAILED
    };

    /**
     * @brief 构造函数
     * @param request_method 对应请求的方法，HEAD的响应没有body
     */
    explicit ResponseParser(Method request_method = Method::GET);

    ~ResponseParser();

    ResponseParser(const ResponseParser&) = delete;
    ResponseParser& operator=(const ResponseParser&) = delete;

    /**
     * @brief 输入数据并尽可能推进解析
     * @return OK响应已完整，NEED_MORE需要更多数据，失败返回对应错误码
     * @note 失败后解析器停留在FAILED，后续调用返回同一错误；完整后多余的数据不会被消费
     */
    utils::Result<ParseResult> feed(const uint8_t* data, size_t len);
    utils::Result<ParseResult> feed(const std::string& data);

    /**
     * @brief 通知对端已关闭
     * @return 以关闭为结束的body在此完成；其他未完成的状态返回UNEXPECTED_EOF
     */
    utils::Result<ParseResult> finish();

    bool is_complete() const { return state_ == State::COMPLETE; }
    bool headers_complete() const { return head_complete_; }
    State state() const { return state_; }

    // 未被消费的字节数（完整后剩余的多余数据）
    size_t buffered_bytes() const { return buffer_.readable_bytes(); }

    /**
     * @brief 取走已完成的响应，仅在is_complete()时有意义
     */
    HttpResponse take_response();

    /**
     * @brief 重置解析器以解析新的响应
     */
    void reset(Method request_method);

    /**
     * @brief 一次性解析完整字节序列（末尾视为连接关闭）
     */
    static utils::Result<HttpResponse> parse(const uint8_t* data, size_t len,
                                             Method request_method = Method::GET);
    static utils::Result<HttpResponse> parse(const std::string& data,
                                             Method request_method = Method::GET);

private:
    enum class LineResult {
        LINE,
        NEED_MORE,
        TOO_LONG
    };

    utils::Result<ParseResult> advance();

    LineResult read_line(std::string* line);
    utils::Result<void> parse_status_line(const std::string& line);
    utils::Result<void> parse_header_line(const std::string& line);
    utils::Result<void> parse_chunk_size(const std::string& line);
    utils::Result<void> select_body_framing();
    void consume_body(uint64_t limit);
    void complete();

    utils::Result<ParseResult> fail(utils::ErrorCode code, const std::string& message);

    utils::Buffer buffer_;
    State state_;
    Method request_method_;
    HttpResponse response_;
    std::vector<uint8_t> body_;
    uint64_t remaining_;
    size_t header_count_;
    size_t trailer_count_;
    bool head_complete_;
    utils::ErrorCode error_code_;
    std::string error_message_;
};

const char* parser_state_to_string(ResponseParser::State state);

} // namespace protocol
} // namespace sync_http_client

// 文件结束
