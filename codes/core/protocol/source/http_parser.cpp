// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: http_parser.cpp
//  描述: ResponseParser类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_parser.hpp"
#include "protocol/protocol_utils.hpp"
#include <algorithm>
#include <utility>

namespace sync_http_client {
namespace protocol {

namespace {

constexpr size_t MAX_CONTENT_LENGTH_DIGITS = 19;  // 不会溢出uint64_t
constexpr size_t MAX_CHUNK_SIZE_DIGITS = 16;

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool parse_decimal(const std::string& text, uint64_t* value) {
    if (text.empty() || text.size() > MAX_CONTENT_LENGTH_DIGITS) {
        return false;
    }
    uint64_t n = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        n = n * 10 + static_cast<uint64_t>(c - '0');
    }
    *value = n;
    return true;
}

bool is_no_body_status(uint16_t code) {
    return (code >= 100 && code < 200) || code == 204 || code == 304;
}

} // namespace

const char* parser_state_to_string(ResponseParser::State state) {
    switch (state) {
        case ResponseParser::State::STATUS_LINE: return "STATUS_LINE";
        case ResponseParser::State::HEADERS: return "HEADERS";
        case ResponseParser::State::BODY_LENGTH: return "BODY_LENGTH";
        case ResponseParser::State::CHUNK_SIZE: return "CHUNK_SIZE";
        case ResponseParser::State::CHUNK_DATA: return "CHUNK_DATA";
        case ResponseParser::State::CHUNK_DATA_CRLF: return "CHUNK_DATA_CRLF";
        case ResponseParser::State::TRAILERS: return "TRAILERS";
        case ResponseParser::State::BODY_UNTIL_CLOSE: return "BODY_UNTIL_CLOSE";
        case ResponseParser::State::COMPLETE: return "COMPLETE";
        case ResponseParser::State::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

// ==================== ResponseParser实现 ====================

ResponseParser::ResponseParser(Method request_method)
    : buffer_()
    , state_(State::STATUS_LINE)
    , request_method_(request_method)
    , response_()
    , body_()
    , remaining_(0)
    , header_count_(0)
    , trailer_count_(0)
    , head_complete_(false)
    , error_code_(utils::ErrorCode::SUCCESS)
    , error_message_()
{
}

ResponseParser::~ResponseParser() = default;

void ResponseParser::reset(Method request_method) {
    buffer_.clear();
    state_ = State::STATUS_LINE;
    request_method_ = request_method;
    response_ = HttpResponse();
    body_.clear();
    remaining_ = 0;
    header_count_ = 0;
    trailer_count_ = 0;
    head_complete_ = false;
    error_code_ = utils::ErrorCode::SUCCESS;
    error_message_.clear();
}

utils::Result<ParseResult> ResponseParser::feed(const uint8_t* data, size_t len) {
    if (state_ == State::FAILED) {
        return utils::make_err<ParseResult>(error_code_, error_message_);
    }

    // 分片写入，完整后不再接收多余数据
    size_t offset = 0;
    do {
        if (state_ == State::COMPLETE) {
            return utils::make_ok(ParseResult::OK);
        }
        size_t slice = std::min(len - offset, BODY_CHUNK_SIZE);
        if (slice > 0 && buffer_.write(data + offset, slice) != slice) {
            return fail(utils::ErrorCode::OPERATION_FAILED, "Parser buffer overflow");
        }
        offset += slice;

        utils::Result<ParseResult> ret = advance();
        if (ret.is_err() || ret.value() == ParseResult::OK) {
            return ret;
        }
    } while (offset < len);

    return utils::make_ok(ParseResult::NEED_MORE);
}

utils::Result<ParseResult> ResponseParser::feed(const std::string& data) {
    return feed(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

utils::Result<ParseResult> ResponseParser::finish() {
    switch (state_) {
        case State::COMPLETE:
            return utils::make_ok(ParseResult::OK);
        case State::FAILED:
            return utils::make_err<ParseResult>(error_code_, error_message_);
        case State::BODY_UNTIL_CLOSE:
            complete();
            return utils::make_ok(ParseResult::OK);
        case State::STATUS_LINE:
        case State::HEADERS:
            return fail(utils::ErrorCode::UNEXPECTED_EOF,
                        "Connection closed before response head was complete");
        default:
            return fail(utils::ErrorCode::UNEXPECTED_EOF,
                        std::string("Connection closed inside response body (state ") +
                        parser_state_to_string(state_) + ")");
    }
}

HttpResponse ResponseParser::take_response() {
    HttpResponse response = std::move(response_);
    response_ = HttpResponse();
    return response;
}

utils::Result<HttpResponse> ResponseParser::parse(const uint8_t* data, size_t len,
                                                  Method request_method) {
    ResponseParser parser(request_method);
    utils::Result<ParseResult> ret = parser.feed(data, len);
    if (ret.is_err()) {
        return utils::forward_err<HttpResponse>(ret);
    }
    ret = parser.finish();
    if (ret.is_err()) {
        return utils::forward_err<HttpResponse>(ret);
    }
    return utils::make_ok(parser.take_response());
}

utils::Result<HttpResponse> ResponseParser::parse(const std::string& data, Method request_method) {
    return parse(reinterpret_cast<const uint8_t*>(data.data()), data.size(), request_method);
}

utils::Result<ParseResult> ResponseParser::advance() {
    while (true) {
        switch (state_) {
            case State::STATUS_LINE: {
                std::string line;
                LineResult lr = read_line(&line);
                if (lr == LineResult::NEED_MORE) {
                    return utils::make_ok(ParseResult::NEED_MORE);
                }
                if (lr == LineResult::TOO_LONG) {
                    return fail(utils::ErrorCode::MALFORMED_STATUS_LINE, "Status line too long");
                }
                utils::Result<void> ret = parse_status_line(line);
                if (ret.is_err()) {
                    return fail(ret.error_code(), ret.error_message());
                }
                state_ = State::HEADERS;
                break;
            }

            case State::HEADERS: {
                std::string line;
                LineResult lr = read_line(&line);
                if (lr == LineResult::NEED_MORE) {
                    return utils::make_ok(ParseResult::NEED_MORE);
                }
                if (lr == LineResult::TOO_LONG) {
                    return fail(utils::ErrorCode::MALFORMED_HEADER_LINE, "Header line too long");
                }
                // 空行表示头部结束
                if (line.empty()) {
                    head_complete_ = true;
                }
                utils::Result<void> ret = line.empty() ? select_body_framing()
                                                       : parse_header_line(line);
                if (ret.is_err()) {
                    return fail(ret.error_code(), ret.error_message());
                }
                break;
            }

            case State::BODY_LENGTH:
                remaining_ -= buffer_.read_append(&body_, static_cast<size_t>(
                    std::min<uint64_t>(remaining_, buffer_.readable_bytes())));
                if (remaining_ > 0) {
                    return utils::make_ok(ParseResult::NEED_MORE);
                }
                complete();
                break;

            case State::CHUNK_SIZE: {
                std::string line;
                LineResult lr = read_line(&line);
                if (lr == LineResult::NEED_MORE) {
                    return utils::make_ok(ParseResult::NEED_MORE);
                }
                if (lr == LineResult::TOO_LONG) {
                    return fail(utils::ErrorCode::MALFORMED_CHUNK_SIZE, "Chunk size line too long");
                }
                utils::Result<void> ret = parse_chunk_size(line);
                if (ret.is_err()) {
                    return fail(ret.error_code(), ret.error_message());
                }
                break;
            }

            case State::CHUNK_DATA:
                remaining_ -= buffer_.read_append(&body_, static_cast<size_t>(
                    std::min<uint64_t>(remaining_, buffer_.readable_bytes())));
                if (remaining_ > 0) {
                    return utils::make_ok(ParseResult::NEED_MORE);
                }
                state_ = State::CHUNK_DATA_CRLF;
                break;

            case State::CHUNK_DATA_CRLF: {
                size_t readable = buffer_.readable_bytes();
                const uint8_t* p = buffer_.read_ptr();
                if ((readable >= 1 && p[0] != '\r') || (readable >= 2 && p[1] != '\n')) {
                    return fail(utils::ErrorCode::MALFORMED_CHUNK_SIZE,
                                "Missing CRLF after chunk data");
                }
                if (readable < 2) {
                    return utils::make_ok(ParseResult::NEED_MORE);
                }
                buffer_.skip(2);
                state_ = State::CHUNK_SIZE;
                break;
            }

            case State::TRAILERS: {
                std::string line;
                LineResult lr = read_line(&line);
                if (lr == LineResult::NEED_MORE) {
                    return utils::make_ok(ParseResult::NEED_MORE);
                }
                if (lr == LineResult::TOO_LONG) {
                    return fail(utils::ErrorCode::MALFORMED_HEADER_LINE, "Trailer line too long");
                }
                if (line.empty()) {
                    complete();
                    break;
                }
                // trailer不合并到响应头部，校验后丢弃
                if (++trailer_count_ > MAX_HEADERS) {
                    return fail(utils::ErrorCode::MALFORMED_HEADER_LINE, "Too many trailer lines");
                }
                if (line.find(':') == std::string::npos) {
                    return fail(utils::ErrorCode::MALFORMED_HEADER_LINE,
                                "Trailer line without colon");
                }
                break;
            }

            case State::BODY_UNTIL_CLOSE:
                buffer_.read_append(&body_, buffer_.readable_bytes());
                return utils::make_ok(ParseResult::NEED_MORE);

            case State::COMPLETE:
                return utils::make_ok(ParseResult::OK);

            case State::FAILED:
            default:
                return utils::make_err<ParseResult>(error_code_, error_message_);
        }
    }
}

ResponseParser::LineResult ResponseParser::read_line(std::string* line) {
    size_t pos = buffer_.find_crlf(0);
    if (pos == utils::Buffer::NPOS) {
        // 末尾可能是CRLF的前半个'\r'
        if (buffer_.readable_bytes() > MAX_LINE_LEN + 1) {
            return LineResult::TOO_LONG;
        }
        return LineResult::NEED_MORE;
    }
    if (pos > MAX_LINE_LEN) {
        return LineResult::TOO_LONG;
    }
    line->assign(reinterpret_cast<const char*>(buffer_.read_ptr()), pos);
    buffer_.skip(pos + 2);
    return LineResult::LINE;
}

utils::Result<void> ResponseParser::parse_status_line(const std::string& line) {
    // <VERSION> SP <3DIGIT> [SP <reason>]
    size_t sp = line.find(' ');
    if (sp == std::string::npos) {
        return utils::make_err(utils::ErrorCode::MALFORMED_STATUS_LINE,
                               "Malformed status line: '" + line + "'");
    }

    utils::Result<Version> version = parse_version(line.substr(0, sp));
    if (version.is_err()) {
        return utils::make_err(utils::ErrorCode::MALFORMED_STATUS_LINE,
                               "Unsupported version in status line: '" + line + "'");
    }

    size_t code_pos = sp + 1;
    if (line.size() < code_pos + 3) {
        return utils::make_err(utils::ErrorCode::MALFORMED_STATUS_LINE,
                               "Status code is not 3 digits: '" + line + "'");
    }
    int code = 0;
    for (size_t i = code_pos; i < code_pos + 3; ++i) {
        if (line[i] < '0' || line[i] > '9') {
            return utils::make_err(utils::ErrorCode::MALFORMED_STATUS_LINE,
                                   "Status code is not 3 digits: '" + line + "'");
        }
        code = code * 10 + (line[i] - '0');
    }
    size_t after_code = code_pos + 3;
    if (line.size() > after_code && line[after_code] != ' ') {
        return utils::make_err(utils::ErrorCode::MALFORMED_STATUS_LINE,
                               "Status code is not 3 digits: '" + line + "'");
    }

    utils::Result<StatusCode> status = StatusCode::from(code);
    if (status.is_err()) {
        return utils::forward_err<void>(status);
    }

    response_.version_ = version.value();
    response_.status_ = status.value();
    response_.reason_ = line.size() > after_code ? line.substr(after_code + 1) : std::string();
    return utils::make_ok();
}

utils::Result<void> ResponseParser::parse_header_line(const std::string& line) {
    if (line[0] == ' ' || line[0] == '\t') {
        return utils::make_err(utils::ErrorCode::MALFORMED_HEADER_LINE,
                               "Folded header lines are not supported");
    }
    if (++header_count_ > MAX_HEADERS) {
        return utils::make_err(utils::ErrorCode::MALFORMED_HEADER_LINE,
                               "Too many headers (max " + std::to_string(MAX_HEADERS) + ")");
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return utils::make_err(utils::ErrorCode::MALFORMED_HEADER_LINE,
                               "Header line without colon: '" + line + "'");
    }

    utils::Result<void> ret = response_.headers_.append(line.substr(0, colon),
                                                        TrimOws(line.substr(colon + 1)));
    if (ret.is_err()) {
        // 收到的非法头部属于协议错误
        return utils::make_err(utils::ErrorCode::MALFORMED_HEADER_LINE, ret.error_message());
    }
    return utils::make_ok();
}

utils::Result<void> ResponseParser::select_body_framing() {
    const HeaderMap& headers = response_.headers_;

    // 1. 无body的响应，忽略头部
    if (request_method_ == Method::HEAD || is_no_body_status(response_.status_.code())) {
        complete();
        return utils::make_ok();
    }

    // 2. chunked
    std::vector<std::string> te_values = headers.get_all("Transfer-Encoding");
    if (!te_values.empty()) {
        state_ = State::BODY_UNTIL_CLOSE;
        for (const auto& value : te_values) {
            if (ListContainsToken(value, "chunked")) {
                state_ = State::CHUNK_SIZE;
                break;
            }
        }
        // 没有chunked时只能以关闭结束
        return utils::make_ok();
    }

    // 3. Content-Length，多个值必须一致
    bool has_length = false;
    uint64_t length = 0;
    for (const auto& raw : headers.get_all("Content-Length")) {
        size_t start = 0;
        while (true) {
            size_t comma = raw.find(',', start);
            std::string item = TrimOws(raw.substr(start, comma == std::string::npos
                                                             ? std::string::npos
                                                             : comma - start));
            uint64_t n = 0;
            if (!parse_decimal(item, &n)) {
                return utils::make_err(utils::ErrorCode::INVALID_CONTENT_LENGTH,
                                       "Invalid Content-Length: '" + raw + "'");
            }
            if (has_length && n != length) {
                return utils::make_err(utils::ErrorCode::INVALID_CONTENT_LENGTH,
                                       "Conflicting Content-Length values");
            }
            has_length = true;
            length = n;
            if (comma == std::string::npos) {
                break;
            }
            start = comma + 1;
        }
    }
    if (has_length) {
        remaining_ = length;
        if (remaining_ == 0) {
            complete();
        } else {
            state_ = State::BODY_LENGTH;
        }
        return utils::make_ok();
    }

    // 4. 读到连接关闭
    state_ = State::BODY_UNTIL_CLOSE;
    return utils::make_ok();
}

utils::Result<void> ResponseParser::parse_chunk_size(const std::string& line) {
    // 忽略chunk-extension
    std::string size_text = line;
    size_t semi = size_text.find(';');
    if (semi != std::string::npos) {
        size_text.erase(semi);
    }
    size_text = TrimOws(size_text);

    if (size_text.empty() || size_text.size() > MAX_CHUNK_SIZE_DIGITS) {
        return utils::make_err(utils::ErrorCode::MALFORMED_CHUNK_SIZE,
                               "Invalid chunk size line: '" + line + "'");
    }
    uint64_t size = 0;
    for (char c : size_text) {
        int v = hex_value(c);
        if (v < 0) {
            return utils::make_err(utils::ErrorCode::MALFORMED_CHUNK_SIZE,
                                   "Invalid chunk size line: '" + line + "'");
        }
        size = (size << 4) | static_cast<uint64_t>(v);
    }

    if (size == 0) {
        state_ = State::TRAILERS;
    } else {
        remaining_ = size;
        state_ = State::CHUNK_DATA;
    }
    return utils::make_ok();
}

void ResponseParser::complete() {
    if (body_.empty()) {
        response_.body_ = Body::empty();
    } else {
        response_.body_ = Body::from_bytes(std::move(body_));
        body_.clear();
    }
    state_ = State::COMPLETE;
}

utils::Result<ParseResult> ResponseParser::fail(utils::ErrorCode code, const std::string& message) {
    state_ = State::FAILED;
    error_code_ = code;
    error_message_ = message;
    return utils::make_err<ParseResult>(code, message);
}

} // namespace protocol
} // namespace sync_http_client

// 文件结束
