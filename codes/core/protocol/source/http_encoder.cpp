// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: http_encoder.cpp
//  描述: HttpEncoder类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_encoder.hpp"
#include "protocol/protocol_utils.hpp"
#include <cstdio>
#include <string>

namespace sync_http_client {
namespace protocol {

namespace {

const char* const CRLF = "\r\n";

bool append(utils::Buffer* out, const std::string& text) {
    return text.empty() || out->write(text) == text.size();
}

} // namespace

const char* framing_mode_to_string(FramingMode mode) {
    switch (mode) {
        case FramingMode::CONTENT_LENGTH: return "CONTENT_LENGTH";
        case FramingMode::CHUNKED: return "CHUNKED";
        default: return "UNKNOWN";
    }
}

// ==================== ChunkedSink实现 ====================

ChunkedSink::ChunkedSink(ByteSink& inner)
    : inner_(inner)
{
}

utils::Result<void> ChunkedSink::write(const uint8_t* data, size_t len) {
    // 零长度块会提前终止body
    if (len == 0) {
        return utils::make_ok();
    }

    char size_line[32];
    int n = snprintf(size_line, sizeof(size_line), "%zx\r\n", len);
    utils::Result<void> ret = inner_.write(reinterpret_cast<const uint8_t*>(size_line),
                                           static_cast<size_t>(n));
    if (ret.is_err()) {
        return ret;
    }
    ret = inner_.write(data, len);
    if (ret.is_err()) {
        return ret;
    }
    return inner_.write(reinterpret_cast<const uint8_t*>(CRLF), 2);
}

utils::Result<void> ChunkedSink::finish() {
    static const char TERMINATOR[] = "0\r\n\r\n";
    return inner_.write(reinterpret_cast<const uint8_t*>(TERMINATOR), sizeof(TERMINATOR) - 1);
}

// ==================== HttpEncoder实现 ====================

utils::Result<FramingMode> HttpEncoder::select_framing(const HttpRequest& request,
                                                       uint64_t* content_length) {
    const HeaderMap& headers = request.headers();
    bool is_http10 = request.version() == Version::HTTP_1_0;

    std::vector<std::string> te_values = headers.get_all("Transfer-Encoding");
    if (!te_values.empty()) {
        if (is_http10) {
            return utils::make_err<FramingMode>(utils::ErrorCode::AMBIGUOUS_BODY_FRAMING,
                                                "Transfer-Encoding is not allowed in HTTP/1.0");
        }
        for (const auto& value : te_values) {
            if (ListContainsToken(value, "chunked")) {
                return utils::make_ok(FramingMode::CHUNKED);
            }
        }
        return utils::make_err<FramingMode>(utils::ErrorCode::AMBIGUOUS_BODY_FRAMING,
                                            "Transfer-Encoding without chunked: " +
                                            te_values.front());
    }

    uint64_t length = 0;
    if (request.body().known_length(&length)) {
        if (content_length) {
            *content_length = length;
        }
        return utils::make_ok(FramingMode::CONTENT_LENGTH);
    }

    if (is_http10) {
        return utils::make_err<FramingMode>(utils::ErrorCode::AMBIGUOUS_BODY_FRAMING,
                                            "Body length unknown and HTTP/1.0 has no chunked encoding");
    }
    return utils::make_ok(FramingMode::CHUNKED);
}

utils::Result<FramingMode> HttpEncoder::encode_head(const HttpRequest& request,
                                                    utils::Buffer* out) {
    uint64_t content_length = 0;
    utils::Result<FramingMode> framing = select_framing(request, &content_length);
    if (framing.is_err()) {
        return framing;
    }
    FramingMode mode = framing.value();
    const HeaderMap& headers = request.headers();

    // 1. 请求行
    std::string head;
    head += method_to_string(request.method());
    head += ' ';
    head += request.url().request_target();
    head += ' ';
    head += version_to_string(request.version());
    head += CRLF;

    // 2. 头部
    if (!headers.contains("Host")) {
        head += "Host: " + request.url().host_header() + CRLF;
    }
    bool user_te = headers.contains("Transfer-Encoding");
    for (const auto& field : headers) {
        // 长度由编码器计算，调用方的值一律丢弃
        if (EqualsIgnoreCase(field.name, "Content-Length")) {
            continue;
        }
        head += field.name + ": " + field.value + CRLF;
    }
    if (mode == FramingMode::CONTENT_LENGTH) {
        head += "Content-Length: " + std::to_string(content_length) + CRLF;
    } else if (!user_te) {
        head += "Transfer-Encoding: chunked";
        head += CRLF;
    }

    // 3. 空行
    head += CRLF;

    if (!append(out, head)) {
        return utils::make_err<FramingMode>(utils::ErrorCode::OPERATION_FAILED,
                                            "Request head exceeds buffer capacity");
    }
    return utils::make_ok(std::move(mode));
}

utils::Result<void> HttpEncoder::encode_body(const HttpRequest& request, FramingMode mode,
                                             ByteSink& sink) {
    if (mode == FramingMode::CONTENT_LENGTH) {
        return request.body().write_to(sink);
    }

    ChunkedSink chunked(sink);
    utils::Result<void> ret = request.body().write_to(chunked);
    if (ret.is_err()) {
        return ret;
    }
    return chunked.finish();
}

utils::Result<std::vector<uint8_t>> HttpEncoder::encode(const HttpRequest& request) {
    utils::Buffer head;
    utils::Result<FramingMode> mode = encode_head(request, &head);
    if (mode.is_err()) {
        return utils::forward_err<std::vector<uint8_t>>(mode);
    }

    VectorSink sink;
    utils::Result<void> ret = sink.write(head.read_ptr(), head.readable_bytes());
    if (ret.is_err()) {
        return utils::forward_err<std::vector<uint8_t>>(ret);
    }
    ret = encode_body(request, mode.value(), sink);
    if (ret.is_err()) {
        return utils::forward_err<std::vector<uint8_t>>(ret);
    }
    return utils::make_ok(sink.take_bytes());
}

} // namespace protocol
} // namespace sync_http_client

// 文件结束
