// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: http_encoder.hpp
//  描述: HttpEncoder类定义 - 请求序列化
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/http_message.hpp"
#include "utils/buffer.hpp"
#include <cstdint>
#include <vector>

namespace sync_http_client {
namespace protocol {

// ==================== body分帧方式 ====================
enum class FramingMode : uint8_t {
    CONTENT_LENGTH = 0,  // 原样发送body，头部带Content-Length
    CHUNKED = 1          // Transfer-Encoding: chunked
};

const char* framing_mode_to_string(FramingMode mode);

// ==================== 分块输出 ====================
// 每次write输出一个"<hex>\r\n<data>\r\n"分块，finish输出结束块
class ChunkedSink : public ByteSink {
public:
    explicit ChunkedSink(ByteSink& inner);

    utils::Result<void> write(const uint8_t* data, size_t len) override;

    // 输出"0\r\n\r\n"
    utils::Result<void> finish();

private:
    ByteSink& inner_;
};

// ==================== 请求编码器 ====================
class HttpEncoder {
public:
    /**
     * @brief 确定body的分帧方式
     * @param request 请求
     * @param content_length 输出长度，仅CONTENT_LENGTH时有效（可为nullptr）
     * @return HTTP/1.0下长度未知或带Transfer-Encoding时返回AMBIGUOUS_BODY_FRAMING；
     *         Transfer-Encoding中没有chunked时同样返回AMBIGUOUS_BODY_FRAMING
     */
    static utils::Result<FramingMode> select_framing(const HttpRequest& request,
                                                     uint64_t* content_length);

    /**
     * @brief 编码请求行、头部和空行
     * @param request 请求
     * @param out 输出缓冲区
     * @return 选定的分帧方式，供encode_body使用
     * @note Host缺失时补在最前；Content-Length/Transfer-Encoding由编码器决定
     */
    static utils::Result<FramingMode> encode_head(const HttpRequest& request, utils::Buffer* out);

    /**
     * @brief 按分帧方式输出body
     */
    static utils::Result<void> encode_body(const HttpRequest& request, FramingMode mode,
                                           ByteSink& sink);

    /**
     * @brief 一次性编码完整请求
     */
    static utils::Result<std::vector<uint8_t>> encode(const HttpRequest& request);
};

} // namespace protocol
} // namespace sync_http_client

// 文件结束
