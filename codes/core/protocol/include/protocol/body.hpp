// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: body.hpp
//  描述: 报文体定义 - Empty / Bytes / FileBacked 三种来源
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace sync_http_client {
namespace protocol {

// ==================== 字节输出接口 ====================
// Body::write_to与编码器通过此接口输出字节，写入失败即终止
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /**
     * @brief 写入全部数据
     * @return 成功返回ok，失败返回对应错误码
     */
    virtual utils::Result<void> write(const uint8_t* data, size_t len) = 0;
};

// 内存输出，用于一次性编码
class VectorSink : public ByteSink {
public:
    utils::Result<void> write(const uint8_t* data, size_t len) override {
        bytes_.insert(bytes_.end(), data, data + len);
        return utils::make_ok();
    }

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    std::vector<uint8_t> take_bytes() { return std::move(bytes_); }

private:
    std::vector<uint8_t> bytes_;
};

// ==================== 报文体类型 ====================
enum class BodyKind : uint8_t {
    EMPTY = 0,
    BYTES = 1,
    FILE_BACKED = 2
};

const char* body_kind_to_string(BodyKind kind);

// ==================== 报文体类 ====================
class Body {
public:
    /**
     * @brief 默认构造为空body
     */
    Body();

    static Body empty();
    static Body from_bytes(std::vector<uint8_t> bytes);
    static Body from_bytes(const uint8_t* data, size_t len);
    static Body from_string(const std::string& text);

    /**
     * @brief 以文件内容作为body，发送时才读取
     * @param path 文件路径
     * @return 文件无法打开或fstat失败返回IO_ERROR
     * @note 普通文件长度在此处确定；管道等非普通文件长度未知，将使用chunked发送
     */
    static utils::Result<Body> from_file(const std::string& path);

    BodyKind kind() const { return kind_; }
    bool is_empty() const { return kind_ == BodyKind::EMPTY; }

    /**
     * @brief 发送前可确定的字节长度
     * @param length 输出长度（可为nullptr）
     * @return true长度已知，false长度未知
     */
    bool known_length(uint64_t* length) const;

    /**
     * @brief 将内容写入sink
     * @return FileBacked读取失败或文件变短返回IO_ERROR，sink错误原样返回
     * @note 失败时sink可能已写入部分数据
     */
    utils::Result<void> write_to(ByteSink& sink) const;

    // BYTES的内容，其他类型为空
    const std::vector<uint8_t>& bytes() const { return bytes_; }

    // BYTES内容转字符串
    std::string text() const;

    // FILE_BACKED的路径
    const std::string& path() const { return path_; }

private:
    utils::Result<void> write_file_to(ByteSink& sink) const;

    BodyKind kind_;
    std::vector<uint8_t> bytes_;
    std::string path_;
    uint64_t file_length_;
    bool file_length_known_;
};

} // namespace protocol
} // namespace sync_http_client

// 文件结束
