// =============================================================================
//  Sync HTTP Client - Utils Module
//  文件: buffer.hpp
//  描述: 动态缓冲区类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace sync_http_client {
namespace utils {

/**
 * @brief 动态缓冲区类（读写双指针）
 * @note 线程安全说明：Buffer 不是线程安全的，由调用方保证独占使用。
 */
class Buffer {
public:
    static constexpr size_t DEFAULT_INITIAL_CAPACITY = 8192;  // 默认初始容量
    static constexpr size_t MIN_CAPACITY = 1024;              // 最小容量
    static constexpr size_t MAX_CAPACITY = 64 * 1024 * 1024;  // 最大容量
    static constexpr size_t GROWTH_THRESHOLD_DOUBLE = 64 * 1024;   // 翻倍扩容阈值
    static constexpr size_t GROWTH_LINEAR_INCREMENT = 256 * 1024;  // 线性扩容增量
    static constexpr size_t NPOS = static_cast<size_t>(-1);

    explicit Buffer(size_t initial_capacity = DEFAULT_INITIAL_CAPACITY);
    ~Buffer();

    // 禁止拷贝
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    // 支持移动
    Buffer(Buffer&& other) noexcept;
    Buffer& operator=(Buffer&& other) noexcept;

    // ========== 写入方法 ==========

    // 写入数据，返回实际写入的字节数
    // 会自动扩容，超过MAX_CAPACITY时返回0
    size_t write(const uint8_t* data, size_t len);
    size_t write(const char* data, size_t len);
    size_t write(const std::string& str) {
        return write(str.data(), str.size());
    }

    // ========== 读取方法 ==========

    // 读取数据，返回实际读取的字节数，移动读指针
    size_t read(uint8_t* data, size_t len);

    // 读取数据追加到vector末尾，返回实际读取的字节数
    size_t read_append(std::vector<uint8_t>* out, size_t len);

    // 在可读数据中从offset起查找"\r\n"
    // return: 相对读指针的位置，未找到返回NPOS
    size_t find_crlf(size_t offset = 0) const;

    // 可读数据拷贝为字符串（不移动读指针）
    std::string to_string() const;

    // ========== 指针操作 ==========

    const uint8_t* read_ptr() const;
    uint8_t* write_ptr();

    // 跳过数据（移动读指针）
    void skip(size_t len);

    // ========== 容量管理 ==========

    size_t readable_bytes() const;
    size_t writable_bytes() const;
    size_t capacity() const;

    // 确保有足够的可写空间，必要时先压缩再扩容
    // return: false-超过MAX_CAPACITY
    bool ensure_writable(size_t len);

    // ========== 清理操作 ==========

    // 清空缓冲区（不释放内存）
    void clear();

    // 将可读数据移到开头，回收已读空间
    void compact();

private:
    size_t calculate_growth(size_t required) const;

    std::vector<uint8_t> data_;
    size_t read_idx_;
    size_t write_idx_;
};

} // namespace utils
} // namespace sync_http_client
