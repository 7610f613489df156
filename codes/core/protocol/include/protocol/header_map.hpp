// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: header_map.hpp
//  描述: HeaderMap类定义 - 有序、大小写不敏感、保留原始大小写的多值头部集合
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <string>
#include <utility>
#include <vector>

namespace sync_http_client {
namespace protocol {

// 单条头部
struct HeaderField {
    std::string name;   // 原始大小写
    std::string value;

    HeaderField() = default;
    HeaderField(const std::string& n, const std::string& v)
        : name(n)
        , value(v)
    {
    }
};

// ==================== 头部集合类 ====================
class HeaderMap {
public:
    using const_iterator = std::vector<HeaderField>::const_iterator;

    HeaderMap();

    /**
     * @brief 追加一条头部，不影响同名的已有头部
     * @return 名称不符合token语法返回INVALID_HEADER_NAME，值含CR/LF/NUL返回INVALID_HEADER_VALUE
     */
    utils::Result<void> append(const std::string& name, const std::string& value);

    /**
     * @brief 设置头部：删除所有同名头部后追加
     * @note 新值放在原第一个同名头部的位置；原来没有则追加到末尾
     */
    utils::Result<void> set(const std::string& name, const std::string& value);

    /**
     * @brief 获取同名的全部值，按插入顺序
     */
    std::vector<std::string> get_all(const std::string& name) const;

    /**
     * @brief 获取第一个同名值
     * @param value 输出值（可为nullptr）
     * @return true找到，false未找到
     */
    bool get_first(const std::string& name, std::string* value) const;

    /**
     * @brief 删除全部同名头部
     * @return 删除的条数
     */
    size_t remove(const std::string& name);

    bool contains(const std::string& name) const;

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
    void clear() { fields_.clear(); }

    // 按插入顺序遍历，可重复遍历
    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

private:
    static utils::Result<void> validate(const std::string& name, const std::string& value);

    std::vector<HeaderField> fields_;
};

} // namespace protocol
} // namespace sync_http_client

// 文件结束
