// =============================================================================
//  Sync HTTP Client - Protocol Module
//  文件: header_map.cpp
//  描述: HeaderMap类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/header_map.hpp"
#include "protocol/protocol_utils.hpp"
#include <algorithm>

namespace sync_http_client {
namespace protocol {

HeaderMap::HeaderMap() = default;

utils::Result<void> HeaderMap::validate(const std::string& name, const std::string& value) {
    if (!IsValidHeaderName(name)) {
        return utils::make_err(utils::ErrorCode::INVALID_HEADER_NAME,
                               "Invalid header name: '" + name + "'");
    }
    if (!IsValidHeaderValue(value)) {
        return utils::make_err(utils::ErrorCode::INVALID_HEADER_VALUE,
                               "Header value of '" + name + "' contains CR, LF or NUL");
    }
    return utils::make_ok();
}

utils::Result<void> HeaderMap::append(const std::string& name, const std::string& value) {
    utils::Result<void> ret = validate(name, value);
    if (ret.is_err()) {
        return ret;
    }
    fields_.emplace_back(name, value);
    return utils::make_ok();
}

utils::Result<void> HeaderMap::set(const std::string& name, const std::string& value) {
    utils::Result<void> ret = validate(name, value);
    if (ret.is_err()) {
        return ret;
    }

    auto first = std::find_if(fields_.begin(), fields_.end(), [&name](const HeaderField& field) {
        return EqualsIgnoreCase(field.name, name);
    });
    if (first == fields_.end()) {
        fields_.emplace_back(name, value);
        return utils::make_ok();
    }

    first->name = name;
    first->value = value;
    // 删除其后的同名头部
    fields_.erase(std::remove_if(first + 1, fields_.end(), [&name](const HeaderField& field) {
        return EqualsIgnoreCase(field.name, name);
    }), fields_.end());
    return utils::make_ok();
}

std::vector<std::string> HeaderMap::get_all(const std::string& name) const {
    std::vector<std::string> values;
    for (const auto& field : fields_) {
        if (EqualsIgnoreCase(field.name, name)) {
            values.push_back(field.value);
        }
    }
    return values;
}

bool HeaderMap::get_first(const std::string& name, std::string* value) const {
    for (const auto& field : fields_) {
        if (EqualsIgnoreCase(field.name, name)) {
            if (value) {
                *value = field.value;
            }
            return true;
        }
    }
    return false;
}

size_t HeaderMap::remove(const std::string& name) {
    size_t before = fields_.size();
    fields_.erase(std::remove_if(fields_.begin(), fields_.end(), [&name](const HeaderField& field) {
        return EqualsIgnoreCase(field.name, name);
    }), fields_.end());
    return before - fields_.size();
}

bool HeaderMap::contains(const std::string& name) const {
    return get_first(name, nullptr);
}

} // namespace protocol
} // namespace sync_http_client

// 文件结束
