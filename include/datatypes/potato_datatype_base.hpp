#pragma once
#include "../potato_core.hpp"
#include <string>
#include <memory>
#include <chrono>

namespace potato {

// 基础数据项接口
// 选择器是未定型的字符串，由各数据类型自行解析（列表为下标，映射为子键）
class DataItem {
public:
    explicit DataItem(Timestamp expire_time);
    virtual ~DataItem() = default;

    DataItem(const DataItem&) = delete;
    DataItem& operator=(const DataItem&) = delete;

    virtual DataType getType() const = 0;

    // 按选择器读取内容
    virtual StatusCode getContent(const std::string& selector, Value& value) const = 0;

    // 按选择器写入内容，不会刷新过期时间
    virtual StatusCode setContent(const Value& value, const std::string& selector) = 0;

    // TTL方法
    Timestamp getExpiration() const;
    bool isExpired() const;
    // 过期时间早于或等于now即视为过期
    bool isExpiredAt(Timestamp now) const;

protected:
    const Timestamp expire_time_;
};

// 前向声明
class StringItem;
class ListItem;
class MapItem;

} // namespace potato
