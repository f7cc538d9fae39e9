#pragma once

#include "potato_datatype_base.hpp"
#include <unordered_map>

namespace potato {

// 映射数据项，子键唯一
class MapItem : public DataItem {
private:
    std::unordered_map<Value, Value> fields_;  // 字段-值映射

public:
    MapItem(const Value& field, const Value& value, Timestamp expire_time);

    // 从DataItem继承的方法
    DataType getType() const override;
    // 选择器为子键，不存在返回WRONG_ARGUMENTS
    StatusCode getContent(const std::string& selector, Value& value) const override;
    // 无条件插入或覆盖子键
    StatusCode setContent(const Value& value, const std::string& selector) override;

    // 映射特有操作
    bool existsField(const Value& field) const;
    size_t size() const;
};

} // namespace potato
