#pragma once

#include "potato_datatype_base.hpp"

namespace potato {

// 字符串数据项
class StringItem : public DataItem {
private:
    Value value_;

public:
    StringItem(const Value& value, Timestamp expire_time);

    // 从DataItem继承的方法，选择器被忽略
    DataType getType() const override;
    StatusCode getContent(const std::string& selector, Value& value) const override;
    StatusCode setContent(const Value& value, const std::string& selector) override;

    // String特有操作
    const Value& getValue() const;
};

} // namespace potato
