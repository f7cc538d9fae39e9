#ifndef POTATO_DATATYPE_LIST_HPP
#define POTATO_DATATYPE_LIST_HPP

#include "potato_datatype_base.hpp"
#include <vector>
#include <string>

namespace potato {

// 追加元素使用的选择器
const std::string LIST_APPEND_SELECTOR = "-1";

// 列表数据项，按下标寻址
class ListItem : public DataItem {
private:
    std::vector<Value> elements_;

public:
    ListItem(const Value& first, Timestamp expire_time);

    // 从DataItem继承的方法
    DataType getType() const override;
    // 选择器为十进制下标，无法解析或越界返回WRONG_ARGUMENTS
    StatusCode getContent(const std::string& selector, Value& value) const override;
    // 选择器为"-1"时追加，否则覆盖对应下标的元素
    StatusCode setContent(const Value& value, const std::string& selector) override;

    // 列表特有操作
    // 在列表尾部追加元素，返回新长度
    size_t append(const Value& value);
    size_t size() const;
    const std::vector<Value>& elements() const;
};

} // namespace potato

#endif // POTATO_DATATYPE_LIST_HPP
