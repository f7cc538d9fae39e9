#include "datatypes/potato_datatype_string.hpp"

namespace potato {

// StringItem 实现
StringItem::StringItem(const Value& value, Timestamp expire_time)
    : DataItem(expire_time), value_(value) {
}

DataType StringItem::getType() const {
    return DataType::STRING;
}

StatusCode StringItem::getContent(const std::string& /*selector*/, Value& value) const {
    value = value_;
    return StatusCode::OK;
}

StatusCode StringItem::setContent(const Value& value, const std::string& /*selector*/) {
    value_ = value;
    return StatusCode::OK;
}

const Value& StringItem::getValue() const {
    return value_;
}

} // namespace potato
