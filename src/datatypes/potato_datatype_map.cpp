#include "datatypes/potato_datatype_map.hpp"

namespace potato {

// MapItem 实现
MapItem::MapItem(const Value& field, const Value& value, Timestamp expire_time)
    : DataItem(expire_time) {
    fields_[field] = value;
}

DataType MapItem::getType() const {
    return DataType::MAP;
}

StatusCode MapItem::getContent(const std::string& selector, Value& value) const {
    auto it = fields_.find(selector);
    if (it == fields_.end()) {
        return StatusCode::WRONG_ARGUMENTS;
    }
    value = it->second;
    return StatusCode::OK;
}

StatusCode MapItem::setContent(const Value& value, const std::string& selector) {
    fields_[selector] = value;
    return StatusCode::OK;
}

bool MapItem::existsField(const Value& field) const {
    return fields_.find(field) != fields_.end();
}

size_t MapItem::size() const {
    return fields_.size();
}

} // namespace potato
