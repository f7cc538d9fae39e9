#include "datatypes/potato_datatype_list.hpp"
#include "potato_utils.hpp"

namespace potato {

// ListItem 实现
ListItem::ListItem(const Value& first, Timestamp expire_time)
    : DataItem(expire_time), elements_{first} {
}

DataType ListItem::getType() const {
    return DataType::LIST;
}

StatusCode ListItem::getContent(const std::string& selector, Value& value) const {
    int64_t index = 0;
    if (!Utils::parseIndex(selector, index)) {
        return StatusCode::WRONG_ARGUMENTS;
    }
    if (index < 0 || static_cast<size_t>(index) >= elements_.size()) {
        return StatusCode::WRONG_ARGUMENTS;
    }
    value = elements_[static_cast<size_t>(index)];
    return StatusCode::OK;
}

StatusCode ListItem::setContent(const Value& value, const std::string& selector) {
    int64_t index = 0;
    if (!Utils::parseIndex(selector, index)) {
        return StatusCode::WRONG_ARGUMENTS;
    }

    // 追加
    if (index == -1) {
        append(value);
        return StatusCode::OK;
    }

    if (static_cast<size_t>(index) >= elements_.size()) {
        return StatusCode::WRONG_ARGUMENTS;
    }
    elements_[static_cast<size_t>(index)] = value;
    return StatusCode::OK;
}

size_t ListItem::append(const Value& value) {
    elements_.push_back(value);
    return elements_.size();
}

size_t ListItem::size() const {
    return elements_.size();
}

const std::vector<Value>& ListItem::elements() const {
    return elements_;
}

} // namespace potato
