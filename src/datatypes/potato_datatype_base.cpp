#include "datatypes/potato_datatype_base.hpp"
#include "potato_utils.hpp"

namespace potato {

DataItem::DataItem(Timestamp expire_time)
    : expire_time_(expire_time) {
}

// TTL方法实现
Timestamp DataItem::getExpiration() const {
    return expire_time_;
}

bool DataItem::isExpired() const {
    return isExpiredAt(Utils::getCurrentTime());
}

bool DataItem::isExpiredAt(Timestamp now) const {
    return expire_time_ <= now;
}

} // namespace potato
