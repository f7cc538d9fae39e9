#include "storage/potato_storage.hpp"
#include "potato_utils.hpp"
#include "potato_logger.hpp"

namespace potato {

void StorageEngine::ensureKeyspace(const UserID& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[user];
}

bool StorageEngine::hasKeyspace(const UserID& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.find(user) != data_.end();
}

DataItem* StorageEngine::findLive(const UserID& user, const Key& key, Timestamp now) const {
    auto user_it = data_.find(user);
    if (user_it == data_.end()) {
        return nullptr;
    }
    auto it = user_it->second.find(key);
    if (it == user_it->second.end() || it->second->isExpiredAt(now)) {
        return nullptr;
    }
    return it->second.get();
}

StatusCode StorageEngine::lookup(const UserID& user, const Key& key, DataType type,
                                 const std::string& selector, Value& value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    DataItem* item = findLive(user, key, Utils::getCurrentTime());
    if (!item) {
        return StatusCode::NO_KEY;
    }
    if (item->getType() != type) {
        return StatusCode::WRONG_TYPE;
    }
    return item->getContent(selector, value);
}

StatusCode StorageEngine::update(const UserID& user, const Key& key, DataType type,
                                 const Value& value, const std::string& selector) {
    std::lock_guard<std::mutex> lock(mutex_);

    DataItem* item = findLive(user, key, Utils::getCurrentTime());
    if (!item) {
        return StatusCode::NO_KEY;
    }
    if (item->getType() != type) {
        return StatusCode::WRONG_TYPE;
    }
    return item->setContent(value, selector);
}

void StorageEngine::insertOrReplace(const UserID& user, const Key& key, std::unique_ptr<DataItem> item) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[user].insert_or_assign(key, std::move(item));
}

StatusCode StorageEngine::upsert(const UserID& user, const Key& key, DataType type,
                                 const Value& value, const std::string& selector, Timestamp expire_time) {
    std::lock_guard<std::mutex> lock(mutex_);

    DataItem* item = findLive(user, key, Utils::getCurrentTime());
    if (item && item->getType() == type) {
        return item->setContent(value, selector);
    }

    // 键不存在、已过期或类型不同：静默替换为新的数据项
    auto new_item = DataItemFactory::create(type, value, selector, expire_time);
    if (!new_item) {
        return StatusCode::WRONG_ARGUMENTS;
    }
    data_[user].insert_or_assign(key, std::move(new_item));
    return StatusCode::OK;
}

bool StorageEngine::del(const UserID& user, const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto user_it = data_.find(user);
    if (user_it == data_.end()) {
        return false;
    }
    auto it = user_it->second.find(key);
    if (it == user_it->second.end()) {
        return false;
    }
    bool live = !it->second->isExpired();
    user_it->second.erase(it);
    return live;
}

std::vector<Key> StorageEngine::keys(const UserID& user) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Key> result;
    auto user_it = data_.find(user);
    if (user_it == data_.end()) {
        return result;
    }

    Timestamp now = Utils::getCurrentTime();
    result.reserve(user_it->second.size());
    for (const auto& pair : user_it->second) {
        if (!pair.second->isExpiredAt(now)) {
            result.push_back(pair.first);
        }
    }
    return result;
}

// 全量扫描，代价为O(数据项总数)
size_t StorageEngine::cleanupExpiredKeys() {
    std::lock_guard<std::mutex> lock(mutex_);

    Timestamp now = Utils::getCurrentTime();
    size_t removed = 0;
    for (auto& user_pair : data_) {
        Keyspace& keyspace = user_pair.second;
        auto it = keyspace.begin();
        while (it != keyspace.end()) {
            if (it->second->isExpiredAt(now)) {
                it = keyspace.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }

    expired_keys_ += removed;
    return removed;
}

size_t StorageEngine::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& user_pair : data_) {
        total += user_pair.second.size();
    }
    return total;
}

size_t StorageEngine::size(const UserID& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto user_it = data_.find(user);
    return user_it == data_.end() ? 0 : user_it->second.size();
}

uint64_t StorageEngine::getExpiredKeys() const {
    return expired_keys_.load();
}

// DataItemFactory 实现
std::unique_ptr<DataItem> DataItemFactory::create(DataType type, const Value& value,
                                                  const std::string& selector, Timestamp expire_time) {
    switch (type) {
        case DataType::STRING:
            return std::make_unique<StringItem>(value, expire_time);
        case DataType::LIST:
            return std::make_unique<ListItem>(value, expire_time);
        case DataType::MAP:
            return std::make_unique<MapItem>(selector, value, expire_time);
        default:
            POTATO_LOG_ERROR("未知的数据类型: ", static_cast<int>(type));
            return nullptr;
    }
}

} // namespace potato
