#pragma once

#include "../potato_core.hpp"
#include "../potato_datatypes.hpp"
#include <unordered_map>
#include <mutex>
#include <atomic>
#include <memory>
#include <vector>

namespace potato {

// 单个用户的键空间
using Keyspace = std::unordered_map<Key, std::unique_ptr<DataItem>>;

// 存储引擎
// 用户 -> 键 -> 数据项 的嵌套映射，由一把全局互斥锁保护。
// 所有公开方法在一次加锁内完成"检查-修改"，调用方不直接接触锁。
// 过期时间早于或等于当前时间的数据项一律视为不存在。
class StorageEngine {
private:
    mutable std::mutex mutex_;
    std::unordered_map<UserID, Keyspace> data_;

    // 统计信息
    std::atomic<uint64_t> expired_keys_{0};

public:
    StorageEngine() = default;
    ~StorageEngine() = default;

    // 禁止拷贝和移动
    StorageEngine(const StorageEngine&) = delete;
    StorageEngine& operator=(const StorageEngine&) = delete;
    StorageEngine(StorageEngine&&) = delete;
    StorageEngine& operator=(StorageEngine&&) = delete;

    // 用户的键空间不存在时创建
    void ensureKeyspace(const UserID& user);
    bool hasKeyspace(const UserID& user) const;

    // 读取：键不存在返回NO_KEY，类型不符返回WRONG_TYPE，其余由数据项决定
    StatusCode lookup(const UserID& user, const Key& key, DataType type,
                      const std::string& selector, Value& value) const;

    // 原位修改已有数据项，从不创建或替换，不刷新过期时间
    StatusCode update(const UserID& user, const Key& key, DataType type,
                      const Value& value, const std::string& selector);

    // 插入或替换整个数据项
    void insertOrReplace(const UserID& user, const Key& key, std::unique_ptr<DataItem> item);

    // 追加或创建：类型一致时原位修改；键不存在或类型不同时以新数据项替换
    StatusCode upsert(const UserID& user, const Key& key, DataType type,
                      const Value& value, const std::string& selector, Timestamp expire_time);

    // 删除，键不存在（或已过期）返回false
    bool del(const UserID& user, const Key& key);

    // 用户键空间中所有未过期的键，无顺序保证
    std::vector<Key> keys(const UserID& user) const;

    // 删除所有过期数据项，返回本次删除数量
    size_t cleanupExpiredKeys();

    // 统计信息
    size_t size() const;
    size_t size(const UserID& user) const;
    uint64_t getExpiredKeys() const;

private:
    // 以下辅助方法要求调用方已持有mutex_
    DataItem* findLive(const UserID& user, const Key& key, Timestamp now) const;
};

// 数据项工厂
class DataItemFactory {
public:
    // 以单个初始值创建数据项；映射类型以selector作为子键
    static std::unique_ptr<DataItem> create(DataType type, const Value& value,
                                            const std::string& selector, Timestamp expire_time);
};

} // namespace potato
