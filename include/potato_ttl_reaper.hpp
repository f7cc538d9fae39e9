#pragma once

#include "potato_core.hpp"
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace potato {

class StorageEngine;

// 过期清理任务
// 独立线程按固定间隔对存储引擎做全量扫描，删除过期数据项。
// 每次扫描代价为O(数据项总数)，规模较大时可改为按过期时间排序的索引。
class TtlReaper {
private:
    StorageEngine* storage_engine_;
    const Duration interval_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_requested_;
    std::atomic<uint64_t> sweeps_{0};

public:
    TtlReaper(StorageEngine* storage_engine, Duration interval);
    ~TtlReaper();

    TtlReaper(const TtlReaper&) = delete;
    TtlReaper& operator=(const TtlReaper&) = delete;

    // 启动清理线程，重复启动返回false
    bool start();

    // 发送停止信号并等待线程退出
    void stop();

    bool isRunning() const { return thread_.joinable(); }

    // 已完成的扫描次数
    uint64_t getSweepCount() const { return sweeps_.load(); }

private:
    void run();
};

} // namespace potato
