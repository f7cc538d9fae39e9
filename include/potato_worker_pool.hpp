#pragma once

#include "potato_core.hpp"
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>

namespace potato {

class WorkerPool;

// 工作许可，持有期间占用工作池的一个名额。
// 只能移动不能拷贝，release()或析构时归还，且只归还一次。
class Permit {
public:
    Permit() : pool_(nullptr) {}
    ~Permit();

    Permit(Permit&& other) noexcept;
    Permit& operator=(Permit&& other) noexcept;
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    // 归还许可，重复调用无效果
    void release();

    bool valid() const { return pool_ != nullptr; }

private:
    friend class WorkerPool;
    explicit Permit(WorkerPool* pool) : pool_(pool) {}

    WorkerPool* pool_;
};

// 工作池：容量固定为W的计数信号量，用于限制并发会话数量
class WorkerPool {
private:
    const size_t capacity_;
    size_t available_;
    std::mutex mutex_;
    std::condition_variable condition_;

public:
    explicit WorkerPool(size_t capacity);
    ~WorkerPool() = default;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // 在timeout内获取许可，超时返回空
    std::optional<Permit> acquire(std::chrono::milliseconds timeout);

    // 阻塞直到所有许可都已归还
    void waitAllReturned();

    // 在timeout内等待所有许可归还
    bool waitAllReturned(std::chrono::milliseconds timeout);

    size_t capacity() const { return capacity_; }
    size_t available();

private:
    friend class Permit;
    void release();
};

} // namespace potato
