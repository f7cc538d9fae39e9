#include "potato_worker_pool.hpp"
#include "potato_logger.hpp"
#include <utility>

namespace potato {

// Permit 实现
Permit::~Permit() {
    release();
}

Permit::Permit(Permit&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)) {
}

Permit& Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
    }
    return *this;
}

void Permit::release() {
    if (pool_) {
        WorkerPool* pool = pool_;
        pool_ = nullptr;
        pool->release();
    }
}

// WorkerPool 实现
WorkerPool::WorkerPool(size_t capacity)
    : capacity_(capacity), available_(capacity) {
    POTATO_LOG_INFO("工作池已创建，容量: ", capacity);
}

std::optional<Permit> WorkerPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    // 等待直到有空闲许可或超时
    if (!condition_.wait_for(lock, timeout, [this] { return available_ > 0; })) {
        return std::nullopt;
    }

    available_--;
    return Permit(this);
}

void WorkerPool::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (available_ >= capacity_) {
            POTATO_LOG_CRITICAL("工作池许可归还次数超过容量");
            return;
        }
        available_++;
    }

    // acquire与waitAllReturned等待的条件不同，全部唤醒
    condition_.notify_all();
}

void WorkerPool::waitAllReturned() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return available_ == capacity_; });
}

bool WorkerPool::waitAllReturned(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return condition_.wait_for(lock, timeout, [this] { return available_ == capacity_; });
}

size_t WorkerPool::available() {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

} // namespace potato
