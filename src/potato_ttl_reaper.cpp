#include "potato_ttl_reaper.hpp"
#include "storage/potato_storage.hpp"
#include "potato_logger.hpp"

namespace potato {

TtlReaper::TtlReaper(StorageEngine* storage_engine, Duration interval)
    : storage_engine_(storage_engine), interval_(interval), stop_requested_(false) {
}

TtlReaper::~TtlReaper() {
    stop();
}

bool TtlReaper::start() {
    if (thread_.joinable()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&TtlReaper::run, this);

    POTATO_LOG_INFO("过期清理线程已启动，扫描间隔: ", interval_.count(), "ms");
    return true;
}

void TtlReaper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    condition_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        POTATO_LOG_INFO("过期清理线程已停止，共扫描 ", sweeps_.load(), " 次");
    }
}

void TtlReaper::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // 等待一个扫描间隔，期间收到停止信号立即退出
            if (condition_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
                break;
            }
        }

        size_t removed = storage_engine_->cleanupExpiredKeys();
        sweeps_++;
        if (removed > 0) {
            POTATO_LOG_DEBUGF("第 {} 次扫描清理过期键 {} 个", sweeps_.load(), removed);
        }
    }
}

} // namespace potato
