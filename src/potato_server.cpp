#include "potato_server.hpp"
#include "storage/potato_storage.hpp"
#include "potato_worker_pool.hpp"
#include "potato_command_handler.hpp"
#include "potato_ttl_reaper.hpp"
#include "net/potato_network.hpp"
#include "potato_logger.hpp"

namespace potato {

PotatoServer::PotatoServer(const ServerConfig& config)
    : config_(config), started_(false) {
    storage_engine_ = std::make_unique<StorageEngine>();
    worker_pool_ = std::make_unique<WorkerPool>(config_.num_workers);
    command_handler_ = std::make_unique<CommandHandler>(storage_engine_.get(), config_.default_ttl);
    ttl_reaper_ = std::make_unique<TtlReaper>(storage_engine_.get(), config_.cleanup_interval);
    network_server_ = std::make_unique<NetworkServer>(storage_engine_.get(), worker_pool_.get(),
                                                      command_handler_.get(), ttl_reaper_.get(),
                                                      config_.port, config_.idle_timeout,
                                                      config_.max_connections);
}

PotatoServer::~PotatoServer() {
    stop();
    // 网络服务先于其依赖的组件析构
    network_server_.reset();
    ttl_reaper_->stop();
}

bool PotatoServer::start() {
    if (started_.load()) {
        return true;
    }

    if (!network_server_->start()) {
        POTATO_LOG_ERROR("启动网络服务失败");
        return false;
    }

    if (!ttl_reaper_->start()) {
        POTATO_LOG_ERROR("启动过期清理任务失败");
        return false;
    }

    started_ = true;
    POTATO_LOG_INFO("服务器已启动，端口: ", getPort(), ", 工作许可: ", config_.num_workers,
                    ", 默认TTL: ", config_.default_ttl.count(), "ms",
                    ", 空闲超时: ", config_.idle_timeout.count(), "ms");
    return true;
}

void PotatoServer::serve() {
    if (!started_.load()) {
        POTATO_LOG_ERROR("服务器未启动");
        return;
    }

    network_server_->serve();
    started_ = false;
    POTATO_LOG_INFO("服务器已停止，剩余键数量: ", getKeyCount(), ", 累计过期清理: ", getExpiredKeys());
}

void PotatoServer::stop() {
    network_server_->stop();
}

bool PotatoServer::isRunning() const {
    return network_server_->isRunning();
}

uint16_t PotatoServer::getPort() const {
    return network_server_->getPort();
}

size_t PotatoServer::getKeyCount() const {
    return storage_engine_->size();
}

uint64_t PotatoServer::getExpiredKeys() const {
    return storage_engine_->getExpiredKeys();
}

uint64_t PotatoServer::getAcceptedConnections() const {
    return network_server_->getAcceptedConnections();
}

uint64_t PotatoServer::getRejectedConnections() const {
    return network_server_->getRejectedConnections();
}

} // namespace potato
