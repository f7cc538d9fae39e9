#pragma once

#include "potato_core.hpp"
#include "potato_config.hpp"
#include <memory>
#include <atomic>

namespace potato {

class StorageEngine;
class WorkerPool;
class CommandHandler;
class TtlReaper;
class NetworkServer;

// 服务器主类
// 持有存储引擎、工作池、命令处理器、过期清理任务和网络服务，
// 负责按顺序启动和关闭它们。
class PotatoServer {
private:
    const ServerConfig config_;

    std::unique_ptr<StorageEngine> storage_engine_;
    std::unique_ptr<WorkerPool> worker_pool_;
    std::unique_ptr<CommandHandler> command_handler_;
    std::unique_ptr<TtlReaper> ttl_reaper_;
    std::unique_ptr<NetworkServer> network_server_;

    std::atomic<bool> started_;

public:
    explicit PotatoServer(const ServerConfig& config);
    ~PotatoServer();

    PotatoServer(const PotatoServer&) = delete;
    PotatoServer& operator=(const PotatoServer&) = delete;

    // 绑定监听端口并启动过期清理任务
    bool start();

    // 在调用线程上运行接受循环，返回时所有会话已结束
    void serve();

    // 请求停止，可在任意线程或信号处理函数中调用
    void stop();

    bool isRunning() const;
    uint16_t getPort() const;

    // 统计信息
    size_t getKeyCount() const;
    uint64_t getExpiredKeys() const;
    uint64_t getAcceptedConnections() const;
    uint64_t getRejectedConnections() const;
};

} // namespace potato
