#pragma once

#include "../potato_core.hpp"
#include "potato_connection.hpp"
#include <netinet/in.h>
#include <vector>
#include <thread>
#include <atomic>
#include <memory>
#include <chrono>
#include <functional>

namespace potato {

class StorageEngine;
class WorkerPool;
class CommandHandler;
class TtlReaper;

// 网络服务器（接纳控制）
// 接受连接后在固定等待预算内申请工作许可：
// 成功则为连接启动独立会话线程，失败则写回一条NoWorkers响应并关闭连接。
// 接受循环结束后停止过期清理任务，等待所有许可归还，再回收会话线程。
class NetworkServer {
public:
    // 申请许可的等待预算
    static constexpr std::chrono::milliseconds ACQUIRE_TIMEOUT{1000};

    NetworkServer(StorageEngine* storage_engine, WorkerPool* worker_pool,
                  const CommandHandler* command_handler, TtlReaper* ttl_reaper,
                  int port, Duration idle_timeout, size_t max_connections = 0);
    virtual ~NetworkServer();

    NetworkServer(const NetworkServer&) = delete;
    NetworkServer& operator=(const NetworkServer&) = delete;

    // 创建监听套接字，失败返回false
    bool start();

    // 接受循环，在调用线程上运行直到达到接受上限或stop()被调用，随后完成关闭流程
    void serve();

    // 请求停止接受循环，可在任意线程调用
    void stop();

    // 实际监听端口（端口配置为0时由系统分配）
    uint16_t getPort() const;

    bool isRunning() const { return running_.load(); }

    // 统计信息
    uint64_t getAcceptedConnections() const { return accepted_connections_.load(); }
    uint64_t getRejectedConnections() const { return rejected_connections_.load(); }

protected:
    // 启动会话线程，无法创建线程时抛出std::system_error
    virtual std::thread launchSession(std::function<void()> body);

private:
    struct SessionThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    StorageEngine* storage_engine_;
    WorkerPool* worker_pool_;
    const CommandHandler* command_handler_;
    TtlReaper* ttl_reaper_;

    int server_fd_;
    sockaddr_in server_addr_;
    const Duration idle_timeout_;
    const size_t max_connections_;  // 0 表示不限

    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::atomic<uint64_t> accepted_connections_{0};
    std::atomic<uint64_t> rejected_connections_{0};

    // 只在接受循环所在线程访问
    std::vector<SessionThread> sessions_;

    // 初始化监听套接字
    bool initializeServer();

    // 处理新连接
    void handleNewConnection(int client_fd, const sockaddr_in& client_addr);

    // 拒绝连接：写回NoWorkers后关闭
    void rejectConnection(std::unique_ptr<Connection> connection, const char* reason);

    // 认证（空实现）：所有连接都映射到固定用户，并确保其键空间存在
    UserID authConnection(const Connection& connection);

    // 回收已结束的会话线程
    void reapSessions(bool wait_all);

    void closeListener();
};

} // namespace potato
