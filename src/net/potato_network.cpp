#include "net/potato_network.hpp"
#include "potato_session.hpp"
#include "potato_worker_pool.hpp"
#include "potato_command_handler.hpp"
#include "potato_ttl_reaper.hpp"
#include "storage/potato_storage.hpp"
#include "potato_logger.hpp"
#include <sys/socket.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <functional>

namespace potato {

NetworkServer::NetworkServer(StorageEngine* storage_engine, WorkerPool* worker_pool,
                             const CommandHandler* command_handler, TtlReaper* ttl_reaper,
                             int port, Duration idle_timeout, size_t max_connections)
    : storage_engine_(storage_engine), worker_pool_(worker_pool),
      command_handler_(command_handler), ttl_reaper_(ttl_reaper),
      server_fd_(-1), idle_timeout_(idle_timeout), max_connections_(max_connections),
      running_(false), stop_requested_(false) {
    memset(&server_addr_, 0, sizeof(server_addr_));
    server_addr_.sin_family = AF_INET;
    server_addr_.sin_addr.s_addr = INADDR_ANY;
    server_addr_.sin_port = htons(static_cast<uint16_t>(port));
}

NetworkServer::~NetworkServer() {
    stop();
    closeListener();
    reapSessions(true);
}

bool NetworkServer::start() {
    if (server_fd_ >= 0) {
        return true;
    }
    if (!initializeServer()) {
        return false;
    }
    stop_requested_ = false;
    POTATO_LOG_INFO("网络服务启动成功，监听端口: ", getPort());
    return true;
}

void NetworkServer::stop() {
    stop_requested_ = true;
}

uint16_t NetworkServer::getPort() const {
    if (server_fd_ >= 0) {
        sockaddr_in bound;
        socklen_t len = sizeof(bound);
        if (getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
            return ntohs(bound.sin_port);
        }
    }
    return ntohs(server_addr_.sin_port);
}

bool NetworkServer::initializeServer() {
    // 创建socket
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        POTATO_LOG_ERROR("创建socket失败: ", strerror(errno));
        return false;
    }

    // 设置socket选项
    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        POTATO_LOG_ERROR("设置socket选项失败: ", strerror(errno));
        closeListener();
        return false;
    }

    // 监听套接字设为非阻塞，由poll驱动accept
    int flags = fcntl(server_fd_, F_GETFL, 0);
    if (flags < 0 || fcntl(server_fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        POTATO_LOG_ERROR("设置非阻塞模式失败: ", strerror(errno));
        closeListener();
        return false;
    }

    // 绑定地址
    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&server_addr_), sizeof(server_addr_)) < 0) {
        POTATO_LOG_ERROR("绑定端口 ", ntohs(server_addr_.sin_port), " 失败: ", strerror(errno));
        closeListener();
        return false;
    }

    // 开始监听
    if (listen(server_fd_, 128) < 0) {
        POTATO_LOG_ERROR("开始监听失败: ", strerror(errno));
        closeListener();
        return false;
    }

    return true;
}

void NetworkServer::closeListener() {
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
}

void NetworkServer::serve() {
    if (server_fd_ < 0) {
        POTATO_LOG_ERROR("监听套接字未初始化，无法接受连接");
        return;
    }

    running_ = true;
    size_t served = 0;

    while (!stop_requested_.load() && (max_connections_ == 0 || served < max_connections_)) {
        struct pollfd pfd;
        pfd.fd = server_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        // 100ms超时，以便及时响应停止请求
        int ready = poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            POTATO_LOG_ERROR("poll监听套接字失败: ", strerror(errno));
            break;
        }

        reapSessions(false);
        if (ready == 0) {
            continue;
        }

        sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);
        int client_fd = accept(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED) {
                continue;
            }
            POTATO_LOG_ERROR("接受连接失败: ", strerror(errno));
            break;
        }

        served++;
        handleNewConnection(client_fd, client_addr);
    }

    closeListener();
    POTATO_LOG_INFO("接受循环结束，共接受连接 ", served, " 个");

    // 停止过期清理任务，再等待所有会话归还许可
    if (ttl_reaper_) {
        ttl_reaper_->stop();
    }
    POTATO_LOG_INFO("等待所有会话结束");
    worker_pool_->waitAllReturned();
    reapSessions(true);

    running_ = false;
    POTATO_LOG_INFO("网络服务已停止");
}

void NetworkServer::handleNewConnection(int client_fd, const sockaddr_in& client_addr) {
    auto connection = std::make_unique<Connection>(client_fd, client_addr);
    accepted_connections_++;

    std::optional<Permit> permit = worker_pool_->acquire(ACQUIRE_TIMEOUT);
    if (!permit) {
        rejectConnection(std::move(connection), "没有可用的工作许可");
        return;
    }

    UserID user = authConnection(*connection);
    POTATO_LOG_INFO("新客户端连接: ", connection->peerAddress(), " 剩余许可: ", worker_pool_->available());

    // 连接与许可在线程启动前仍归这里所有，线程创建失败时可以写回响应
    auto pending = std::make_shared<std::unique_ptr<Connection>>(std::move(connection));
    auto held = std::make_shared<Permit>(std::move(*permit));
    auto finished = std::make_shared<std::atomic<bool>>(false);
    try {
        std::thread thread = launchSession([this, user, finished, pending, held]() {
            try {
                Session session(std::move(*pending), user, std::move(*held), *command_handler_, idle_timeout_);
                session.run();
            } catch (const std::exception& e) {
                POTATO_LOG_ERROR("会话线程异常退出: ", e.what());
            }
            finished->store(true);
        });
        sessions_.push_back(SessionThread{std::move(thread), finished});
    } catch (const std::system_error& e) {
        POTATO_LOG_ERROR("创建会话线程失败: ", e.what());
        held->release();
        if (*pending) {
            rejectConnection(std::move(*pending), "无法创建会话线程");
        }
    }
}

std::thread NetworkServer::launchSession(std::function<void()> body) {
    return std::thread(std::move(body));
}

void NetworkServer::rejectConnection(std::unique_ptr<Connection> connection, const char* reason) {
    rejected_connections_++;
    POTATO_LOG_WARNING(reason, "，拒绝连接: ", connection->peerAddress());

    if (!connection->writeResponse(Response(StatusCode::NO_WORKERS))) {
        POTATO_LOG_DEBUG("写回NoWorkers响应失败: ", connection->peerAddress());
    }
    connection->close();
}

UserID NetworkServer::authConnection(const Connection& /*connection*/) {
    storage_engine_->ensureKeyspace(DEFAULT_USER);
    return DEFAULT_USER;
}

void NetworkServer::reapSessions(bool wait_all) {
    auto it = sessions_.begin();
    while (it != sessions_.end()) {
        if (wait_all || it->finished->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace potato
