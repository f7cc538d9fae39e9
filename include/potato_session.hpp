#pragma once

#include "potato_core.hpp"
#include "potato_worker_pool.hpp"
#include "net/potato_connection.hpp"
#include <memory>

namespace potato {

class CommandHandler;

// 会话：一个已接纳连接的命令循环。
// 每轮重置空闲截止时间，读取一条命令，交给命令处理器执行并写回响应。
// 读失败（断开、超时、格式错误）时结束会话：关闭连接，然后归还许可。
class Session {
private:
    std::unique_ptr<Connection> connection_;
    UserID user_;
    Permit permit_;
    const CommandHandler& command_handler_;
    const Duration idle_timeout_;
    uint64_t commands_served_;

public:
    Session(std::unique_ptr<Connection> connection, const UserID& user, Permit permit,
            const CommandHandler& command_handler, Duration idle_timeout);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // 运行命令循环直到会话结束，返回结束原因
    ReadStatus run();

    uint64_t getCommandsServed() const { return commands_served_; }

private:
    void finish();
};

} // namespace potato
