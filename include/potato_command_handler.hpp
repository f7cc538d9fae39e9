#ifndef POTATO_COMMAND_HANDLER_HPP
#define POTATO_COMMAND_HANDLER_HPP

#include "potato_core.hpp"
#include "storage/potato_storage.hpp"
#include <unordered_map>
#include <string>

namespace potato {

// 命令处理器类，负责参数校验与存储引擎访问
class CommandHandler {
public:
    CommandHandler(StorageEngine* storage_engine, Duration default_ttl);

    // 按命令名分发；参数个数不符返回WRONG_ARGUMENTS，未知命令返回UNKNOWN_COMMAND
    Response execute(const UserID& user, const Command& command) const;

    bool isKnownCommand(const std::string& name) const;

    // 通用命令处理
    Response handleDelCommand(const UserID& user, const Command& command) const;
    Response handleKeysCommand(const UserID& user, const Command& command) const;

    // 字符串命令处理
    Response handleGetCommand(const UserID& user, const Command& command) const;
    Response handleSetCommand(const UserID& user, const Command& command) const;

    // 列表命令处理
    Response handleLPushCommand(const UserID& user, const Command& command) const;
    Response handleLSetCommand(const UserID& user, const Command& command) const;
    Response handleLGetCommand(const UserID& user, const Command& command) const;

    // 映射命令处理
    Response handleHGetCommand(const UserID& user, const Command& command) const;
    Response handleHSetCommand(const UserID& user, const Command& command) const;

    Duration getDefaultTtl() const { return default_ttl_; }

private:
    using HandlerFunc = Response (CommandHandler::*)(const UserID&, const Command&) const;

    struct CommandEntry {
        size_t arity;
        HandlerFunc handler;
    };

    StorageEngine* storage_engine_;  // 存储引擎指针
    const Duration default_ttl_;
    const std::unordered_map<std::string, CommandEntry> command_table_;

    // 新建数据项的过期时间：命令TTL非零时使用命令TTL（负值即刻过期），否则使用默认TTL
    Timestamp expireTimeFor(const Command& command) const;
};

} // namespace potato

#endif // POTATO_COMMAND_HANDLER_HPP
