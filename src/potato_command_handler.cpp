#include "potato_command_handler.hpp"
#include "potato_logger.hpp"
#include "potato_utils.hpp"

namespace potato {

CommandHandler::CommandHandler(StorageEngine* storage_engine, Duration default_ttl)
    : storage_engine_(storage_engine), default_ttl_(default_ttl),
      command_table_{
          {"del",   {1, &CommandHandler::handleDelCommand}},
          {"keys",  {0, &CommandHandler::handleKeysCommand}},
          {"get",   {1, &CommandHandler::handleGetCommand}},
          {"set",   {2, &CommandHandler::handleSetCommand}},
          {"lpush", {2, &CommandHandler::handleLPushCommand}},
          {"lset",  {3, &CommandHandler::handleLSetCommand}},
          {"lget",  {2, &CommandHandler::handleLGetCommand}},
          {"hget",  {2, &CommandHandler::handleHGetCommand}},
          {"hset",  {3, &CommandHandler::handleHSetCommand}},
      } {
}

Response CommandHandler::execute(const UserID& user, const Command& command) const {
    auto it = command_table_.find(command.name);
    if (it == command_table_.end()) {
        POTATO_LOG_DEBUG("未知命令: ", command.name);
        return Response(StatusCode::UNKNOWN_COMMAND);
    }

    // 参数个数校验先于任何存储访问
    if (command.args.size() != it->second.arity) {
        POTATO_LOG_DEBUG(command.name, " 命令需要 ", it->second.arity, " 个参数，实际 ", command.args.size(), " 个");
        return Response(StatusCode::WRONG_ARGUMENTS);
    }

    return (this->*(it->second.handler))(user, command);
}

bool CommandHandler::isKnownCommand(const std::string& name) const {
    return command_table_.find(name) != command_table_.end();
}

Timestamp CommandHandler::expireTimeFor(const Command& command) const {
    Duration ttl = command.ttl != Duration::zero() ? command.ttl : default_ttl_;
    return Utils::addDuration(Utils::getCurrentTime(), ttl);
}

Response CommandHandler::handleDelCommand(const UserID& user, const Command& command) const {
    const Key& key = command.args[0];
    if (!storage_engine_->del(user, key)) {
        POTATO_LOG_DEBUG("键 ", key, " 不存在，删除失败");
        return Response(StatusCode::NO_KEY);
    }
    POTATO_LOG_DEBUG("删除键 ", key, " 成功");
    return Response(StatusCode::OK);
}

Response CommandHandler::handleKeysCommand(const UserID& user, const Command& /*command*/) const {
    std::string result;
    for (const auto& key : storage_engine_->keys(user)) {
        result += "'" + key + "',";
    }
    return Response(StatusCode::OK, result);
}

Response CommandHandler::handleGetCommand(const UserID& user, const Command& command) const {
    Value value;
    StatusCode status = storage_engine_->lookup(user, command.args[0], DataType::STRING, "", value);
    return Response(status, status == StatusCode::OK ? value : "");
}

Response CommandHandler::handleSetCommand(const UserID& user, const Command& command) const {
    const Key& key = command.args[0];

    // 无论原类型是什么，都以新的字符串数据项替换
    storage_engine_->insertOrReplace(user, key,
        DataItemFactory::create(DataType::STRING, command.args[1], "", expireTimeFor(command)));
    POTATO_LOG_DEBUG("设置键 ", key);
    return Response(StatusCode::OK);
}

Response CommandHandler::handleLPushCommand(const UserID& user, const Command& command) const {
    return Response(storage_engine_->upsert(user, command.args[0], DataType::LIST,
                                            command.args[1], LIST_APPEND_SELECTOR, expireTimeFor(command)));
}

// lset key index value
Response CommandHandler::handleLSetCommand(const UserID& user, const Command& command) const {
    return Response(storage_engine_->update(user, command.args[0], DataType::LIST,
                                            command.args[2], command.args[1]));
}

// lget key index
Response CommandHandler::handleLGetCommand(const UserID& user, const Command& command) const {
    Value value;
    StatusCode status = storage_engine_->lookup(user, command.args[0], DataType::LIST, command.args[1], value);
    return Response(status, status == StatusCode::OK ? value : "");
}

// hget key field
Response CommandHandler::handleHGetCommand(const UserID& user, const Command& command) const {
    Value value;
    StatusCode status = storage_engine_->lookup(user, command.args[0], DataType::MAP, command.args[1], value);
    return Response(status, status == StatusCode::OK ? value : "");
}

// hset key field value
Response CommandHandler::handleHSetCommand(const UserID& user, const Command& command) const {
    return Response(storage_engine_->upsert(user, command.args[0], DataType::MAP,
                                            command.args[2], command.args[1], expireTimeFor(command)));
}

} // namespace potato
