#include "potato_session.hpp"
#include "potato_command_handler.hpp"
#include "potato_logger.hpp"

namespace potato {

Session::Session(std::unique_ptr<Connection> connection, const UserID& user, Permit permit,
                 const CommandHandler& command_handler, Duration idle_timeout)
    : connection_(std::move(connection)), user_(user), permit_(std::move(permit)),
      command_handler_(command_handler), idle_timeout_(idle_timeout), commands_served_(0) {
}

Session::~Session() {
    finish();
}

void Session::finish() {
    if (connection_) {
        connection_->close();
    }
    permit_.release();
}

ReadStatus Session::run() {
    std::string peer = connection_->peerAddress();
    POTATO_LOG_INFO("会话开始: ", peer, " 用户: ", user_);

    ReadStatus status = ReadStatus::OK;
    while (true) {
        connection_->setReadDeadline(std::chrono::steady_clock::now() + idle_timeout_);

        Command command;
        status = connection_->readCommand(command);
        if (status != ReadStatus::OK) {
            break;
        }

        Response response = command_handler_.execute(user_, command);
        commands_served_++;
        POTATO_LOG_DEBUG(peer, " 执行命令 ", command.name, " 状态码: ", static_cast<uint32_t>(response.code));

        if (!connection_->writeResponse(response)) {
            status = ReadStatus::CLOSED;
            break;
        }
    }

    finish();
    POTATO_LOG_INFO("会话结束: ", peer, " 原因: ", readStatusToString(status),
                    " 命令数: ", commands_served_);
    return status;
}

} // namespace potato
