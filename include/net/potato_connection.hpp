#pragma once

#include "../potato_core.hpp"
#include "potato_protocol.hpp"
#include <netinet/in.h>
#include <string>
#include <chrono>

namespace potato {

// 读取命令的结果
enum class ReadStatus {
    OK = 0,
    TIMEOUT = 1,     // 读超时（空闲超时）
    CLOSED = 2,      // 对端断开
    MALFORMED = 3,   // 数据格式错误
    ERROR = 4        // 套接字错误
};

const char* readStatusToString(ReadStatus status);

// 客户端连接，析构时关闭套接字
class Connection {
private:
    int fd_;
    sockaddr_in addr_;
    std::string read_buffer_;
    FrameState frame_state_;     // read_buffer_中未完成消息的扫描进度
    std::chrono::steady_clock::time_point read_deadline_;

public:
    Connection(int socket_fd, const sockaddr_in& address);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // 设置读截止时间，readCommand在截止时间前未读到完整命令则返回TIMEOUT
    void setReadDeadline(std::chrono::steady_clock::time_point deadline);

    // 读取一条完整命令，多余数据保留在缓冲区供下次使用
    ReadStatus readCommand(Command& command);

    // 写出一条响应
    bool writeResponse(const Response& response);

    // 写出全部数据
    bool writeAll(const std::string& data);

    void close();
    bool isOpen() const { return fd_ >= 0; }
    int getFd() const { return fd_; }

    // 对端地址，格式为 ip:port
    std::string peerAddress() const;
};

} // namespace potato
