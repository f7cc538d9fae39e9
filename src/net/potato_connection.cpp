#include "net/potato_connection.hpp"
#include "potato_logger.hpp"
#include <sys/socket.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <cstdint>
#include <algorithm>

namespace potato {

const char* readStatusToString(ReadStatus status) {
    switch (status) {
        case ReadStatus::OK:
            return "ok";
        case ReadStatus::TIMEOUT:
            return "idle timeout";
        case ReadStatus::CLOSED:
            return "peer closed";
        case ReadStatus::MALFORMED:
            return "malformed stream";
        case ReadStatus::ERROR:
            return "socket error";
        default:
            return "unknown";
    }
}

Connection::Connection(int socket_fd, const sockaddr_in& address)
    : fd_(socket_fd), addr_(address),
      read_deadline_(std::chrono::steady_clock::time_point::max()) {
}

Connection::~Connection() {
    close();
}

void Connection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Connection::setReadDeadline(std::chrono::steady_clock::time_point deadline) {
    read_deadline_ = deadline;
}

ReadStatus Connection::readCommand(Command& command) {
    if (fd_ < 0) {
        return ReadStatus::CLOSED;
    }

    char buffer[8192];
    while (true) {
        // 先尝试从已缓冲的数据中解析，只扫描上次之后新到的字节
        size_t pos = 0;
        DecodeStatus status = MessageProtocol::parseCommand(read_buffer_, pos, command, frame_state_);
        if (status == DecodeStatus::OK) {
            read_buffer_.erase(0, pos);
            return ReadStatus::OK;
        }
        if (status == DecodeStatus::MALFORMED) {
            return ReadStatus::MALFORMED;
        }

        // 等待更多数据，直到截止时间
        auto now = std::chrono::steady_clock::now();
        if (now >= read_deadline_) {
            return ReadStatus::TIMEOUT;
        }
        int timeout_ms = -1;
        if (read_deadline_ != std::chrono::steady_clock::time_point::max()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(read_deadline_ - now).count();
            timeout_ms = static_cast<int>(std::min<int64_t>(remaining + 1, INT32_MAX));
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            POTATO_LOG_ERROR("poll失败: ", strerror(errno));
            return ReadStatus::ERROR;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t bytes_read = recv(fd_, buffer, sizeof(buffer), 0);
        if (bytes_read == 0) {
            return ReadStatus::CLOSED;
        }
        if (bytes_read < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            if (errno == ECONNRESET) {
                return ReadStatus::CLOSED;
            }
            POTATO_LOG_ERROR("读取客户端数据失败: ", strerror(errno));
            return ReadStatus::ERROR;
        }
        read_buffer_.append(buffer, static_cast<size_t>(bytes_read));
    }
}

bool Connection::writeResponse(const Response& response) {
    return writeAll(MessageProtocol::serializeResponse(response));
}

bool Connection::writeAll(const std::string& data) {
    if (fd_ < 0) {
        return false;
    }

    size_t sent = 0;
    while (sent < data.length()) {
        ssize_t n = send(fd_, data.data() + sent, data.length() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            POTATO_LOG_DEBUG("发送响应失败: ", strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

std::string Connection::peerAddress() const {
    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr_.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(addr_.sin_port));
}

} // namespace potato
