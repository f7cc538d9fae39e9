#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <chrono>

namespace potato {

// 基础类型定义
using Key = std::string;
using Value = std::string;
using UserID = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// 数据类型枚举
enum class DataType {
    STRING = 0,
    LIST = 1,
    MAP = 2
};

// 响应状态码（线上协议中的整数值，不可更改）
enum class StatusCode : uint32_t {
    OK = 0,
    WRONG_TYPE = 1,
    NO_KEY = 2,
    WRONG_ARGUMENTS = 3,
    NO_WORKERS = 4,
    UNKNOWN_COMMAND = 5
};

// 状态码对应的状态信息
inline const char* statusMessage(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::WRONG_TYPE:
            return "Object stored at the key is of different type";
        case StatusCode::NO_KEY:
            return "Key doesn't exist";
        case StatusCode::WRONG_ARGUMENTS:
            return "Wrong call arguments";
        case StatusCode::NO_WORKERS:
            return "There are no available workers on the server";
        case StatusCode::UNKNOWN_COMMAND:
            return "Unknown command";
        default:
            return "Unknown status";
    }
}

// 命令结构
struct Command {
    std::string name;
    std::vector<std::string> args;
    Duration ttl;  // 0 表示使用服务器默认TTL

    Command() : ttl(Duration::zero()) {}
    Command(const std::string& n, const std::vector<std::string>& a, Duration t = Duration::zero())
        : name(n), args(a), ttl(t) {}
};

// 响应结构
struct Response {
    StatusCode code;
    std::string message;
    std::string value;

    Response() : code(StatusCode::OK), message(statusMessage(StatusCode::OK)) {}
    explicit Response(StatusCode c, const std::string& v = "")
        : code(c), message(statusMessage(c)), value(v) {}
};

// 固定身份（认证为空实现，所有连接都映射到该用户）
const UserID DEFAULT_USER = "user";

} // namespace potato

#include "potato_utils.hpp"
