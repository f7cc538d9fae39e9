#pragma once

#include "../potato_core.hpp"
#include <json/json.h>
#include <string>

namespace potato {

// 解码结果
enum class DecodeStatus {
    OK = 0,         // 成功解析出一条消息
    NEED_MORE = 1,  // 数据不完整，等待更多数据
    MALFORMED = 2   // 数据格式错误
};

// 分帧扫描状态，跨多次读取保存，使每个字节只扫描一次。
// 位置均为缓冲区内的绝对下标，缓冲区前部被丢弃后需要reset()。
struct FrameState {
    size_t scan_pos = 0;     // 下一个待扫描的字节
    size_t begin = 0;        // 当前对象的起始位置
    bool started = false;    // 是否已遇到对象的'{'
    int depth = 0;
    bool in_string = false;
    bool escaped = false;

    void reset() { *this = FrameState(); }
};

// 消息协议：流上首尾相接的JSON对象，没有额外的长度帧。
// 请求  {"Name": string, "Arguments": [string...], "TTL": 纳秒}
// 响应  {"Code": uint, "StatusMessage": string, "Value": string}
// 字段名大小写不敏感；Arguments可省略或为null，TTL可省略。
class MessageProtocol {
public:
    // 单条消息的长度上限
    static constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

    // 从data[pos]开始解析一条命令，成功时pos移动到该消息之后
    static DecodeStatus parseCommand(const std::string& data, size_t& pos, Command& command);

    // 增量版本：NEED_MORE时state记录扫描进度，下次调用从中断处继续
    static DecodeStatus parseCommand(const std::string& data, size_t& pos, Command& command,
                                     FrameState& state);

    // 序列化响应，以换行结尾
    static std::string serializeResponse(const Response& response);

    // 客户端方向：序列化命令、解析响应
    static std::string serializeCommand(const Command& command);
    static DecodeStatus parseResponse(const std::string& data, size_t& pos, Response& response);
    static DecodeStatus parseResponse(const std::string& data, size_t& pos, Response& response,
                                      FrameState& state);

private:
    // 定位下一个完整JSON对象的区间[begin, end)
    static DecodeStatus frameObject(const std::string& data, size_t pos, FrameState& state, size_t& end);

    // 解析一个JSON对象
    static bool parseObject(const std::string& data, size_t begin, size_t end, Json::Value& root);

    // 大小写不敏感地查找成员，不存在返回nullptr
    static const Json::Value* findMember(const Json::Value& object, const std::string& name);

    static std::string writeCompact(const Json::Value& root);
};

} // namespace potato
