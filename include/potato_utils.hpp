#pragma once

#include <string>
#include <chrono>
#include "potato_core.hpp"

namespace potato {

// 工具函数
class Utils {
public:
    // 获取当前时间戳
    static Timestamp getCurrentTime();

    // 检查字符串是否为十进制非负整数
    static bool isNumeric(const std::string& str);

    // 解析列表下标，失败返回false
    static bool parseIndex(const std::string& str, int64_t& index);

    // 解析时长，支持 ms / s / m 后缀，无后缀按毫秒处理
    static bool parseDuration(const std::string& str, Duration& duration);

    // 纳秒转换为毫秒，保留符号，不足1ms的非零值取整为±1ms
    static Duration fromNanoseconds(int64_t nanoseconds);

    // 毫秒转换为纳秒，超出int64范围时饱和
    static int64_t toNanoseconds(Duration duration);

    // base + duration，结果饱和在[纪元起点, Timestamp::max()]之内
    static Timestamp addDuration(Timestamp base, Duration duration);
};

} // namespace potato
