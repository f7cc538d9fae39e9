#pragma once

#include "potato_core.hpp"
#include "potato_logger.hpp"
#include <string>

namespace potato {

// 服务器配置
struct ServerConfig {
    int port = 6379;
    size_t num_workers = 8;                          // 工作池容量
    Duration default_ttl = Duration(60 * 1000);      // 默认TTL
    Duration idle_timeout = Duration(30 * 1000);     // 会话空闲超时
    Duration cleanup_interval = Duration(1000);      // 过期清理间隔
    size_t max_connections = 0;                      // 接受连接数上限，0表示不限
    std::string log_level = "info";
    std::string log_file;                            // 为空则不输出到文件

    // 仅命令行使用
    std::string config_file;
    bool show_help = false;
    bool show_version = false;
};

// 从配置文件加载，每行一个"键 值"，#开头为注释
bool loadConfigFile(const std::string& config_file, ServerConfig& config);

// 设置单个配置项，未知的键返回false
bool applyConfigValue(const std::string& key, const std::string& value, ServerConfig& config);

// 校验配置取值
bool validateConfig(const ServerConfig& config);

// 解析命令行参数，按出现顺序生效（-c 出现时立即加载配置文件）
bool parseArguments(int argc, const char* const argv[], ServerConfig& config);

} // namespace potato
