#include "potato_config.hpp"
#include "potato_utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace potato {

namespace {

bool parseSize(const std::string& value, size_t& out) {
    if (!Utils::isNumeric(value)) {
        return false;
    }
    try {
        out = std::stoull(value);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

bool parsePort(const std::string& value, int& out) {
    size_t port = 0;
    if (!parseSize(value, port) || port > 65535) {
        return false;
    }
    out = static_cast<int>(port);
    return true;
}

bool isConfigKey(const std::string& key) {
    static const char* const keys[] = {
        "port", "workers", "default_ttl", "idle_timeout",
        "cleanup_interval", "max_connections", "log_level", "log_file",
    };
    for (const char* k : keys) {
        if (key == k) {
            return true;
        }
    }
    return false;
}

} // namespace

bool applyConfigValue(const std::string& key, const std::string& value, ServerConfig& config) {
    bool ok = true;
    if (key == "port") {
        ok = parsePort(value, config.port);
    } else if (key == "workers") {
        ok = parseSize(value, config.num_workers);
    } else if (key == "default_ttl") {
        ok = Utils::parseDuration(value, config.default_ttl);
    } else if (key == "idle_timeout") {
        ok = Utils::parseDuration(value, config.idle_timeout);
    } else if (key == "cleanup_interval") {
        ok = Utils::parseDuration(value, config.cleanup_interval);
    } else if (key == "max_connections") {
        ok = parseSize(value, config.max_connections);
    } else if (key == "log_level") {
        LogLevel level;
        ok = Logger::parseLogLevel(value, level);
        if (ok) {
            config.log_level = value;
        }
    } else if (key == "log_file") {
        config.log_file = value;
    } else {
        POTATO_LOG_WARNING("未知配置项: ", key);
        return false;
    }

    if (!ok) {
        POTATO_LOG_ERROR("配置项 ", key, " 的值无效: ", value);
    }
    return ok;
}

bool loadConfigFile(const std::string& config_file, ServerConfig& config) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        POTATO_LOG_ERROR("无法打开配置文件: ", config_file);
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        // 跳过注释和空行
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        std::istringstream iss(line);
        std::string key, value;
        if (!(iss >> key >> value)) {
            POTATO_LOG_ERROR("配置文件 ", config_file, " 第 ", line_no, " 行格式错误: ", line);
            return false;
        }

        // 未知配置项只告警
        if (!isConfigKey(key)) {
            POTATO_LOG_WARNING("配置文件 ", config_file, " 第 ", line_no, " 行: 忽略未知配置项 ", key);
            continue;
        }
        if (!applyConfigValue(key, value, config)) {
            POTATO_LOG_ERROR("配置文件 ", config_file, " 第 ", line_no, " 行无效");
            return false;
        }
    }

    return validateConfig(config);
}

bool validateConfig(const ServerConfig& config) {
    if (config.num_workers == 0) {
        POTATO_LOG_ERROR("工作池容量必须大于0");
        return false;
    }
    if (config.default_ttl <= Duration::zero()) {
        POTATO_LOG_ERROR("默认TTL必须大于0");
        return false;
    }
    if (config.idle_timeout <= Duration::zero()) {
        POTATO_LOG_ERROR("会话空闲超时必须大于0");
        return false;
    }
    if (config.cleanup_interval <= Duration::zero()) {
        POTATO_LOG_ERROR("过期清理间隔必须大于0");
        return false;
    }
    return true;
}

bool parseArguments(int argc, const char* const argv[], ServerConfig& config) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            continue;
        }
        if (arg == "-v" || arg == "--version") {
            config.show_version = true;
            continue;
        }

        std::string key;
        if (arg == "-c" || arg == "--config") {
            key = "config";
        } else if (arg == "-p" || arg == "--port") {
            key = "port";
        } else if (arg == "-w" || arg == "--workers") {
            key = "workers";
        } else if (arg == "-t" || arg == "--ttl") {
            key = "default_ttl";
        } else if (arg == "-i" || arg == "--idle-timeout") {
            key = "idle_timeout";
        } else if (arg == "-s" || arg == "--cleanup-interval") {
            key = "cleanup_interval";
        } else if (arg == "-n" || arg == "--max-connections") {
            key = "max_connections";
        } else if (arg == "-l" || arg == "--log-level") {
            key = "log_level";
        } else if (arg == "-f" || arg == "--log-file") {
            key = "log_file";
        } else {
            POTATO_LOG_ERROR("未知参数: ", arg);
            return false;
        }

        if (i + 1 >= argc) {
            POTATO_LOG_ERROR(arg, " 需要指定参数值");
            return false;
        }
        std::string value = argv[++i];

        if (key == "config") {
            config.config_file = value;
            if (!loadConfigFile(value, config)) {
                return false;
            }
        } else if (!applyConfigValue(key, value, config)) {
            return false;
        }
    }

    return validateConfig(config);
}

} // namespace potato
