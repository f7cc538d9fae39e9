#include "potato_server.hpp"
#include "potato_config.hpp"
#include "potato_logger.hpp"
#include <iostream>
#include <string>
#include <csignal>
#include <atomic>

namespace potato {

// 全局服务器实例，用于信号处理
PotatoServer* g_server = nullptr;
std::atomic<bool> g_should_exit{false};

// 信号处理函数，只做原子操作
void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_should_exit = true;
        if (g_server) {
            g_server->stop();
        }
    }
}

// 打印帮助信息
void printHelp() {
    std::cout << "Potato - 带TTL的内存键值存储 v0.1\n" << std::endl;
    std::cout << "用法: potato_slave [选项]\n" << std::endl;
    std::cout << "选项:" << std::endl;
    std::cout << "  -c, --config <file>             使用指定的配置文件" << std::endl;
    std::cout << "  -p, --port <port>               设置服务器端口（默认：6379）" << std::endl;
    std::cout << "  -w, --workers <num>             设置工作许可数量（默认：8）" << std::endl;
    std::cout << "  -t, --ttl <duration>            设置默认TTL（默认：60s）" << std::endl;
    std::cout << "  -i, --idle-timeout <duration>   设置会话空闲超时（默认：30s）" << std::endl;
    std::cout << "  -s, --cleanup-interval <dur>    设置过期清理间隔（默认：1s）" << std::endl;
    std::cout << "  -n, --max-connections <num>     接受指定数量的连接后退出（默认：0，不限）" << std::endl;
    std::cout << "  -l, --log-level <level>         设置日志等级（debug, info, warning, error, critical, 默认：info）" << std::endl;
    std::cout << "  -f, --log-file <file>           设置日志文件路径" << std::endl;
    std::cout << "  -v, --version                   显示版本信息" << std::endl;
    std::cout << "  -h, --help                      显示帮助信息" << std::endl;
    std::cout << "\n时长可带单位 ms、s、m，不带单位按毫秒处理。" << std::endl;
    std::cout << "\n示例:" << std::endl;
    std::cout << "  potato_slave                       # 使用默认配置启动" << std::endl;
    std::cout << "  potato_slave -p 6380 -w 16         # 在端口6380启动，16个工作许可" << std::endl;
    std::cout << "  potato_slave -c potato.conf -p 7000 # 使用配置文件，并覆盖端口" << std::endl;
    std::cout << "  potato_slave -l debug -f potato.log # 启用调试日志并输出到文件" << std::endl;
}

// 打印版本信息
void printVersion() {
    std::cout << "Potato v0.1.0" << std::endl;
    std::cout << "基于C++17的内存键值存储服务" << std::endl;
}

} // namespace potato

int main(int argc, char* argv[]) {
    using namespace potato;

    // 初始化日志系统
    auto& logger = Logger::getInstance();

    // 解析命令行参数
    ServerConfig config;
    if (!parseArguments(argc, argv, config)) {
        std::cerr << "使用 -h 或 --help 查看帮助信息" << std::endl;
        return 1;
    }

    // 处理帮助和版本信息
    if (config.show_help) {
        printHelp();
        return 0;
    }

    if (config.show_version) {
        printVersion();
        return 0;
    }

    // 配置日志系统
    LogLevel level;
    if (Logger::parseLogLevel(config.log_level, level)) {
        logger.setLogLevel(level);
    } else {
        std::cerr << "无效的日志等级: " << config.log_level << ", 使用默认等级 (info)" << std::endl;
    }

    // 设置日志文件
    if (!config.log_file.empty()) {
        if (!logger.setLogFile(config.log_file)) {
            std::cerr << "无法打开日志文件: " << config.log_file << std::endl;
            return 1;
        }
        POTATO_LOG_INFO("日志文件已设置为: ", config.log_file);
    }

    // 创建服务器实例
    POTATO_LOG_INFO("正在创建服务器实例，端口: ", config.port, ", 工作许可数量: ", config.num_workers);
    PotatoServer server(config);
    g_server = &server;

    // 设置信号处理
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    // 启动服务器
    POTATO_LOG_INFO("正在启动服务器...");
    if (!server.start()) {
        POTATO_LOG_ERROR("启动服务器失败");
        g_server = nullptr;
        return 1;
    }

    // 接受循环，直到收到退出信号或达到连接上限
    server.serve();

    if (g_should_exit) {
        POTATO_LOG_INFO("收到中断信号，服务器已关闭");
    }

    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    g_server = nullptr;

    // 关闭日志文件
    logger.closeLogFile();

    return 0;
}
