#ifndef POTATO_LOGGER_HPP
#define POTATO_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <chrono>
#include <mutex>
#include <atomic>
#include <iomanip>
#include <ctime>

namespace potato {

// 日志等级枚举
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

// 日志系统类
class Logger {
public:
    // 获取单例实例
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    // 从字符串解析日志等级（debug, info, warning, error, critical）
    static bool parseLogLevel(const std::string& name, LogLevel& level) {
        if (name == "debug") {
            level = LogLevel::DEBUG;
        } else if (name == "info") {
            level = LogLevel::INFO;
        } else if (name == "warning") {
            level = LogLevel::WARNING;
        } else if (name == "error") {
            level = LogLevel::ERROR;
        } else if (name == "critical") {
            level = LogLevel::CRITICAL;
        } else {
            return false;
        }
        return true;
    }

    void setLogLevel(LogLevel level) {
        log_level_ = level;
    }

    LogLevel getLogLevel() const {
        return log_level_;
    }

    // 设置日志文件路径（追加模式）
    bool setLogFile(const std::string& file_path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
        log_file_.open(file_path, std::ios::out | std::ios::app);
        log_to_file_ = log_file_.is_open();
        return log_to_file_;
    }

    void closeLogFile() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
            log_to_file_ = false;
        }
    }

    void setConsoleOutput(bool enable) {
        console_output_ = enable;
    }

    // 日志输出方法，参数直接拼接
    template<typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (level < log_level_) {
            return;
        }

        std::stringstream ss;
        writePrefix(ss, level);
        printArgs(ss, std::forward<Args>(args)...);
        write(level, ss.str());
    }

    // 格式化日志方法，支持{}占位符
    template<typename... Args>
    void logf(LogLevel level, const std::string& format, Args&&... args) {
        if (level < log_level_) {
            return;
        }

        std::stringstream ss;
        writePrefix(ss, level);
        printfArgs(ss, format, std::forward<Args>(args)...);
        write(level, ss.str());
    }

    template<typename... Args>
    void debug(Args&&... args) { log(LogLevel::DEBUG, std::forward<Args>(args)...); }

    template<typename... Args>
    void info(Args&&... args) { log(LogLevel::INFO, std::forward<Args>(args)...); }

    template<typename... Args>
    void warning(Args&&... args) { log(LogLevel::WARNING, std::forward<Args>(args)...); }

    template<typename... Args>
    void error(Args&&... args) { log(LogLevel::ERROR, std::forward<Args>(args)...); }

    template<typename... Args>
    void critical(Args&&... args) { log(LogLevel::CRITICAL, std::forward<Args>(args)...); }

    template<typename... Args>
    void debugf(const std::string& format, Args&&... args) {
        logf(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void infof(const std::string& format, Args&&... args) {
        logf(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warningf(const std::string& format, Args&&... args) {
        logf(LogLevel::WARNING, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void errorf(const std::string& format, Args&&... args) {
        logf(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void criticalf(const std::string& format, Args&&... args) {
        logf(LogLevel::CRITICAL, format, std::forward<Args>(args)...);
    }

private:
    Logger() : log_level_(LogLevel::INFO), console_output_(true), log_to_file_(false) {}

    ~Logger() {
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // 时间戳与日志等级前缀
    void writePrefix(std::stringstream& ss, LogLevel level) {
        auto now = std::chrono::system_clock::now();
        auto now_c = std::chrono::system_clock::to_time_t(now);
        std::tm now_tm;
        localtime_r(&now_c, &now_tm);
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        ss << "[" << std::put_time(&now_tm, "%Y-%m-%d %H:%M:%S") << "."
           << std::setw(3) << std::setfill('0') << now_ms.count() << "] ";
        ss << "[" << levelToString(level) << "] ";
    }

    void write(LogLevel level, const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (console_output_) {
            std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
            out << entry << std::endl;
        }

        if (log_to_file_ && log_file_.is_open()) {
            log_file_ << entry << std::endl;
        }
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARNING";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::CRITICAL:
                return "CRITICAL";
            default:
                return "UNKNOWN";
        }
    }

    // 将所有参数直接转为字符串并拼接
    template<typename T, typename... Args>
    void printArgs(std::stringstream& ss, T&& arg, Args&&... args) {
        ss << std::forward<T>(arg);
        if constexpr (sizeof...(args) > 0) {
            printArgs(ss, std::forward<Args>(args)...);
        }
    }

    void printArgs(std::stringstream& /*unused*/) {}

    template<typename T, typename... Args>
    void printfArgsFrom(std::stringstream& ss, const std::string& format, size_t pos, T&& arg, Args&&... args) {
        size_t placeholder_pos = format.find("{}", pos);
        if (placeholder_pos == std::string::npos) {
            ss << format.substr(pos);
            return;
        }

        ss << format.substr(pos, placeholder_pos - pos);
        ss << std::forward<T>(arg);

        if constexpr (sizeof...(args) > 0) {
            printfArgsFrom(ss, format, placeholder_pos + 2, std::forward<Args>(args)...);
        } else {
            ss << format.substr(placeholder_pos + 2);
        }
    }

    template<typename... Args>
    void printfArgs(std::stringstream& ss, const std::string& format, Args&&... args) {
        if constexpr (sizeof...(args) > 0) {
            printfArgsFrom(ss, format, 0, std::forward<Args>(args)...);
        } else {
            ss << format;
        }
    }

    std::atomic<LogLevel> log_level_;
    std::atomic<bool> console_output_;
    bool log_to_file_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// 全局日志宏
#define POTATO_LOG_DEBUG(...) ::potato::Logger::getInstance().debug(__VA_ARGS__)
#define POTATO_LOG_INFO(...) ::potato::Logger::getInstance().info(__VA_ARGS__)
#define POTATO_LOG_WARNING(...) ::potato::Logger::getInstance().warning(__VA_ARGS__)
#define POTATO_LOG_ERROR(...) ::potato::Logger::getInstance().error(__VA_ARGS__)
#define POTATO_LOG_CRITICAL(...) ::potato::Logger::getInstance().critical(__VA_ARGS__)

// 格式化版本日志宏
#define POTATO_LOG_DEBUGF(...) ::potato::Logger::getInstance().debugf(__VA_ARGS__)
#define POTATO_LOG_INFOF(...) ::potato::Logger::getInstance().infof(__VA_ARGS__)
#define POTATO_LOG_WARNINGF(...) ::potato::Logger::getInstance().warningf(__VA_ARGS__)
#define POTATO_LOG_ERRORF(...) ::potato::Logger::getInstance().errorf(__VA_ARGS__)
#define POTATO_LOG_CRITICALF(...) ::potato::Logger::getInstance().criticalf(__VA_ARGS__)

} // namespace potato

#endif // POTATO_LOGGER_HPP
