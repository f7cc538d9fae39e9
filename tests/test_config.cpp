#include <gtest/gtest.h>
#include "potato_config.hpp"
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace potato;
using std::chrono::milliseconds;

namespace {

bool parse(const std::vector<std::string>& args, ServerConfig& config) {
    std::vector<const char*> argv;
    argv.push_back("potato_slave");
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    return parseArguments(static_cast<int>(argv.size()), argv.data(), config);
}

} // namespace

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = "/tmp/potato_test_" + std::to_string(getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf";
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void writeFile(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    std::string path_;
};

// 默认值
TEST(ConfigTest, Defaults) {
    ServerConfig config;
    EXPECT_EQ(config.port, 6379);
    EXPECT_EQ(config.num_workers, 8u);
    EXPECT_EQ(config.default_ttl, milliseconds(60000));
    EXPECT_EQ(config.idle_timeout, milliseconds(30000));
    EXPECT_EQ(config.cleanup_interval, milliseconds(1000));
    EXPECT_EQ(config.max_connections, 0u);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_TRUE(validateConfig(config));
}

// 命令行参数
TEST(ConfigTest, ParseArguments) {
    ServerConfig config;
    ASSERT_TRUE(parse({"-p", "7000", "-w", "4", "--ttl", "5s", "-i", "2m", "-s", "250ms",
                       "-n", "3", "-l", "debug", "-f", "/tmp/potato.log"}, config));
    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.num_workers, 4u);
    EXPECT_EQ(config.default_ttl, milliseconds(5000));
    EXPECT_EQ(config.idle_timeout, milliseconds(120000));
    EXPECT_EQ(config.cleanup_interval, milliseconds(250));
    EXPECT_EQ(config.max_connections, 3u);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.log_file, "/tmp/potato.log");
}

// 帮助与版本
TEST(ConfigTest, HelpAndVersion) {
    ServerConfig config;
    ASSERT_TRUE(parse({"-h", "--version"}, config));
    EXPECT_TRUE(config.show_help);
    EXPECT_TRUE(config.show_version);
}

// 非法参数
TEST(ConfigTest, BadArguments) {
    ServerConfig config;
    EXPECT_FALSE(parse({"--bogus"}, config));
    EXPECT_FALSE(parse({"-p"}, config));
    EXPECT_FALSE(parse({"-p", "http"}, config));
    EXPECT_FALSE(parse({"-p", "70000"}, config));
    EXPECT_FALSE(parse({"-w", "0"}, config));
    EXPECT_FALSE(parse({"-w", "-3"}, config));
    EXPECT_FALSE(parse({"-t", "0"}, config));
    EXPECT_FALSE(parse({"-t", "5h"}, config));
    EXPECT_FALSE(parse({"-l", "verbose"}, config));
    EXPECT_FALSE(parse({"-w", "99999999999999999999999"}, config));
}

// 时长单位，无单位按毫秒
TEST(ConfigTest, DurationUnits) {
    ServerConfig config;
    EXPECT_TRUE(applyConfigValue("default_ttl", "1500", config));
    EXPECT_EQ(config.default_ttl, milliseconds(1500));
    EXPECT_TRUE(applyConfigValue("default_ttl", "3s", config));
    EXPECT_EQ(config.default_ttl, milliseconds(3000));
    EXPECT_TRUE(applyConfigValue("default_ttl", "1m", config));
    EXPECT_EQ(config.default_ttl, milliseconds(60000));
    EXPECT_FALSE(applyConfigValue("default_ttl", "ms", config));
    EXPECT_FALSE(applyConfigValue("default_ttl", "1.5s", config));
    EXPECT_FALSE(applyConfigValue("no_such_key", "1", config));
    // 乘以单位后溢出
    EXPECT_FALSE(applyConfigValue("default_ttl", "9223372036854775807m", config));
    EXPECT_EQ(config.default_ttl, milliseconds(60000));
}

// 配置文件
TEST_F(ConfigFileTest, LoadFile) {
    writeFile("# potato\n"
              "\n"
              "port 7001\n"
              "   workers 2\n"
              "default_ttl 10s\n"
              "unknown_option yes\n"
              "log_level warning\n");

    ServerConfig config;
    ASSERT_TRUE(loadConfigFile(path_, config));
    EXPECT_EQ(config.port, 7001);
    EXPECT_EQ(config.num_workers, 2u);
    EXPECT_EQ(config.default_ttl, milliseconds(10000));
    EXPECT_EQ(config.log_level, "warning");
}

// 配置文件中的非法值
TEST_F(ConfigFileTest, InvalidValue) {
    writeFile("workers many\n");
    ServerConfig config;
    EXPECT_FALSE(loadConfigFile(path_, config));

    writeFile("port\n");
    EXPECT_FALSE(loadConfigFile(path_, config));
}

// 文件不存在
TEST(ConfigTest, MissingFile) {
    ServerConfig config;
    EXPECT_FALSE(loadConfigFile("/nonexistent/potato.conf", config));
    EXPECT_FALSE(parse({"-c", "/nonexistent/potato.conf"}, config));
}

// 命令行参数覆盖配置文件
TEST_F(ConfigFileTest, ArgumentsOverrideFile) {
    writeFile("port 7002\nworkers 3\n");
    ServerConfig config;
    ASSERT_TRUE(parse({"-c", path_, "-p", "7100"}, config));
    EXPECT_EQ(config.config_file, path_);
    EXPECT_EQ(config.port, 7100);
    EXPECT_EQ(config.num_workers, 3u);
}
