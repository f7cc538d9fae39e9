#include "storage/potato_storage.hpp"
#include "potato_command_handler.hpp"
#include "net/potato_protocol.hpp"
#include <benchmark/benchmark.h>
#include <memory>
#include <string>

namespace potato {

// 预先写入1000个字符串键
class StorageBenchmark : public ::benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        storage_ = std::make_unique<StorageEngine>();
        handler_ = std::make_unique<CommandHandler>(storage_.get(), std::chrono::seconds(600));
        storage_->ensureKeyspace(DEFAULT_USER);
        for (int i = 0; i < 1000; ++i) {
            handler_->execute(DEFAULT_USER,
                              Command("set", {"bench_key_" + std::to_string(i), "value_" + std::to_string(i)}));
        }
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        handler_.reset();
        storage_.reset();
    }

protected:
    std::unique_ptr<StorageEngine> storage_;
    std::unique_ptr<CommandHandler> handler_;
};

BENCHMARK_F(StorageBenchmark, BM_Set)(benchmark::State& state) {
    int64_t i = 0;
    for (auto _ : state) {
        Command command("set", {"bench_key_" + std::to_string(i % 1000), "v"});
        benchmark::DoNotOptimize(handler_->execute(DEFAULT_USER, command));
        i++;
    }
}

BENCHMARK_F(StorageBenchmark, BM_Get)(benchmark::State& state) {
    int64_t i = 0;
    for (auto _ : state) {
        Command command("get", {"bench_key_" + std::to_string(i % 1000)});
        benchmark::DoNotOptimize(handler_->execute(DEFAULT_USER, command));
        i++;
    }
}

BENCHMARK_F(StorageBenchmark, BM_LPush)(benchmark::State& state) {
    Command command("lpush", {"bench_list", "v"});
    for (auto _ : state) {
        benchmark::DoNotOptimize(handler_->execute(DEFAULT_USER, command));
    }
}

// 全量过期扫描，无过期键时的开销
BENCHMARK_F(StorageBenchmark, BM_Sweep)(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(storage_->cleanupExpiredKeys());
    }
}

// 多线程争用全局锁
static void BM_ConcurrentGetSet(benchmark::State& state) {
    static StorageEngine storage;
    static CommandHandler handler(&storage, std::chrono::seconds(600));

    std::string prefix = "t" + std::to_string(state.thread_index()) + "_";
    int64_t i = 0;
    for (auto _ : state) {
        Key key = prefix + std::to_string(i % 100);
        if (i % 4 == 0) {
            benchmark::DoNotOptimize(handler.execute(DEFAULT_USER, Command("set", {key, "v"})));
        } else {
            benchmark::DoNotOptimize(handler.execute(DEFAULT_USER, Command("get", {key})));
        }
        i++;
    }
}
BENCHMARK(BM_ConcurrentGetSet)->Threads(1)->Threads(4)->Threads(8);

// 请求解码
static void BM_ParseCommand(benchmark::State& state) {
    std::string data = MessageProtocol::serializeCommand(
        Command("hset", {"bench_map", "field", "value"}, std::chrono::milliseconds(5000)));
    for (auto _ : state) {
        size_t pos = 0;
        Command command;
        benchmark::DoNotOptimize(MessageProtocol::parseCommand(data, pos, command));
    }
}
BENCHMARK(BM_ParseCommand);

} // namespace potato

BENCHMARK_MAIN();
