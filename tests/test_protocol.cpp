#include <gtest/gtest.h>
#include "net/potato_protocol.hpp"
#include <algorithm>

using namespace potato;

// 解析完整的请求
TEST(MessageProtocolTest, ParseCommand) {
    std::string data = R"({"Name":"set","Arguments":["k","v"],"TTL":5000000000})";
    size_t pos = 0;
    Command command;
    ASSERT_EQ(MessageProtocol::parseCommand(data, pos, command), DecodeStatus::OK);
    EXPECT_EQ(pos, data.size());
    EXPECT_EQ(command.name, "set");
    ASSERT_EQ(command.args.size(), 2u);
    EXPECT_EQ(command.args[0], "k");
    EXPECT_EQ(command.args[1], "v");
    EXPECT_EQ(command.ttl, std::chrono::milliseconds(5000));
}

// 字段名大小写不敏感，Arguments与TTL可省略
TEST(MessageProtocolTest, CaseInsensitiveAndOptionalFields) {
    std::string data = R"({"name":"keys"})";
    size_t pos = 0;
    Command command;
    ASSERT_EQ(MessageProtocol::parseCommand(data, pos, command), DecodeStatus::OK);
    EXPECT_EQ(command.name, "keys");
    EXPECT_TRUE(command.args.empty());
    EXPECT_EQ(command.ttl, Duration::zero());

    data = R"({"NAME":"get","arguments":null,"ttl":0})";
    pos = 0;
    ASSERT_EQ(MessageProtocol::parseCommand(data, pos, command), DecodeStatus::OK);
    EXPECT_EQ(command.name, "get");
    EXPECT_TRUE(command.args.empty());
}

// 不足一毫秒的非零TTL向上取整
TEST(MessageProtocolTest, SubMillisecondTtl) {
    std::string data = R"({"Name":"set","Arguments":["k","v"],"TTL":1})";
    size_t pos = 0;
    Command command;
    ASSERT_EQ(MessageProtocol::parseCommand(data, pos, command), DecodeStatus::OK);
    EXPECT_EQ(command.ttl, std::chrono::milliseconds(1));
}

// TTL的符号与范围
TEST(MessageProtocolTest, TtlSignAndRange) {
    std::string data = R"({"Name":"set","Arguments":["k","v"],"TTL":9223372036854775807})"
                       R"({"Name":"set","Arguments":["k","v"],"TTL":-1})"
                       R"({"Name":"set","Arguments":["k","v"],"TTL":-2500000})";
    size_t pos = 0;
    Command command;

    ASSERT_EQ(MessageProtocol::parseCommand(data, pos, command), DecodeStatus::OK);
    EXPECT_EQ(command.ttl, std::chrono::milliseconds(9223372036855LL));

    // 负值保留符号，不会变成默认值
    ASSERT_EQ(MessageProtocol::parseCommand(data, pos, command), DecodeStatus::OK);
    EXPECT_EQ(command.ttl, std::chrono::milliseconds(-1));
    ASSERT_EQ(MessageProtocol::parseCommand(data, pos, command), DecodeStatus::OK);
    EXPECT_EQ(command.ttl, std::chrono::milliseconds(-3));

    // 序列化时饱和在int64范围内
    std::string text = MessageProtocol::serializeCommand(Command("get", {"k"}, Duration::max()));
    EXPECT_NE(text.find("\"TTL\":9223372036854775807"), std::string::npos);
}

// 流上首尾相接的多条消息
TEST(MessageProtocolTest, BackToBackMessages) {
    std::string data = R"({"Name":"get","Arguments":["a"]}  {"Name":"get","Arguments":["b}"]})" "\n";
    size_t pos = 0;
    Command command;

    ASSERT_EQ(MessageProtocol::parseCommand(data, pos, command), DecodeStatus::OK);
    EXPECT_EQ(command.args[0], "a");
    ASSERT_EQ(MessageProtocol::parseCommand(data, pos, command), DecodeStatus::OK);
    EXPECT_EQ(command.args[0], "b}");
    EXPECT_EQ(MessageProtocol::parseCommand(data, pos, command), DecodeStatus::NEED_MORE);
}

// 不完整的消息需要更多数据
TEST(MessageProtocolTest, PartialMessage) {
    std::string full = R"({"Name":"set","Arguments":["k","va\"l{ue"]})";
    for (size_t cut = 0; cut < full.size(); cut++) {
        std::string partial = full.substr(0, cut);
        size_t pos = 0;
        Command command;
        EXPECT_EQ(MessageProtocol::parseCommand(partial, pos, command), DecodeStatus::NEED_MORE) << cut;
        EXPECT_EQ(pos, 0u);
    }

    size_t pos = 0;
    Command command;
    ASSERT_EQ(MessageProtocol::parseCommand(full, pos, command), DecodeStatus::OK);
    EXPECT_EQ(command.args[1], "va\"l{ue");
}

// 分块到达的大消息：每块只扫描新到的字节
TEST(MessageProtocolTest, LargeMessageInChunks) {
    const size_t value_size = 8 * 1024 * 1024;
    const size_t chunk_size = 8 * 1024;
    std::string value(value_size, 'x');
    // 混入会影响分帧的字符
    for (size_t i = 0; i < value_size; i += 4096) {
        value[i] = (i % 3 == 0) ? '{' : ((i % 3 == 1) ? '}' : '"');
    }
    std::string full = MessageProtocol::serializeCommand(Command("set", {"big", value}));
    ASSERT_LT(full.size(), MessageProtocol::MAX_MESSAGE_SIZE);

    std::string buffer;
    FrameState state;
    Command command;
    size_t offset = 0;
    size_t need_more = 0;
    DecodeStatus status = DecodeStatus::NEED_MORE;
    while (offset < full.size()) {
        size_t n = std::min(chunk_size, full.size() - offset);
        buffer.append(full, offset, n);
        offset += n;

        size_t pos = 0;
        status = MessageProtocol::parseCommand(buffer, pos, command, state);
        if (status != DecodeStatus::NEED_MORE) {
            break;
        }
        need_more++;
        // 扫描进度停在缓冲区末尾，下次从这里继续
        ASSERT_EQ(state.scan_pos, buffer.size());
    }

    ASSERT_EQ(status, DecodeStatus::OK);
    EXPECT_EQ(offset, full.size());
    EXPECT_GT(need_more, 1000u);
    EXPECT_EQ(command.name, "set");
    ASSERT_EQ(command.args.size(), 2u);
    EXPECT_EQ(command.args[1], value);

    // 解析成功后状态已复位
    EXPECT_FALSE(state.started);
    EXPECT_EQ(state.scan_pos, 0u);
}

// 超过长度上限
TEST(MessageProtocolTest, OversizedMessage) {
    std::string data = R"({"Name":"set","Arguments":["k",")";
    data.append(MessageProtocol::MAX_MESSAGE_SIZE, 'a');
    size_t pos = 0;
    Command command;
    EXPECT_EQ(MessageProtocol::parseCommand(data, pos, command), DecodeStatus::MALFORMED);
}

// 格式错误
TEST(MessageProtocolTest, Malformed) {
    const char* cases[] = {
        "[1,2]",
        "hello",
        R"({"Name":1})",
        R"({"Name":"set","Arguments":"k"})",
        R"({"Name":"set","Arguments":["k",2]})",
        R"({"Name":"set","TTL":"soon"})",
        R"({"Name":"set","TTL":1.5})",
        R"({"Name" "set"})",
    };
    for (const char* text : cases) {
        std::string data = text;
        size_t pos = 0;
        Command command;
        EXPECT_EQ(MessageProtocol::parseCommand(data, pos, command), DecodeStatus::MALFORMED) << text;
    }
}

// 响应序列化
TEST(MessageProtocolTest, SerializeResponse) {
    std::string text = MessageProtocol::serializeResponse(Response(StatusCode::OK, "v"));
    EXPECT_EQ(text, R"({"Code":0,"StatusMessage":"OK","Value":"v"})" "\n");

    text = MessageProtocol::serializeResponse(Response(StatusCode::NO_WORKERS));
    size_t pos = 0;
    Response response;
    ASSERT_EQ(MessageProtocol::parseResponse(text, pos, response), DecodeStatus::OK);
    EXPECT_EQ(response.code, StatusCode::NO_WORKERS);
    EXPECT_EQ(response.message, "There are no available workers on the server");
    EXPECT_EQ(response.value, "");
}

// 客户端序列化的命令可被服务端解析
TEST(MessageProtocolTest, SerializeCommand) {
    Command sent("hset", {"h", "f", "v\n\"x\""}, std::chrono::milliseconds(1500));
    std::string text = MessageProtocol::serializeCommand(sent);
    EXPECT_NE(text.find("\"TTL\":1500000000"), std::string::npos);

    size_t pos = 0;
    Command parsed;
    ASSERT_EQ(MessageProtocol::parseCommand(text, pos, parsed), DecodeStatus::OK);
    EXPECT_EQ(parsed.name, sent.name);
    EXPECT_EQ(parsed.args, sent.args);
    EXPECT_EQ(parsed.ttl, sent.ttl);
}
