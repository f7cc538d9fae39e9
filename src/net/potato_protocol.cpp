#include "net/potato_protocol.hpp"
#include "potato_utils.hpp"
#include "potato_logger.hpp"
#include <memory>
#include <cctype>
#include <algorithm>
#include <strings.h>

namespace potato {

// MessageProtocol 实现

DecodeStatus MessageProtocol::frameObject(const std::string& data, size_t pos, FrameState& state, size_t& end) {
    size_t i = std::max(pos, state.scan_pos);

    if (!state.started) {
        // 跳过消息之间的空白
        while (i < data.length() && std::isspace(static_cast<unsigned char>(data[i]))) {
            i++;
        }
        if (i >= data.length()) {
            state.scan_pos = i;
            return DecodeStatus::NEED_MORE;
        }
        if (data[i] != '{') {
            return DecodeStatus::MALFORMED;
        }
        state.started = true;
        state.begin = i;
    }

    for (; i < data.length(); ++i) {
        if (i - state.begin >= MAX_MESSAGE_SIZE) {
            return DecodeStatus::MALFORMED;
        }

        char c = data[i];
        if (state.in_string) {
            if (state.escaped) {
                state.escaped = false;
            } else if (c == '\\') {
                state.escaped = true;
            } else if (c == '"') {
                state.in_string = false;
            }
            continue;
        }

        switch (c) {
            case '"':
                state.in_string = true;
                break;
            case '{':
            case '[':
                state.depth++;
                break;
            case '}':
            case ']':
                state.depth--;
                if (state.depth == 0) {
                    end = i + 1;
                    return DecodeStatus::OK;
                }
                if (state.depth < 0) {
                    return DecodeStatus::MALFORMED;
                }
                break;
            default:
                break;
        }
    }

    state.scan_pos = i;
    return DecodeStatus::NEED_MORE;
}

bool MessageProtocol::parseObject(const std::string& data, size_t begin, size_t end, Json::Value& root) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["allowComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    std::string errors;
    const char* text = data.data();
    if (!reader->parse(text + begin, text + end, &root, &errors)) {
        POTATO_LOG_DEBUG("JSON解析失败: ", errors);
        return false;
    }
    return root.isObject();
}

const Json::Value* MessageProtocol::findMember(const Json::Value& object, const std::string& name) {
    const Json::Value* exact = object.find(name.data(), name.data() + name.length());
    if (exact) {
        return exact;
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (strcasecmp(it.name().c_str(), name.c_str()) == 0) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string MessageProtocol::writeCompact(const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, root) + "\n";
}

DecodeStatus MessageProtocol::parseCommand(const std::string& data, size_t& pos, Command& command) {
    FrameState state;
    return parseCommand(data, pos, command, state);
}

DecodeStatus MessageProtocol::parseCommand(const std::string& data, size_t& pos, Command& command,
                                           FrameState& state) {
    size_t end = 0;
    DecodeStatus status = frameObject(data, pos, state, end);
    if (status != DecodeStatus::OK) {
        return status;
    }
    size_t begin = state.begin;
    state.reset();

    Json::Value root;
    if (!parseObject(data, begin, end, root)) {
        return DecodeStatus::MALFORMED;
    }

    Command result;

    const Json::Value* name = findMember(root, "Name");
    if (name && !name->isNull()) {
        if (!name->isString()) {
            return DecodeStatus::MALFORMED;
        }
        result.name = name->asString();
    }

    const Json::Value* args = findMember(root, "Arguments");
    if (args && !args->isNull()) {
        if (!args->isArray()) {
            return DecodeStatus::MALFORMED;
        }
        result.args.reserve(args->size());
        for (const auto& arg : *args) {
            if (!arg.isString()) {
                return DecodeStatus::MALFORMED;
            }
            result.args.push_back(arg.asString());
        }
    }

    const Json::Value* ttl = findMember(root, "TTL");
    if (ttl && !ttl->isNull()) {
        if (!ttl->isInt64()) {
            return DecodeStatus::MALFORMED;
        }
        result.ttl = Utils::fromNanoseconds(ttl->asInt64());
    }

    command = std::move(result);
    pos = end;
    return DecodeStatus::OK;
}

std::string MessageProtocol::serializeResponse(const Response& response) {
    Json::Value root(Json::objectValue);
    root["Code"] = Json::UInt(static_cast<uint32_t>(response.code));
    root["StatusMessage"] = response.message;
    root["Value"] = response.value;
    return writeCompact(root);
}

std::string MessageProtocol::serializeCommand(const Command& command) {
    Json::Value root(Json::objectValue);
    root["Name"] = command.name;

    Json::Value args(Json::arrayValue);
    for (const auto& arg : command.args) {
        args.append(arg);
    }
    root["Arguments"] = args;
    root["TTL"] = Json::Int64(Utils::toNanoseconds(command.ttl));
    return writeCompact(root);
}

DecodeStatus MessageProtocol::parseResponse(const std::string& data, size_t& pos, Response& response) {
    FrameState state;
    return parseResponse(data, pos, response, state);
}

DecodeStatus MessageProtocol::parseResponse(const std::string& data, size_t& pos, Response& response,
                                            FrameState& state) {
    size_t end = 0;
    DecodeStatus status = frameObject(data, pos, state, end);
    if (status != DecodeStatus::OK) {
        return status;
    }
    size_t begin = state.begin;
    state.reset();

    Json::Value root;
    if (!parseObject(data, begin, end, root)) {
        return DecodeStatus::MALFORMED;
    }

    const Json::Value* code = findMember(root, "Code");
    const Json::Value* message = findMember(root, "StatusMessage");
    const Json::Value* value = findMember(root, "Value");
    if (!code || !code->isUInt()) {
        return DecodeStatus::MALFORMED;
    }

    response.code = static_cast<StatusCode>(code->asUInt());
    response.message = (message && message->isString()) ? message->asString() : "";
    response.value = (value && value->isString()) ? value->asString() : "";
    pos = end;
    return DecodeStatus::OK;
}

} // namespace potato
