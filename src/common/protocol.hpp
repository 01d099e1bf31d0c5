#pragma once

#include <nlohmann/json.hpp>

#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace trk::protocol
{

using json = nlohmann::json;

// --------------------- 基础消息封装 ---------------------

enum class MessageType
{
    CommandResponse,
    Error
};

// payload 格式：
// - 成功：{ "ok": true,  "data": {...} }
// - 失败：{ "ok": false, "error": { "code": "...", "message": "..." } }
struct Message
{
    MessageType type{};
    json        payload;

    [[nodiscard]] bool ok() const { return type == MessageType::CommandResponse; }
};

// json -> 文本。参数来自 stdin，可能不是合法 UTF-8，非法字节替换为 U+FFFD 而不是抛异常
inline std::string dumpJson(const json& value, int indent = -1)
{
    return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

// 输出层序列化：只输出 payload，indent < 0 时为单行
inline std::string serialize(const Message& msg, int indent = -1)
{
    return dumpJson(msg.payload, indent);
}

// --------------------- 统一命令协议层 ---------------------

// 统一的「命令」抽象：
// - name    : 命令名（例如 CREATE_ISSUE / ASSIGN / DASHBOARD 等），已转为大写
// - rawArgs : 命令名之后的原始参数字符串
// - args    : 参数数组
struct Command
{
    std::string              name;
    std::string              rawArgs;
    std::vector<std::string> args;
};

inline std::string toUpperCopy(std::string s)
{
    for (char& c : s)
    {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

// 从 JSON 解析 Command
// JSON 格式: { "cmd": "...", "args": [...] }，非字符串参数会被忽略
inline Command parseCommandFromJson(const json& payload)
{
    Command cmd;
    cmd.name = toUpperCopy(payload.value("cmd", ""));

    if (payload.contains("args") && payload["args"].is_array())
    {
        for (const auto& arg : payload["args"])
        {
            if (arg.is_string())
            {
                cmd.args.push_back(arg.get<std::string>());
            }
        }
    }

    for (const auto& arg : cmd.args)
    {
        if (!cmd.rawArgs.empty()) cmd.rawArgs.push_back(' ');
        cmd.rawArgs += arg;
    }
    return cmd;
}

// 将 Command 转换为 JSON
inline json commandToJson(const Command& cmd)
{
    json j;
    j["cmd"] = cmd.name;
    j["args"] = cmd.args;
    return j;
}

// 按空白切分参数；双引号包住的部分作为一个参数（可含空格），引号内 \" 表示字面引号
inline std::vector<std::string> splitArgs(const std::string& raw)
{
    std::vector<std::string> out;
    std::string              current;
    bool                     inQuotes = false;
    bool                     hasToken = false;

    for (std::size_t i = 0; i < raw.size(); ++i)
    {
        char ch = raw[i];
        if (inQuotes)
        {
            if (ch == '\\' && i + 1 < raw.size() && raw[i + 1] == '"')
            {
                current.push_back('"');
                ++i;
            }
            else if (ch == '"')
            {
                inQuotes = false;
            }
            else
            {
                current.push_back(ch);
            }
            continue;
        }

        if (ch == '"')
        {
            inQuotes = true;
            hasToken = true;
        }
        else if (std::isspace(static_cast<unsigned char>(ch)))
        {
            if (hasToken)
            {
                out.push_back(current);
                current.clear();
                hasToken = false;
            }
        }
        else
        {
            current.push_back(ch);
            hasToken = true;
        }
    }

    // 未闭合的引号按到行尾处理
    if (hasToken)
    {
        out.push_back(current);
    }
    return out;
}

// 解析文本命令行：如 CREATE_ISSUE I1 "NullPointer in Login" "NPE when user logs in" CRITICAL bug
inline Command parseCommandLine(const std::string& line)
{
    Command cmd;

    std::size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos)
    {
        return cmd; // 空命令
    }

    std::size_t spacePos = line.find_first_of(" \t", start);
    if (spacePos == std::string::npos)
    {
        cmd.name = toUpperCopy(line.substr(start));
        return cmd;
    }

    cmd.name = toUpperCopy(line.substr(start, spacePos - start));

    std::size_t argStart = line.find_first_not_of(" \t", spacePos);
    if (argStart == std::string::npos)
    {
        return cmd;
    }

    cmd.rawArgs = line.substr(argStart);
    cmd.args = splitArgs(cmd.rawArgs);
    return cmd;
}

// 以 '{' 开头的行按 JSON 命令解析，其余按文本命令解析；JSON 非法时返回 std::nullopt
inline std::optional<Command> parseRequestLine(const std::string& line)
{
    std::size_t start = line.find_first_not_of(" \t");
    if (start != std::string::npos && line[start] == '{')
    {
        try
        {
            json payload = json::parse(line);
            if (!payload.is_object())
            {
                return std::nullopt;
            }
            return parseCommandFromJson(payload);
        }
        catch (const json::exception&)
        {
            return std::nullopt;
        }
    }
    return parseCommandLine(line);
}

// --------------------- 响应构建辅助函数 ---------------------

inline Message makeSuccessResponse(const json& data = json::object())
{
    Message msg;
    msg.type = MessageType::CommandResponse;
    msg.payload = {{"ok", true}, {"data", data}};
    return msg;
}

inline Message makeErrorResponse(const std::string& code, const std::string& message, const json& details = json::object())
{
    Message msg;
    msg.type = MessageType::Error;
    json error = {{"code", code}, {"message", message}};
    if (!details.empty())
    {
        error["details"] = details;
    }
    msg.payload = {{"ok", false}, {"error", error}};
    return msg;
}

} // namespace trk::protocol
