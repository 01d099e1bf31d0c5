#pragma once

#include "common/protocol.hpp"
#include "common/types.hpp"
#include "domain/issue.hpp"
#include "domain/roles.hpp"

#include <cctype>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace trk::app::utils
{

inline std::string trimCopy(const std::string& s)
{
    std::size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    std::size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// 命令行输入的枚举值大小写不敏感，例如 "dev" / "Dev" / "DEV"
inline std::optional<Role> parseRole(const std::string& s)
{
    return domain::stringToRole(protocol::toUpperCopy(trimCopy(s)));
}

inline std::optional<Severity> parseSeverity(const std::string& s)
{
    return domain::stringToSeverity(protocol::toUpperCopy(trimCopy(s)));
}

inline std::optional<IssueStatus> parseStatus(const std::string& s)
{
    return domain::stringToIssueStatus(protocol::toUpperCopy(trimCopy(s)));
}

// args[from..] 用空格拼接，用于 bio / description 这类可能没加引号的长文本
inline std::string joinArgs(const std::vector<std::string>& args, std::size_t from)
{
    std::string out;
    for (std::size_t i = from; i < args.size(); ++i)
    {
        if (i > from) out.push_back(' ');
        out += args[i];
    }
    return out;
}

// UTC，ISO 8601 格式：2026-01-02T03:04:05Z
inline std::string formatTimestamp(Timestamp ts)
{
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm     tm{};
    gmtime_r(&t, &tm);

    char buf[32]{};
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0)
    {
        return {};
    }
    return buf;
}

} // namespace trk::app::utils
