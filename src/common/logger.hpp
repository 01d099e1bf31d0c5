#pragma once

#include <atomic>
#include <cctype>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace trk
{

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

// 进程级日志阈值，低于该级别的日志直接丢弃
inline std::atomic<LogLevel>& logThreshold() noexcept
{
    static std::atomic<LogLevel> level{LogLevel::Info};
    return level;
}

inline void setLogLevel(LogLevel level) noexcept
{
    logThreshold().store(level);
}

// 解析 debug / info / warn / error（大小写不敏感），无法识别时返回 std::nullopt
inline std::optional<LogLevel> parseLogLevel(std::string_view s)
{
    std::string lower;
    lower.reserve(s.size());
    for (char c : s)
    {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

inline void log(LogLevel level, std::string_view msg)
{
    if (level < logThreshold().load())
    {
        return;
    }

    const char* tag = "";
    switch (level)
    {
    case LogLevel::Debug: tag = "[DEBUG]"; break;
    case LogLevel::Info: tag = "[INFO ]"; break;
    case LogLevel::Warn: tag = "[WARN ]"; break;
    case LogLevel::Error: tag = "[ERROR]"; break;
    }

    // 先拼成整行再一次性写出，避免多线程下同一行被打断
    std::ostringstream line;
    line << tag << ' ' << msg << '\n';
    std::clog << line.str();
}

} // namespace trk
