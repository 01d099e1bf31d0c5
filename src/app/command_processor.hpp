#pragma once

#include "common/protocol.hpp"
#include "service/synchronized_tracker.hpp"

#include <string>

namespace trk::app
{

// 把文本/JSON 命令映射到 TrackerService 上的操作，并把结果序列化为 JSON 响应。
// 每条命令在 SynchronizedTracker 的一个临界区内完成。
class CommandProcessor
{
public:
    explicit CommandProcessor(service::SynchronizedTracker& tracker)
        : tracker_(tracker)
    {
    }

    protocol::Message execute(const protocol::Command& cmd);

    // 解析一行输入（文本或 JSON）后执行；JSON 非法时返回 PARSE_ERROR
    protocol::Message executeLine(const std::string& line);

private:
    service::SynchronizedTracker& tracker_;
};

} // namespace trk::app
