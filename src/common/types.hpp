#pragma once

#include <array>
#include <chrono>
#include <string>

namespace trk
{

using UserId = std::string;
using ProjectId = std::string;
using IssueId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

enum class Role
{
    Qa,
    Dev,
    Manager
};

enum class Severity
{
    Low,
    Medium,
    High,
    Critical
};

enum class IssueStatus
{
    New,
    InProgress,
    Resolved,
    Closed
};

// 只影响显示标签，不影响行为
enum class IssueKind
{
    Bug,
    Task
};

// 报表统一使用的严重级别顺序
inline constexpr std::array<Severity, 4> kAllSeverities{
    Severity::Low, Severity::Medium, Severity::High, Severity::Critical};

} // namespace trk
