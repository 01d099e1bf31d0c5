#pragma once

#include "tracker_service.hpp"

#include "common/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace trk::service
{

struct SeverityCount
{
    Severity    severity{Severity::Low};
    std::size_t count{0};
};

// 项目仪表盘：完整的严重级别直方图
struct DashboardSummary
{
    ProjectId                  projectId;
    std::string                projectName;
    std::vector<SeverityCount> counts; // 已知项目固定 4 项（LOW, MEDIUM, HIGH, CRITICAL）；未知项目为空

    [[nodiscard]] bool empty() const noexcept { return counts.empty(); }
    [[nodiscard]] std::size_t total() const noexcept;
    [[nodiscard]] std::size_t countOf(Severity severity) const noexcept;
};

struct SeverityReportRow
{
    IssueId     issueId;
    std::string title;
    Severity    severity{Severity::Low};
    IssueStatus status{IssueStatus::New};
};

// 全局问题列表中的一行
struct IssueDescriptor
{
    std::string label; // "BUG" / "TASK"
    IssueId     issueId;
    std::string title;
    IssueStatus status{IssueStatus::New};
    Severity    severity{Severity::Low};
};

// 以下均为只读查询，不修改任何状态；未知 projectId 返回空结果

[[nodiscard]] DashboardSummary dashboardSummary(const TrackerService& tracker, const ProjectId& projectId);

// 按 backlog 顺序逐条列出
[[nodiscard]] std::vector<SeverityReportRow> severityReport(const TrackerService& tracker, const ProjectId& projectId);

// 顺序为注册表迭代顺序
[[nodiscard]] std::vector<IssueDescriptor> issueListing(const TrackerService& tracker);

} // namespace trk::service
