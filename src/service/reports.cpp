#include "reports.hpp"

namespace trk::service
{

std::size_t DashboardSummary::total() const noexcept
{
    std::size_t sum = 0;
    for (const auto& c : counts)
    {
        sum += c.count;
    }
    return sum;
}

std::size_t DashboardSummary::countOf(Severity severity) const noexcept
{
    for (const auto& c : counts)
    {
        if (c.severity == severity)
        {
            return c.count;
        }
    }
    return 0;
}

DashboardSummary dashboardSummary(const TrackerService& tracker, const ProjectId& projectId)
{
    DashboardSummary summary;
    const domain::Project* project = tracker.findProject(projectId);
    if (!project)
    {
        return summary;
    }

    summary.projectId = project->projectId();
    summary.projectName = project->name();

    // 先放入全部 4 个级别（包括 0），保证直方图完整且顺序固定
    summary.counts.reserve(kAllSeverities.size());
    for (Severity s : kAllSeverities)
    {
        summary.counts.push_back({s, 0});
    }

    for (const auto& issueId : project->backlog())
    {
        const domain::Issue* issue = tracker.findIssue(issueId);
        if (!issue)
        {
            continue;
        }
        for (auto& c : summary.counts)
        {
            if (c.severity == issue->severity())
            {
                ++c.count;
                break;
            }
        }
    }
    return summary;
}

std::vector<SeverityReportRow> severityReport(const TrackerService& tracker, const ProjectId& projectId)
{
    std::vector<SeverityReportRow> rows;
    const domain::Project* project = tracker.findProject(projectId);
    if (!project)
    {
        return rows;
    }

    rows.reserve(project->backlog().size());
    for (const auto& issueId : project->backlog())
    {
        if (const domain::Issue* issue = tracker.findIssue(issueId))
        {
            rows.push_back({issue->issueId(), issue->title(), issue->severity(), issue->status()});
        }
    }
    return rows;
}

std::vector<IssueDescriptor> issueListing(const TrackerService& tracker)
{
    std::vector<IssueDescriptor> out;
    for (const auto& issue : tracker.issues())
    {
        out.push_back({issue.label(), issue.issueId(), issue.title(), issue.status(), issue.severity()});
    }
    return out;
}

} // namespace trk::service
