#include "user.hpp"

#include "issue.hpp"
#include "roles.hpp"

namespace trk::domain
{

bool User::approveIssue(Issue& issue) const
{
    if (!canApprove_)
    {
        return false;
    }

    if (issue.severity() != Severity::Critical)
    {
        return false;
    }

    // 已经 RESOLVED / CLOSED 的问题也会被拉回 IN_PROGRESS
    issue.setStatus(IssueStatus::InProgress);
    return true;
}

std::string User::toString() const
{
    return name_ + " (" + roleToString(role_) + ")";
}

} // namespace trk::domain
