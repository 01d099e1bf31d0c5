#include "project.hpp"

#include "user.hpp"

#include <algorithm>

namespace trk::domain
{

namespace
{
template <typename Id>
bool eraseFirst(std::vector<Id>& ids, const Id& id)
{
    auto it = std::find(ids.begin(), ids.end(), id);
    if (it == ids.end())
    {
        return false;
    }
    ids.erase(it);
    return true;
}
} // namespace

Project::Project(ProjectId id, std::string name, std::string repoUrl)
    : id_(std::move(id))
    , name_(std::move(name))
    , repoUrl_(std::move(repoUrl))
    , createdAt_(std::chrono::system_clock::now())
{
}

void Project::addUser(const User& user)
{
    team_.push_back(user.id());
}

void Project::addIssue(const Issue& issue)
{
    backlog_.push_back(issue.issueId());
}

bool Project::removeUser(const User& user)
{
    return eraseFirst(team_, user.id());
}

bool Project::removeIssue(const Issue& issue)
{
    return eraseFirst(backlog_, issue.issueId());
}

std::vector<Issue> Project::listBySeverity(Severity severity, const IssueResolver& resolve) const
{
    std::vector<Issue> out;
    if (!resolve)
    {
        return out;
    }

    for (const auto& issueId : backlog_)
    {
        const Issue* issue = resolve(issueId);
        if (issue && issue->severity() == severity)
        {
            out.push_back(*issue);
        }
    }
    return out;
}

std::string Project::toString() const
{
    return name_ + " [" + id_ + "]";
}

} // namespace trk::domain
