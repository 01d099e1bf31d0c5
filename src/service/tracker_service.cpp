#include "tracker_service.hpp"

#include "common/logger.hpp"
#include "domain/roles.hpp"

namespace trk::service
{

namespace
{
template <typename Map>
auto* findIn(Map& map, const std::string& id)
{
    auto it = map.find(id);
    return it == map.end() ? nullptr : &it->second;
}

template <typename T>
std::vector<T> snapshot(const std::unordered_map<std::string, T>& map)
{
    std::vector<T> out;
    out.reserve(map.size());
    for (const auto& [id, entity] : map)
    {
        out.push_back(entity);
    }
    return out;
}
} // namespace

domain::User& TrackerService::createUser(const UserId& id, std::string name, Role role, std::string email)
{
    auto [it, inserted] = users_.insert_or_assign(id, domain::User(id, std::move(name), role, std::move(email)));
    trk::log(LogLevel::Debug,
             std::string(inserted ? "Created" : "Replaced") + " user " + id + " ("
                 + domain::roleToString(role) + ")");
    return it->second;
}

domain::Project& TrackerService::createProject(const ProjectId& id, std::string name, std::string repoUrl)
{
    auto [it, inserted] = projects_.insert_or_assign(id, domain::Project(id, std::move(name), std::move(repoUrl)));
    trk::log(LogLevel::Debug, std::string(inserted ? "Created" : "Replaced") + " project " + id);
    return it->second;
}

domain::Issue& TrackerService::createIssue(const IssueId&     id,
                                           std::string        title,
                                           std::string        description,
                                           Severity           severity,
                                           const std::string& kind)
{
    domain::Issue issue(id, std::move(title), std::move(description), severity, domain::parseIssueKind(kind));
    auto [it, inserted] = issues_.insert_or_assign(id, std::move(issue));
    trk::log(LogLevel::Debug,
             std::string(inserted ? "Created" : "Replaced") + " issue " + id + " (" + it->second.label() + ", "
                 + domain::severityToString(severity) + ")");
    return it->second;
}

domain::User* TrackerService::findUser(const UserId& id)
{
    return findIn(users_, id);
}

const domain::User* TrackerService::findUser(const UserId& id) const
{
    return findIn(users_, id);
}

domain::Project* TrackerService::findProject(const ProjectId& id)
{
    return findIn(projects_, id);
}

const domain::Project* TrackerService::findProject(const ProjectId& id) const
{
    return findIn(projects_, id);
}

domain::Issue* TrackerService::findIssue(const IssueId& id)
{
    return findIn(issues_, id);
}

const domain::Issue* TrackerService::findIssue(const IssueId& id) const
{
    return findIn(issues_, id);
}

std::vector<domain::User> TrackerService::users() const
{
    return snapshot(users_);
}

std::vector<domain::Project> TrackerService::projects() const
{
    return snapshot(projects_);
}

std::vector<domain::Issue> TrackerService::issues() const
{
    return snapshot(issues_);
}

void TrackerService::attachToIssue(const IssueId& issueId, std::string attachment)
{
    domain::Issue* issue = findIssue(issueId);
    if (!issue)
    {
        trk::log(LogLevel::Debug, "attachToIssue: issue not found: " + issueId);
        return;
    }
    issue->addAttachment(std::move(attachment));
}

void TrackerService::tagIssue(const IssueId& issueId, std::string tag)
{
    domain::Issue* issue = findIssue(issueId);
    if (!issue)
    {
        trk::log(LogLevel::Debug, "tagIssue: issue not found: " + issueId);
        return;
    }
    issue->addTag(std::move(tag));
}

bool TrackerService::assignIssue(const IssueId& issueId, const UserId& userId)
{
    domain::Issue*      issue = findIssue(issueId);
    const domain::User* user = findUser(userId);
    if (!issue || !user)
    {
        trk::log(LogLevel::Debug, "assignIssue: issue or user not found: " + issueId + " -> " + userId);
        return false;
    }

    issue->assignTo(*user);
    issue->setStatus(IssueStatus::InProgress);
    return true;
}

bool TrackerService::changeStatus(const IssueId& issueId, IssueStatus status)
{
    domain::Issue* issue = findIssue(issueId);
    if (!issue)
    {
        return false;
    }
    issue->setStatus(status);
    return true;
}

void TrackerService::addIssueToProject(const ProjectId& projectId, const domain::Issue& issue)
{
    if (domain::Project* project = findProject(projectId))
    {
        project->addIssue(issue);
    }
}

void TrackerService::addUserToProject(const ProjectId& projectId, const domain::User& user)
{
    if (domain::Project* project = findProject(projectId))
    {
        project->addUser(user);
    }
}

bool TrackerService::removeIssueFromProject(const ProjectId& projectId, const domain::Issue& issue)
{
    domain::Project* project = findProject(projectId);
    return project && project->removeIssue(issue);
}

bool TrackerService::removeUserFromProject(const ProjectId& projectId, const domain::User& user)
{
    domain::Project* project = findProject(projectId);
    return project && project->removeUser(user);
}

std::vector<domain::Issue> TrackerService::listBySeverity(const ProjectId& projectId, Severity severity) const
{
    const domain::Project* project = findProject(projectId);
    if (!project)
    {
        return {};
    }
    return project->listBySeverity(severity, issueResolver());
}

domain::IssueResolver TrackerService::issueResolver() const
{
    return [this](const IssueId& id) { return findIssue(id); };
}

} // namespace trk::service
