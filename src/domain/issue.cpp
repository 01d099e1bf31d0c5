#include "issue.hpp"

#include "user.hpp"

#include <cctype>

namespace trk::domain
{

IssueKind parseIssueKind(const std::string& kind)
{
    static constexpr char kTask[] = "task";
    constexpr std::size_t kTaskLen = sizeof(kTask) - 1;

    if (kind.size() != kTaskLen)
    {
        return IssueKind::Bug;
    }
    for (std::size_t i = 0; i < kTaskLen; ++i)
    {
        if (std::tolower(static_cast<unsigned char>(kind[i])) != kTask[i])
        {
            return IssueKind::Bug;
        }
    }
    return IssueKind::Task;
}

Issue::Issue(IssueId id, std::string title, std::string description, Severity severity, IssueKind kind)
    : id_(std::move(id))
    , title_(std::move(title))
    , description_(std::move(description))
    , severity_(severity)
    , status_(IssueStatus::New)
    , kind_(kind)
    , createdAt_(std::chrono::system_clock::now())
{
}

void Issue::assignTo(const User& user)
{
    assignee_ = user.id();
}

void Issue::addAttachment(std::string attachment)
{
    attachments_.push_back(std::move(attachment));
}

void Issue::addTag(std::string tag)
{
    tags_.insert(std::move(tag));
}

std::string Issue::toString() const
{
    return "[" + label() + "] " + id_ + " " + title_ + " " + issueStatusToString(status_) + " "
           + severityToString(severity_);
}

} // namespace trk::domain
