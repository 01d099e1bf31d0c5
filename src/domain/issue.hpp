#pragma once

#include "common/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace trk::domain
{

class User;

inline std::string severityToString(Severity s)
{
    switch (s)
    {
    case Severity::Low:      return "LOW";
    case Severity::Medium:   return "MEDIUM";
    case Severity::High:     return "HIGH";
    case Severity::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

inline std::optional<Severity> stringToSeverity(const std::string& s)
{
    if (s == "LOW") return Severity::Low;
    if (s == "MEDIUM") return Severity::Medium;
    if (s == "HIGH") return Severity::High;
    if (s == "CRITICAL") return Severity::Critical;
    return std::nullopt;
}

inline std::string issueStatusToString(IssueStatus s)
{
    switch (s)
    {
    case IssueStatus::New:        return "NEW";
    case IssueStatus::InProgress: return "IN_PROGRESS";
    case IssueStatus::Resolved:   return "RESOLVED";
    case IssueStatus::Closed:     return "CLOSED";
    }
    return "UNKNOWN";
}

inline std::optional<IssueStatus> stringToIssueStatus(const std::string& s)
{
    if (s == "NEW") return IssueStatus::New;
    if (s == "IN_PROGRESS") return IssueStatus::InProgress;
    if (s == "RESOLVED") return IssueStatus::Resolved;
    if (s == "CLOSED") return IssueStatus::Closed;
    return std::nullopt;
}

inline std::string issueKindLabel(IssueKind kind)
{
    return kind == IssueKind::Task ? "TASK" : "BUG";
}

// "task"（大小写不敏感）得到 Task，其余任何输入（包括空串）都得到 Bug
IssueKind parseIssueKind(const std::string& kind);

// 问题单（Bug / Task 共用同一结构，kind 仅决定显示标签）
class Issue
{
public:
    Issue(IssueId     id,
          std::string title,
          std::string description,
          Severity    severity,
          IssueKind   kind = IssueKind::Bug);

    [[nodiscard]] const IssueId& issueId() const noexcept { return id_; }
    [[nodiscard]] const std::string& title() const noexcept { return title_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] Severity severity() const noexcept { return severity_; }
    [[nodiscard]] IssueStatus status() const noexcept { return status_; }
    [[nodiscard]] IssueKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::optional<UserId>& assignee() const noexcept { return assignee_; }
    [[nodiscard]] const std::vector<std::string>& attachments() const noexcept { return attachments_; }
    [[nodiscard]] const std::set<std::string>& tags() const noexcept { return tags_; }
    [[nodiscard]] Timestamp createdAt() const noexcept { return createdAt_; }

    [[nodiscard]] std::string label() const { return issueKindLabel(kind_); }

    void setTitle(std::string title) { title_ = std::move(title); }
    void setDescription(std::string description) { description_ = std::move(description); }
    void setSeverity(Severity severity) noexcept { severity_ = severity; }
    void setStatus(IssueStatus status) noexcept { status_ = status; }

    // 只记录用户 ID，不持有 User 对象
    void assignTo(const User& user);

    void addAttachment(std::string attachment);

    // tags 是集合，重复添加同一个 tag 不会产生重复项
    void addTag(std::string tag);

    // 形如 "[BUG] I1 title IN_PROGRESS CRITICAL"
    [[nodiscard]] std::string toString() const;

private:
    IssueId                  id_;
    std::string              title_;
    std::string              description_;
    Severity                 severity_{Severity::Low};
    IssueStatus              status_{IssueStatus::New};
    IssueKind                kind_{IssueKind::Bug};
    std::optional<UserId>    assignee_;
    std::vector<std::string> attachments_;
    std::set<std::string>    tags_;
    Timestamp                createdAt_;
};

} // namespace trk::domain
