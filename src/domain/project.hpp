#pragma once

#include "issue.hpp"

#include "common/types.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace trk::domain
{

class User;

// 按 ID 查找问题单的接口，用于解耦 Project 与具体的注册表实现；找不到时返回 nullptr
using IssueResolver = std::function<const Issue*(const IssueId&)>;

// 项目：backlog / team 只保存 ID，不拥有对应实体的生命周期
class Project
{
public:
    Project(ProjectId id, std::string name, std::string repoUrl);

    [[nodiscard]] const ProjectId& projectId() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& repoUrl() const noexcept { return repoUrl_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] Timestamp createdAt() const noexcept { return createdAt_; }
    [[nodiscard]] const std::vector<IssueId>& backlog() const noexcept { return backlog_; }
    [[nodiscard]] const std::vector<UserId>& team() const noexcept { return team_; }

    void setDescription(std::string description) { description_ = std::move(description); }

    // 追加到末尾，不做去重
    void addUser(const User& user);
    void addIssue(const Issue& issue);

    // 删除第一个 ID 相同的条目，没有找到时返回 false
    bool removeUser(const User& user);
    bool removeIssue(const Issue& issue);

    // 按 backlog 顺序返回当前严重级别等于 severity 的问题单（调用时通过 resolve 取最新状态）。
    // resolve 找不到的 ID 会被跳过。
    [[nodiscard]] std::vector<Issue> listBySeverity(Severity severity, const IssueResolver& resolve) const;

    // 形如 "Alpha [P1]"
    [[nodiscard]] std::string toString() const;

private:
    ProjectId            id_;
    std::string          name_;
    std::string          repoUrl_;
    std::string          description_;
    Timestamp            createdAt_;
    std::vector<IssueId> backlog_;
    std::vector<UserId>  team_;
};

} // namespace trk::domain
