#pragma once

#include "common/types.hpp"
#include "domain/issue.hpp"
#include "domain/project.hpp"
#include "domain/user.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace trk::service
{

// 问题跟踪服务：
// - 持有 users / projects / issues 三张注册表（ID -> 实体），是实体生命周期的唯一拥有者
// - 所有跨实体操作都通过 ID 查表完成；ID 不存在不是错误，相应操作退化为 no-op 或返回 false
// - 重复 ID 创建时直接覆盖旧条目（后写者胜）
// 本类不加锁，多线程场景请通过 SynchronizedTracker 访问。
class TrackerService
{
public:
    TrackerService() = default;

    // role 为 MANAGER 时创建出的用户具有审批权
    domain::User& createUser(const UserId& id, std::string name, Role role, std::string email);

    domain::Project& createProject(const ProjectId& id, std::string name, std::string repoUrl);

    // kind 大小写不敏感："task" 创建 Task，其余（包括缺省）创建 Bug
    domain::Issue& createIssue(const IssueId&    id,
                               std::string       title,
                               std::string       description,
                               Severity          severity,
                               const std::string& kind = "bug");

    // 查找失败返回 nullptr
    [[nodiscard]] domain::User* findUser(const UserId& id);
    [[nodiscard]] const domain::User* findUser(const UserId& id) const;
    [[nodiscard]] domain::Project* findProject(const ProjectId& id);
    [[nodiscard]] const domain::Project* findProject(const ProjectId& id) const;
    [[nodiscard]] domain::Issue* findIssue(const IssueId& id);
    [[nodiscard]] const domain::Issue* findIssue(const IssueId& id) const;

    // 注册表快照（值拷贝），顺序为注册表内部迭代顺序，不保证与创建顺序一致
    [[nodiscard]] std::vector<domain::User> users() const;
    [[nodiscard]] std::vector<domain::Project> projects() const;
    [[nodiscard]] std::vector<domain::Issue> issues() const;

    // issue 不存在时静默忽略
    void attachToIssue(const IssueId& issueId, std::string attachment);
    void tagIssue(const IssueId& issueId, std::string tag);

    // issue 与 user 都存在时：设置 assignee 并把状态置为 IN_PROGRESS（无论之前是什么状态），返回 true。
    // 任一不存在时返回 false，且不做任何修改。
    bool assignIssue(const IssueId& issueId, const UserId& userId);

    // 不校验状态迁移是否合法
    bool changeStatus(const IssueId& issueId, IssueStatus status);

    // project 不存在时静默忽略；不做去重
    void addIssueToProject(const ProjectId& projectId, const domain::Issue& issue);
    void addUserToProject(const ProjectId& projectId, const domain::User& user);

    // 只从项目列表中移除，不影响注册表
    bool removeIssueFromProject(const ProjectId& projectId, const domain::Issue& issue);
    bool removeUserFromProject(const ProjectId& projectId, const domain::User& user);

    // project 不存在时返回空列表
    [[nodiscard]] std::vector<domain::Issue> listBySeverity(const ProjectId& projectId, Severity severity) const;

    // 基于 issue 注册表的查找器，供 Project 解析 backlog
    [[nodiscard]] domain::IssueResolver issueResolver() const;

private:
    std::unordered_map<UserId, domain::User>       users_;
    std::unordered_map<ProjectId, domain::Project> projects_;
    std::unordered_map<IssueId, domain::Issue>     issues_;
};

} // namespace trk::service
