#pragma once

#include "common/types.hpp"
#include "roles.hpp"

#include <string>
#include <utility>

namespace trk::domain
{

class Issue;

class User
{
public:
    User(UserId id, std::string name, Role role, std::string email)
        : id_(std::move(id))
        , name_(std::move(name))
        , role_(role)
        , email_(std::move(email))
        , canApprove_(hasApprovalAuthority(role))
    {
    }

    [[nodiscard]] const UserId& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] Role role() const noexcept { return role_; }
    [[nodiscard]] const std::string& email() const noexcept { return email_; }
    [[nodiscard]] const std::string& bio() const noexcept { return bio_; }
    // 创建时的角色决定是否为审批者，之后 setRole 不改变它
    [[nodiscard]] bool canApprove() const noexcept { return canApprove_; }

    void setName(std::string name) { name_ = std::move(name); }
    void setRole(Role role) noexcept { role_ = role; }
    void setEmail(std::string email) { email_ = std::move(email); }
    void setBio(std::string bio) { bio_ = std::move(bio); }

    // 审批行为由创建时的角色决定：
    // - 以 QA / DEV 创建：总是返回 false，不修改 issue
    // - 以 MANAGER 创建：issue 严重级别为 CRITICAL 时，无论当前状态都置为 IN_PROGRESS 并返回 true
    bool approveIssue(Issue& issue) const;

    // 形如 "Alice (QA)"
    [[nodiscard]] std::string toString() const;

private:
    UserId      id_;
    std::string name_;
    Role        role_{Role::Qa};
    std::string email_;
    std::string bio_;
    bool        canApprove_{false};
};

} // namespace trk::domain
