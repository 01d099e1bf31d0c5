#pragma once

#include "common/types.hpp"

#include <optional>
#include <string>

namespace trk::domain
{

inline std::string roleToString(Role role)
{
    switch (role)
    {
    case Role::Qa: return "QA";
    case Role::Dev: return "DEV";
    case Role::Manager: return "MANAGER";
    }
    return "UNKNOWN";
}

// 仅接受大写名称，与 roleToString 的输出一一对应
inline std::optional<Role> stringToRole(const std::string& s)
{
    if (s == "QA") return Role::Qa;
    if (s == "DEV") return Role::Dev;
    if (s == "MANAGER") return Role::Manager;
    return std::nullopt;
}

// 只有 Manager 有审批权（把 CRITICAL 问题拉回 IN_PROGRESS）
inline bool hasApprovalAuthority(Role role) noexcept
{
    switch (role)
    {
    case Role::Manager:
        return true;
    case Role::Qa:
    case Role::Dev:
        return false;
    }
    return false;
}

} // namespace trk::domain
