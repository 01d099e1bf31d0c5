#include "command_processor.hpp"

#include "command_utils.hpp"

#include "common/logger.hpp"
#include "service/reports.hpp"

#include <optional>
#include <vector>

namespace trk::app
{

namespace
{
using protocol::Command;
using protocol::json;
using protocol::makeErrorResponse;
using protocol::makeSuccessResponse;
using protocol::Message;
using service::TrackerService;

json userToJson(const domain::User& u)
{
    return {{"id", u.id()},
            {"name", u.name()},
            {"role", domain::roleToString(u.role())},
            {"canApprove", u.canApprove()},
            {"email", u.email()},
            {"bio", u.bio()}};
}

json issueToJson(const domain::Issue& i)
{
    json j = {{"id", i.issueId()},
              {"kind", i.label()},
              {"title", i.title()},
              {"description", i.description()},
              {"severity", domain::severityToString(i.severity())},
              {"status", domain::issueStatusToString(i.status())},
              {"attachments", i.attachments()},
              {"tags", i.tags()},
              {"createdAt", utils::formatTimestamp(i.createdAt())}};
    j["assignee"] = i.assignee() ? json(*i.assignee()) : json(nullptr);
    return j;
}

json projectToJson(const domain::Project& p)
{
    return {{"id", p.projectId()},
            {"name", p.name()},
            {"repoUrl", p.repoUrl()},
            {"description", p.description()},
            {"createdAt", utils::formatTimestamp(p.createdAt())},
            {"backlog", p.backlog()},
            {"team", p.team()}};
}

Message missingArgs(const std::string& usage)
{
    return makeErrorResponse("MISSING_ARGS", "Usage: " + usage);
}

Message invalidArg(const std::string& what, const std::string& value)
{
    return makeErrorResponse("INVALID_ARGS", "Invalid " + what + ": " + value);
}

Message notFound(const std::string& what, const std::string& id)
{
    return makeErrorResponse("NOT_FOUND", what + " not found: " + id);
}

const std::vector<std::string>& helpLines()
{
    static const std::vector<std::string> lines = {
        "CREATE_USER <id> <name> <QA|DEV|MANAGER> <email>",
        "CREATE_PROJECT <id> <name> <repoUrl>",
        "CREATE_ISSUE <id> <title> <description> <LOW|MEDIUM|HIGH|CRITICAL> [bug|task]",
        "GET_USER <id> | GET_PROJECT <id> | GET_ISSUE <id>",
        "SET_USER <id> <name|email|role|bio> <value>",
        "SET_ISSUE <id> <title|description|severity> <value>",
        "SET_PROJECT <id> description <value>",
        "ATTACH <issueId> <attachment> | TAG <issueId> <tag>",
        "ASSIGN <issueId> <userId>",
        "STATUS <issueId> <NEW|IN_PROGRESS|RESOLVED|CLOSED>",
        "APPROVE <userId> <issueId>",
        "ADD_ISSUE <projectId> <issueId> | REMOVE_ISSUE <projectId> <issueId>",
        "ADD_MEMBER <projectId> <userId> | REMOVE_MEMBER <projectId> <userId>",
        "LIST_SEVERITY <projectId> <severity>",
        "DASHBOARD <projectId> | REPORT <projectId> | LIST_ISSUES",
        "HELP",
    };
    return lines;
}

// 实体的创建 / 查询 / 修改。返回 std::nullopt 表示不处理该命令
std::optional<Message> handleEntityCommand(TrackerService& tracker, const Command& cmd)
{
    const auto& args = cmd.args;

    if (cmd.name == "CREATE_USER")
    {
        if (args.size() < 4) return missingArgs("CREATE_USER <id> <name> <QA|DEV|MANAGER> <email>");
        auto role = utils::parseRole(args[2]);
        if (!role) return invalidArg("role", args[2]);
        return makeSuccessResponse(userToJson(tracker.createUser(args[0], args[1], *role, args[3])));
    }

    if (cmd.name == "CREATE_PROJECT")
    {
        if (args.size() < 3) return missingArgs("CREATE_PROJECT <id> <name> <repoUrl>");
        return makeSuccessResponse(projectToJson(tracker.createProject(args[0], args[1], args[2])));
    }

    if (cmd.name == "CREATE_ISSUE")
    {
        if (args.size() < 4) return missingArgs("CREATE_ISSUE <id> <title> <description> <severity> [kind]");
        auto severity = utils::parseSeverity(args[3]);
        if (!severity) return invalidArg("severity", args[3]);
        const std::string kind = args.size() >= 5 ? args[4] : "bug";
        return makeSuccessResponse(issueToJson(tracker.createIssue(args[0], args[1], args[2], *severity, kind)));
    }

    if (cmd.name == "GET_USER")
    {
        if (args.empty()) return missingArgs("GET_USER <id>");
        const domain::User* user = tracker.findUser(args[0]);
        if (!user) return notFound("User", args[0]);
        return makeSuccessResponse(userToJson(*user));
    }

    if (cmd.name == "GET_PROJECT")
    {
        if (args.empty()) return missingArgs("GET_PROJECT <id>");
        const domain::Project* project = tracker.findProject(args[0]);
        if (!project) return notFound("Project", args[0]);
        return makeSuccessResponse(projectToJson(*project));
    }

    if (cmd.name == "GET_ISSUE")
    {
        if (args.empty()) return missingArgs("GET_ISSUE <id>");
        const domain::Issue* issue = tracker.findIssue(args[0]);
        if (!issue) return notFound("Issue", args[0]);
        return makeSuccessResponse(issueToJson(*issue));
    }

    if (cmd.name == "SET_USER")
    {
        if (args.size() < 3) return missingArgs("SET_USER <id> <name|email|role|bio> <value>");
        domain::User* user = tracker.findUser(args[0]);
        if (!user) return notFound("User", args[0]);

        const std::string field = protocol::toUpperCopy(args[1]);
        const std::string value = utils::joinArgs(args, 2);
        if (field == "NAME")
        {
            user->setName(value);
        }
        else if (field == "EMAIL")
        {
            user->setEmail(value);
        }
        else if (field == "BIO")
        {
            user->setBio(value);
        }
        else if (field == "ROLE")
        {
            auto role = utils::parseRole(value);
            if (!role) return invalidArg("role", value);
            user->setRole(*role);
        }
        else
        {
            return invalidArg("user field", args[1]);
        }
        return makeSuccessResponse(userToJson(*user));
    }

    if (cmd.name == "SET_ISSUE")
    {
        if (args.size() < 3) return missingArgs("SET_ISSUE <id> <title|description|severity> <value>");
        domain::Issue* issue = tracker.findIssue(args[0]);
        if (!issue) return notFound("Issue", args[0]);

        const std::string field = protocol::toUpperCopy(args[1]);
        const std::string value = utils::joinArgs(args, 2);
        if (field == "TITLE")
        {
            issue->setTitle(value);
        }
        else if (field == "DESCRIPTION")
        {
            issue->setDescription(value);
        }
        else if (field == "SEVERITY")
        {
            auto severity = utils::parseSeverity(value);
            if (!severity) return invalidArg("severity", value);
            issue->setSeverity(*severity);
        }
        else
        {
            return invalidArg("issue field", args[1]);
        }
        return makeSuccessResponse(issueToJson(*issue));
    }

    if (cmd.name == "SET_PROJECT")
    {
        if (args.size() < 3) return missingArgs("SET_PROJECT <id> description <value>");
        domain::Project* project = tracker.findProject(args[0]);
        if (!project) return notFound("Project", args[0]);
        if (protocol::toUpperCopy(args[1]) != "DESCRIPTION") return invalidArg("project field", args[1]);
        project->setDescription(utils::joinArgs(args, 2));
        return makeSuccessResponse(projectToJson(*project));
    }

    return std::nullopt;
}

// issue 与 user / project 之间的关系操作
std::optional<Message> handleRelationCommand(TrackerService& tracker, const Command& cmd)
{
    const auto& args = cmd.args;

    if (cmd.name == "ATTACH" || cmd.name == "TAG")
    {
        if (args.size() < 2) return missingArgs(cmd.name + " <issueId> <value>");
        // 核心层对未知 issue 静默忽略，这里只在响应中标出是否生效
        const bool found = tracker.findIssue(args[0]) != nullptr;
        if (cmd.name == "ATTACH")
        {
            tracker.attachToIssue(args[0], args[1]);
        }
        else
        {
            tracker.tagIssue(args[0], args[1]);
        }
        return makeSuccessResponse({{"issueId", args[0]}, {"applied", found}});
    }

    if (cmd.name == "ASSIGN")
    {
        if (args.size() < 2) return missingArgs("ASSIGN <issueId> <userId>");
        if (!tracker.assignIssue(args[0], args[1]))
        {
            return makeErrorResponse("NOT_FOUND", "Issue or user not found: " + args[0] + ", " + args[1]);
        }
        return makeSuccessResponse(issueToJson(*tracker.findIssue(args[0])));
    }

    if (cmd.name == "STATUS")
    {
        if (args.size() < 2) return missingArgs("STATUS <issueId> <status>");
        auto status = utils::parseStatus(args[1]);
        if (!status) return invalidArg("status", args[1]);
        if (!tracker.changeStatus(args[0], *status)) return notFound("Issue", args[0]);
        return makeSuccessResponse(issueToJson(*tracker.findIssue(args[0])));
    }

    if (cmd.name == "APPROVE")
    {
        if (args.size() < 2) return missingArgs("APPROVE <userId> <issueId>");
        const domain::User* user = tracker.findUser(args[0]);
        if (!user) return notFound("User", args[0]);
        domain::Issue* issue = tracker.findIssue(args[1]);
        if (!issue) return notFound("Issue", args[1]);

        const bool approved = user->approveIssue(*issue);
        return makeSuccessResponse({{"approved", approved}, {"issue", issueToJson(*issue)}});
    }

    if (cmd.name == "ADD_ISSUE" || cmd.name == "REMOVE_ISSUE")
    {
        if (args.size() < 2) return missingArgs(cmd.name + " <projectId> <issueId>");
        if (!tracker.findProject(args[0])) return notFound("Project", args[0]);
        const domain::Issue* issue = tracker.findIssue(args[1]);
        if (!issue) return notFound("Issue", args[1]);

        if (cmd.name == "ADD_ISSUE")
        {
            tracker.addIssueToProject(args[0], *issue);
        }
        else if (!tracker.removeIssueFromProject(args[0], *issue))
        {
            return makeErrorResponse("NOT_FOUND", "Issue " + args[1] + " is not in backlog of " + args[0]);
        }
        return makeSuccessResponse(projectToJson(*tracker.findProject(args[0])));
    }

    if (cmd.name == "ADD_MEMBER" || cmd.name == "REMOVE_MEMBER")
    {
        if (args.size() < 2) return missingArgs(cmd.name + " <projectId> <userId>");
        if (!tracker.findProject(args[0])) return notFound("Project", args[0]);
        const domain::User* user = tracker.findUser(args[1]);
        if (!user) return notFound("User", args[1]);

        if (cmd.name == "ADD_MEMBER")
        {
            tracker.addUserToProject(args[0], *user);
        }
        else if (!tracker.removeUserFromProject(args[0], *user))
        {
            return makeErrorResponse("NOT_FOUND", "User " + args[1] + " is not in team of " + args[0]);
        }
        return makeSuccessResponse(projectToJson(*tracker.findProject(args[0])));
    }

    return std::nullopt;
}

// 只读报表
std::optional<Message> handleReportCommand(const TrackerService& tracker, const Command& cmd)
{
    const auto& args = cmd.args;

    if (cmd.name == "LIST_SEVERITY")
    {
        if (args.size() < 2) return missingArgs("LIST_SEVERITY <projectId> <severity>");
        auto severity = utils::parseSeverity(args[1]);
        if (!severity) return invalidArg("severity", args[1]);

        json issues = json::array();
        for (const auto& issue : tracker.listBySeverity(args[0], *severity))
        {
            issues.push_back(issueToJson(issue));
        }
        return makeSuccessResponse(
            {{"projectId", args[0]}, {"severity", domain::severityToString(*severity)}, {"issues", issues}});
    }

    if (cmd.name == "DASHBOARD")
    {
        if (args.empty()) return missingArgs("DASHBOARD <projectId>");
        const auto summary = service::dashboardSummary(tracker, args[0]);

        // 用数组而不是对象，保持 LOW, MEDIUM, HIGH, CRITICAL 的固定顺序
        json counts = json::array();
        for (const auto& c : summary.counts)
        {
            counts.push_back({{"severity", domain::severityToString(c.severity)}, {"count", c.count}});
        }
        return makeSuccessResponse({{"projectId", args[0]},
                                    {"projectName", summary.projectName},
                                    {"counts", counts},
                                    {"total", summary.total()}});
    }

    if (cmd.name == "REPORT")
    {
        if (args.empty()) return missingArgs("REPORT <projectId>");
        json rows = json::array();
        for (const auto& row : service::severityReport(tracker, args[0]))
        {
            rows.push_back({{"issueId", row.issueId},
                            {"title", row.title},
                            {"severity", domain::severityToString(row.severity)},
                            {"status", domain::issueStatusToString(row.status)}});
        }
        return makeSuccessResponse({{"projectId", args[0]}, {"rows", rows}});
    }

    if (cmd.name == "LIST_ISSUES")
    {
        json issues = json::array();
        for (const auto& d : service::issueListing(tracker))
        {
            issues.push_back({{"label", d.label},
                              {"id", d.issueId},
                              {"title", d.title},
                              {"status", domain::issueStatusToString(d.status)},
                              {"severity", domain::severityToString(d.severity)}});
        }
        return makeSuccessResponse({{"issues", issues}});
    }

    return std::nullopt;
}

Message dispatch(TrackerService& tracker, const Command& cmd)
{
    if (auto resp = handleEntityCommand(tracker, cmd)) return *resp;
    if (auto resp = handleRelationCommand(tracker, cmd)) return *resp;
    if (auto resp = handleReportCommand(tracker, cmd)) return *resp;

    if (cmd.name == "HELP")
    {
        return makeSuccessResponse({{"commands", helpLines()}});
    }
    return makeErrorResponse("UNKNOWN_COMMAND", "Unknown command: " + cmd.name);
}

} // namespace

Message CommandProcessor::execute(const Command& cmd)
{
    trk::log(LogLevel::Debug, "Execute: " + protocol::dumpJson(protocol::commandToJson(cmd)));

    Message resp = tracker_.withLock([&cmd](TrackerService& tracker) { return dispatch(tracker, cmd); });
    if (!resp.ok())
    {
        trk::log(LogLevel::Warn, cmd.name + " failed: " + resp.payload["error"].value("message", ""));
    }
    return resp;
}

Message CommandProcessor::executeLine(const std::string& line)
{
    auto cmd = protocol::parseRequestLine(line);
    if (!cmd)
    {
        return makeErrorResponse("PARSE_ERROR", "Failed to parse JSON command");
    }
    return execute(*cmd);
}

} // namespace trk::app
