#include <gtest/gtest.h>

#include "app/command_processor.hpp"

using trk::protocol::json;
using trk::protocol::Message;

class CommandProcessorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        run("CREATE_USER U1 Alice QA alice@example.com");
        run("CREATE_USER U2 Bob DEV bob@example.com");
        run("CREATE_USER M1 Carol MANAGER carol@example.com");
        run("CREATE_PROJECT P1 Alpha https://repo/alpha");
        run(R"(CREATE_ISSUE I1 "NullPointer in Login" "NPE when user logs in" CRITICAL bug)");
        run(R"(CREATE_ISSUE I2 "UI alignment" "Button misaligned on mobile" LOW task)");
        run("ADD_ISSUE P1 I1");
        run("ADD_ISSUE P1 I2");
    }

    Message run(const std::string& line) { return processor.executeLine(line); }

    static std::string errorCode(const Message& resp)
    {
        return resp.payload.at("error").at("code").get<std::string>();
    }

    trk::service::SynchronizedTracker tracker;
    trk::app::CommandProcessor        processor{tracker};
};

TEST_F(CommandProcessorTest, CreateIssueReturnsIssue)
{
    auto resp = run(R"(CREATE_ISSUE I9 t d medium TASK)");
    ASSERT_TRUE(resp.ok());
    const json& data = resp.payload["data"];
    EXPECT_EQ(data["kind"], "TASK");
    EXPECT_EQ(data["severity"], "MEDIUM");
    EXPECT_EQ(data["status"], "NEW");
    EXPECT_TRUE(data["assignee"].is_null());
}

TEST_F(CommandProcessorTest, AssignMarksInProgress)
{
    auto resp = run("ASSIGN I1 U2");
    ASSERT_TRUE(resp.ok());
    EXPECT_EQ(resp.payload["data"]["status"], "IN_PROGRESS");
    EXPECT_EQ(resp.payload["data"]["assignee"], "U2");

    auto missing = run("ASSIGN I1 nobody");
    EXPECT_FALSE(missing.ok());
    EXPECT_EQ(errorCode(missing), "NOT_FOUND");
}

TEST_F(CommandProcessorTest, ApproveByManagerAndDeveloper)
{
    run("STATUS I1 CLOSED");

    auto byDev = run("APPROVE U2 I1");
    ASSERT_TRUE(byDev.ok());
    EXPECT_EQ(byDev.payload["data"]["approved"], false);
    EXPECT_EQ(byDev.payload["data"]["issue"]["status"], "CLOSED");

    auto byManager = run("APPROVE M1 I1");
    ASSERT_TRUE(byManager.ok());
    EXPECT_EQ(byManager.payload["data"]["approved"], true);
    EXPECT_EQ(byManager.payload["data"]["issue"]["status"], "IN_PROGRESS");

    auto lowIssue = run("APPROVE M1 I2");
    EXPECT_EQ(lowIssue.payload["data"]["approved"], false);
    EXPECT_EQ(lowIssue.payload["data"]["issue"]["status"], "NEW");
}

TEST_F(CommandProcessorTest, DashboardKeepsCanonicalOrder)
{
    auto resp = run("DASHBOARD P1");
    ASSERT_TRUE(resp.ok());
    const json& counts = resp.payload["data"]["counts"];
    ASSERT_EQ(counts.size(), 4u);
    EXPECT_EQ(counts[0]["severity"], "LOW");
    EXPECT_EQ(counts[0]["count"], 1);
    EXPECT_EQ(counts[1]["severity"], "MEDIUM");
    EXPECT_EQ(counts[1]["count"], 0);
    EXPECT_EQ(counts[2]["severity"], "HIGH");
    EXPECT_EQ(counts[3]["severity"], "CRITICAL");
    EXPECT_EQ(counts[3]["count"], 1);
    EXPECT_EQ(resp.payload["data"]["total"], 2);

    auto unknown = run("DASHBOARD P9");
    ASSERT_TRUE(unknown.ok());
    EXPECT_TRUE(unknown.payload["data"]["counts"].empty());
}

TEST_F(CommandProcessorTest, ReportAndListings)
{
    auto report = run("REPORT P1");
    ASSERT_TRUE(report.ok());
    const json& rows = report.payload["data"]["rows"];
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0]["issueId"], "I1");
    EXPECT_EQ(rows[1]["issueId"], "I2");

    auto low = run("LIST_SEVERITY P1 low");
    ASSERT_TRUE(low.ok());
    ASSERT_EQ(low.payload["data"]["issues"].size(), 1u);
    EXPECT_EQ(low.payload["data"]["issues"][0]["id"], "I2");

    auto all = run("LIST_ISSUES");
    ASSERT_TRUE(all.ok());
    EXPECT_EQ(all.payload["data"]["issues"].size(), 2u);
}

TEST_F(CommandProcessorTest, AttachAndTagReportWhetherApplied)
{
    auto tag = run("TAG I1 login");
    ASSERT_TRUE(tag.ok());
    EXPECT_EQ(tag.payload["data"]["applied"], true);
    run("TAG I1 login");

    auto issue = run("GET_ISSUE I1");
    EXPECT_EQ(issue.payload["data"]["tags"].size(), 1u);

    auto unknown = run("ATTACH I9 screenshot.png");
    ASSERT_TRUE(unknown.ok());
    EXPECT_EQ(unknown.payload["data"]["applied"], false);
}

TEST_F(CommandProcessorTest, MembershipCommands)
{
    auto added = run("ADD_MEMBER P1 U1");
    ASSERT_TRUE(added.ok());
    EXPECT_EQ(added.payload["data"]["team"].size(), 1u);

    EXPECT_TRUE(run("REMOVE_MEMBER P1 U1").ok());
    EXPECT_EQ(errorCode(run("REMOVE_MEMBER P1 U1")), "NOT_FOUND");
    EXPECT_EQ(errorCode(run("ADD_MEMBER P9 U1")), "NOT_FOUND");

    auto removed = run("REMOVE_ISSUE P1 I1");
    ASSERT_TRUE(removed.ok());
    EXPECT_EQ(removed.payload["data"]["backlog"].size(), 1u);
    // 注册表中仍然存在
    EXPECT_TRUE(run("GET_ISSUE I1").ok());
}

TEST_F(CommandProcessorTest, SettersUpdateEntities)
{
    auto bio = run("SET_USER U1 bio likes edge cases");
    ASSERT_TRUE(bio.ok());
    EXPECT_EQ(bio.payload["data"]["bio"], "likes edge cases");

    auto promoted = run("SET_USER U2 role manager");
    ASSERT_TRUE(promoted.ok());
    EXPECT_EQ(promoted.payload["data"]["role"], "MANAGER");
    // 审批能力在创建时确定，改角色不会让 DEV 获得审批权
    EXPECT_EQ(promoted.payload["data"]["canApprove"], false);
    EXPECT_EQ(run("APPROVE U2 I1").payload["data"]["approved"], false);
    EXPECT_EQ(run("GET_ISSUE I1").payload["data"]["status"], "NEW");

    auto severity = run("SET_ISSUE I2 severity critical");
    ASSERT_TRUE(severity.ok());
    EXPECT_EQ(run("LIST_SEVERITY P1 CRITICAL").payload["data"]["issues"].size(), 2u);

    auto desc = run("SET_PROJECT P1 description first project");
    ASSERT_TRUE(desc.ok());
    EXPECT_EQ(desc.payload["data"]["description"], "first project");

    EXPECT_EQ(errorCode(run("SET_USER U1 shoe size")), "INVALID_ARGS");
    EXPECT_EQ(errorCode(run("SET_ISSUE I9 title x")), "NOT_FOUND");
}

TEST_F(CommandProcessorTest, ErrorCodes)
{
    EXPECT_EQ(errorCode(run("CREATE_USER U5 Eve ADMIN eve@example.com")), "INVALID_ARGS");
    EXPECT_EQ(errorCode(run("CREATE_ISSUE I5 t d URGENT")), "INVALID_ARGS");
    EXPECT_EQ(errorCode(run("STATUS I1 DONE")), "INVALID_ARGS");
    EXPECT_EQ(errorCode(run("STATUS I9 CLOSED")), "NOT_FOUND");
    EXPECT_EQ(errorCode(run("ASSIGN I1")), "MISSING_ARGS");
    EXPECT_EQ(errorCode(run("GET_USER nobody")), "NOT_FOUND");
    EXPECT_EQ(errorCode(run("FROBNICATE")), "UNKNOWN_COMMAND");
    EXPECT_EQ(errorCode(run("{not json")), "PARSE_ERROR");
}

TEST_F(CommandProcessorTest, NonUtf8TextStillGetsResponse)
{
    Message resp;
    ASSERT_NO_THROW(resp = run("CREATE_ISSUE I7 caf\xE9 d LOW"));
    ASSERT_TRUE(resp.ok());

    std::string out;
    ASSERT_NO_THROW(out = trk::protocol::serialize(resp));
    EXPECT_EQ(json::parse(out)["data"]["id"], "I7");

    // 请求已完整执行，后续命令照常工作
    EXPECT_TRUE(run("GET_ISSUE I7").ok());
    EXPECT_TRUE(run("TAG I7 \xFF\xFE").ok());
    EXPECT_NO_THROW(trk::protocol::serialize(run("LIST_ISSUES")));
}

TEST_F(CommandProcessorTest, JsonCommandLine)
{
    auto resp = run(R"({"cmd": "assign", "args": ["I2", "U1"]})");
    ASSERT_TRUE(resp.ok());
    EXPECT_EQ(resp.payload["data"]["assignee"], "U1");
}

TEST_F(CommandProcessorTest, HelpListsCommands)
{
    auto resp = run("help");
    ASSERT_TRUE(resp.ok());
    EXPECT_FALSE(resp.payload["data"]["commands"].empty());
}
