#include <gtest/gtest.h>

#include "service/tracker_service.hpp"

using trk::IssueKind;
using trk::IssueStatus;
using trk::Role;
using trk::Severity;
using trk::service::TrackerService;

class TrackerServiceTest : public ::testing::Test
{
protected:
    TrackerService tracker;
};

TEST_F(TrackerServiceTest, CreateAndFind)
{
    auto& user = tracker.createUser("U1", "Alice", Role::Qa, "alice@example.com");
    EXPECT_EQ(user.name(), "Alice");
    EXPECT_EQ(tracker.findUser("U1"), &user);
    EXPECT_EQ(tracker.findUser("nobody"), nullptr);

    auto& project = tracker.createProject("P1", "Alpha", "https://repo/alpha");
    EXPECT_EQ(tracker.findProject("P1"), &project);
    EXPECT_EQ(tracker.findProject("P2"), nullptr);

    auto& issue = tracker.createIssue("I1", "t", "d", Severity::Medium);
    EXPECT_EQ(tracker.findIssue("I1"), &issue);
    EXPECT_EQ(issue.status(), IssueStatus::New);
    EXPECT_EQ(issue.kind(), IssueKind::Bug);
}

TEST_F(TrackerServiceTest, CreateManagerGrantsApproval)
{
    auto& manager = tracker.createUser("M1", "Carol", Role::Manager, "carol@example.com");
    auto& issue = tracker.createIssue("I1", "t", "d", Severity::Critical);

    EXPECT_TRUE(manager.approveIssue(issue));
    EXPECT_EQ(issue.status(), IssueStatus::InProgress);
}

TEST_F(TrackerServiceTest, CreateIssueKindIsCaseInsensitive)
{
    EXPECT_EQ(tracker.createIssue("I9", "t", "d", Severity::Medium, "TASK").kind(), IssueKind::Task);
    EXPECT_EQ(tracker.createIssue("I10", "t", "d", Severity::Medium, "Task").kind(), IssueKind::Task);
    EXPECT_EQ(tracker.createIssue("I11", "t", "d", Severity::Medium, "story").kind(), IssueKind::Bug);
    EXPECT_EQ(tracker.createIssue("I12", "t", "d", Severity::Medium).kind(), IssueKind::Bug);
}

TEST_F(TrackerServiceTest, DuplicateIdOverwrites)
{
    tracker.createUser("U1", "Alice", Role::Qa, "alice@example.com");
    tracker.createUser("U1", "Alicia", Role::Dev, "alicia@example.com");
    ASSERT_NE(tracker.findUser("U1"), nullptr);
    EXPECT_EQ(tracker.findUser("U1")->name(), "Alicia");
    EXPECT_EQ(tracker.users().size(), 1u);

    tracker.createIssue("I1", "old", "d", Severity::Low);
    tracker.tagIssue("I1", "x");
    tracker.createIssue("I1", "new", "d", Severity::High);
    EXPECT_EQ(tracker.findIssue("I1")->title(), "new");
    EXPECT_TRUE(tracker.findIssue("I1")->tags().empty());
    EXPECT_EQ(tracker.issues().size(), 1u);
}

TEST_F(TrackerServiceTest, AttachAndTag)
{
    tracker.createIssue("I1", "t", "d", Severity::Low);
    tracker.attachToIssue("I1", "screenshot.png");
    tracker.tagIssue("I1", "login");
    tracker.tagIssue("I1", "login");

    const auto* issue = tracker.findIssue("I1");
    ASSERT_NE(issue, nullptr);
    EXPECT_EQ(issue->attachments().size(), 1u);
    EXPECT_EQ(issue->tags().size(), 1u);

    // 未知 ID：静默忽略
    tracker.attachToIssue("missing", "a");
    tracker.tagIssue("missing", "b");
    EXPECT_EQ(tracker.issues().size(), 1u);
}

TEST_F(TrackerServiceTest, AssignSetsAssigneeAndInProgress)
{
    tracker.createUser("U2", "Bob", Role::Dev, "bob@example.com");
    tracker.createIssue("I1", "t", "d", Severity::Critical);

    EXPECT_TRUE(tracker.assignIssue("I1", "U2"));
    const auto* issue = tracker.findIssue("I1");
    EXPECT_EQ(issue->status(), IssueStatus::InProgress);
    ASSERT_TRUE(issue->assignee().has_value());
    EXPECT_EQ(*issue->assignee(), "U2");
}

TEST_F(TrackerServiceTest, AssignOverridesAnyPriorStatus)
{
    tracker.createUser("U2", "Bob", Role::Dev, "bob@example.com");
    for (IssueStatus st : {IssueStatus::New, IssueStatus::InProgress, IssueStatus::Resolved, IssueStatus::Closed})
    {
        tracker.createIssue("I1", "t", "d", Severity::Low);
        tracker.changeStatus("I1", st);
        EXPECT_TRUE(tracker.assignIssue("I1", "U2"));
        EXPECT_EQ(tracker.findIssue("I1")->status(), IssueStatus::InProgress);
    }
}

TEST_F(TrackerServiceTest, AssignFailureLeavesStateUntouched)
{
    tracker.createUser("U2", "Bob", Role::Dev, "bob@example.com");
    tracker.createIssue("I1", "t", "d", Severity::Low);
    tracker.changeStatus("I1", IssueStatus::Resolved);

    EXPECT_FALSE(tracker.assignIssue("I1", "nobody"));
    EXPECT_FALSE(tracker.assignIssue("missing", "U2"));

    const auto* issue = tracker.findIssue("I1");
    EXPECT_EQ(issue->status(), IssueStatus::Resolved);
    EXPECT_FALSE(issue->assignee().has_value());
}

TEST_F(TrackerServiceTest, ChangeStatusAcceptsAnyTransition)
{
    tracker.createIssue("I1", "t", "d", Severity::Low);
    EXPECT_TRUE(tracker.changeStatus("I1", IssueStatus::Closed));
    EXPECT_TRUE(tracker.changeStatus("I1", IssueStatus::New));
    EXPECT_EQ(tracker.findIssue("I1")->status(), IssueStatus::New);
    EXPECT_FALSE(tracker.changeStatus("missing", IssueStatus::Closed));
}

TEST_F(TrackerServiceTest, ProjectMembershipAndBacklog)
{
    tracker.createProject("P1", "Alpha", "https://repo/alpha");
    auto& user = tracker.createUser("U1", "Alice", Role::Qa, "a@x");
    auto& issue = tracker.createIssue("I1", "t", "d", Severity::Low);

    tracker.addUserToProject("P1", user);
    tracker.addIssueToProject("P1", issue);
    tracker.addIssueToProject("P1", issue);
    // 未知项目：no-op
    tracker.addUserToProject("P9", user);
    tracker.addIssueToProject("P9", issue);

    const auto* project = tracker.findProject("P1");
    EXPECT_EQ(project->team().size(), 1u);
    EXPECT_EQ(project->backlog().size(), 2u);

    EXPECT_TRUE(tracker.removeIssueFromProject("P1", issue));
    EXPECT_EQ(project->backlog().size(), 1u);
    EXPECT_NE(tracker.findIssue("I1"), nullptr);

    EXPECT_TRUE(tracker.removeUserFromProject("P1", user));
    EXPECT_FALSE(tracker.removeUserFromProject("P1", user));
    EXPECT_FALSE(tracker.removeUserFromProject("P9", user));
    EXPECT_NE(tracker.findUser("U1"), nullptr);
}

TEST_F(TrackerServiceTest, ListBySeverity)
{
    tracker.createProject("P1", "Alpha", "https://repo/alpha");
    auto& i1 = tracker.createIssue("I1", "t", "d", Severity::Critical);
    auto& i2 = tracker.createIssue("I2", "t", "d", Severity::Low);
    tracker.addIssueToProject("P1", i1);
    tracker.addIssueToProject("P1", i2);

    auto critical = tracker.listBySeverity("P1", Severity::Critical);
    ASSERT_EQ(critical.size(), 1u);
    EXPECT_EQ(critical[0].issueId(), "I1");

    EXPECT_TRUE(tracker.listBySeverity("P1", Severity::Medium).empty());
    EXPECT_TRUE(tracker.listBySeverity("P9", Severity::Low).empty());

    i2.setSeverity(Severity::Critical);
    EXPECT_EQ(tracker.listBySeverity("P1", Severity::Critical).size(), 2u);
}

TEST_F(TrackerServiceTest, EmptyProjectListsNothing)
{
    tracker.createProject("P1", "Alpha", "https://repo/alpha");
    for (Severity s : trk::kAllSeverities)
    {
        EXPECT_TRUE(tracker.listBySeverity("P1", s).empty());
    }
}

TEST_F(TrackerServiceTest, SnapshotsAreCopies)
{
    tracker.createIssue("I1", "t", "d", Severity::Low);
    auto issues = tracker.issues();
    ASSERT_EQ(issues.size(), 1u);
    issues[0].setStatus(IssueStatus::Closed);
    EXPECT_EQ(tracker.findIssue("I1")->status(), IssueStatus::New);
}
