#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "navigator.hpp"
#include "test_support.hpp"

namespace {
std::vector<std::string> Ids(const TaskNavigator &nav) {
    std::vector<std::string> ids;
    for (const auto &task : nav.Queue()) {
        ids.push_back(task.id);
    }
    return ids;
}

const TimePoint kNow = FromUnixTime(1700000000.0);
} // namespace

TEST(TaskNavigator, SortsByPriorityThenDueDateThenCreation) {
    TaskNavigator nav;
    nav.SetTasks(
        {
            MakeTask("low", LOW),
            MakeTask("med-undated", MEDIUM, std::nullopt, 10),
            MakeTask("med-late", MEDIUM, kNow + std::chrono::hours(48)),
            MakeTask("med-early", MEDIUM, kNow + std::chrono::hours(1)),
            MakeTask("high-new", HIGH, std::nullopt, 200),
            MakeTask("high-old", HIGH, std::nullopt, 100),
        },
        kNow);

    EXPECT_EQ(Ids(nav), (std::vector<std::string>{"high-old", "high-new", "med-early", "med-late",
                                                  "med-undated", "low"}));
}

TEST(TaskNavigator, FiltersCompletedHiddenAndSnoozed) {
    Task done = MakeTask("done");
    done.completed = true;
    Task hidden = MakeTask("hidden");
    hidden.hidden = true;
    Task snoozed = MakeTask("snoozed");
    snoozed.snoozedUntil = kNow + std::chrono::hours(2);
    Task woke = MakeTask("woke");
    woke.snoozedUntil = kNow - std::chrono::minutes(1);

    TaskNavigator nav;
    nav.SetTasks({done, hidden, snoozed, woke, MakeTask("open")}, kNow);
    EXPECT_EQ(Ids(nav), (std::vector<std::string>{"open", "woke"}));
}

TEST(TaskNavigator, AdvanceAndRetreatReportBoundaries) {
    TaskNavigator nav;
    std::vector<std::string> moves;
    nav.SetOnMoved([&](const Task &task) { moves.push_back(task.id); });
    nav.SetTasks({MakeTask("a", HIGH), MakeTask("b", LOW)}, kNow);

    EXPECT_EQ(nav.CurrentTask()->id, "a");
    EXPECT_EQ(nav.Retreat(), NAV_AT_START);
    EXPECT_EQ(nav.Advance(), NAV_MOVED);
    EXPECT_EQ(nav.CurrentTask()->id, "b");
    EXPECT_EQ(nav.Advance(), NAV_AT_END);
    EXPECT_EQ(nav.Retreat(), NAV_MOVED);
    EXPECT_EQ(moves, (std::vector<std::string>{"b", "a"}));
}

TEST(TaskNavigator, EmptyListHasNoCursor) {
    TaskNavigator nav;
    nav.SetTasks({}, kNow);
    EXPECT_FALSE(nav.Cursor().has_value());
    EXPECT_EQ(nav.CurrentTask(), nullptr);
    EXPECT_EQ(nav.Advance(), NAV_EMPTY);
    EXPECT_EQ(nav.Retreat(), NAV_EMPTY);
}

TEST(TaskNavigator, CursorFollowsSelectedTaskAcrossResort) {
    TaskNavigator nav;
    nav.SetTasks({MakeTask("a", HIGH), MakeTask("b", MEDIUM), MakeTask("c", LOW)}, kNow);
    nav.Advance();
    ASSERT_EQ(nav.CurrentTask()->id, "b");

    // A new high-priority task shifts every index by one.
    nav.SetTasks({MakeTask("a", HIGH), MakeTask("b", MEDIUM), MakeTask("c", LOW),
                  MakeTask("z", HIGH, std::nullopt, 1)},
                 kNow);
    EXPECT_EQ(nav.CurrentTask()->id, "b");
    EXPECT_EQ(*nav.Cursor(), 2u);
}

TEST(TaskNavigator, CursorClampsWhenSelectedTaskDisappears) {
    TaskNavigator nav;
    nav.SetTasks({MakeTask("a", HIGH), MakeTask("b", MEDIUM), MakeTask("c", LOW)}, kNow);
    nav.Advance();
    nav.Advance();
    ASSERT_EQ(nav.CurrentTask()->id, "c");

    nav.SetTasks({MakeTask("a", HIGH), MakeTask("b", MEDIUM)}, kNow);
    EXPECT_EQ(*nav.Cursor(), 1u);
    EXPECT_EQ(nav.CurrentTask()->id, "b");

    nav.SetTasks({MakeTask("a", HIGH), MakeTask("c", LOW)}, kNow);
    EXPECT_EQ(*nav.Cursor(), 1u);
    EXPECT_EQ(nav.CurrentTask()->id, "c");
}

TEST(TaskNavigator, EmptyCallbackFiresOnlyWhenQueueDrains) {
    TaskNavigator nav;
    int emptied = 0;
    nav.SetOnEmpty([&] { emptied++; });

    nav.SetTasks({}, kNow);
    EXPECT_EQ(emptied, 0);

    nav.SetTasks({MakeTask("a")}, kNow);
    nav.SetTasks({}, kNow);
    EXPECT_EQ(emptied, 1);
    EXPECT_FALSE(nav.Cursor().has_value());

    nav.SetTasks({}, kNow);
    EXPECT_EQ(emptied, 1);
}

TEST(TaskNavigator, SelectPointsCursorAtTask) {
    TaskNavigator nav;
    nav.SetTasks({MakeTask("a", HIGH), MakeTask("b", LOW)}, kNow);
    EXPECT_TRUE(nav.Select("b"));
    EXPECT_EQ(nav.CurrentTask()->id, "b");
    EXPECT_FALSE(nav.Select("missing"));
    EXPECT_EQ(nav.CurrentTask()->id, "b");
}
