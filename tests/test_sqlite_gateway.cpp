#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

#include "sqlite.hpp"

namespace {
SessionOpenRequest Open(const std::string &user, double start) {
    SessionOpenRequest request;
    request.userId = user;
    request.taskId = "task-1";
    request.intention = "deep work";
    request.startTime = FromUnixTime(start);
    return request;
}
} // namespace

class SQLiteGatewayTest : public ::testing::Test {
  protected:
    SQLiteGateway gateway{":memory:"};
};

TEST_F(SQLiteGatewayTest, CreateThenFetch) {
    const std::string id = gateway.CreateSession(Open("user-1", 1700000000.0));
    EXPECT_EQ(id.size(), 20u);

    auto record = gateway.FetchSession(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, id);
    EXPECT_EQ(record->userId, "user-1");
    EXPECT_EQ(record->taskId, std::optional<std::string>("task-1"));
    EXPECT_EQ(record->intention, std::optional<std::string>("deep work"));
    EXPECT_FALSE(record->background.has_value());
    EXPECT_FALSE(record->endTime.has_value());
    EXPECT_DOUBLE_EQ(ToUnixTime(record->startTime), 1700000000.0);
    EXPECT_TRUE(record->notes.empty());
}

TEST_F(SQLiteGatewayTest, EndStoresOutcome) {
    const std::string id = gateway.CreateSession(Open("user-1", 1700000000.0));

    SessionCloseRequest close;
    close.sessionId = id;
    close.endTime = FromUnixTime(1700001800.0);
    close.durationMinutes = 30;
    close.notes = {"first", "second"};
    close.pomodoroCount = 1;
    gateway.EndSession(close);

    auto record = gateway.FetchSession(id);
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->endTime.has_value());
    EXPECT_DOUBLE_EQ(ToUnixTime(*record->endTime), 1700001800.0);
    EXPECT_EQ(record->durationMinutes, 30);
    EXPECT_EQ(record->notes, (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(record->pomodoroCount, 1);
}

TEST_F(SQLiteGatewayTest, EndingUnknownSessionThrows) {
    SessionCloseRequest close;
    close.sessionId = "does-not-exist";
    EXPECT_THROW(gateway.EndSession(close), GatewayError);

    close.sessionId.clear();
    EXPECT_THROW(gateway.EndSession(close), GatewayError);
}

TEST_F(SQLiteGatewayTest, CreateNeedsUser) {
    EXPECT_THROW(gateway.CreateSession(Open("", 1700000000.0)), GatewayError);
}

TEST_F(SQLiteGatewayTest, FetchMissingIsEmpty) {
    EXPECT_FALSE(gateway.FetchSession("nope").has_value());
}

TEST_F(SQLiteGatewayTest, ListIsPerUserNewestFirst) {
    const std::string older = gateway.CreateSession(Open("user-1", 1700000000.0));
    const std::string newer = gateway.CreateSession(Open("user-1", 1700009000.0));
    gateway.CreateSession(Open("user-2", 1700005000.0));

    auto records = gateway.ListSessions("user-1", 10);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, newer);
    EXPECT_EQ(records[1].id, older);

    EXPECT_EQ(gateway.ListSessions("user-1", 1).size(), 1u);
    EXPECT_TRUE(gateway.ListSessions("user-3", 10).empty());
}

TEST(SQLiteGatewayFileTest, RecordsSurviveReopen) {
    const std::string path = ::testing::TempDir() + "flowlock_sqlite_test.sqlite";
    std::remove(path.c_str());

    std::string id;
    {
        SQLiteGateway gateway(path);
        id = gateway.CreateSession(Open("user-1", 1700000000.0));
    }
    {
        SQLiteGateway gateway(path);
        EXPECT_TRUE(gateway.FetchSession(id).has_value());
    }
    std::remove(path.c_str());
}

TEST(SQLiteGatewayFileTest, UnopenablePathThrows) {
    EXPECT_THROW(SQLiteGateway("/nonexistent-dir/flowlock/data.sqlite"), GatewayError);
}
