#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "recorder.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

class RecorderTest : public ::testing::Test {
  protected:
    FakeGateway gateway;
    EventLoop loop;
    std::unique_ptr<SessionRecorder> recorder;
    std::vector<RecorderOutcome> outcomes;

    void SetUp() override {
        RecorderOptions options;
        options.maxAttempts = 3;
        options.retryBackoff = 0ms;
        recorder = std::make_unique<SessionRecorder>(gateway, loop, options);
    }

    SessionRecorder::OutcomeCallback Collect() {
        return [this](const RecorderOutcome &outcome) { outcomes.push_back(outcome); };
    }

    bool WaitFor(std::size_t count) {
        return loop.RunUntil([&] { return outcomes.size() >= count; }, 5000ms);
    }

    SessionOpenRequest OpenRequest() {
        SessionOpenRequest request;
        request.userId = "user-1";
        request.taskId = "task-a";
        request.intention = "ship it";
        request.startTime = FromUnixTime(1700000000.0);
        return request;
    }

    SessionCloseRequest CloseRequest(int minutes = 25) {
        SessionCloseRequest request;
        request.endTime = FromUnixTime(1700000000.0 + minutes * 60);
        request.durationMinutes = minutes;
        request.notes = {"first note"};
        request.pomodoroCount = 1;
        return request;
    }
};

TEST_F(RecorderTest, OpenThenCloseIsVerified) {
    recorder->Open(OpenRequest(), Collect());
    recorder->Close(CloseRequest(), Collect());
    ASSERT_TRUE(WaitFor(2));

    EXPECT_EQ(outcomes[0].op, RECORD_OPEN);
    EXPECT_TRUE(outcomes[0].ok);
    EXPECT_EQ(outcomes[0].attempts, 1);
    EXPECT_EQ(outcomes[1].op, RECORD_CLOSE);
    EXPECT_TRUE(outcomes[1].ok);
    EXPECT_EQ(outcomes[1].sessionId, outcomes[0].sessionId);

    auto stored = gateway.Record(outcomes[0].sessionId);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->durationMinutes, 25);
    EXPECT_EQ(stored->notes, std::vector<std::string>{"first note"});
    EXPECT_EQ(stored->pomodoroCount, 1);
    EXPECT_TRUE(stored->endTime.has_value());
}

TEST_F(RecorderTest, TransientCreateFailureIsRetried) {
    gateway.failCreates = 2;
    recorder->Open(OpenRequest(), Collect());
    ASSERT_TRUE(WaitFor(1));
    EXPECT_TRUE(outcomes[0].ok);
    EXPECT_EQ(outcomes[0].attempts, 3);
    EXPECT_EQ(gateway.createCalls.load(), 3);
    EXPECT_EQ(gateway.RecordCount(), 1u);
}

TEST_F(RecorderTest, FailedReadBackDoesNotInsertTwice) {
    gateway.failFetches = 1;
    recorder->Open(OpenRequest(), Collect());
    ASSERT_TRUE(WaitFor(1));
    EXPECT_TRUE(outcomes[0].ok);
    EXPECT_EQ(outcomes[0].attempts, 2);
    EXPECT_EQ(gateway.createCalls.load(), 1);
    EXPECT_EQ(gateway.RecordCount(), 1u);
}

TEST_F(RecorderTest, MissingRecordFailsVerification) {
    gateway.dropCreates = 1;
    recorder->Open(OpenRequest(), Collect());
    ASSERT_TRUE(WaitFor(1));
    EXPECT_FALSE(outcomes[0].ok);
    EXPECT_EQ(outcomes[0].attempts, 3);
    EXPECT_EQ(outcomes[0].error, "stored session missing");
}

TEST_F(RecorderTest, GivesUpAfterMaxAttempts) {
    gateway.failCreates = 5;
    recorder->Open(OpenRequest(), Collect());
    ASSERT_TRUE(WaitFor(1));
    EXPECT_FALSE(outcomes[0].ok);
    EXPECT_EQ(outcomes[0].attempts, 3);
    EXPECT_EQ(gateway.createCalls.load(), 3);
}

TEST_F(RecorderTest, CloseAfterFailedOpenReportsFailure) {
    gateway.failCreates = 5;
    recorder->Open(OpenRequest(), Collect());
    recorder->Close(CloseRequest(), Collect());
    ASSERT_TRUE(WaitFor(2));
    EXPECT_FALSE(outcomes[1].ok);
    EXPECT_EQ(gateway.endCalls.load(), 0);
}

TEST_F(RecorderTest, CorruptedEndIsRewritten) {
    gateway.corruptEnds = 1;
    recorder->Open(OpenRequest(), Collect());
    recorder->Close(CloseRequest(40), Collect());
    ASSERT_TRUE(WaitFor(2));
    EXPECT_TRUE(outcomes[1].ok);
    EXPECT_EQ(outcomes[1].attempts, 2);
    EXPECT_EQ(gateway.endCalls.load(), 2);
    EXPECT_EQ(gateway.Record(outcomes[0].sessionId)->durationMinutes, 40);
}

TEST_F(RecorderTest, EndFailureIsReported) {
    gateway.failEnds = 3;
    recorder->Open(OpenRequest(), Collect());
    recorder->Close(CloseRequest(), Collect());
    ASSERT_TRUE(WaitFor(2));
    EXPECT_FALSE(outcomes[1].ok);
    EXPECT_EQ(outcomes[1].error, "store unavailable");
    EXPECT_EQ(gateway.endCalls.load(), 3);
}

TEST_F(RecorderTest, ShutdownDrainsQueuedWrites) {
    recorder->Open(OpenRequest(), nullptr);
    recorder->Close(CloseRequest(), nullptr);
    recorder.reset();
    EXPECT_EQ(gateway.createCalls.load(), 1);
    EXPECT_EQ(gateway.endCalls.load(), 1);
}
