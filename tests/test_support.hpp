#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common.hpp"
#include "event_loop.hpp"
#include "gateway.hpp"

// In-memory store with scripted failures.
class FakeGateway : public PersistenceGateway {
  public:
    std::string CreateSession(const SessionOpenRequest &request) override {
        std::lock_guard<std::mutex> lock(m_Mutex);
        createCalls++;
        if (failCreates > 0) {
            failCreates--;
            throw GatewayError("store unavailable");
        }
        FocusSessionRecord record;
        record.id = "session-" + std::to_string(++m_Seq);
        record.userId = request.userId;
        record.taskId = request.taskId;
        record.startTime = request.startTime;
        record.intention = request.intention;
        record.background = request.background;
        if (dropCreates > 0) {
            // Acknowledged but never stored.
            dropCreates--;
            return record.id;
        }
        m_Records[record.id] = record;
        return record.id;
    }

    void EndSession(const SessionCloseRequest &request) override {
        std::lock_guard<std::mutex> lock(m_Mutex);
        endCalls++;
        lastClose = request;
        if (failEnds > 0) {
            failEnds--;
            throw GatewayError("store unavailable");
        }
        auto it = m_Records.find(request.sessionId);
        if (it == m_Records.end()) {
            throw GatewayError("unknown session " + request.sessionId);
        }
        it->second.endTime = request.endTime;
        it->second.durationMinutes = request.durationMinutes;
        it->second.notes = request.notes;
        it->second.pomodoroCount = request.pomodoroCount;
        if (corruptEnds > 0) {
            corruptEnds--;
            it->second.durationMinutes = -1;
        }
    }

    std::optional<FocusSessionRecord> FetchSession(const std::string &sessionId) override {
        std::lock_guard<std::mutex> lock(m_Mutex);
        fetchCalls++;
        if (failFetches > 0) {
            failFetches--;
            throw GatewayError("read timed out");
        }
        auto it = m_Records.find(sessionId);
        if (it == m_Records.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<FocusSessionRecord> ListSessions(const std::string &userId, int limit) override {
        std::lock_guard<std::mutex> lock(m_Mutex);
        std::vector<FocusSessionRecord> out;
        for (const auto &entry : m_Records) {
            if (entry.second.userId == userId && static_cast<int>(out.size()) < limit) {
                out.push_back(entry.second);
            }
        }
        return out;
    }

    std::optional<FocusSessionRecord> Record(const std::string &id) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        auto it = m_Records.find(id);
        if (it == m_Records.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t RecordCount() {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Records.size();
    }

    std::atomic<int> createCalls{0};
    std::atomic<int> endCalls{0};
    std::atomic<int> fetchCalls{0};

    // Scripted faults, consumed one per call.
    int failCreates = 0;
    int dropCreates = 0;
    int failEnds = 0;
    int corruptEnds = 0;
    int failFetches = 0;

    SessionCloseRequest lastClose;

  private:
    std::mutex m_Mutex;
    std::map<std::string, FocusSessionRecord> m_Records;
    int m_Seq = 0;
};

// Steady and wall clocks that only move when told to.
struct ManualClock {
    EventLoop::SteadyClock::time_point steady{std::chrono::hours(1)};
    TimePoint wall = FromUnixTime(1700000000.0);

    void Advance(std::chrono::milliseconds d) {
        steady += d;
        wall += d;
    }
};

inline Task MakeTask(const std::string &id, TaskPriority priority = MEDIUM,
                     std::optional<TimePoint> due = std::nullopt, double createdAt = 1000.0) {
    Task task;
    task.id = id;
    task.title = "Task " + id;
    task.priority = priority;
    task.dueDate = due;
    task.createdAt = FromUnixTime(createdAt);
    return task;
}
