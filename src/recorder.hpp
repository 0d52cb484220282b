#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "event_loop.hpp"
#include "gateway.hpp"

enum RecorderOp { RECORD_OPEN, RECORD_CLOSE };

struct RecorderOutcome {
    RecorderOp op = RECORD_OPEN;
    bool ok = false;
    std::string sessionId;
    std::string error;
    int attempts = 0;
};

struct RecorderOptions {
    int maxAttempts = 3;
    std::chrono::milliseconds retryBackoff{1000};
};

// Runs gateway writes on a worker thread. Each write is read back and compared; mismatches and
// exceptions are retried. Outcomes are posted to the engine's EventLoop.
class SessionRecorder {
  public:
    using OutcomeCallback = std::function<void(const RecorderOutcome &outcome)>;

    SessionRecorder(PersistenceGateway &gateway, EventLoop &loop, RecorderOptions options = {});
    ~SessionRecorder();

    SessionRecorder(const SessionRecorder &) = delete;
    SessionRecorder &operator=(const SessionRecorder &) = delete;

    void Open(SessionOpenRequest request, OutcomeCallback callback);
    // The session id is taken from the preceding Open when the request leaves it empty.
    void Close(SessionCloseRequest request, OutcomeCallback callback);

    std::size_t PendingJobs() const;

  private:
    struct Job {
        RecorderOp op;
        SessionOpenRequest open;
        SessionCloseRequest close;
        OutcomeCallback callback;
    };

    void Enqueue(Job job);
    void WorkerLoop();
    RecorderOutcome RunOpen(const SessionOpenRequest &request);
    RecorderOutcome RunClose(SessionCloseRequest request);
    void Backoff(int attempt);

    static bool MatchesOpen(const FocusSessionRecord &record, const SessionOpenRequest &request);
    static bool MatchesClose(const FocusSessionRecord &record, const SessionCloseRequest &request);

  private:
    PersistenceGateway &m_Gateway;
    EventLoop &m_Loop;
    RecorderOptions m_Options;

    mutable std::mutex m_Mutex;
    std::condition_variable m_Cv;
    std::deque<Job> m_Jobs;
    bool m_Busy = false;
    std::atomic<bool> m_Shutdown{false};
    std::thread m_Worker;

    // Worker-thread only
    std::string m_LastSessionId;
};
