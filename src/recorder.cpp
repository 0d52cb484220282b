#include "recorder.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
SessionRecorder::SessionRecorder(PersistenceGateway &gateway, EventLoop &loop,
                                 RecorderOptions options)
    : m_Gateway(gateway), m_Loop(loop), m_Options(options) {
    if (m_Options.maxAttempts < 1) {
        m_Options.maxAttempts = 1;
    }
    m_Worker = std::thread([this] { WorkerLoop(); });
}

// ─────────────────────────────────────
SessionRecorder::~SessionRecorder() {
    // Queued jobs are drained first so a session ended right before shutdown still lands.
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Shutdown.store(true);
    }
    m_Cv.notify_all();
    if (m_Worker.joinable()) {
        m_Worker.join();
    }
}

// ─────────────────────────────────────
void SessionRecorder::Open(SessionOpenRequest request, OutcomeCallback callback) {
    Job job;
    job.op = RECORD_OPEN;
    job.open = std::move(request);
    job.callback = std::move(callback);
    Enqueue(std::move(job));
}

// ─────────────────────────────────────
void SessionRecorder::Close(SessionCloseRequest request, OutcomeCallback callback) {
    Job job;
    job.op = RECORD_CLOSE;
    job.close = std::move(request);
    job.callback = std::move(callback);
    Enqueue(std::move(job));
}

// ─────────────────────────────────────
std::size_t SessionRecorder::PendingJobs() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Jobs.size() + (m_Busy ? 1 : 0);
}

// ─────────────────────────────────────
void SessionRecorder::Enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Jobs.push_back(std::move(job));
    }
    m_Cv.notify_one();
}

// ─────────────────────────────────────
void SessionRecorder::WorkerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_Mutex);
            m_Cv.wait(lock, [this] { return m_Shutdown.load() || !m_Jobs.empty(); });
            if (m_Jobs.empty()) {
                return;
            }
            job = std::move(m_Jobs.front());
            m_Jobs.pop_front();
            m_Busy = true;
        }

        RecorderOutcome outcome =
            job.op == RECORD_OPEN ? RunOpen(job.open) : RunClose(std::move(job.close));

        if (job.callback) {
            m_Loop.Post([callback = std::move(job.callback), outcome] { callback(outcome); });
        }

        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Busy = false;
    }
}

// ─────────────────────────────────────
void SessionRecorder::Backoff(int attempt) {
    const auto wait = m_Options.retryBackoff * attempt;
    if (wait.count() > 0) {
        std::this_thread::sleep_for(wait);
    }
}

// ─────────────────────────────────────
bool SessionRecorder::MatchesOpen(const FocusSessionRecord &record,
                                  const SessionOpenRequest &request) {
    return record.userId == request.userId && record.taskId == request.taskId &&
           !record.endTime.has_value();
}

// ─────────────────────────────────────
bool SessionRecorder::MatchesClose(const FocusSessionRecord &record,
                                   const SessionCloseRequest &request) {
    return record.endTime.has_value() && record.durationMinutes == request.durationMinutes &&
           record.pomodoroCount == request.pomodoroCount && record.notes == request.notes;
}

// ─────────────────────────────────────
RecorderOutcome SessionRecorder::RunOpen(const SessionOpenRequest &request) {
    RecorderOutcome outcome;
    outcome.op = RECORD_OPEN;
    m_LastSessionId.clear();

    std::string id;
    for (int attempt = 1; attempt <= m_Options.maxAttempts; ++attempt) {
        outcome.attempts = attempt;
        try {
            // Only the read-back is retried once the insert succeeded; re-inserting would
            // leave orphan records behind.
            if (id.empty()) {
                id = m_Gateway.CreateSession(request);
                spdlog::info("Recorder: focus session {} created (attempt {})", id, attempt);
            }
            auto stored = m_Gateway.FetchSession(id);
            if (stored && MatchesOpen(*stored, request)) {
                outcome.ok = true;
                outcome.sessionId = id;
                m_LastSessionId = id;
                return outcome;
            }
            outcome.error = stored ? "stored session does not match" : "stored session missing";
            spdlog::warn("Recorder: verification of session {} failed: {} (attempt {}/{})", id,
                         outcome.error, attempt, m_Options.maxAttempts);
        } catch (const std::exception &e) {
            outcome.error = e.what();
            spdlog::warn("Recorder: create session failed: {} (attempt {}/{})", e.what(), attempt,
                         m_Options.maxAttempts);
        }
        if (attempt < m_Options.maxAttempts) {
            Backoff(attempt);
        }
    }

    spdlog::error("Recorder: giving up on creating focus session: {}", outcome.error);
    return outcome;
}

// ─────────────────────────────────────
RecorderOutcome SessionRecorder::RunClose(SessionCloseRequest request) {
    RecorderOutcome outcome;
    outcome.op = RECORD_CLOSE;

    if (request.sessionId.empty()) {
        request.sessionId = m_LastSessionId;
    }
    outcome.sessionId = request.sessionId;
    if (request.sessionId.empty()) {
        outcome.error = "focus session was never created";
        spdlog::error("Recorder: cannot end session: {}", outcome.error);
        return outcome;
    }

    for (int attempt = 1; attempt <= m_Options.maxAttempts; ++attempt) {
        outcome.attempts = attempt;
        try {
            m_Gateway.EndSession(request);
            auto stored = m_Gateway.FetchSession(request.sessionId);
            if (stored && MatchesClose(*stored, request)) {
                spdlog::info("Recorder: focus session {} ended, {} min (attempt {})",
                             request.sessionId, request.durationMinutes, attempt);
                outcome.ok = true;
                return outcome;
            }
            outcome.error = stored ? "stored session does not match" : "stored session missing";
            spdlog::warn("Recorder: verification of session {} end failed: {} (attempt {}/{})",
                         request.sessionId, outcome.error, attempt, m_Options.maxAttempts);
        } catch (const std::exception &e) {
            outcome.error = e.what();
            spdlog::warn("Recorder: end session {} failed: {} (attempt {}/{})", request.sessionId,
                         e.what(), attempt, m_Options.maxAttempts);
        }
        if (attempt < m_Options.maxAttempts) {
            Backoff(attempt);
        }
    }

    spdlog::error("Recorder: giving up on ending focus session {}: {}", request.sessionId,
                  outcome.error);
    return outcome;
}
