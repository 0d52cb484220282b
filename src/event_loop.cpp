#include "event_loop.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace {
void RunJob(const EventLoop::Job &job, const char *kind) {
    try {
        job();
    } catch (const std::exception &e) {
        spdlog::error("EventLoop: {} threw: {}", kind, e.what());
    }
}
} // namespace

// ─────────────────────────────────────
EventLoop::EventLoop(NowFn now) : m_Now(std::move(now)) {
    if (!m_Now) {
        m_Now = [] { return SteadyClock::now(); };
    }
}

// ─────────────────────────────────────
EventLoop::SteadyClock::time_point EventLoop::Now() const {
    return m_Now();
}

// ─────────────────────────────────────
void EventLoop::Post(Job job) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Posted.push_back(std::move(job));
    WakeLocked();
}

// ─────────────────────────────────────
EventLoop::TimerId EventLoop::Schedule(std::chrono::milliseconds delay, Job job) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    const TimerId id = m_NextTimerId++;
    m_Timers.emplace(id, Timer{m_Now() + delay, std::move(job)});
    WakeLocked();
    return id;
}

// ─────────────────────────────────────
bool EventLoop::Cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Timers.erase(id) > 0;
}

// ─────────────────────────────────────
bool EventLoop::IsScheduled(TimerId id) const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Timers.count(id) > 0;
}

// ─────────────────────────────────────
bool EventLoop::PopDueTimer(Job &out) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    const auto now = m_Now();
    auto due = m_Timers.end();
    for (auto it = m_Timers.begin(); it != m_Timers.end(); ++it) {
        if (it->second.deadline > now) {
            continue;
        }
        // Map order breaks deadline ties by scheduling order.
        if (due == m_Timers.end() || it->second.deadline < due->second.deadline) {
            due = it;
        }
    }
    if (due == m_Timers.end()) {
        return false;
    }
    out = std::move(due->second.job);
    m_Timers.erase(due);
    return true;
}

// ─────────────────────────────────────
std::size_t EventLoop::RunPending() {
    std::size_t ran = 0;

    std::deque<Job> posted;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        posted.swap(m_Posted);
    }
    for (auto &job : posted) {
        RunJob(job, "posted job");
        ran++;
    }

    // Erased before it runs, so a Cancel() issued by an earlier job always wins.
    Job timer;
    while (PopDueTimer(timer)) {
        RunJob(timer, "timer");
        ran++;
    }
    return ran;
}

// ─────────────────────────────────────
bool EventLoop::RunUntil(const std::function<bool()> &done, std::chrono::milliseconds timeout) {
    const auto giveUpAt = SteadyClock::now() + timeout;
    while (true) {
        RunPending();
        if (done()) {
            return true;
        }
        std::unique_lock<std::mutex> lock(m_Mutex);
        if (!m_Cv.wait_until(lock, giveUpAt, [this] { return !m_Posted.empty(); })) {
            break;
        }
    }
    RunPending();
    return done();
}

// ─────────────────────────────────────
void EventLoop::Run() {
    spdlog::debug("EventLoop: running");
    while (!m_StopRequested.load()) {
        RunPending();

        std::unique_lock<std::mutex> lock(m_Mutex);
        const std::uint64_t seq = m_WakeupSeq;
        const auto wait = NextDeadlineLocked() - m_Now();
        if (wait <= SteadyClock::duration::zero()) {
            continue;
        }
        m_Cv.wait_for(lock, wait, [this, seq] {
            return m_StopRequested.load() || !m_Posted.empty() || m_WakeupSeq != seq;
        });
    }
    spdlog::debug("EventLoop: stopped");
}

// ─────────────────────────────────────
void EventLoop::Stop() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_StopRequested.store(true);
    WakeLocked();
}

// ─────────────────────────────────────
EventLoop::SteadyClock::time_point EventLoop::NextDeadlineLocked() const {
    auto deadline = m_Now() + kIdleWait;
    for (const auto &entry : m_Timers) {
        if (entry.second.deadline < deadline) {
            deadline = entry.second.deadline;
        }
    }
    return deadline;
}

// ─────────────────────────────────────
void EventLoop::WakeLocked() {
    m_WakeupSeq++;
    m_Cv.notify_all();
}
