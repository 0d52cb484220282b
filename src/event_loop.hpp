#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

// Single logical thread for the engine. Other threads only talk to it through Post().
class EventLoop {
  public:
    using Job = std::function<void()>;
    using TimerId = std::uint64_t;
    using SteadyClock = std::chrono::steady_clock;
    using NowFn = std::function<SteadyClock::time_point()>;

    explicit EventLoop(NowFn now = nullptr);

    void Post(Job job);
    TimerId Schedule(std::chrono::milliseconds delay, Job job);
    bool Cancel(TimerId id);
    bool IsScheduled(TimerId id) const;

    // Runs posted jobs and due timers without blocking; returns how many ran.
    std::size_t RunPending();
    // Pumps until done() holds or the wall-clock timeout elapses.
    bool RunUntil(const std::function<bool()> &done, std::chrono::milliseconds timeout);
    void Run();
    void Stop();

    SteadyClock::time_point Now() const;

  private:
    struct Timer {
        SteadyClock::time_point deadline;
        Job job;
    };

    bool PopDueTimer(Job &out);
    SteadyClock::time_point NextDeadlineLocked() const;
    void WakeLocked();

  private:
    mutable std::mutex m_Mutex;
    std::condition_variable m_Cv;
    std::deque<Job> m_Posted;
    std::map<TimerId, Timer> m_Timers;
    TimerId m_NextTimerId = 1;
    std::uint64_t m_WakeupSeq = 0;
    std::atomic<bool> m_StopRequested{false};
    NowFn m_Now;

    static constexpr std::chrono::hours kIdleWait{24};
};
