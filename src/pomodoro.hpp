#pragma once

#include <chrono>
#include <functional>

#include "event_loop.hpp"

enum PomodoroPhase { POMODORO_IDLE, POMODORO_FOCUS, POMODORO_BREAK };

class Pomodoro {
  public:
    using PhaseCallback = std::function<void(PomodoroPhase phase)>;
    using FocusDoneCallback = std::function<void(int count)>;

    Pomodoro(EventLoop &loop, std::chrono::milliseconds focus, std::chrono::milliseconds pause,
             bool autoStartBreaks = true);
    ~Pomodoro();

    Pomodoro(const Pomodoro &) = delete;
    Pomodoro &operator=(const Pomodoro &) = delete;

    // Idle starts a focus interval, running pauses, paused resumes.
    void Toggle();
    void Stop();

    PomodoroPhase Phase() const;
    bool IsRunning() const;
    bool IsPaused() const;
    int Count() const;
    std::chrono::milliseconds Remaining() const;

    void SetOnPhaseChanged(PhaseCallback callback);
    void SetOnFocusDone(FocusDoneCallback callback);

  private:
    void StartPhase(PomodoroPhase phase, std::chrono::milliseconds length);
    void Arm(std::chrono::milliseconds length);
    void OnPhaseEnd();
    void Disarm();

  private:
    EventLoop &m_Loop;
    std::chrono::milliseconds m_Focus;
    std::chrono::milliseconds m_Break;
    bool m_AutoStartBreaks;

    PomodoroPhase m_Phase = POMODORO_IDLE;
    bool m_Paused = false;
    int m_Count = 0;
    std::chrono::milliseconds m_Remaining{0};
    EventLoop::SteadyClock::time_point m_PhaseEnd{};
    EventLoop::TimerId m_Timer = 0;

    PhaseCallback m_OnPhaseChanged;
    FocusDoneCallback m_OnFocusDone;
};
