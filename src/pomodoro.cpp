#include "pomodoro.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Pomodoro::Pomodoro(EventLoop &loop, std::chrono::milliseconds focus,
                   std::chrono::milliseconds pause, bool autoStartBreaks)
    : m_Loop(loop), m_Focus(focus), m_Break(pause), m_AutoStartBreaks(autoStartBreaks) {}

// ─────────────────────────────────────
Pomodoro::~Pomodoro() {
    Disarm();
}

// ─────────────────────────────────────
void Pomodoro::Toggle() {
    if (m_Phase == POMODORO_IDLE) {
        StartPhase(POMODORO_FOCUS, m_Focus);
        return;
    }
    if (m_Paused) {
        m_Paused = false;
        Arm(m_Remaining);
        spdlog::info("Pomodoro: resumed, {} s left", m_Remaining.count() / 1000);
        return;
    }
    m_Remaining = Remaining();
    Disarm();
    m_Paused = true;
    spdlog::info("Pomodoro: paused, {} s left", m_Remaining.count() / 1000);
}

// ─────────────────────────────────────
void Pomodoro::Stop() {
    Disarm();
    m_Paused = false;
    m_Remaining = std::chrono::milliseconds(0);
    if (m_Phase != POMODORO_IDLE) {
        m_Phase = POMODORO_IDLE;
        spdlog::debug("Pomodoro: stopped");
        if (m_OnPhaseChanged) {
            m_OnPhaseChanged(m_Phase);
        }
    }
}

// ─────────────────────────────────────
PomodoroPhase Pomodoro::Phase() const {
    return m_Phase;
}

// ─────────────────────────────────────
bool Pomodoro::IsRunning() const {
    return m_Phase != POMODORO_IDLE && !m_Paused;
}

// ─────────────────────────────────────
bool Pomodoro::IsPaused() const {
    return m_Paused;
}

// ─────────────────────────────────────
int Pomodoro::Count() const {
    return m_Count;
}

// ─────────────────────────────────────
std::chrono::milliseconds Pomodoro::Remaining() const {
    if (m_Phase == POMODORO_IDLE) {
        return std::chrono::milliseconds(0);
    }
    if (m_Paused) {
        return m_Remaining;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(m_PhaseEnd - m_Loop.Now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

// ─────────────────────────────────────
void Pomodoro::SetOnPhaseChanged(PhaseCallback callback) {
    m_OnPhaseChanged = std::move(callback);
}

// ─────────────────────────────────────
void Pomodoro::SetOnFocusDone(FocusDoneCallback callback) {
    m_OnFocusDone = std::move(callback);
}

// ─────────────────────────────────────
void Pomodoro::StartPhase(PomodoroPhase phase, std::chrono::milliseconds length) {
    m_Phase = phase;
    m_Paused = false;
    Arm(length);
    spdlog::info("Pomodoro: {} started ({} min)", phase == POMODORO_FOCUS ? "focus" : "break",
                 std::chrono::duration_cast<std::chrono::minutes>(length).count());
    if (m_OnPhaseChanged) {
        m_OnPhaseChanged(m_Phase);
    }
}

// ─────────────────────────────────────
void Pomodoro::Arm(std::chrono::milliseconds length) {
    Disarm();
    m_PhaseEnd = m_Loop.Now() + length;
    m_Timer = m_Loop.Schedule(length, [this] {
        m_Timer = 0;
        OnPhaseEnd();
    });
}

// ─────────────────────────────────────
void Pomodoro::Disarm() {
    if (m_Timer != 0) {
        m_Loop.Cancel(m_Timer);
        m_Timer = 0;
    }
}

// ─────────────────────────────────────
void Pomodoro::OnPhaseEnd() {
    if (m_Phase == POMODORO_FOCUS) {
        m_Count++;
        spdlog::info("Pomodoro: focus interval {} finished", m_Count);
        if (m_OnFocusDone) {
            m_OnFocusDone(m_Count);
        }
        if (m_AutoStartBreaks) {
            StartPhase(POMODORO_BREAK, m_Break);
            return;
        }
    } else if (m_Phase == POMODORO_BREAK) {
        spdlog::info("Pomodoro: break finished");
    }
    m_Phase = POMODORO_IDLE;
    if (m_OnPhaseChanged) {
        m_OnPhaseChanged(m_Phase);
    }
}
