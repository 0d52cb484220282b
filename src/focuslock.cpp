#include "focuslock.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
void FocusLock::Enable(TimePoint now) {
    if (m_Locked) {
        return;
    }
    m_Locked = true;
    m_LockedSince = now;
    spdlog::info("Focus Lock enabled, exits are vetoed");
    if (m_OnChanged) {
        m_OnChanged(true, LOCK_BY_USER);
    }
}

// ─────────────────────────────────────
void FocusLock::Disable(LockReason reason) {
    if (!m_Locked) {
        return;
    }
    m_Locked = false;
    m_LockedSince.reset();
    spdlog::info("Focus Lock {}", reason == LOCK_AUTO ? "auto-unlocked" : "disabled");
    if (m_OnChanged) {
        m_OnChanged(false, reason);
    }
}

// ─────────────────────────────────────
bool FocusLock::Toggle(TimePoint now) {
    if (m_Locked) {
        Disable(LOCK_BY_USER);
    } else {
        Enable(now);
    }
    return m_Locked;
}

// ─────────────────────────────────────
bool FocusLock::IsLocked() const {
    return m_Locked;
}

// ─────────────────────────────────────
bool FocusLock::IsExitAllowed() const {
    return !m_Locked;
}

// ─────────────────────────────────────
std::optional<TimePoint> FocusLock::LockedSince() const {
    return m_LockedSince;
}

// ─────────────────────────────────────
void FocusLock::SetOnChanged(ChangeCallback callback) {
    m_OnChanged = std::move(callback);
}
