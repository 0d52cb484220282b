#pragma once

#include <functional>
#include <optional>

#include "common.hpp"

enum LockReason { LOCK_BY_USER, LOCK_AUTO };

// Focus Lock: while locked every exit-class transition is vetoed by its action.
class FocusLock {
  public:
    using ChangeCallback = std::function<void(bool locked, LockReason reason)>;

    void Enable(TimePoint now);
    void Disable(LockReason reason = LOCK_BY_USER);
    bool Toggle(TimePoint now);

    bool IsLocked() const;
    bool IsExitAllowed() const;
    std::optional<TimePoint> LockedSince() const;

    void SetOnChanged(ChangeCallback callback);

  private:
    bool m_Locked = false;
    std::optional<TimePoint> m_LockedSince;
    ChangeCallback m_OnChanged;
};
