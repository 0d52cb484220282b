#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "focuslock.hpp"
#include "test_support.hpp"

TEST(FocusLock, StartsUnlocked) {
    FocusLock lock;
    EXPECT_FALSE(lock.IsLocked());
    EXPECT_TRUE(lock.IsExitAllowed());
    EXPECT_FALSE(lock.LockedSince().has_value());
}

TEST(FocusLock, ToggleAlwaysFlipsState) {
    const TimePoint now = FromUnixTime(1700000000.0);
    FocusLock lock;
    EXPECT_TRUE(lock.Toggle(now));
    EXPECT_FALSE(lock.IsExitAllowed());
    EXPECT_EQ(lock.LockedSince(), now);
    EXPECT_FALSE(lock.Toggle(now));
    EXPECT_TRUE(lock.IsExitAllowed());
    EXPECT_FALSE(lock.LockedSince().has_value());
}

TEST(FocusLock, CallbackFiresOnlyOnRealTransitions) {
    const TimePoint now = FromUnixTime(1700000000.0);
    FocusLock lock;
    std::vector<std::pair<bool, LockReason>> changes;
    lock.SetOnChanged([&](bool locked, LockReason reason) { changes.emplace_back(locked, reason); });

    lock.Disable();
    lock.Enable(now);
    lock.Enable(now);
    lock.Disable(LOCK_AUTO);
    lock.Disable(LOCK_AUTO);

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0], std::make_pair(true, LOCK_BY_USER));
    EXPECT_EQ(changes[1], std::make_pair(false, LOCK_AUTO));
}
