#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "shortcuts.hpp"

namespace {
ShortcutBinding MakeBinding(const std::string &id, std::vector<std::string> keys, int priority,
                            bool allowInModal, std::vector<std::string> *fired) {
    ShortcutBinding binding;
    binding.id = id;
    binding.macKeys = keys;
    binding.otherKeys = keys;
    binding.priority = priority;
    binding.allowInModal = allowInModal;
    binding.action = [fired, id] { fired->push_back(id); };
    return binding;
}

KeyEvent Key(const std::string &key, bool ctrl = false, bool shift = false) {
    KeyEvent event;
    event.key = key;
    event.ctrl = ctrl;
    event.shift = shift;
    return event;
}
} // namespace

TEST(ShortcutDispatcher, HighestPriorityWinsAndOnlyOneFires) {
    std::vector<std::string> fired;
    ShortcutDispatcher dispatcher(PLATFORM_OTHER);
    dispatcher.Register({
        MakeBinding("low", {"enter"}, 10, false, &fired),
        MakeBinding("high", {"enter"}, 85, false, &fired),
        MakeBinding("mid", {"enter"}, 50, false, &fired),
    });

    DispatchResult result = dispatcher.Dispatch(Key("Enter"));
    EXPECT_TRUE(result.handled);
    EXPECT_TRUE(result.preventDefault);
    EXPECT_EQ(result.bindingId, "high");
    ASSERT_EQ(fired.size(), 1u);
    EXPECT_EQ(fired[0], "high");
}

TEST(ShortcutDispatcher, LaterRegistrationWinsPriorityTie) {
    std::vector<std::string> fired;
    ShortcutDispatcher dispatcher(PLATFORM_OTHER);
    dispatcher.Register({
        MakeBinding("first", {"p"}, 75, false, &fired),
        MakeBinding("second", {"p"}, 75, false, &fired),
    });

    EXPECT_EQ(dispatcher.Dispatch(Key("p")).bindingId, "second");
    EXPECT_EQ(fired, std::vector<std::string>{"second"});
}

TEST(ShortcutDispatcher, ModifiersMustMatchExactly) {
    std::vector<std::string> fired;
    ShortcutDispatcher dispatcher(PLATFORM_OTHER);
    dispatcher.Register({
        MakeBinding("complete", {"ctrl", "enter"}, 85, false, &fired),
        MakeBinding("postpone", {"ctrl", "shift", "arrowright"}, 80, false, &fired),
    });

    EXPECT_FALSE(dispatcher.Dispatch(Key("enter")).handled);
    EXPECT_FALSE(dispatcher.Dispatch(Key("enter", true, true)).handled);
    EXPECT_FALSE(dispatcher.Dispatch(Key("ArrowRight", true)).handled);
    EXPECT_EQ(dispatcher.Dispatch(Key("ArrowRight", true, true)).bindingId, "postpone");
    EXPECT_EQ(dispatcher.Dispatch(Key("Enter", true)).bindingId, "complete");
    EXPECT_EQ(fired.size(), 2u);
}

TEST(ShortcutDispatcher, ModalBlocksBindingsThatAreNotAllowedInModal) {
    std::vector<std::string> fired;
    ShortcutDispatcher dispatcher(PLATFORM_OTHER);
    dispatcher.Register({
        MakeBinding("next-task", {"arrowright"}, 80, false, &fired),
        MakeBinding("toggle-focus-lock", {"ctrl", "l"}, 90, true, &fired),
    });

    dispatcher.PushModal();
    EXPECT_FALSE(dispatcher.Dispatch(Key("ArrowRight")).handled);
    EXPECT_TRUE(dispatcher.Dispatch(Key("l", true)).handled);

    dispatcher.PopModal();
    EXPECT_TRUE(dispatcher.Dispatch(Key("ArrowRight")).handled);
    EXPECT_EQ(fired, (std::vector<std::string>{"toggle-focus-lock", "next-task"}));
}

TEST(ShortcutDispatcher, NestedModalsCloseOneLevelAtATime) {
    ShortcutDispatcher dispatcher(PLATFORM_OTHER);
    dispatcher.PushModal();
    dispatcher.PushModal();
    dispatcher.PopModal();
    EXPECT_TRUE(dispatcher.IsModalOpen());
    dispatcher.PopModal();
    EXPECT_FALSE(dispatcher.IsModalOpen());
    dispatcher.PopModal();
    EXPECT_FALSE(dispatcher.IsModalOpen());
    dispatcher.PushModal();
    EXPECT_TRUE(dispatcher.IsModalOpen());
}

TEST(ShortcutDispatcher, PlatformSelectsKeySet) {
    std::vector<std::string> fired;
    ShortcutBinding binding;
    binding.id = "snooze-task";
    binding.macKeys = {"meta", "s"};
    binding.otherKeys = {"ctrl", "s"};
    binding.action = [&] { fired.push_back("snooze-task"); };

    ShortcutDispatcher mac(PLATFORM_MAC);
    mac.Register({binding});
    KeyEvent metaS;
    metaS.key = "s";
    metaS.meta = true;
    EXPECT_TRUE(mac.Dispatch(metaS).handled);
    EXPECT_FALSE(mac.Dispatch(Key("s", true)).handled);

    ShortcutDispatcher other(PLATFORM_OTHER);
    other.Register({binding});
    EXPECT_FALSE(other.Dispatch(metaS).handled);
    EXPECT_TRUE(other.Dispatch(Key("s", true)).handled);
    EXPECT_EQ(fired.size(), 2u);
}

TEST(ShortcutDispatcher, RegisterReplacesTheWholeSet) {
    std::vector<std::string> fired;
    ShortcutDispatcher dispatcher(PLATFORM_OTHER);
    dispatcher.Register({MakeBinding("old", {"enter"}, 85, false, &fired)});
    dispatcher.Register({MakeBinding("new", {"n"}, 65, false, &fired)});

    EXPECT_FALSE(dispatcher.Dispatch(Key("enter")).handled);
    EXPECT_TRUE(dispatcher.Dispatch(Key("n")).handled);
    EXPECT_EQ(dispatcher.Bindings().size(), 1u);
}

TEST(ShortcutDispatcher, ActionMayReRegisterDuringDispatch) {
    ShortcutDispatcher dispatcher(PLATFORM_OTHER);
    int calls = 0;
    ShortcutBinding binding;
    binding.id = "swap";
    binding.otherKeys = {"enter"};
    binding.action = [&] {
        calls++;
        dispatcher.Register({});
    };
    dispatcher.Register({binding});

    DispatchResult result = dispatcher.Dispatch(Key("enter"));
    EXPECT_EQ(result.bindingId, "swap");
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(dispatcher.Bindings().empty());
}

TEST(ShortcutDispatcher, ThrowingActionIsReportedNotPropagated) {
    ShortcutDispatcher dispatcher(PLATFORM_OTHER);
    std::string reported;
    dispatcher.SetOnError([&](const ShortcutBinding &binding, const std::string &what) {
        reported = binding.id + ":" + what;
    });
    ShortcutBinding binding;
    binding.id = "boom";
    binding.otherKeys = {"b"};
    binding.action = [] { throw std::runtime_error("broken"); };
    dispatcher.Register({binding});

    DispatchResult result;
    EXPECT_NO_THROW(result = dispatcher.Dispatch(Key("b")));
    EXPECT_TRUE(result.handled);
    EXPECT_EQ(reported, "boom:broken");
}

TEST(ShortcutDispatcher, NormalizesKeyAliases) {
    EXPECT_EQ(ShortcutDispatcher::NormalizeKey("Esc"), "escape");
    EXPECT_EQ(ShortcutDispatcher::NormalizeKey("Return"), "enter");
    EXPECT_EQ(ShortcutDispatcher::NormalizeKey("Delete"), "backspace");
    EXPECT_EQ(ShortcutDispatcher::NormalizeKey("del"), "backspace");
    EXPECT_EQ(ShortcutDispatcher::NormalizeKey(" "), "space");
    EXPECT_EQ(ShortcutDispatcher::NormalizeKey("ArrowLeft"), "arrowleft");

    KeyEvent esc;
    esc.key = "Esc";
    EXPECT_TRUE(ShortcutDispatcher::Matches(esc, {"escape"}));
}

TEST(ShortcutDispatcher, FormatsCombosPerPlatform) {
    EXPECT_EQ(ShortcutDispatcher::FormatKeys({"meta", "l"}, PLATFORM_MAC), "⌘ + L");
    EXPECT_EQ(ShortcutDispatcher::FormatKeys({"ctrl", "l"}, PLATFORM_OTHER), "Ctrl + L");
    EXPECT_EQ(ShortcutDispatcher::FormatKeys({"ctrl", "alt", "n"}, PLATFORM_OTHER),
              "Ctrl + Alt + N");
    EXPECT_EQ(ShortcutDispatcher::FormatKeys({"escape"}, PLATFORM_OTHER), "Esc");
}
