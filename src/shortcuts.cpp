#include "shortcuts.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace {
std::string ToLower(std::string s) {
    for (char &c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}
} // namespace

// ─────────────────────────────────────
ShortcutDispatcher::ShortcutDispatcher(Platform platform) : m_Platform(platform) {}

// ─────────────────────────────────────
Platform ShortcutDispatcher::DetectPlatform() {
#ifdef __APPLE__
    return PLATFORM_MAC;
#else
    return PLATFORM_OTHER;
#endif
}

// ─────────────────────────────────────
void ShortcutDispatcher::Register(std::vector<ShortcutBinding> bindings) {
    // Full replacement; merging would let a stale binding fire alongside its successor.
    m_Bindings = std::move(bindings);
    spdlog::debug("Shortcuts: registered {} bindings", m_Bindings.size());
}

// ─────────────────────────────────────
DispatchResult ShortcutDispatcher::Dispatch(const KeyEvent &event) {
    DispatchResult result;
    const bool modalOpen = IsModalOpen();

    const ShortcutBinding *winner = nullptr;
    for (const auto &binding : m_Bindings) {
        if (!binding.allowInModal && modalOpen) {
            continue;
        }
        if (!Matches(event, KeysFor(binding))) {
            continue;
        }
        // '>=' so the later registration wins a priority tie.
        if (!winner || binding.priority >= winner->priority) {
            winner = &binding;
        }
    }

    if (!winner) {
        spdlog::debug("Shortcuts: no binding for key '{}'", event.key);
        return result;
    }

    result.handled = true;
    result.preventDefault = true;
    result.bindingId = winner->id;

    // The action may re-register bindings, so nothing may point into m_Bindings past here.
    ShortcutBinding fired = *winner;
    spdlog::debug("Shortcuts: '{}' fired (priority {})", fired.id, fired.priority);
    if (!fired.action) {
        return result;
    }
    try {
        fired.action();
    } catch (const std::exception &e) {
        spdlog::error("Shortcuts: '{}' failed: {}", fired.id, e.what());
        if (m_OnError) {
            m_OnError(fired, e.what());
        }
    }
    return result;
}

// ─────────────────────────────────────
void ShortcutDispatcher::PushModal() {
    m_ModalDepth++;
}

// ─────────────────────────────────────
void ShortcutDispatcher::PopModal() {
    m_ModalDepth = std::max(0, m_ModalDepth - 1);
}

// ─────────────────────────────────────
bool ShortcutDispatcher::IsModalOpen() const {
    return m_ModalDepth > 0;
}

// ─────────────────────────────────────
const std::vector<ShortcutBinding> &ShortcutDispatcher::Bindings() const {
    return m_Bindings;
}

// ─────────────────────────────────────
const std::vector<std::string> &ShortcutDispatcher::KeysFor(const ShortcutBinding &binding) const {
    return m_Platform == PLATFORM_MAC ? binding.macKeys : binding.otherKeys;
}

// ─────────────────────────────────────
Platform ShortcutDispatcher::GetPlatform() const {
    return m_Platform;
}

// ─────────────────────────────────────
void ShortcutDispatcher::SetOnError(ErrorCallback callback) {
    m_OnError = std::move(callback);
}

// ─────────────────────────────────────
std::string ShortcutDispatcher::NormalizeKey(const std::string &key) {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"delete", "backspace"}, {"del", "backspace"}, {" ", "space"},
        {"esc", "escape"},       {"return", "enter"},
    };
    std::string lower = ToLower(key);
    auto it = aliases.find(lower);
    return it != aliases.end() ? it->second : lower;
}

// ─────────────────────────────────────
bool ShortcutDispatcher::Matches(const KeyEvent &event, const std::vector<std::string> &keys) {
    if (keys.empty() || event.key.empty()) {
        return false;
    }

    std::vector<std::string> eventKeys;
    if (event.meta) eventKeys.emplace_back("meta");
    if (event.ctrl) eventKeys.emplace_back("ctrl");
    if (event.shift) eventKeys.emplace_back("shift");
    if (event.alt) eventKeys.emplace_back("alt");
    eventKeys.push_back(NormalizeKey(event.key));

    if (eventKeys.size() != keys.size()) {
        return false;
    }
    return std::all_of(keys.begin(), keys.end(), [&](const std::string &k) {
        return std::find(eventKeys.begin(), eventKeys.end(), NormalizeKey(k)) != eventKeys.end();
    });
}

// ─────────────────────────────────────
std::string ShortcutDispatcher::FormatKeys(const std::vector<std::string> &keys,
                                           Platform platform) {
    const bool mac = platform == PLATFORM_MAC;
    const std::unordered_map<std::string, std::string> labels = {
        {"meta", mac ? "⌘" : "Ctrl"},
        {"ctrl", "Ctrl"},
        {"shift", "⇧"},
        {"alt", mac ? "⌥" : "Alt"},
        {"enter", "↵"},
        {"escape", "Esc"},
        {"arrowup", "↑"},
        {"arrowdown", "↓"},
        {"arrowleft", "←"},
        {"arrowright", "→"},
    };

    std::string out;
    for (const auto &key : keys) {
        if (!out.empty()) {
            out += " + ";
        }
        const std::string lower = ToLower(key);
        auto it = labels.find(lower);
        if (it != labels.end()) {
            out += it->second;
        } else {
            std::string upper = key;
            for (char &c : upper) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            out += upper;
        }
    }
    return out;
}
