#pragma once

#include <functional>
#include <string>
#include <vector>

enum Platform { PLATFORM_MAC, PLATFORM_OTHER };

enum ShortcutCategory { CATEGORY_NAVIGATION, CATEGORY_TASKS, CATEGORY_GENERAL };

struct KeyEvent {
    std::string key;
    bool ctrl = false;
    bool meta = false;
    bool shift = false;
    bool alt = false;
};

struct ShortcutBinding {
    std::string id;
    std::string description;
    ShortcutCategory category = CATEGORY_GENERAL;
    std::vector<std::string> macKeys;
    std::vector<std::string> otherKeys;
    int priority = 50;
    bool allowInModal = false;
    std::function<void()> action;
};

struct DispatchResult {
    bool handled = false;
    // Set whenever a binding matched; the host must swallow the platform default.
    bool preventDefault = false;
    std::string bindingId;
};

class ShortcutDispatcher {
  public:
    using ErrorCallback = std::function<void(const ShortcutBinding &, const std::string &)>;

    explicit ShortcutDispatcher(Platform platform = DetectPlatform());

    void Register(std::vector<ShortcutBinding> bindings);
    DispatchResult Dispatch(const KeyEvent &event);

    void PushModal();
    void PopModal();
    bool IsModalOpen() const;

    const std::vector<ShortcutBinding> &Bindings() const;
    const std::vector<std::string> &KeysFor(const ShortcutBinding &binding) const;
    Platform GetPlatform() const;
    void SetOnError(ErrorCallback callback);

    static Platform DetectPlatform();
    static std::string NormalizeKey(const std::string &key);
    static bool Matches(const KeyEvent &event, const std::vector<std::string> &keys);
    static std::string FormatKeys(const std::vector<std::string> &keys, Platform platform);

  private:
    Platform m_Platform;
    std::vector<ShortcutBinding> m_Bindings;
    int m_ModalDepth = 0;
    ErrorCallback m_OnError;
};
