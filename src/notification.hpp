#pragma once

#include <dbus/dbus.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "common.hpp"

// Desktop notifications over org.freedesktop.Notifications.
class Notification {
  public:
    explicit Notification(std::chrono::milliseconds rateLimit = std::chrono::milliseconds(3000));
    ~Notification();

    Notification(const Notification &) = delete;
    Notification &operator=(const Notification &) = delete;

    bool Show(NoticeLevel level, const std::string &summary, const std::string &body);
    bool IsConnected() const;

    static const char *IconFor(NoticeLevel level);
    static int32_t TimeoutFor(NoticeLevel level);

  private:
    DBusError m_Err;
    DBusConnection *m_Conn = nullptr;
    std::chrono::milliseconds m_RateLimit;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> m_LastShown;
};
