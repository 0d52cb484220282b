#include "notification.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Notification::Notification(std::chrono::milliseconds rateLimit) : m_RateLimit(rateLimit) {
    dbus_error_init(&m_Err);
    m_Conn = dbus_bus_get(DBUS_BUS_SESSION, &m_Err);
    if (dbus_error_is_set(&m_Err) || !m_Conn) {
        spdlog::warn("Failed to connect to session bus: {}",
                     m_Err.message ? m_Err.message : "unknown error");
        dbus_error_free(&m_Err);
        m_Conn = nullptr;
        return;
    }
}

// ─────────────────────────────────────
Notification::~Notification() {
    if (m_Conn) {
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
    }

    if (dbus_error_is_set(&m_Err)) {
        dbus_error_free(&m_Err);
    }
}

// ─────────────────────────────────────
bool Notification::IsConnected() const {
    return m_Conn != nullptr;
}

// ─────────────────────────────────────
const char *Notification::IconFor(NoticeLevel level) {
    switch (level) {
    case NOTICE_SUCCESS:
        return "emblem-ok-symbolic";
    case NOTICE_WARNING:
        return "dialog-warning";
    case NOTICE_ERROR:
        return "dialog-error";
    case NOTICE_INFO:
        return "dialog-information";
    }
    return "dialog-information";
}

// ─────────────────────────────────────
int32_t Notification::TimeoutFor(NoticeLevel level) {
    return level == NOTICE_ERROR ? 6000 : 3000; // ms
}

// ─────────────────────────────────────
bool Notification::Show(NoticeLevel level, const std::string &summary, const std::string &body) {
    if (!m_Conn) {
        return false;
    }

    const auto now = std::chrono::steady_clock::now();
    auto last = m_LastShown.find(summary);
    if (last != m_LastShown.end() && now - last->second < m_RateLimit) {
        spdlog::debug("Notification '{}' skipped: rate limit exceeded", summary);
        return false;
    }

    DBusMessage *msg_dbus = dbus_message_new_method_call("org.freedesktop.Notifications",
                                                         "/org/freedesktop/Notifications",
                                                         "org.freedesktop.Notifications", "Notify");
    if (!msg_dbus) {
        spdlog::error("Failed to create DBus message");
        return false;
    }

    DBusMessageIter args;
    dbus_message_iter_init_append(msg_dbus, &args);

    const char *app_name = "Flowlock";
    uint32_t replaces_id = 0;
    const char *icon = IconFor(level);
    const char *summary_c = summary.c_str();
    const char *body_c = body.c_str();
    int32_t timeout = TimeoutFor(level);

    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &app_name);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_UINT32, &replaces_id);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &icon);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &summary_c);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &body_c);

    DBusMessageIter actions;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "s", &actions);
    dbus_message_iter_close_container(&args, &actions);

    DBusMessageIter hints;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "{sv}", &hints);
    dbus_message_iter_close_container(&args, &hints);

    dbus_message_iter_append_basic(&args, DBUS_TYPE_INT32, &timeout);

    if (!dbus_connection_send(m_Conn, msg_dbus, nullptr)) {
        spdlog::error("Failed to send DBus message");
        dbus_message_unref(msg_dbus);
        return false;
    }
    dbus_connection_flush(m_Conn);
    dbus_message_unref(msg_dbus);

    m_LastShown[summary] = now;
    return true;
}
