#include "notification.hpp"

#include <cstdint>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Notification::Notification() {
    dbus_error_init(&m_Err);
    m_Conn = dbus_bus_get(DBUS_BUS_SESSION, &m_Err);
    if (dbus_error_is_set(&m_Err) || !m_Conn) {
        spdlog::error("Failed to connect to session bus: {}",
                      dbus_error_is_set(&m_Err) ? m_Err.message : "unknown");
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
void Notification::Notify(const std::string &icon, const std::string &summary,
                          const std::string &body) {
    int32_t timeout = 8000; // ms

    if (!m_Conn) {
        spdlog::info("Notification (no session bus): {}: {}", summary, body);
        return;
    }

    std::chrono::time_point<std::chrono::system_clock> now = std::chrono::system_clock::now();
    if (summary == m_LastSummary && now - m_LastNotification < std::chrono::seconds(3)) {
        spdlog::debug("Notification skipped: rate limit exceeded");
        return;
    }

    DBusMessage *msg_dbus = dbus_message_new_method_call("org.freedesktop.Notifications",
                                                         "/org/freedesktop/Notifications",
                                                         "org.freedesktop.Notifications", "Notify");
    if (!msg_dbus) {
        spdlog::error("Failed to create DBus message");
        return;
    }

    DBusMessageIter args;
    dbus_message_iter_init_append(msg_dbus, &args);

    const char *app_name = "prayerguard";
    uint32_t replaces_id = 0;
    const char *icon_c = icon.c_str();
    const char *summary_c = summary.c_str();
    const char *body_c = body.c_str();

    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &app_name);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_UINT32, &replaces_id);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &icon_c);
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
        return;
    }

    // The agent exits right after notifying; push the message out before that.
    dbus_connection_flush(m_Conn);
    dbus_message_unref(msg_dbus);
    m_LastNotification = now;
    m_LastSummary = summary;
}
