#pragma once

#include <dbus/dbus.h>

#include <chrono>
#include <string>

#include "notifier.hpp"

// Desktop notifications through org.freedesktop.Notifications on the session bus.
class Notification : public Notifier {
  public:
    Notification();
    ~Notification() override;

    Notification(const Notification &) = delete;
    Notification &operator=(const Notification &) = delete;

    void Notify(const std::string &icon, const std::string &summary,
                const std::string &body) override;

  private:
    DBusError m_Err;
    DBusConnection *m_Conn = nullptr;

    std::chrono::time_point<std::chrono::system_clock> m_LastNotification;
    std::string m_LastSummary;
};
