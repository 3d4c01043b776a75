#pragma once

#include <dbus/dbus.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>

#include "activity_monitor.hpp"

struct SystemdMonitorOptions {
    std::filesystem::path unitDir;
    std::filesystem::path agentPath;
    std::size_t ceiling = 20;
    Seconds preStartWarning{60};
    Seconds preEndWarning{60};
};

// Registers each window as a set of user timers (start, end and the two warnings) whose
// services run the agent binary. Talks to the systemd user manager over the session bus.
class SystemdActivityMonitor : public ActivityMonitor {
  public:
    explicit SystemdActivityMonitor(SystemdMonitorOptions options);
    ~SystemdActivityMonitor() override;

    SystemdActivityMonitor(const SystemdActivityMonitor &) = delete;
    SystemdActivityMonitor &operator=(const SystemdActivityMonitor &) = delete;

    RegisterStatus Register(const PrayerWindow &window, std::string &error) override;
    bool Unregister(const std::string &windowId, std::string &error) override;
    std::size_t Ceiling() const override;

    static std::string UnitBaseName(AgentEvent event, const std::string &windowId);
    static std::string TimerUnit(const std::string &base, TimePoint at);
    std::string ServiceUnit(AgentEvent event, const std::string &windowId) const;

  private:
    bool Connect(std::string &error);
    bool CallManager(const char *method, const std::string &unit, std::string &error,
                     std::string &errorName);
    bool WriteUnit(const std::string &name, const std::string &content, std::string &error);
    std::size_t CountRegistered(const std::string &exceptId) const;

  private:
    SystemdMonitorOptions m_Options;
    DBusConnection *m_Conn = nullptr;

    static constexpr std::array<AgentEvent, 4> kEvents = {
        EVENT_WILL_START_WARNING, EVENT_INTERVAL_START, EVENT_WILL_END_WARNING,
        EVENT_INTERVAL_END};
};
