#pragma once

#include <string>
#include <vector>

#include "activity_monitor.hpp"
#include "common.hpp"
#include "shared_state.hpp"

struct RegistrationReport {
    std::vector<std::string> registered;
    std::vector<std::string> unregistered;
    std::vector<std::string> kept;
    std::vector<std::string> rejected;
    bool needsAuthorization = false;
    bool ceilingReached = false;
};

// Reconciles the desired plan with what the host has registered. The registered set lives in
// the store so a restarted daemon picks up where the previous one stopped.
class ScheduleRegistrar {
  public:
    ScheduleRegistrar(SharedState &state, ActivityMonitor &monitor);

    RegistrationReport Reconcile(const std::vector<PrayerWindow> &desired, TimePoint now);

  private:
    SharedState &m_State;
    ActivityMonitor &m_Monitor;
};
