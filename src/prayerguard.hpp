#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "blocking_state.hpp"
#include "common.hpp"
#include "config.hpp"
#include "notification.hpp"
#include "planner.hpp"
#include "prayer_source.hpp"
#include "registrar.hpp"
#include "shared_state.hpp"
#include "shield.hpp"
#include "store.hpp"
#include "store_observer.hpp"
#include "systemd_monitor.hpp"

// Main process. Owns the plan, the user's settings and intents, and watches the agent's facts
// to keep the shield watcher and notifications in line with the derived blocking session.
class PrayerGuard {
  public:
    explicit PrayerGuard(const Config &config);
    ~PrayerGuard();

    PrayerGuard(const PrayerGuard &) = delete;
    PrayerGuard &operator=(const PrayerGuard &) = delete;

    // Blocks until RequestShutdown().
    void Run();
    void RequestShutdown();

    RegistrationReport Replan(TimePoint now);
    BlockingSession Status(TimePoint now);
    bool Confirm(TimePoint now);
    bool RequestEarlyUnlock(TimePoint now);

    SharedState &State() {
        return *m_State;
    }

  private:
    void WakeScheduler();
    bool ReplanDue(const StateSnapshot &snapshot, TimePoint now) const;
    void ReplanSafely(TimePoint now);
    void NotifyAuthorization(const StateSnapshot &snapshot);
    void NotifyAwaiting(const BlockingSession &session);
    void UpdateShieldWatcher(const BlockingSession &session);
    std::chrono::local_days LocalDay(TimePoint now) const;
    TimePoint NextLocalMidnight(TimePoint now) const;
    TimePoint NextDeadline(const StateSnapshot &snapshot, const BlockingSession &session,
                           TimePoint now) const;
    void WaitUntilNextDeadline(TimePoint deadline);

  private:
    Config m_Config;
    const std::chrono::time_zone *m_Zone;

    // Scheduler: wait-until-next-deadline with reliable wakeups
    std::mutex m_SchedulerMutex;
    std::condition_variable m_SchedulerCv;
    std::atomic<std::uint64_t> m_WakeupSeq{0};
    std::atomic<bool> m_ShutdownRequested{false};

    // Parts
    std::unique_ptr<StateStore> m_Store;
    std::unique_ptr<SharedState> m_State;
    std::unique_ptr<ShieldFile> m_Shield;
    std::unique_ptr<ShieldWatcher> m_Watcher;
    std::unique_ptr<SystemdActivityMonitor> m_Monitor;
    std::unique_ptr<Notification> m_Notification;
    std::unique_ptr<PrayerTimeSource> m_Source;
    std::unique_ptr<ScheduleRegistrar> m_Registrar;
    std::unique_ptr<BlockingController> m_Controller;
    std::unique_ptr<StoreObserver> m_Observer;
    PrayerWindowPlanner m_Planner;

    // Re-plan bookkeeping
    std::optional<TimePoint> m_LastReplan;
    std::chrono::local_days m_LastReplanDay{};
    TimePoint m_ReplanRetryAt{};
    std::string m_PlannedSettings;

    // Notifications already shown
    bool m_AuthNotified{false};
    std::string m_AwaitNotifiedId;

    static constexpr Seconds kShieldSweepEvery{30};
    static constexpr Seconds kReplanRetryEvery{5 * 60};
};
