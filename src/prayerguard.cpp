#include "prayerguard.hpp"

#include <algorithm>

// ─────────────────────────────────────
PrayerGuard::PrayerGuard(const Config &config)
    : m_Config(config), m_Zone(std::chrono::current_zone()),
      m_Planner(config.registrationCeiling, config.guard) {

    // Store
    m_Store = std::make_unique<StateStore>(m_Config.dbPath.string(), ROLE_MAIN);
    m_State = std::make_unique<SharedState>(*m_Store);
    spdlog::info("State database: {}", m_Config.dbPath.string());

    // Shield
    m_Shield = std::make_unique<ShieldFile>(m_Config.shieldPath);
    m_Watcher = std::make_unique<ShieldWatcher>(*m_Shield, m_Config.categories);
    spdlog::debug("Shield file: {}", m_Config.shieldPath.string());

    // Host scheduler
    SystemdMonitorOptions options;
    options.unitDir = m_Config.unitDir;
    options.agentPath = m_Config.agentPath;
    options.ceiling = m_Config.registrationCeiling;
    options.preStartWarning = m_Config.preStartWarning;
    options.preEndWarning = m_Config.preEndWarning;
    m_Monitor = std::make_unique<SystemdActivityMonitor>(std::move(options));
    spdlog::debug("Agent binary: {}", m_Config.agentPath.string());

    // Notifications
    m_Notification = std::make_unique<Notification>();

    // Prayer times
    m_Source = std::make_unique<JsonPrayerTimeSource>(m_Config.prayerTimesPath, m_Zone);
    spdlog::debug("Prayer times: {}", m_Config.prayerTimesPath.string());

    m_Registrar = std::make_unique<ScheduleRegistrar>(*m_State, *m_Monitor);
    m_Controller = std::make_unique<BlockingController>(*m_State, *m_Shield);
    m_Observer = std::make_unique<StoreObserver>(m_Config.dbPath, m_Config.observerFallback);
}

// ─────────────────────────────────────
PrayerGuard::~PrayerGuard() {
    if (m_Observer) {
        m_Observer->Stop();
    }
    if (m_Watcher) {
        m_Watcher->Stop();
    }
}

// ─────────────────────────────────────
std::chrono::local_days PrayerGuard::LocalDay(TimePoint now) const {
    return std::chrono::floor<std::chrono::days>(m_Zone->to_local(now));
}

// ─────────────────────────────────────
TimePoint PrayerGuard::NextLocalMidnight(TimePoint now) const {
    const std::chrono::local_seconds midnight{LocalDay(now) + std::chrono::days{1}};
    return std::chrono::floor<Seconds>(m_Zone->to_sys(midnight, std::chrono::choose::earliest));
}

// ─────────────────────────────────────
RegistrationReport PrayerGuard::Replan(TimePoint now) {
    const FocusSettings settings = m_State->Settings();
    const std::vector<PrayerOccurrence> occurrences = m_Source->Upcoming(now);
    const std::vector<PrayerWindow> windows = m_Planner.Plan(occurrences, settings, now);

    RegistrationReport report = m_Registrar->Reconcile(windows, now);
    spdlog::info("Plan: {} windows, {} registered, {} unregistered, {} kept, {} rejected",
                 windows.size(), report.registered.size(), report.unregistered.size(),
                 report.kept.size(), report.rejected.size());
    if (report.needsAuthorization) {
        spdlog::warn("Plan: the user manager refused registration, authorization needed");
    } else if (report.ceilingReached) {
        spdlog::info("Plan: registration ceiling reached, farther windows wait for the next plan");
    }

    m_LastReplan = now;
    m_LastReplanDay = LocalDay(now);
    m_PlannedSettings = SettingsToJson(settings).dump();
    return report;
}

// ─────────────────────────────────────
void PrayerGuard::ReplanSafely(TimePoint now) {
    try {
        Replan(now);
    } catch (const std::exception &e) {
        spdlog::error("Re-plan failed: {}", e.what());
        m_ReplanRetryAt = now + kReplanRetryEvery;
    }
}

// ─────────────────────────────────────
bool PrayerGuard::ReplanDue(const StateSnapshot &snapshot, TimePoint now) const {
    if (now < m_ReplanRetryAt) {
        return false;
    }
    if (!m_LastReplan) {
        return true;
    }
    if (now >= *m_LastReplan + m_Config.replanInterval) {
        return true;
    }
    if (LocalDay(now) != m_LastReplanDay) {
        return true;
    }
    // Settings written by another process since the last plan.
    return SettingsToJson(snapshot.settings).dump() != m_PlannedSettings;
}

// ─────────────────────────────────────
BlockingSession PrayerGuard::Status(TimePoint now) {
    return m_Controller->Observe(now);
}

// ─────────────────────────────────────
bool PrayerGuard::Confirm(TimePoint now) {
    const bool done = m_Controller->Confirm(now);
    WakeScheduler();
    return done;
}

// ─────────────────────────────────────
bool PrayerGuard::RequestEarlyUnlock(TimePoint now) {
    const bool done = m_Controller->RequestEarlyUnlock(now);
    WakeScheduler();
    return done;
}

// ─────────────────────────────────────
void PrayerGuard::NotifyAuthorization(const StateSnapshot &snapshot) {
    if (!snapshot.needsAuthorization.active) {
        m_AuthNotified = false;
        return;
    }
    if (m_AuthNotified) {
        return;
    }
    m_AuthNotified = true;
    std::string body = "Prayer windows could not be scheduled.";
    if (!snapshot.needsAuthorization.reason.empty()) {
        body += " " + snapshot.needsAuthorization.reason;
    }
    m_Notification->Notify("dialog-warning", "Prayerguard needs authorization", body);
}

// ─────────────────────────────────────
void PrayerGuard::NotifyAwaiting(const BlockingSession &session) {
    if (!session.isWaitingConfirmation || session.windowId == m_AwaitNotifiedId) {
        return;
    }
    m_AwaitNotifiedId = session.windowId;
    m_Notification->Notify("appointment-soon", session.prayerName + " window ended",
                           "Strict mode: run 'prayerguard confirm' to lift restrictions.");
}

// ─────────────────────────────────────
void PrayerGuard::UpdateShieldWatcher(const BlockingSession &session) {
    m_Watcher->SetEnabled(session.isBlocking);
    if (!session.isBlocking) {
        return;
    }
    const std::size_t closed = m_Watcher->Enforce();
    if (closed > 0) {
        spdlog::debug("Shield sweep closed {} windows", closed);
    }
}

// ─────────────────────────────────────
TimePoint PrayerGuard::NextDeadline(const StateSnapshot &snapshot,
                                    const BlockingSession &session, TimePoint now) const {
    TimePoint deadline = now + std::chrono::hours(24);

    if (auto blocking = NextBlockingDeadline(snapshot, now)) {
        deadline = std::min(deadline, *blocking);
    }

    // Day rollover and periodic re-plan
    deadline = std::min(deadline, NextLocalMidnight(now));
    if (m_LastReplan) {
        deadline = std::min(deadline, std::max(*m_LastReplan + m_Config.replanInterval,
                                               m_ReplanRetryAt));
    } else {
        deadline = std::min(deadline, std::max(now + Seconds{1}, m_ReplanRetryAt));
    }

    // Windows opened while the event stream was down
    if (session.isBlocking) {
        deadline = std::min(deadline, now + kShieldSweepEvery);
    }

    return std::max(deadline, now + Seconds{1});
}

// ─────────────────────────────────────
void PrayerGuard::WaitUntilNextDeadline(TimePoint deadline) {
    const auto seq = m_WakeupSeq.load(std::memory_order_relaxed);
    std::unique_lock<std::mutex> lk(m_SchedulerMutex);
    m_SchedulerCv.wait_until(lk, deadline, [&] {
        if (m_ShutdownRequested.load()) {
            return true;
        }
        return m_WakeupSeq.load(std::memory_order_relaxed) != seq;
    });
}

// ─────────────────────────────────────
void PrayerGuard::Run() {
    if (m_Watcher->Start()) {
        spdlog::info("Niri event stream enabled, shield closes windows as they open");
    }
    if (!m_Observer->Start([this]() { WakeScheduler(); })) {
        spdlog::warn("Store observer unavailable; agent facts are picked up on deadlines only");
    }

    while (!m_ShutdownRequested.load()) {
        const TimePoint now = Now();
        TimePoint deadline = now + kShieldSweepEvery;

        try {
            StateSnapshot snapshot = m_State->ReadSnapshot();
            if (ReplanDue(snapshot, now)) {
                ReplanSafely(now);
                snapshot = m_State->ReadSnapshot();
            }

            const BlockingSession session = ComputeBlockingSession(snapshot, now);
            spdlog::debug("Session: {} {} remaining {}s", PhaseToString(session.phase),
                          session.windowId, session.timeRemaining.count());

            NotifyAuthorization(snapshot);
            NotifyAwaiting(session);
            UpdateShieldWatcher(session);

            deadline = NextDeadline(snapshot, session, now);
        } catch (const std::exception &e) {
            spdlog::error("Main loop: {}", e.what());
        }

        WaitUntilNextDeadline(deadline);
    }

    m_Watcher->SetEnabled(false);
    m_Observer->Stop();
    m_Watcher->Stop();
    spdlog::info("prayerguard stopped");
}

// ─────────────────────────────────────
void PrayerGuard::RequestShutdown() {
    m_ShutdownRequested.store(true);
    WakeScheduler();
}

// ─────────────────────────────────────
void PrayerGuard::WakeScheduler() {
    m_WakeupSeq.fetch_add(1, std::memory_order_relaxed);
    m_SchedulerCv.notify_one();
}
