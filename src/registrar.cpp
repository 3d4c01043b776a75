#include "registrar.hpp"

#include "planner.hpp"

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

namespace {
constexpr std::size_t kRegisteredMargin = 5;
}

// ─────────────────────────────────────
const char *RegisterStatusToString(RegisterStatus status) {
    switch (status) {
    case REGISTER_OK:
        return "ok";
    case REGISTER_CEILING:
        return "ceiling reached";
    case REGISTER_UNAUTHORIZED:
        return "not authorized";
    case REGISTER_FAILED:
        return "failed";
    }
    return "unknown";
}

// ─────────────────────────────────────
ScheduleRegistrar::ScheduleRegistrar(SharedState &state, ActivityMonitor &monitor)
    : m_State(state), m_Monitor(monitor) {}

// ─────────────────────────────────────
RegistrationReport ScheduleRegistrar::Reconcile(const std::vector<PrayerWindow> &desired,
                                                TimePoint now) {
    RegistrationReport report;

    const std::vector<std::string> previousIds = m_State.RegisteredIds();
    const std::vector<PrayerWindow> previousPlan = m_State.PlannedWindows();
    const FocusSettings settings = m_State.Settings();
    const AuthorizationFlag previousAuth = m_State.NeedsAuthorization();

    const std::set<std::string> previous(previousIds.begin(), previousIds.end());
    std::set<std::string> desiredIds;
    for (const auto &w : desired) {
        desiredIds.insert(w.id);
    }

    auto findPrevious = [&previousPlan](const std::string &id) -> const PrayerWindow * {
        for (const auto &w : previousPlan) {
            if (w.id == id) {
                return &w;
            }
        }
        return nullptr;
    };

    std::vector<std::string> active;
    std::vector<std::string> stuck;
    std::vector<PrayerWindow> keptWindows;
    std::string error;
    std::string authError;

    // Stale registrations
    for (const auto &id : previousIds) {
        if (desiredIds.count(id) > 0) {
            continue;
        }

        PrayerWindow w;
        if (const PrayerWindow *p = findPrevious(id)) {
            w = *p;
        } else if (ParseWindowId(id, w.prayerName, w.startTime)) {
            w.id = id;
            w.duration = PrayerWindowPlanner::EffectiveDuration(settings);
        } else {
            spdlog::warn("Registrar: unparsable registered id '{}'", id);
            w.id = id;
        }

        if (w.duration > Seconds{0} && w.startTime <= now && now < w.EndTime()) {
            spdlog::info("Registrar: keeping in-progress window {}", id);
            report.kept.push_back(id);
            active.push_back(id);
            keptWindows.push_back(w);
            continue;
        }

        error.clear();
        if (m_Monitor.Unregister(id, error)) {
            spdlog::info("Registrar: unregistered {}", id);
            report.unregistered.push_back(id);
        } else {
            spdlog::warn("Registrar: failed to unregister {}: {}", id, error);
            active.push_back(id);
            stuck.push_back(id);
        }
    }

    // New registrations, nearest first
    bool stop = false;
    for (const auto &w : desired) {
        const PrayerWindow *old = findPrevious(w.id);
        const bool already = previous.count(w.id) > 0;
        if (already && old && old->duration == w.duration) {
            active.push_back(w.id);
            continue;
        }

        if (stop) {
            report.rejected.push_back(w.id);
            if (already) {
                active.push_back(w.id);
            }
            continue;
        }

        if (!already && active.size() >= m_Monitor.Ceiling()) {
            spdlog::warn("Registrar: host ceiling of {} reached, {} not registered",
                         m_Monitor.Ceiling(), w.id);
            report.ceilingReached = true;
            report.rejected.push_back(w.id);
            stop = true;
            continue;
        }

        error.clear();
        const RegisterStatus status = m_Monitor.Register(w, error);
        switch (status) {
        case REGISTER_OK:
            spdlog::info("Registrar: registered {} at {} for {} min", w.id,
                         FormatTime(w.startTime), w.duration.count() / 60);
            report.registered.push_back(w.id);
            active.push_back(w.id);
            break;
        case REGISTER_CEILING:
            spdlog::warn("Registrar: host refused {} (ceiling): {}", w.id, error);
            report.ceilingReached = true;
            report.rejected.push_back(w.id);
            stop = true;
            break;
        case REGISTER_UNAUTHORIZED:
            spdlog::error("Registrar: host refused {} (authorization): {}", w.id, error);
            report.needsAuthorization = true;
            authError = error;
            report.rejected.push_back(w.id);
            stop = true;
            break;
        case REGISTER_FAILED:
            spdlog::error("Registrar: registering {} failed: {}", w.id, error);
            report.rejected.push_back(w.id);
            break;
        }

        if (status != REGISTER_OK && already) {
            active.push_back(w.id);
        }
    }

    std::vector<PrayerWindow> planned;
    const std::set<std::string> activeSet(active.begin(), active.end());
    for (const auto &w : desired) {
        if (activeSet.count(w.id) > 0) {
            planned.push_back(w);
        }
    }
    planned.insert(planned.end(), keptWindows.begin(), keptWindows.end());
    std::sort(planned.begin(), planned.end(), [](const PrayerWindow &a, const PrayerWindow &b) {
        return a.startTime < b.startTime;
    });

    const std::size_t bound = m_Monitor.Ceiling() + kRegisteredMargin;
    std::vector<std::string> registeredIds =
        BoundIdList(active, now, SharedState::kIdListHorizon, bound, bound);

    // Units that would not go away stay tracked until a later pass removes them.
    for (const auto &id : stuck) {
        if (std::find(registeredIds.begin(), registeredIds.end(), id) == registeredIds.end()) {
            spdlog::warn("Registrar: keeping {} past the horizon until it unregisters", id);
            registeredIds.push_back(id);
        }
    }

    StateStore::Transaction tx(m_State.Store());
    m_State.SetPlannedWindows(planned);
    m_State.SetRegisteredIds(registeredIds);
    if (report.needsAuthorization) {
        m_State.SetNeedsAuthorization({true, now, authError});
    } else if (previousAuth.active && report.rejected.empty()) {
        spdlog::info("Registrar: host authorization restored");
        m_State.SetNeedsAuthorization({false, now, ""});
    }
    tx.Commit();

    spdlog::info("Registrar: {} registered, {} unregistered, {} kept, {} rejected",
                 report.registered.size(), report.unregistered.size(), report.kept.size(),
                 report.rejected.size());
    return report;
}
