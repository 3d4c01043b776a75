#include "blocking_state.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace {

// ─────────────────────────────────────
const PrayerWindow *NextPlanned(const StateSnapshot &state, TimePoint now) {
    const PrayerWindow *next = nullptr;
    for (const auto &w : state.plannedWindows) {
        if (w.startTime > now && (!next || w.startTime < next->startTime)) {
            next = &w;
        }
    }
    return next;
}

// ─────────────────────────────────────
const EnforcementRecord *EnforcedRecord(const StateSnapshot &state) {
    if (state.enforcedWindowId.empty() || !state.enforcedRecord) {
        return nullptr;
    }
    const EnforcementRecord &record = *state.enforcedRecord;
    if (record.windowId != state.enforcedWindowId || record.skipped || !record.appliedAt) {
        return nullptr;
    }
    return &record;
}

// ─────────────────────────────────────
bool IsLifted(const StateSnapshot &state, const EnforcementRecord &record) {
    if (!state.currentlyEnforced || record.clearedAt) {
        return true;
    }
    if (state.confirmation && state.confirmation->windowId == record.windowId) {
        return true;
    }
    return state.earlyUnlock && state.earlyUnlock->windowId == record.windowId;
}

// ─────────────────────────────────────
TimePoint UnlockThreshold(const EnforcementRecord &record, double fraction) {
    const auto offset = std::llround(static_cast<double>(record.duration.count()) * fraction);
    return record.startTime + Seconds{offset};
}

} // namespace

// ─────────────────────────────────────
BlockingSession ComputeBlockingSession(const StateSnapshot &state, TimePoint now) {
    BlockingSession session;

    if (const EnforcementRecord *record = EnforcedRecord(state)) {
        const TimePoint end = record->EndTime();
        session.windowId = record->windowId;
        session.prayerName = record->prayerName;
        session.endTime = end;

        if (!IsLifted(state, *record)) {
            if (now < end) {
                session.phase = PHASE_ACTIVE;
                session.isBlocking = true;
                session.timeRemaining = end - now;
                if (state.mode == MODE_NORMAL) {
                    const TimePoint threshold =
                        UnlockThreshold(*record, state.settings.earlyUnlockFraction);
                    session.earlyUnlockAvailable = now >= threshold;
                    session.earlyUnlockAvailableIn = std::max(Seconds{0}, threshold - now);
                }
                return session;
            }

            // Past the end: the agent's flag wins, otherwise the current mode predicts it.
            if (state.awaitingConfirmation || state.mode == MODE_STRICT) {
                session.phase = PHASE_AWAITING_CONFIRMATION;
                session.isBlocking = true;
                session.isWaitingConfirmation = true;
                return session;
            }
        }

        if (now < end) {
            session.phase = PHASE_CLEARED;
            return session;
        }
    }

    if (const PrayerWindow *next = NextPlanned(state, now)) {
        BlockingSession scheduled;
        scheduled.phase = PHASE_SCHEDULED;
        scheduled.windowId = next->id;
        scheduled.prayerName = next->prayerName;
        scheduled.endTime = next->EndTime();
        return scheduled;
    }

    if (!session.windowId.empty()) {
        session.phase = PHASE_CLEARED;
        return session;
    }
    return BlockingSession{};
}

// ─────────────────────────────────────
std::optional<TimePoint> NextBlockingDeadline(const StateSnapshot &state, TimePoint now) {
    std::optional<TimePoint> deadline;
    auto consider = [&](TimePoint tp) {
        if (tp > now && (!deadline || tp < *deadline)) {
            deadline = tp;
        }
    };

    if (const EnforcementRecord *record = EnforcedRecord(state)) {
        consider(record->EndTime());
        if (state.mode == MODE_NORMAL) {
            consider(UnlockThreshold(*record, state.settings.earlyUnlockFraction));
        }
    }
    for (const auto &w : state.plannedWindows) {
        consider(w.startTime);
        consider(w.EndTime());
    }
    return deadline;
}

// ─────────────────────────────────────
BlockingController::BlockingController(SharedState &state, RestrictionEnforcer &enforcer)
    : m_State(state), m_Enforcer(enforcer) {}

// ─────────────────────────────────────
BlockingSession BlockingController::Observe(TimePoint now) {
    return ComputeBlockingSession(m_State.ReadSnapshot(), now);
}

// ─────────────────────────────────────
bool BlockingController::Confirm(TimePoint now) {
    const BlockingSession session = Observe(now);
    if (!session.isWaitingConfirmation) {
        spdlog::info("Nothing is waiting for confirmation");
        return false;
    }

    m_State.SetConfirmation({session.windowId, now});
    m_Enforcer.Clear();
    spdlog::info("Confirmed {}, restrictions lifted", session.windowId);
    return true;
}

// ─────────────────────────────────────
bool BlockingController::RequestEarlyUnlock(TimePoint now) {
    const BlockingSession session = Observe(now);
    if (!session.earlyUnlockAvailable) {
        if (session.phase == PHASE_ACTIVE && session.earlyUnlockAvailableIn > Seconds{0}) {
            spdlog::info("Early unlock for {} available in {} s", session.windowId,
                         session.earlyUnlockAvailableIn.count());
        } else {
            spdlog::info("Early unlock is not available");
        }
        return false;
    }

    m_State.SetEarlyUnlock({session.windowId, now});
    m_Enforcer.Clear();
    spdlog::info("Early unlock used for {}", session.windowId);
    return true;
}
