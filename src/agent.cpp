#include "agent.hpp"

#include "planner.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace {
const char *const kMissedStart = "missed-start";
} // namespace

// ─────────────────────────────────────
EnforcementAgent::EnforcementAgent(SharedState &state, RestrictionEnforcer &enforcer,
                                   SelectionProvider &selection, Notifier &notifier)
    : m_State(state), m_Enforcer(enforcer), m_Selection(selection), m_Notifier(notifier) {}

// ─────────────────────────────────────
bool EnforcementAgent::Handle(AgentEvent event, const std::string &windowId, TimePoint now) {
    try {
        PrayerWindow window;
        if (!ResolveWindow(windowId, window)) {
            spdlog::error("Agent: '{}' is not a window id, ignoring {}", windowId,
                          EventToString(event));
            return false;
        }

        spdlog::info("Agent: {} {} ({} -> {})", EventToString(event), windowId,
                     FormatTime(window.startTime), FormatTime(window.EndTime()));

        if (event == EVENT_WILL_START_WARNING || event == EVENT_WILL_END_WARNING) {
            OnWarning(event, window);
            return true;
        }

        // Another agent invocation blocks here until this one commits, so the facts read
        // below still hold when the restrictions change.
        StateStore::Transaction tx(m_State.Store());
        const TokenSet before = m_Enforcer.Current();
        m_PendingNotice.clear();

        try {
            ConsumeIntents();
            TrackMonitored(windowId, now);
            if (event == EVENT_INTERVAL_START) {
                OnIntervalStart(window, now);
            } else {
                OnIntervalEnd(window, now);
            }
            tx.Commit();
        } catch (const std::exception &e) {
            spdlog::error("Agent: {} {} failed, restoring previous restrictions: {}",
                          EventToString(event), windowId, e.what());
            RestoreRestrictions(before);
            throw;
        }

        if (!m_PendingNotice.empty()) {
            m_Notifier.Notify("dialog-warning", m_PendingNotice,
                              "No apps are selected, nothing was blocked.");
        }
        return true;
    } catch (const std::exception &e) {
        spdlog::error("Agent: {} {} failed: {}", EventToString(event), windowId, e.what());
        return false;
    }
}

// ─────────────────────────────────────
void EnforcementAgent::RestoreRestrictions(const TokenSet &tokens) {
    if (m_Enforcer.Current() == tokens) {
        return;
    }
    if (tokens.Empty()) {
        m_Enforcer.Clear();
    } else {
        m_Enforcer.Apply(tokens);
    }
}

// ─────────────────────────────────────
bool EnforcementAgent::ResolveWindow(const std::string &windowId, PrayerWindow &window) {
    if (!ParseWindowId(windowId, window.prayerName, window.startTime)) {
        return false;
    }
    window.id = windowId;

    for (const auto &planned : m_State.PlannedWindows()) {
        if (planned.id == windowId) {
            window.duration = planned.duration;
            return true;
        }
    }

    window.duration = PrayerWindowPlanner::EffectiveDuration(m_State.Settings());
    spdlog::debug("Agent: {} not in the plan, using configured duration", windowId);
    return true;
}

// ─────────────────────────────────────
void EnforcementAgent::ConsumeIntents() {
    const std::string enforcedId = m_State.EnforcedWindowId();
    if (enforcedId.empty() || !m_State.CurrentlyEnforced()) {
        return;
    }

    std::optional<TimePoint> clearedAt;
    if (auto intent = m_State.Confirmation(); intent && intent->windowId == enforcedId) {
        spdlog::info("Agent: {} was confirmed at {}", enforcedId, FormatTime(intent->at));
        clearedAt = intent->at;
    } else if (auto token = m_State.EarlyUnlock(); token && token->windowId == enforcedId) {
        spdlog::info("Agent: {} was unlocked early at {}", enforcedId, FormatTime(token->usedAt));
        clearedAt = token->usedAt;
    }

    if (!clearedAt) {
        return;
    }

    m_Enforcer.Clear();
    m_State.SetCurrentlyEnforced(false);
    m_State.SetAwaitingConfirmation(false);
    FinalizeRecord(enforcedId, *clearedAt);
}

// ─────────────────────────────────────
void EnforcementAgent::TrackMonitored(const std::string &windowId, TimePoint now) {
    std::vector<std::string> ids = m_State.MonitoredIds();
    if (std::find(ids.begin(), ids.end(), windowId) == ids.end()) {
        ids.push_back(windowId);
    }
    m_State.SetMonitoredIds(BoundIdList(ids, now, SharedState::kIdListHorizon,
                                        SharedState::kMonitoredHighWater,
                                        SharedState::kMonitoredKeep));
}

// ─────────────────────────────────────
void EnforcementAgent::OnIntervalStart(const PrayerWindow &window, TimePoint now) {
    const FocusSettings settings = m_State.Settings();
    const std::optional<EnforcementRecord> existing = m_State.Record(window.id);
    const bool alreadyApplied =
        existing && !existing->skipped && existing->appliedAt && !existing->clearedAt;

    if (existing && existing->clearedAt) {
        spdlog::info("Agent: {} already finished at {}, nothing to do", window.id,
                     FormatTime(*existing->clearedAt));
        return;
    }
    if (existing && existing->skipped && existing->skipReason == kMissedStart) {
        spdlog::info("Agent: {} already ended without a start, nothing to do", window.id);
        return;
    }
    if (now >= window.EndTime()) {
        spdlog::warn("Agent: start of {} arrived after its end ({}), not restricting",
                     window.id, FormatTime(window.EndTime()));
        if (!existing) {
            WriteSkipped(window, kMissedStart, now);
        }
        return;
    }

    if (!settings.IsEnabled(window.prayerName) && !alreadyApplied) {
        spdlog::info("Agent: {} is disabled, skipping {}", window.prayerName, window.id);
        WriteSkipped(window, "prayer-disabled", now);
        return;
    }

    const TokenSet selection = m_Selection.CurrentSelection();
    if (selection.Empty()) {
        const NoSelectionWarning previous = m_State.GetNoSelectionWarning();

        spdlog::warn("Agent: nothing selected to restrict for {}", window.id);
        m_State.SetNoSelectionWarning({true, now, window.id});
        WriteSkipped(window, "no-selection", now);

        if (!previous.active || previous.windowId != window.id) {
            m_PendingNotice = "Prayer time: " + window.prayerName;
        }
        return;
    }

    const std::string previousId = m_State.EnforcedWindowId();
    const bool previousEnforced = m_State.CurrentlyEnforced();
    const NoSelectionWarning warning = m_State.GetNoSelectionWarning();

    m_Enforcer.Apply(selection);

    EnforcementRecord record;
    if (alreadyApplied) {
        record = *existing;
        spdlog::info("Agent: duplicate start for {}, keeping applied_at {}", window.id,
                     FormatTime(*record.appliedAt));
    } else {
        record.windowId = window.id;
        record.prayerName = window.prayerName;
        record.startTime = window.startTime;
        record.duration = window.duration;
        record.appliedAt = now;
    }
    record.mode = m_State.GetMode();
    record.skipped = false;
    record.skipReason.clear();
    record.awaitingConfirmation = false;

    if (previousEnforced && !previousId.empty() && previousId != window.id) {
        spdlog::info("Agent: {} supersedes {}", window.id, previousId);
        FinalizeRecord(previousId, now);
    }
    m_State.PutRecord(record);
    m_State.SetCurrentlyEnforced(true);
    m_State.SetEnforcedWindowId(window.id);
    m_State.SetEnforcementStartTime(*record.appliedAt);
    m_State.SetAwaitingConfirmation(false);
    if (warning.active) {
        m_State.SetNoSelectionWarning({false, now, ""});
    }

    spdlog::info("Agent: restricting {} apps, {} categories, {} domains until {}",
                 selection.applications.size(), selection.categories.size(),
                 selection.webDomains.size(), FormatTime(window.EndTime()));
}

// ─────────────────────────────────────
void EnforcementAgent::OnIntervalEnd(const PrayerWindow &window, TimePoint now) {
    std::optional<EnforcementRecord> record = m_State.Record(window.id);
    if (!record) {
        spdlog::warn("Agent: end of {} without a start, recording it as missed", window.id);
        WriteSkipped(window, kMissedStart, now);
        return;
    }
    if (record->skipped) {
        spdlog::info("Agent: {} was skipped ({}), nothing to clear", window.id,
                     record->skipReason);
        return;
    }

    const std::string enforcedId = m_State.EnforcedWindowId();
    if (enforcedId != window.id || !m_State.CurrentlyEnforced()) {
        if (!record->clearedAt && enforcedId != window.id) {
            FinalizeRecord(window.id, now);
        }
        spdlog::info("Agent: {} is not the enforced window ({}), bookkeeping only", window.id,
                     enforcedId.empty() ? "none" : enforcedId);
        return;
    }

    if (m_State.AwaitingConfirmation()) {
        spdlog::info("Agent: {} already waiting for confirmation", window.id);
        return;
    }

    const Mode mode = m_State.GetMode();
    record->mode = mode;

    if (mode == MODE_STRICT) {
        record->awaitingConfirmation = true;
        m_State.PutRecord(*record);
        m_State.SetAwaitingConfirmation(true);
        spdlog::info("Agent: strict mode, {} stays restricted until confirmed", window.id);
        return;
    }

    m_Enforcer.Clear();
    record->clearedAt = now;
    record->awaitingConfirmation = false;
    m_State.PutRecord(*record);
    m_State.SetCurrentlyEnforced(false);
    m_State.SetAwaitingConfirmation(false);

    spdlog::info("Agent: restrictions for {} cleared", window.id);
}

// ─────────────────────────────────────
void EnforcementAgent::OnWarning(AgentEvent event, const PrayerWindow &window) {
    const TokenSet planned = m_Selection.CurrentSelection();
    const TokenSet current = m_Enforcer.Current();

    if (event == EVENT_WILL_START_WARNING) {
        spdlog::info("Agent: {} starts at {}; {} tokens selected, {} currently applied",
                     window.id, FormatTime(window.startTime), planned.Size(), current.Size());
        if (planned.Empty()) {
            spdlog::warn("Agent: {} will start with an empty selection", window.id);
        }
    } else {
        spdlog::info("Agent: {} ends at {}; {} tokens applied, selection {}", window.id,
                     FormatTime(window.EndTime()), current.Size(),
                     planned == current ? "unchanged" : "changed since start");
    }
}

// ─────────────────────────────────────
void EnforcementAgent::WriteSkipped(const PrayerWindow &window, const std::string &reason,
                                    TimePoint now) {
    EnforcementRecord record;
    record.windowId = window.id;
    record.prayerName = window.prayerName;
    record.startTime = window.startTime;
    record.duration = window.duration;
    record.mode = m_State.GetMode();
    record.skipped = true;
    record.skipReason = reason;
    m_State.PutRecord(record);
    spdlog::debug("Agent: record {} skipped ({}) at {}", window.id, reason, FormatTime(now));
}

// ─────────────────────────────────────
void EnforcementAgent::FinalizeRecord(const std::string &windowId, TimePoint at) {
    std::optional<EnforcementRecord> record = m_State.Record(windowId);
    if (!record || record->clearedAt) {
        return;
    }
    record->clearedAt = at;
    record->awaitingConfirmation = false;
    m_State.PutRecord(*record);
}
