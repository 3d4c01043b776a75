#pragma once

#include <string>

#include "common.hpp"
#include "notifier.hpp"
#include "restriction_enforcer.hpp"
#include "selection_provider.hpp"
#include "shared_state.hpp"

// Handles one host callback in the short-lived agent process. The agent keeps no state of its
// own between invocations: everything it needs is recovered from the window id and the store.
// Start and end callbacks run inside one write transaction; warnings only read.
class EnforcementAgent {
  public:
    EnforcementAgent(SharedState &state, RestrictionEnforcer &enforcer,
                     SelectionProvider &selection, Notifier &notifier);

    // Never throws. Returns false when the callback failed and nothing was changed.
    bool Handle(AgentEvent event, const std::string &windowId, TimePoint now);

  private:
    void ConsumeIntents();
    void RestoreRestrictions(const TokenSet &tokens);
    bool ResolveWindow(const std::string &windowId, PrayerWindow &window);
    void TrackMonitored(const std::string &windowId, TimePoint now);

    void OnIntervalStart(const PrayerWindow &window, TimePoint now);
    void OnIntervalEnd(const PrayerWindow &window, TimePoint now);
    void OnWarning(AgentEvent event, const PrayerWindow &window);

    void WriteSkipped(const PrayerWindow &window, const std::string &reason, TimePoint now);
    void FinalizeRecord(const std::string &windowId, TimePoint at);

  private:
    SharedState &m_State;
    RestrictionEnforcer &m_Enforcer;
    SelectionProvider &m_Selection;
    Notifier &m_Notifier;

    // Sent after the callback commits.
    std::string m_PendingNotice;
};
