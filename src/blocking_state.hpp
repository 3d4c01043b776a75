#pragma once

#include "common.hpp"
#include "restriction_enforcer.hpp"
#include "shared_state.hpp"

// Derives the user-facing blocking session from stored facts and the wall clock. The agent's
// facts are authoritative, except that the main-owned confirmation intent and early-unlock token
// for the enforced window override them until the agent consumes them.
BlockingSession ComputeBlockingSession(const StateSnapshot &state, TimePoint now);

// Next instant at which ComputeBlockingSession may change without any store write.
std::optional<TimePoint> NextBlockingDeadline(const StateSnapshot &state, TimePoint now);

class BlockingController {
  public:
    BlockingController(SharedState &state, RestrictionEnforcer &enforcer);

    BlockingSession Observe(TimePoint now);

    // Ends a strict wait. Returns false when nothing is waiting for confirmation.
    bool Confirm(TimePoint now);

    // Lifts a normal-mode window once per occurrence after the unlock threshold.
    bool RequestEarlyUnlock(TimePoint now);

  private:
    SharedState &m_State;
    RestrictionEnforcer &m_Enforcer;
};
