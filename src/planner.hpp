#pragma once

#include <cstddef>
#include <vector>

#include "common.hpp"

// Turns upcoming prayer occurrences into the ordered, capped set of windows to register.
class PrayerWindowPlanner {
  public:
    static constexpr Seconds kMinimumDuration{15 * 60};
    static constexpr std::size_t kDefaultCeiling = 20;
    static constexpr Seconds kDefaultGuard{60};

    PrayerWindowPlanner(std::size_t ceiling = kDefaultCeiling, Seconds guard = kDefaultGuard);

    // Pure: every returned window starts after now + guard, ascending, at most `ceiling` of them,
    // one per prayer and local day.
    std::vector<PrayerWindow> Plan(const std::vector<PrayerOccurrence> &occurrences,
                                   const FocusSettings &settings, TimePoint now) const;

    static Seconds EffectiveDuration(const FocusSettings &settings);

  private:
    std::size_t m_Ceiling;
    Seconds m_Guard;
};
