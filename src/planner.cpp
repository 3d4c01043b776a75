#include "planner.hpp"

#include <algorithm>
#include <set>
#include <tuple>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
PrayerWindowPlanner::PrayerWindowPlanner(std::size_t ceiling, Seconds guard)
    : m_Ceiling(ceiling), m_Guard(guard) {}

// ─────────────────────────────────────
Seconds PrayerWindowPlanner::EffectiveDuration(const FocusSettings &settings) {
    return std::max(settings.duration, kMinimumDuration);
}

// ─────────────────────────────────────
std::vector<PrayerWindow> PrayerWindowPlanner::Plan(const std::vector<PrayerOccurrence> &occurrences,
                                                    const FocusSettings &settings,
                                                    TimePoint now) const {
    const Seconds duration = EffectiveDuration(settings);
    const Seconds buffer = std::max(settings.prePrayerBuffer, Seconds{0});

    struct Candidate {
        PrayerWindow window;
        std::chrono::year_month_day localDate;
        int order;
    };

    std::vector<Candidate> candidates;
    for (const auto &occ : occurrences) {
        if (!IsCanonicalPrayer(occ.name)) {
            spdlog::debug("Planner: ignoring unknown prayer '{}'", occ.name);
            continue;
        }
        if (!settings.IsEnabled(occ.name)) {
            continue;
        }

        const TimePoint start = FloorToMinute(occ.time - buffer);
        if (start <= now + m_Guard) {
            continue;
        }

        PrayerWindow w;
        w.id = MakeWindowId(occ.name, start);
        w.prayerName = occ.name;
        w.startTime = start;
        w.duration = duration;
        candidates.push_back({std::move(w), occ.localDate, PrayerOrder(occ.name)});
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate &a, const Candidate &b) {
                         return std::tie(a.window.startTime, a.order) <
                                std::tie(b.window.startTime, b.order);
                     });

    std::vector<PrayerWindow> plan;
    std::set<std::pair<std::string, int>> seenDays;
    for (auto &c : candidates) {
        // Plans are strictly ordered; a second prayer on the same minute adds nothing.
        if (!plan.empty() && plan.back().startTime == c.window.startTime) {
            spdlog::debug("Planner: {} starts with {}, dropped", c.window.id, plan.back().id);
            continue;
        }
        const int dayKey = static_cast<int>(c.localDate.year()) * 10000 +
                           static_cast<int>(static_cast<unsigned>(c.localDate.month())) * 100 +
                           static_cast<int>(static_cast<unsigned>(c.localDate.day()));
        if (!seenDays.insert({c.window.prayerName, dayKey}).second) {
            spdlog::debug("Planner: duplicate {} on the same day dropped ({})",
                          c.window.prayerName, c.window.id);
            continue;
        }
        if (plan.size() >= m_Ceiling) {
            break;
        }
        plan.push_back(std::move(c.window));
    }

    spdlog::debug("Planner: {} occurrences -> {} windows (ceiling {})", occurrences.size(),
                  plan.size(), m_Ceiling);
    return plan;
}
