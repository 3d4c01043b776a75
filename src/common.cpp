#include "common.hpp"

#include <algorithm>
#include <charconv>
#include <ctime>

// ─────────────────────────────────────
bool FocusSettings::IsEnabled(const std::string &prayer) const {
    auto it = enabled.find(prayer);
    if (it == enabled.end()) {
        // Prayers are selected unless the user turned them off.
        return IsCanonicalPrayer(prayer);
    }
    return it->second;
}

// ─────────────────────────────────────
TimePoint Now() {
    return std::chrono::floor<Seconds>(std::chrono::system_clock::now());
}

// ─────────────────────────────────────
TimePoint FloorToMinute(TimePoint tp) {
    return std::chrono::floor<std::chrono::minutes>(tp);
}

// ─────────────────────────────────────
int64_t ToUnix(TimePoint tp) {
    return tp.time_since_epoch().count();
}

// ─────────────────────────────────────
TimePoint FromUnix(int64_t seconds) {
    return TimePoint{Seconds{seconds}};
}

// ─────────────────────────────────────
std::string FormatTime(TimePoint tp) {
    const std::time_t t = static_cast<std::time_t>(ToUnix(tp));
    std::tm local{};
    localtime_r(&t, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

// ─────────────────────────────────────
bool IsCanonicalPrayer(const std::string &name) {
    return PrayerOrder(name) >= 0;
}

// ─────────────────────────────────────
int PrayerOrder(const std::string &name) {
    for (std::size_t i = 0; i < kPrayerNames.size(); ++i) {
        if (name == kPrayerNames[i]) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

// ─────────────────────────────────────
const char *ModeToString(Mode mode) {
    return mode == MODE_STRICT ? "strict" : "normal";
}

// ─────────────────────────────────────
std::optional<Mode> ModeFromString(const std::string &s) {
    if (s == "normal") {
        return MODE_NORMAL;
    }
    if (s == "strict") {
        return MODE_STRICT;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
const char *PhaseToString(BlockingPhase phase) {
    switch (phase) {
    case PHASE_IDLE:
        return "idle";
    case PHASE_SCHEDULED:
        return "scheduled";
    case PHASE_ACTIVE:
        return "active";
    case PHASE_AWAITING_CONFIRMATION:
        return "awaiting-confirmation";
    case PHASE_CLEARED:
        return "cleared";
    }
    return "unknown";
}

// ─────────────────────────────────────
const char *EventToString(AgentEvent event) {
    switch (event) {
    case EVENT_INTERVAL_START:
        return "start";
    case EVENT_INTERVAL_END:
        return "end";
    case EVENT_WILL_START_WARNING:
        return "warn-start";
    case EVENT_WILL_END_WARNING:
        return "warn-end";
    }
    return "unknown";
}

// ─────────────────────────────────────
std::optional<AgentEvent> EventFromString(const std::string &s) {
    for (AgentEvent e : {EVENT_INTERVAL_START, EVENT_INTERVAL_END, EVENT_WILL_START_WARNING,
                         EVENT_WILL_END_WARNING}) {
        if (s == EventToString(e)) {
            return e;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::string MakeWindowId(const std::string &prayer, TimePoint start) {
    return "Prayer_" + prayer + "_" + std::to_string(ToUnix(FloorToMinute(start)));
}

// ─────────────────────────────────────
bool ParseWindowId(const std::string &id, std::string &prayer, TimePoint &start) {
    const std::string prefix = "Prayer_";
    if (id.rfind(prefix, 0) != 0) {
        return false;
    }

    const std::size_t sep = id.find('_', prefix.size());
    if (sep == std::string::npos || sep + 1 >= id.size()) {
        return false;
    }

    const std::string name = id.substr(prefix.size(), sep - prefix.size());
    if (!IsCanonicalPrayer(name)) {
        return false;
    }

    int64_t ts = 0;
    const char *first = id.data() + sep + 1;
    const char *last = id.data() + id.size();
    auto [ptr, ec] = std::from_chars(first, last, ts);
    if (ec != std::errc() || ptr != last) {
        return false;
    }

    prayer = name;
    start = FromUnix(ts);
    return true;
}
