#pragma once

#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

using TimePoint = std::chrono::sys_seconds;
using Seconds = std::chrono::seconds;

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

enum Mode { MODE_NORMAL = 1, MODE_STRICT = 2 };

enum AgentEvent {
    EVENT_INTERVAL_START = 1,
    EVENT_INTERVAL_END = 2,
    EVENT_WILL_START_WARNING = 3,
    EVENT_WILL_END_WARNING = 4
};

enum BlockingPhase {
    PHASE_IDLE = 0,
    PHASE_SCHEDULED = 1,
    PHASE_ACTIVE = 2,
    PHASE_AWAITING_CONFIRMATION = 3,
    PHASE_CLEARED = 4
};

enum StoreRole { ROLE_MAIN = 1, ROLE_AGENT = 2 };

// Category name -> Wayland app_ids, from the config file.
using CategoryMap = std::map<std::string, std::vector<std::string>>;

inline constexpr std::array<const char *, 5> kPrayerNames = {"Fajr", "Dhuhr", "Asr", "Maghrib",
                                                             "Isha"};

struct PrayerOccurrence {
    std::string name;
    TimePoint time;
    std::chrono::year_month_day localDate;
};

struct PrayerWindow {
    std::string id;
    std::string prayerName;
    TimePoint startTime;
    Seconds duration{0};

    TimePoint EndTime() const {
        return startTime + duration;
    }
};

// Restriction tokens. Applications are Wayland app_ids, categories are names resolved through
// the config file, web domains are matched against window titles.
struct TokenSet {
    std::set<std::string> applications;
    std::set<std::string> categories;
    std::set<std::string> webDomains;

    bool Empty() const {
        return applications.empty() && categories.empty() && webDomains.empty();
    }
    std::size_t Size() const {
        return applications.size() + categories.size() + webDomains.size();
    }
    bool operator==(const TokenSet &other) const = default;
};

struct FocusSettings {
    std::map<std::string, bool> enabled;
    Seconds duration{15 * 60};
    Seconds prePrayerBuffer{0};
    double earlyUnlockFraction = 1.0 / 3.0;

    bool IsEnabled(const std::string &prayer) const;
};

struct EnforcementRecord {
    std::string windowId;
    std::string prayerName;
    TimePoint startTime;
    Seconds duration{0};
    std::optional<TimePoint> appliedAt;
    std::optional<TimePoint> clearedAt;
    Mode mode = MODE_NORMAL;
    bool skipped = false;
    std::string skipReason;
    bool awaitingConfirmation = false;

    TimePoint EndTime() const {
        return startTime + duration;
    }
};

struct EarlyUnlockToken {
    std::string windowId;
    TimePoint usedAt;
};

struct ConfirmationIntent {
    std::string windowId;
    TimePoint at;
};

struct NoSelectionWarning {
    bool active = false;
    TimePoint at;
    std::string windowId;
};

struct AuthorizationFlag {
    bool active = false;
    TimePoint at;
    std::string reason;
};

struct BlockingSession {
    BlockingPhase phase = PHASE_IDLE;
    bool isBlocking = false;
    bool isWaitingConfirmation = false;
    Seconds timeRemaining{0};
    bool earlyUnlockAvailable = false;
    Seconds earlyUnlockAvailableIn{0};
    std::string windowId;
    std::string prayerName;
    std::optional<TimePoint> endTime;
};

TimePoint Now();
TimePoint FloorToMinute(TimePoint tp);
int64_t ToUnix(TimePoint tp);
TimePoint FromUnix(int64_t seconds);
std::string FormatTime(TimePoint tp);

bool IsCanonicalPrayer(const std::string &name);
int PrayerOrder(const std::string &name);

const char *ModeToString(Mode mode);
std::optional<Mode> ModeFromString(const std::string &s);
const char *PhaseToString(BlockingPhase phase);
const char *EventToString(AgentEvent event);
std::optional<AgentEvent> EventFromString(const std::string &s);

// Deterministic window ids: "Prayer_<Name>_<unix start>", start floored to the minute.
std::string MakeWindowId(const std::string &prayer, TimePoint start);
bool ParseWindowId(const std::string &id, std::string &prayer, TimePoint &start);
