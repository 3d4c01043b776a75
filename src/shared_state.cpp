#include "shared_state.hpp"

#include "schema.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace {
const JsonParse kJson;

// ─────────────────────────────────────
std::optional<TimePoint> OptionalTime(const nlohmann::json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    if (!j.at(key).is_number()) {
        spdlog::warn("SharedState: '{}' is not a timestamp", key);
        return std::nullopt;
    }
    return FromUnix(kJson.GetInt64(j, key, 0));
}

// ─────────────────────────────────────
nlohmann::json OptionalTimeToJson(const std::optional<TimePoint> &tp) {
    if (!tp) {
        return nullptr;
    }
    return ToUnix(*tp);
}
} // namespace

// ─────────────────────────────────────
nlohmann::json SettingsToJson(const FocusSettings &settings) {
    nlohmann::json enabled = nlohmann::json::object();
    for (const char *name : kPrayerNames) {
        enabled[name] = settings.IsEnabled(name);
    }
    return {
        {"enabled", enabled},
        {"duration_minutes", settings.duration.count() / 60},
        {"pre_prayer_buffer_minutes", settings.prePrayerBuffer.count() / 60},
        {"early_unlock_fraction", settings.earlyUnlockFraction},
    };
}

// ─────────────────────────────────────
FocusSettings SettingsFromJson(const nlohmann::json &j) {
    FocusSettings settings;
    if (j.is_object() && j.contains("enabled") && j.at("enabled").is_object()) {
        for (const char *name : kPrayerNames) {
            settings.enabled[name] = kJson.GetBool(j.at("enabled"), name, true);
        }
    }

    const int duration = kJson.GetInt(j, "duration_minutes", 15);
    const int buffer = kJson.GetInt(j, "pre_prayer_buffer_minutes", 0);
    settings.duration = Seconds{std::max(duration, 0) * 60};
    settings.prePrayerBuffer = Seconds{std::max(buffer, 0) * 60};

    const double fraction = kJson.GetDouble(j, "early_unlock_fraction", 1.0 / 3.0);
    if (fraction >= 0.0 && fraction <= 1.0) {
        settings.earlyUnlockFraction = fraction;
    } else {
        spdlog::warn("SharedState: early_unlock_fraction {} out of range, using default",
                     fraction);
    }
    return settings;
}

// ─────────────────────────────────────
nlohmann::json TokenSetToJson(const TokenSet &tokens) {
    return {
        {"applications", tokens.applications},
        {"categories", tokens.categories},
        {"web_domains", tokens.webDomains},
    };
}

// ─────────────────────────────────────
TokenSet TokenSetFromJson(const nlohmann::json &j) {
    TokenSet tokens;
    if (!j.is_object()) {
        return tokens;
    }
    if (j.contains("applications")) {
        tokens.applications = kJson.JsonArray2Set(j.at("applications"));
    }
    if (j.contains("categories")) {
        tokens.categories = kJson.JsonArray2Set(j.at("categories"));
    }
    if (j.contains("web_domains")) {
        tokens.webDomains = kJson.JsonArray2Set(j.at("web_domains"));
    }
    return tokens;
}

// ─────────────────────────────────────
nlohmann::json RecordToJson(const EnforcementRecord &record) {
    return {
        {"window_id", record.windowId},
        {"prayer", record.prayerName},
        {"start", ToUnix(record.startTime)},
        {"duration", record.duration.count()},
        {"applied_at", OptionalTimeToJson(record.appliedAt)},
        {"cleared_at", OptionalTimeToJson(record.clearedAt)},
        {"mode", ModeToString(record.mode)},
        {"skipped", record.skipped},
        {"skip_reason", record.skipReason},
        {"awaiting_confirmation", record.awaitingConfirmation},
    };
}

// ─────────────────────────────────────
std::optional<EnforcementRecord> RecordFromJson(const nlohmann::json &j) {
    EnforcementRecord record;
    record.windowId = kJson.GetString(j, "window_id", "");
    if (record.windowId.empty()) {
        spdlog::warn("SharedState: record without window_id ignored");
        return std::nullopt;
    }
    record.prayerName = kJson.GetString(j, "prayer", "");
    record.startTime = FromUnix(kJson.GetInt64(j, "start", 0));
    record.duration = Seconds{kJson.GetInt64(j, "duration", 0)};
    record.appliedAt = OptionalTime(j, "applied_at");
    record.clearedAt = OptionalTime(j, "cleared_at");
    record.mode = ModeFromString(kJson.GetString(j, "mode", "normal")).value_or(MODE_NORMAL);
    record.skipped = kJson.GetBool(j, "skipped", false);
    record.skipReason = kJson.GetString(j, "skip_reason", "");
    record.awaitingConfirmation = kJson.GetBool(j, "awaiting_confirmation", false);
    return record;
}

// ─────────────────────────────────────
std::vector<std::string> BoundIdList(const std::vector<std::string> &ids, TimePoint now,
                                     Seconds horizon, std::size_t highWater, std::size_t keep) {
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (const auto &id : ids) {
        std::string prayer;
        TimePoint start;
        if (!ParseWindowId(id, prayer, start)) {
            spdlog::debug("Dropping unparsable window id '{}'", id);
            continue;
        }
        if (start < now - horizon) {
            continue;
        }
        if (std::find(out.begin(), out.end(), id) == out.end()) {
            out.push_back(id);
        }
    }

    if (out.size() > highWater) {
        std::vector<std::pair<TimePoint, std::string>> byStart;
        for (const auto &id : out) {
            std::string prayer;
            TimePoint start;
            ParseWindowId(id, prayer, start);
            byStart.emplace_back(start, id);
        }
        std::stable_sort(byStart.begin(), byStart.end(),
                         [](const auto &a, const auto &b) { return a.first > b.first; });
        byStart.resize(keep);

        std::vector<std::string> kept;
        for (const auto &id : out) {
            for (const auto &entry : byStart) {
                if (entry.second == id) {
                    kept.push_back(id);
                    break;
                }
            }
        }
        out = std::move(kept);
    }
    return out;
}

// ─────────────────────────────────────
SharedState::SharedState(StateStore &store) : m_Store(store) {}

// ─────────────────────────────────────
FocusSettings SharedState::Settings() {
    auto j = m_Store.Read(keys::kSettings);
    return j ? SettingsFromJson(*j) : FocusSettings{};
}

// ─────────────────────────────────────
void SharedState::SetSettings(const FocusSettings &settings) {
    m_Store.Write(keys::kSettings, SettingsToJson(settings));
}

// ─────────────────────────────────────
Mode SharedState::GetMode() {
    auto j = m_Store.Read(keys::kMode);
    if (!j || !j->is_string()) {
        return MODE_NORMAL;
    }
    return ModeFromString(j->get<std::string>()).value_or(MODE_NORMAL);
}

// ─────────────────────────────────────
void SharedState::SetMode(Mode mode) {
    m_Store.Write(keys::kMode, ModeToString(mode));
}

// ─────────────────────────────────────
TokenSet SharedState::Selection() {
    auto j = m_Store.Read(keys::kSelection);
    return j ? TokenSetFromJson(*j) : TokenSet{};
}

// ─────────────────────────────────────
void SharedState::SetSelection(const TokenSet &selection) {
    m_Store.Write(keys::kSelection, TokenSetToJson(selection));
}

// ─────────────────────────────────────
std::vector<PrayerWindow> SharedState::PlannedWindows() {
    std::vector<PrayerWindow> windows;
    auto j = m_Store.Read(keys::kPlannedWindows);
    if (!j || !j->is_array()) {
        return windows;
    }
    for (const auto &item : *j) {
        PrayerWindow w;
        w.id = m_Json.GetString(item, "id", "");
        w.prayerName = m_Json.GetString(item, "prayer", "");
        w.startTime = FromUnix(m_Json.GetInt64(item, "start", 0));
        w.duration = Seconds{m_Json.GetInt64(item, "duration", 0)};
        if (w.id.empty() || w.duration <= Seconds{0}) {
            spdlog::warn("SharedState: ignoring malformed planned window");
            continue;
        }
        windows.push_back(std::move(w));
    }
    return windows;
}

// ─────────────────────────────────────
void SharedState::SetPlannedWindows(const std::vector<PrayerWindow> &windows) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &w : windows) {
        arr.push_back({{"id", w.id},
                       {"prayer", w.prayerName},
                       {"start", ToUnix(w.startTime)},
                       {"duration", w.duration.count()}});
    }
    m_Store.Write(keys::kPlannedWindows, arr);
}

// ─────────────────────────────────────
std::vector<std::string> SharedState::ReadIdList(const char *key) {
    auto j = m_Store.Read(key);
    if (!j) {
        return {};
    }
    return m_Json.JsonArray2String(*j);
}

// ─────────────────────────────────────
std::vector<std::string> SharedState::RegisteredIds() {
    return ReadIdList(keys::kRegisteredWindowIds);
}

// ─────────────────────────────────────
void SharedState::SetRegisteredIds(const std::vector<std::string> &ids) {
    m_Store.Write(keys::kRegisteredWindowIds, ids);
}

// ─────────────────────────────────────
AuthorizationFlag SharedState::NeedsAuthorization() {
    AuthorizationFlag flag;
    auto j = m_Store.Read(keys::kNeedsAuthorization);
    if (!j) {
        return flag;
    }
    flag.active = m_Json.GetBool(*j, "active", false);
    flag.at = FromUnix(m_Json.GetInt64(*j, "at", 0));
    flag.reason = m_Json.GetString(*j, "reason", "");
    return flag;
}

// ─────────────────────────────────────
void SharedState::SetNeedsAuthorization(const AuthorizationFlag &flag) {
    m_Store.Write(keys::kNeedsAuthorization,
                  {{"active", flag.active}, {"at", ToUnix(flag.at)}, {"reason", flag.reason}});
}

// ─────────────────────────────────────
std::optional<ConfirmationIntent> SharedState::Confirmation() {
    auto j = m_Store.Read(keys::kConfirmation);
    if (!j) {
        return std::nullopt;
    }
    ConfirmationIntent intent;
    intent.windowId = m_Json.GetString(*j, "window_id", "");
    intent.at = FromUnix(m_Json.GetInt64(*j, "at", 0));
    if (intent.windowId.empty()) {
        return std::nullopt;
    }
    return intent;
}

// ─────────────────────────────────────
void SharedState::SetConfirmation(const ConfirmationIntent &intent) {
    m_Store.Write(keys::kConfirmation, {{"window_id", intent.windowId}, {"at", ToUnix(intent.at)}});
}

// ─────────────────────────────────────
std::optional<EarlyUnlockToken> SharedState::EarlyUnlock() {
    auto j = m_Store.Read(keys::kEarlyUnlock);
    if (!j) {
        return std::nullopt;
    }
    EarlyUnlockToken token;
    token.windowId = m_Json.GetString(*j, "window_id", "");
    token.usedAt = FromUnix(m_Json.GetInt64(*j, "used_at", 0));
    if (token.windowId.empty()) {
        return std::nullopt;
    }
    return token;
}

// ─────────────────────────────────────
void SharedState::SetEarlyUnlock(const EarlyUnlockToken &token) {
    m_Store.Write(keys::kEarlyUnlock,
                  {{"window_id", token.windowId}, {"used_at", ToUnix(token.usedAt)}});
}

// ─────────────────────────────────────
bool SharedState::CurrentlyEnforced() {
    auto j = m_Store.Read(keys::kCurrentlyEnforced);
    return j && j->is_boolean() && j->get<bool>();
}

// ─────────────────────────────────────
void SharedState::SetCurrentlyEnforced(bool enforced) {
    m_Store.Write(keys::kCurrentlyEnforced, enforced);
}

// ─────────────────────────────────────
std::string SharedState::EnforcedWindowId() {
    auto j = m_Store.Read(keys::kEnforcedWindowId);
    if (!j || !j->is_string()) {
        return {};
    }
    return j->get<std::string>();
}

// ─────────────────────────────────────
void SharedState::SetEnforcedWindowId(const std::string &id) {
    m_Store.Write(keys::kEnforcedWindowId, id);
}

// ─────────────────────────────────────
bool SharedState::AwaitingConfirmation() {
    auto j = m_Store.Read(keys::kAwaitingConfirmation);
    return j && j->is_boolean() && j->get<bool>();
}

// ─────────────────────────────────────
void SharedState::SetAwaitingConfirmation(bool awaiting) {
    m_Store.Write(keys::kAwaitingConfirmation, awaiting);
}

// ─────────────────────────────────────
std::optional<TimePoint> SharedState::EnforcementStartTime() {
    auto j = m_Store.Read(keys::kEnforcementStartTime);
    if (!j || !j->is_number_integer()) {
        return std::nullopt;
    }
    return FromUnix(j->get<int64_t>());
}

// ─────────────────────────────────────
void SharedState::SetEnforcementStartTime(TimePoint start) {
    m_Store.Write(keys::kEnforcementStartTime, ToUnix(start));
}

// ─────────────────────────────────────
NoSelectionWarning SharedState::GetNoSelectionWarning() {
    NoSelectionWarning warning;
    auto j = m_Store.Read(keys::kNoSelectionWarning);
    if (!j) {
        return warning;
    }
    warning.active = m_Json.GetBool(*j, "active", false);
    warning.at = FromUnix(m_Json.GetInt64(*j, "at", 0));
    warning.windowId = m_Json.GetString(*j, "window_id", "");
    return warning;
}

// ─────────────────────────────────────
void SharedState::SetNoSelectionWarning(const NoSelectionWarning &warning) {
    m_Store.Write(keys::kNoSelectionWarning, {{"active", warning.active},
                                              {"at", ToUnix(warning.at)},
                                              {"window_id", warning.windowId}});
}

// ─────────────────────────────────────
std::vector<std::string> SharedState::MonitoredIds() {
    return ReadIdList(keys::kMonitoredWindowIds);
}

// ─────────────────────────────────────
void SharedState::SetMonitoredIds(const std::vector<std::string> &ids) {
    m_Store.Write(keys::kMonitoredWindowIds, ids);
}

// ─────────────────────────────────────
std::optional<EnforcementRecord> SharedState::Record(const std::string &windowId) {
    if (windowId.empty()) {
        return std::nullopt;
    }
    auto j = m_Store.Read(RecordKey(windowId));
    if (!j) {
        return std::nullopt;
    }
    return RecordFromJson(*j);
}

// ─────────────────────────────────────
void SharedState::PutRecord(const EnforcementRecord &record) {
    m_Store.Write(RecordKey(record.windowId), RecordToJson(record));
}

// ─────────────────────────────────────
std::vector<EnforcementRecord> SharedState::Records() {
    std::vector<EnforcementRecord> records;
    for (const auto &key : m_Store.Keys(keys::kRecordPrefix)) {
        auto j = m_Store.Read(key);
        if (!j) {
            continue;
        }
        if (auto record = RecordFromJson(*j)) {
            records.push_back(std::move(*record));
        }
    }
    std::sort(records.begin(), records.end(),
              [](const auto &a, const auto &b) { return a.startTime < b.startTime; });
    return records;
}

// ─────────────────────────────────────
std::size_t SharedState::PruneRecords(TimePoint now, Seconds retention) {
    std::size_t pruned = 0;
    for (const auto &record : Records()) {
        if (record.EndTime() < now - retention) {
            m_Store.Erase(RecordKey(record.windowId));
            ++pruned;
        }
    }
    if (pruned > 0) {
        spdlog::info("Pruned {} enforcement records older than {} days", pruned,
                     retention.count() / 86400);
    }
    return pruned;
}

// ─────────────────────────────────────
StateSnapshot SharedState::ReadSnapshot() {
    StateStore::Transaction tx(m_Store, false);

    StateSnapshot s;
    s.settings = Settings();
    s.mode = GetMode();
    s.selection = Selection();
    s.plannedWindows = PlannedWindows();
    s.registeredIds = RegisteredIds();
    s.needsAuthorization = NeedsAuthorization();
    s.confirmation = Confirmation();
    s.earlyUnlock = EarlyUnlock();

    s.currentlyEnforced = CurrentlyEnforced();
    s.enforcedWindowId = EnforcedWindowId();
    s.awaitingConfirmation = AwaitingConfirmation();
    s.enforcementStartTime = EnforcementStartTime();
    s.noSelectionWarning = GetNoSelectionWarning();
    s.monitoredIds = MonitoredIds();
    s.enforcedRecord = Record(s.enforcedWindowId);

    tx.Commit();
    return s;
}
