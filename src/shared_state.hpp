#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "common.hpp"
#include "json.hpp"
#include "store.hpp"

// Everything both processes know, read in one consistent pass.
struct StateSnapshot {
    FocusSettings settings;
    Mode mode = MODE_NORMAL;
    TokenSet selection;
    std::vector<PrayerWindow> plannedWindows;
    std::vector<std::string> registeredIds;
    AuthorizationFlag needsAuthorization;
    std::optional<ConfirmationIntent> confirmation;
    std::optional<EarlyUnlockToken> earlyUnlock;

    bool currentlyEnforced = false;
    std::string enforcedWindowId;
    bool awaitingConfirmation = false;
    std::optional<TimePoint> enforcementStartTime;
    NoSelectionWarning noSelectionWarning;
    std::vector<std::string> monitoredIds;
    std::optional<EnforcementRecord> enforcedRecord;
};

// Typed view over the StateStore keys. Readers tolerate missing or malformed values and fall
// back to defaults; writers throw StoreError / OwnershipError.
class SharedState {
  public:
    static constexpr Seconds kIdListHorizon{24 * 60 * 60};
    static constexpr std::size_t kMonitoredHighWater = 30;
    static constexpr std::size_t kMonitoredKeep = 25;

    explicit SharedState(StateStore &store);

    StateStore &Store() {
        return m_Store;
    }

    // main
    FocusSettings Settings();
    void SetSettings(const FocusSettings &settings);
    Mode GetMode();
    void SetMode(Mode mode);
    TokenSet Selection();
    void SetSelection(const TokenSet &selection);
    std::vector<PrayerWindow> PlannedWindows();
    void SetPlannedWindows(const std::vector<PrayerWindow> &windows);
    std::vector<std::string> RegisteredIds();
    void SetRegisteredIds(const std::vector<std::string> &ids);
    AuthorizationFlag NeedsAuthorization();
    void SetNeedsAuthorization(const AuthorizationFlag &flag);
    std::optional<ConfirmationIntent> Confirmation();
    void SetConfirmation(const ConfirmationIntent &intent);
    std::optional<EarlyUnlockToken> EarlyUnlock();
    void SetEarlyUnlock(const EarlyUnlockToken &token);

    // agent
    bool CurrentlyEnforced();
    void SetCurrentlyEnforced(bool enforced);
    std::string EnforcedWindowId();
    void SetEnforcedWindowId(const std::string &id);
    bool AwaitingConfirmation();
    void SetAwaitingConfirmation(bool awaiting);
    std::optional<TimePoint> EnforcementStartTime();
    void SetEnforcementStartTime(TimePoint start);
    NoSelectionWarning GetNoSelectionWarning();
    void SetNoSelectionWarning(const NoSelectionWarning &warning);
    std::vector<std::string> MonitoredIds();
    void SetMonitoredIds(const std::vector<std::string> &ids);
    std::optional<EnforcementRecord> Record(const std::string &windowId);
    void PutRecord(const EnforcementRecord &record);
    std::vector<EnforcementRecord> Records();

    // Deletes records whose window ended before now - retention. Returns how many went.
    std::size_t PruneRecords(TimePoint now, Seconds retention);

    StateSnapshot ReadSnapshot();

  private:
    std::vector<std::string> ReadIdList(const char *key);

  private:
    StateStore &m_Store;
    JsonParse m_Json;
};

// Drops ids whose start is older than now - horizon (or that do not parse), then keeps the
// newest `keep` entries once the list grows past `highWater`. Order of survivors is preserved.
std::vector<std::string> BoundIdList(const std::vector<std::string> &ids, TimePoint now,
                                     Seconds horizon, std::size_t highWater, std::size_t keep);

nlohmann::json SettingsToJson(const FocusSettings &settings);
FocusSettings SettingsFromJson(const nlohmann::json &j);
nlohmann::json TokenSetToJson(const TokenSet &tokens);
TokenSet TokenSetFromJson(const nlohmann::json &j);
nlohmann::json RecordToJson(const EnforcementRecord &record);
std::optional<EnforcementRecord> RecordFromJson(const nlohmann::json &j);
