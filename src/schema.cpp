#include "schema.hpp"

#include "store.hpp"

#include <array>
#include <string>
#include <utility>

namespace {
constexpr std::array<std::pair<const char *, StoreRole>, 14> kOwners = {{
    {keys::kSettings, ROLE_MAIN},
    {keys::kMode, ROLE_MAIN},
    {keys::kSelection, ROLE_MAIN},
    {keys::kPlannedWindows, ROLE_MAIN},
    {keys::kRegisteredWindowIds, ROLE_MAIN},
    {keys::kNeedsAuthorization, ROLE_MAIN},
    {keys::kConfirmation, ROLE_MAIN},
    {keys::kEarlyUnlock, ROLE_MAIN},
    {keys::kCurrentlyEnforced, ROLE_AGENT},
    {keys::kEnforcedWindowId, ROLE_AGENT},
    {keys::kAwaitingConfirmation, ROLE_AGENT},
    {keys::kEnforcementStartTime, ROLE_AGENT},
    {keys::kNoSelectionWarning, ROLE_AGENT},
    {keys::kMonitoredWindowIds, ROLE_AGENT},
}};
} // namespace

// ─────────────────────────────────────
StoreRole OwnerOfKey(const std::string &key) {
    for (const auto &[name, role] : kOwners) {
        if (key == name) {
            return role;
        }
    }
    const std::string recordPrefix = keys::kRecordPrefix;
    if (key.size() > recordPrefix.size() &&
        key.compare(0, recordPrefix.size(), recordPrefix) == 0) {
        return ROLE_AGENT;
    }
    throw StoreError("key is not part of the store schema: " + key);
}

// ─────────────────────────────────────
const char *RoleToString(StoreRole role) {
    return role == ROLE_AGENT ? "agent" : "main";
}

// ─────────────────────────────────────
std::string RecordKey(const std::string &windowId) {
    return std::string(keys::kRecordPrefix) + windowId;
}
