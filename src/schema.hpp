#pragma once

#include <string>

#include "common.hpp"

// Keys of the shared store. Every key has exactly one writer role.
namespace keys {
// Written by the main process
inline constexpr const char *kSettings = "settings";
inline constexpr const char *kMode = "mode";
inline constexpr const char *kSelection = "selection";
inline constexpr const char *kPlannedWindows = "planned-windows";
inline constexpr const char *kRegisteredWindowIds = "registered-window-ids";
inline constexpr const char *kNeedsAuthorization = "needs-authorization";
inline constexpr const char *kConfirmation = "confirmation";
inline constexpr const char *kEarlyUnlock = "early-unlock-used-for-window-id";

// Written by the enforcement agent
inline constexpr const char *kCurrentlyEnforced = "currently-enforced";
inline constexpr const char *kEnforcedWindowId = "enforced-window-id";
inline constexpr const char *kAwaitingConfirmation = "awaiting-confirmation";
inline constexpr const char *kEnforcementStartTime = "enforcement-start-time";
inline constexpr const char *kNoSelectionWarning = "no-selection-warning";
inline constexpr const char *kMonitoredWindowIds = "currently-monitored-window-ids";
inline constexpr const char *kRecordPrefix = "record/";
} // namespace keys

// Throws StoreError for keys outside the schema.
StoreRole OwnerOfKey(const std::string &key);
const char *RoleToString(StoreRole role);
std::string RecordKey(const std::string &windowId);
