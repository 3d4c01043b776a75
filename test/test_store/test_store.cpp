/*
 * File: test/test_store/test_store.cpp
 * Description: The shared store as seen from both processes: ownership, visibility,
 *              transactions and record retention.
 */
#include <unity.h>
#include "FakeHost.h"
#include "schema.hpp"

#include <sqlite3.h>

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// TEST CASES
// ============================================================================

void test_every_key_has_one_owner(void) {
    TEST_ASSERT_EQUAL(ROLE_MAIN, OwnerOfKey(keys::kSettings));
    TEST_ASSERT_EQUAL(ROLE_MAIN, OwnerOfKey(keys::kConfirmation));
    TEST_ASSERT_EQUAL(ROLE_MAIN, OwnerOfKey(keys::kEarlyUnlock));
    TEST_ASSERT_EQUAL(ROLE_AGENT, OwnerOfKey(keys::kCurrentlyEnforced));
    TEST_ASSERT_EQUAL(ROLE_AGENT, OwnerOfKey(keys::kMonitoredWindowIds));
    TEST_ASSERT_EQUAL(ROLE_AGENT, OwnerOfKey(RecordKey("Prayer_Fajr_1772341200")));
}

void test_unknown_key_is_rejected(void) {
    TwoProcessHost host;
    bool threw = false;
    bool ownership = false;
    try {
        host.mainStore.Write("favourite-colour", "green");
    } catch (const OwnershipError &) {
        ownership = true;
    } catch (const StoreError &) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_FALSE(ownership);
}

void test_main_cannot_write_agent_facts(void) {
    TwoProcessHost host;
    bool threw = false;
    try {
        host.mainSide.SetCurrentlyEnforced(true);
    } catch (const OwnershipError &) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_FALSE(host.agentSide.CurrentlyEnforced());
}

void test_agent_cannot_write_user_settings(void) {
    TwoProcessHost host;
    bool threw = false;
    try {
        host.agentSide.SetMode(MODE_STRICT);
    } catch (const OwnershipError &) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_EQUAL(MODE_NORMAL, host.mainSide.GetMode());
}

void test_writes_are_visible_to_the_other_connection(void) {
    TwoProcessHost host;

    host.mainSide.SetMode(MODE_STRICT);
    TokenSet selection;
    selection.applications = {"org.mozilla.firefox"};
    selection.webDomains = {"youtube.com"};
    host.mainSide.SetSelection(selection);

    host.agentSide.SetEnforcedWindowId("Prayer_Asr_1772379600");

    TEST_ASSERT_EQUAL(MODE_STRICT, host.agentSide.GetMode());
    TEST_ASSERT_TRUE(host.agentSide.Selection() == selection);
    TEST_ASSERT_EQUAL_STRING("Prayer_Asr_1772379600", host.mainSide.EnforcedWindowId().c_str());
}

void test_missing_keys_read_as_defaults(void) {
    TwoProcessHost host;
    const StateSnapshot s = host.mainSide.ReadSnapshot();

    TEST_ASSERT_EQUAL(MODE_NORMAL, s.mode);
    TEST_ASSERT_FALSE(s.currentlyEnforced);
    TEST_ASSERT_FALSE(s.awaitingConfirmation);
    TEST_ASSERT_FALSE(s.needsAuthorization.active);
    TEST_ASSERT_TRUE(s.selection.Empty());
    TEST_ASSERT_TRUE(s.plannedWindows.empty());
    TEST_ASSERT_FALSE(s.enforcedRecord.has_value());
    TEST_ASSERT_EQUAL_INT64(15 * 60, s.settings.duration.count());
    TEST_ASSERT_TRUE(s.settings.IsEnabled("Fajr"));
}

void test_settings_survive_the_store(void) {
    TwoProcessHost host;
    FocusSettings settings;
    settings.enabled["Isha"] = false;
    settings.duration = std::chrono::minutes{20};
    settings.prePrayerBuffer = std::chrono::minutes{10};
    settings.earlyUnlockFraction = 0.5;
    host.mainSide.SetSettings(settings);

    const FocusSettings read = host.agentSide.Settings();
    TEST_ASSERT_FALSE(read.IsEnabled("Isha"));
    TEST_ASSERT_TRUE(read.IsEnabled("Fajr"));
    TEST_ASSERT_EQUAL_INT64(20 * 60, read.duration.count());
    TEST_ASSERT_EQUAL_INT64(10 * 60, read.prePrayerBuffer.count());
    TEST_ASSERT_TRUE(read.earlyUnlockFraction == 0.5);
}

void test_uncommitted_transaction_is_rolled_back(void) {
    TwoProcessHost host;
    {
        StateStore::Transaction tx(host.agentStore);
        host.agentSide.SetCurrentlyEnforced(true);
        host.agentSide.SetEnforcedWindowId("Prayer_Fajr_1772341200");
    }
    TEST_ASSERT_FALSE(host.mainSide.CurrentlyEnforced());
    TEST_ASSERT_EQUAL_STRING("", host.mainSide.EnforcedWindowId().c_str());

    {
        StateStore::Transaction tx(host.agentStore);
        host.agentSide.SetCurrentlyEnforced(true);
        host.agentSide.SetEnforcedWindowId("Prayer_Fajr_1772341200");
        tx.Commit();
    }
    TEST_ASSERT_TRUE(host.mainSide.CurrentlyEnforced());
}

void test_data_version_moves_on_foreign_commit(void) {
    TwoProcessHost host;
    const int64_t before = host.mainStore.DataVersion();

    host.agentSide.SetAwaitingConfirmation(true);

    TEST_ASSERT_TRUE(host.mainStore.DataVersion() != before);
}

void test_records_are_listed_and_pruned(void) {
    TwoProcessHost host;

    EnforcementRecord old;
    old.windowId = MakeWindowId("Fajr", At(5, 0));
    old.prayerName = "Fajr";
    old.startTime = At(5, 0);
    old.duration = std::chrono::minutes{15};
    old.appliedAt = At(5, 0);
    old.clearedAt = At(5, 15);
    host.agentSide.PutRecord(old);

    EnforcementRecord recent = old;
    recent.windowId = MakeWindowId("Fajr", At(5, 0) + std::chrono::days{20});
    recent.startTime = At(5, 0) + std::chrono::days{20};
    host.agentSide.PutRecord(recent);

    TEST_ASSERT_EQUAL_size_t(2, host.mainSide.Records().size());

    const TimePoint now = At(12, 0) + std::chrono::days{20};
    const std::size_t pruned = host.agentSide.PruneRecords(now, std::chrono::days{14});

    TEST_ASSERT_EQUAL_size_t(1, pruned);
    TEST_ASSERT_FALSE(host.mainSide.Record(old.windowId).has_value());

    auto kept = host.mainSide.Record(recent.windowId);
    TEST_ASSERT_TRUE(kept.has_value());
    TEST_ASSERT_TRUE(kept->clearedAt.has_value());
    TEST_ASSERT_EQUAL_INT64(ToUnix(recent.startTime), ToUnix(kept->startTime));
}

void test_newer_schema_is_refused(void) {
    TempDb db;
    {
        StateStore store(db.Path(), ROLE_MAIN);
    }

    sqlite3 *raw = nullptr;
    TEST_ASSERT_EQUAL(SQLITE_OK, sqlite3_open(db.Path().c_str(), &raw));
    const char *bump = "UPDATE meta SET value = '99' WHERE name = 'schema_version'";
    TEST_ASSERT_EQUAL(SQLITE_OK, sqlite3_exec(raw, bump, nullptr, nullptr, nullptr));
    sqlite3_close(raw);

    bool threw = false;
    try {
        StateStore store(db.Path(), ROLE_AGENT);
    } catch (const StoreError &) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

// ============================================================================
// RUNNER
// ============================================================================
int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_every_key_has_one_owner);
    RUN_TEST(test_unknown_key_is_rejected);
    RUN_TEST(test_main_cannot_write_agent_facts);
    RUN_TEST(test_agent_cannot_write_user_settings);
    RUN_TEST(test_writes_are_visible_to_the_other_connection);
    RUN_TEST(test_missing_keys_read_as_defaults);
    RUN_TEST(test_settings_survive_the_store);
    RUN_TEST(test_uncommitted_transaction_is_rolled_back);
    RUN_TEST(test_data_version_moves_on_foreign_commit);
    RUN_TEST(test_records_are_listed_and_pruned);
    RUN_TEST(test_newer_schema_is_refused);
    return UNITY_END();
}
