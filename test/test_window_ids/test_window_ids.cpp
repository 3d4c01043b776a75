/*
 * File: test/test_window_ids/test_window_ids.cpp
 * Description: Deterministic window ids and the bounded id lists kept in the store.
 */
#include <unity.h>
#include "FakeHost.h"

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// TEST CASES
// ============================================================================

void test_id_is_floored_to_the_minute(void) {
    const std::string a = MakeWindowId("Fajr", At(5, 0, 0));
    const std::string b = MakeWindowId("Fajr", At(5, 0, 42));

    TEST_ASSERT_EQUAL_STRING(a.c_str(), b.c_str());
    const std::string expected = "Prayer_Fajr_" + std::to_string(ToUnix(At(5, 0)));
    TEST_ASSERT_EQUAL_STRING(expected.c_str(), a.c_str());
}

void test_id_differs_per_prayer_and_start(void) {
    TEST_ASSERT_TRUE(MakeWindowId("Fajr", At(5, 0)) != MakeWindowId("Dhuhr", At(5, 0)));
    TEST_ASSERT_TRUE(MakeWindowId("Fajr", At(5, 0)) != MakeWindowId("Fajr", At(5, 1)));
}

void test_context_is_recovered_from_the_id(void) {
    std::string prayer;
    TimePoint start;
    TEST_ASSERT_TRUE(ParseWindowId(MakeWindowId("Maghrib", At(18, 7)), prayer, start));
    TEST_ASSERT_EQUAL_STRING("Maghrib", prayer.c_str());
    TEST_ASSERT_EQUAL_INT64(ToUnix(At(18, 7)), ToUnix(start));
}

void test_malformed_ids_are_rejected(void) {
    std::string prayer;
    TimePoint start;
    TEST_ASSERT_FALSE(ParseWindowId("", prayer, start));
    TEST_ASSERT_FALSE(ParseWindowId("Fajr_1700000000", prayer, start));
    TEST_ASSERT_FALSE(ParseWindowId("Prayer_Fajr_", prayer, start));
    TEST_ASSERT_FALSE(ParseWindowId("Prayer_Fajr_17000x", prayer, start));
    TEST_ASSERT_FALSE(ParseWindowId("Prayer_Tahajjud_1700000000", prayer, start));
}

void test_event_names_parse_back(void) {
    auto ev = EventFromString("warn-end");
    TEST_ASSERT_TRUE(ev.has_value());
    TEST_ASSERT_EQUAL(EVENT_WILL_END_WARNING, *ev);
    TEST_ASSERT_FALSE(EventFromString("stop").has_value());
}

void test_bounded_list_drops_entries_older_than_a_day(void) {
    const TimePoint now = NextDayAt(12, 0);
    const std::vector<std::string> ids = {
        MakeWindowId("Fajr", At(5, 0)),      // 31h old
        MakeWindowId("Isha", At(20, 0)),     // 16h old
        MakeWindowId("Dhuhr", NextDayAt(13, 0)),
        "garbage",
    };

    const auto out = BoundIdList(ids, now, SharedState::kIdListHorizon, 30, 25);

    TEST_ASSERT_EQUAL_size_t(2, out.size());
    TEST_ASSERT_EQUAL_STRING(ids[1].c_str(), out[0].c_str());
    TEST_ASSERT_EQUAL_STRING(ids[2].c_str(), out[1].c_str());
}

void test_bounded_list_keeps_newest_past_high_water(void) {
    const TimePoint now = At(0, 0);
    std::vector<std::string> ids;
    for (int i = 0; i < 31; ++i) {
        ids.push_back(MakeWindowId("Asr", now + std::chrono::minutes{i}));
    }

    const auto out = BoundIdList(ids, now, SharedState::kIdListHorizon,
                                 SharedState::kMonitoredHighWater, SharedState::kMonitoredKeep);

    TEST_ASSERT_EQUAL_size_t(SharedState::kMonitoredKeep, out.size());
    TEST_ASSERT_EQUAL_STRING(ids[6].c_str(), out.front().c_str());
    TEST_ASSERT_EQUAL_STRING(ids[30].c_str(), out.back().c_str());
}

void test_bounded_list_under_high_water_is_untouched(void) {
    const TimePoint now = At(0, 0);
    std::vector<std::string> ids;
    for (int i = 0; i < 30; ++i) {
        ids.push_back(MakeWindowId("Asr", now + std::chrono::minutes{i}));
    }
    TEST_ASSERT_EQUAL_size_t(30, BoundIdList(ids, now, SharedState::kIdListHorizon, 30, 25).size());
}

// ============================================================================
// RUNNER
// ============================================================================
int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_id_is_floored_to_the_minute);
    RUN_TEST(test_id_differs_per_prayer_and_start);
    RUN_TEST(test_context_is_recovered_from_the_id);
    RUN_TEST(test_malformed_ids_are_rejected);
    RUN_TEST(test_event_names_parse_back);
    RUN_TEST(test_bounded_list_drops_entries_older_than_a_day);
    RUN_TEST(test_bounded_list_keeps_newest_past_high_water);
    RUN_TEST(test_bounded_list_under_high_water_is_untouched);
    return UNITY_END();
}
