/*
 * File: test/test_planner/test_planner.cpp
 * Description: Turning prayer occurrences into the ordered, capped set of windows.
 */
#include <unity.h>
#include "FakeHost.h"
#include "planner.hpp"

namespace {

// Three days of the five prayers, starting on 2026-03-01.
std::vector<PrayerOccurrence> ThreeDays() {
    std::vector<PrayerOccurrence> out;
    for (int day = 0; day < 3; ++day) {
        const auto shift = std::chrono::hours{24 * day};
        out.push_back(Occurrence("Fajr", At(5, 0) + shift));
        out.push_back(Occurrence("Dhuhr", At(12, 15) + shift));
        out.push_back(Occurrence("Asr", At(15, 40) + shift));
        out.push_back(Occurrence("Maghrib", At(18, 5) + shift));
        out.push_back(Occurrence("Isha", At(19, 30) + shift));
    }
    return out;
}

} // namespace

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// TEST CASES
// ============================================================================

void test_plan_is_future_ordered_and_capped(void) {
    PrayerWindowPlanner planner(5);
    const TimePoint now = At(10, 0);

    const auto plan = planner.Plan(ThreeDays(), FocusSettings{}, now);

    TEST_ASSERT_EQUAL_size_t(5, plan.size());
    for (std::size_t i = 0; i < plan.size(); ++i) {
        TEST_ASSERT_TRUE(plan[i].startTime > now);
        if (i > 0) {
            TEST_ASSERT_TRUE(plan[i - 1].startTime < plan[i].startTime);
        }
    }
    // Nearest first: Fajr at 05:00 has passed.
    TEST_ASSERT_EQUAL_STRING("Dhuhr", plan[0].prayerName.c_str());
    TEST_ASSERT_EQUAL_STRING("Isha", plan[3].prayerName.c_str());
    TEST_ASSERT_EQUAL_STRING("Fajr", plan[4].prayerName.c_str());
    TEST_ASSERT_EQUAL_INT64(ToUnix(NextDayAt(5, 0)), ToUnix(plan[4].startTime));
}

void test_default_ceiling_is_twenty(void) {
    PrayerWindowPlanner planner;
    std::vector<PrayerOccurrence> many;
    for (int day = 0; day < 6; ++day) {
        for (const auto &occ : ThreeDays()) {
            many.push_back(Occurrence(occ.name, occ.time + std::chrono::hours{72 * day}));
        }
    }
    TEST_ASSERT_EQUAL_size_t(20, planner.Plan(many, FocusSettings{}, At(0, 0)).size());
}

void test_replanning_same_inputs_gives_same_ids(void) {
    PrayerWindowPlanner planner;
    const auto a = planner.Plan(ThreeDays(), FocusSettings{}, At(10, 0));
    const auto b = planner.Plan(ThreeDays(), FocusSettings{}, At(10, 0));

    TEST_ASSERT_EQUAL_size_t(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        TEST_ASSERT_EQUAL_STRING(a[i].id.c_str(), b[i].id.c_str());
    }
}

void test_disabled_and_unknown_prayers_are_dropped(void) {
    PrayerWindowPlanner planner;
    FocusSettings settings;
    settings.enabled["Asr"] = false;

    auto occurrences = ThreeDays();
    occurrences.push_back(Occurrence("Tahajjud", At(23, 0)));

    for (const auto &w : planner.Plan(occurrences, settings, At(0, 0))) {
        TEST_ASSERT_TRUE(w.prayerName != "Asr");
        TEST_ASSERT_TRUE(IsCanonicalPrayer(w.prayerName));
    }
}

void test_no_enabled_prayers_gives_empty_plan(void) {
    PrayerWindowPlanner planner;
    FocusSettings settings;
    for (const char *name : kPrayerNames) {
        settings.enabled[name] = false;
    }
    TEST_ASSERT_TRUE(planner.Plan(ThreeDays(), settings, At(0, 0)).empty());
}

void test_buffer_moves_start_before_the_prayer(void) {
    PrayerWindowPlanner planner;
    FocusSettings settings;
    settings.prePrayerBuffer = std::chrono::minutes{10};

    const auto plan = planner.Plan({Occurrence("Dhuhr", At(12, 15, 30))}, settings, At(0, 0));

    TEST_ASSERT_EQUAL_size_t(1, plan.size());
    TEST_ASSERT_EQUAL_INT64(ToUnix(At(12, 5)), ToUnix(plan[0].startTime));
    TEST_ASSERT_EQUAL_STRING(MakeWindowId("Dhuhr", At(12, 5)).c_str(), plan[0].id.c_str());
}

void test_duration_has_a_fifteen_minute_floor(void) {
    PrayerWindowPlanner planner;
    FocusSettings settings;
    settings.duration = std::chrono::minutes{5};

    const auto shortPlan = planner.Plan({Occurrence("Asr", At(15, 40))}, settings, At(0, 0));
    TEST_ASSERT_EQUAL_INT64(15 * 60, shortPlan[0].duration.count());

    settings.duration = std::chrono::minutes{40};
    const auto longPlan = planner.Plan({Occurrence("Asr", At(15, 40))}, settings, At(0, 0));
    TEST_ASSERT_EQUAL_INT64(40 * 60, longPlan[0].duration.count());
}

void test_windows_inside_the_guard_are_dropped(void) {
    PrayerWindowPlanner planner(20, std::chrono::seconds{60});
    const TimePoint now = At(11, 59, 30);

    const auto plan = planner.Plan({Occurrence("Dhuhr", At(12, 0)), Occurrence("Asr", At(15, 0))},
                                   FocusSettings{}, now);

    TEST_ASSERT_EQUAL_size_t(1, plan.size());
    TEST_ASSERT_EQUAL_STRING("Asr", plan[0].prayerName.c_str());
}

void test_one_occurrence_per_prayer_and_day(void) {
    PrayerWindowPlanner planner;
    const std::vector<PrayerOccurrence> occurrences = {
        Occurrence("Isha", At(19, 30)),
        Occurrence("Isha", At(19, 45)),
        Occurrence("Isha", NextDayAt(19, 30)),
    };
    const auto plan = planner.Plan(occurrences, FocusSettings{}, At(0, 0));

    TEST_ASSERT_EQUAL_size_t(2, plan.size());
    TEST_ASSERT_EQUAL_INT64(ToUnix(At(19, 30)), ToUnix(plan[0].startTime));
    TEST_ASSERT_EQUAL_INT64(ToUnix(NextDayAt(19, 30)), ToUnix(plan[1].startTime));
}

void test_same_minute_keeps_the_canonical_first(void) {
    PrayerWindowPlanner planner;
    const auto plan = planner.Plan({Occurrence("Isha", At(19, 0)), Occurrence("Maghrib", At(19, 0)),
                                    Occurrence("Isha", NextDayAt(20, 30))},
                                   FocusSettings{}, At(0, 0));

    TEST_ASSERT_EQUAL_size_t(2, plan.size());
    TEST_ASSERT_EQUAL_STRING("Maghrib", plan[0].prayerName.c_str());
    TEST_ASSERT_EQUAL_STRING("Isha", plan[1].prayerName.c_str());
    for (std::size_t i = 1; i < plan.size(); ++i) {
        TEST_ASSERT_TRUE(plan[i - 1].startTime < plan[i].startTime);
    }
}

// ============================================================================
// RUNNER
// ============================================================================
int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_plan_is_future_ordered_and_capped);
    RUN_TEST(test_default_ceiling_is_twenty);
    RUN_TEST(test_replanning_same_inputs_gives_same_ids);
    RUN_TEST(test_disabled_and_unknown_prayers_are_dropped);
    RUN_TEST(test_no_enabled_prayers_gives_empty_plan);
    RUN_TEST(test_buffer_moves_start_before_the_prayer);
    RUN_TEST(test_duration_has_a_fifteen_minute_floor);
    RUN_TEST(test_windows_inside_the_guard_are_dropped);
    RUN_TEST(test_one_occurrence_per_prayer_and_day);
    RUN_TEST(test_same_minute_keeps_the_canonical_first);
    return UNITY_END();
}
