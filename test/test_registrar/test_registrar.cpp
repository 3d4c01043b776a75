/*
 * File: test/test_registrar/test_registrar.cpp
 * Description: Reconciling the desired plan with the host's registrations.
 */
#include <unity.h>
#include "FakeHost.h"
#include "registrar.hpp"

namespace {

bool Contains(const std::vector<std::string> &ids, const std::string &id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

std::vector<PrayerWindow> Today() {
    return {Window("Fajr", At(5, 0)), Window("Dhuhr", At(12, 15)), Window("Asr", At(15, 40))};
}

} // namespace

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// TEST CASES
// ============================================================================

void test_fresh_plan_registers_every_window(void) {
    TwoProcessHost host;
    FakeActivityMonitor monitor;
    ScheduleRegistrar registrar(host.mainSide, monitor);

    const auto report = registrar.Reconcile(Today(), At(4, 0));

    TEST_ASSERT_EQUAL_size_t(3, report.registered.size());
    TEST_ASSERT_TRUE(report.rejected.empty());
    TEST_ASSERT_FALSE(report.needsAuthorization);
    TEST_ASSERT_EQUAL_size_t(3, monitor.registered.size());

    const auto stored = host.mainSide.RegisteredIds();
    TEST_ASSERT_EQUAL_size_t(3, stored.size());
    TEST_ASSERT_EQUAL_size_t(3, host.agentSide.PlannedWindows().size());
}

void test_identical_replan_is_a_no_op(void) {
    TwoProcessHost host;
    FakeActivityMonitor monitor;
    ScheduleRegistrar registrar(host.mainSide, monitor);

    registrar.Reconcile(Today(), At(4, 0));
    monitor.registerCalls.clear();

    const auto report = registrar.Reconcile(Today(), At(4, 0));

    TEST_ASSERT_TRUE(report.registered.empty());
    TEST_ASSERT_TRUE(report.unregistered.empty());
    TEST_ASSERT_TRUE(monitor.registerCalls.empty());
    TEST_ASSERT_EQUAL_size_t(3, host.mainSide.RegisteredIds().size());
}

void test_stale_windows_are_unregistered(void) {
    TwoProcessHost host;
    FakeActivityMonitor monitor;
    ScheduleRegistrar registrar(host.mainSide, monitor);
    registrar.Reconcile(Today(), At(4, 0));

    // Fajr has ended; Asr was turned off.
    const std::vector<PrayerWindow> desired = {Window("Dhuhr", At(12, 15))};
    const auto report = registrar.Reconcile(desired, At(5, 30));

    TEST_ASSERT_EQUAL_size_t(2, report.unregistered.size());
    TEST_ASSERT_TRUE(Contains(report.unregistered, Window("Fajr", At(5, 0)).id));
    TEST_ASSERT_TRUE(Contains(report.unregistered, Window("Asr", At(15, 40)).id));
    TEST_ASSERT_EQUAL_size_t(1, monitor.registered.size());

    const auto stored = host.mainSide.RegisteredIds();
    TEST_ASSERT_EQUAL_size_t(1, stored.size());
    TEST_ASSERT_EQUAL_STRING(desired[0].id.c_str(), stored[0].c_str());
}

void test_in_progress_window_stays_registered(void) {
    TwoProcessHost host;
    FakeActivityMonitor monitor;
    ScheduleRegistrar registrar(host.mainSide, monitor);
    registrar.Reconcile(Today(), At(4, 0));

    const PrayerWindow fajr = Window("Fajr", At(5, 0));
    const std::vector<PrayerWindow> desired = {Window("Dhuhr", At(12, 15)),
                                               Window("Asr", At(15, 40))};
    const auto report = registrar.Reconcile(desired, At(5, 5));

    TEST_ASSERT_TRUE(Contains(report.kept, fajr.id));
    TEST_ASSERT_FALSE(Contains(monitor.unregisterCalls, fajr.id));
    TEST_ASSERT_TRUE(Contains(host.mainSide.RegisteredIds(), fajr.id));

    // The agent still finds the duration at the end callback.
    bool planned = false;
    for (const auto &w : host.agentSide.PlannedWindows()) {
        if (w.id == fajr.id) {
            planned = true;
            TEST_ASSERT_EQUAL_INT64(15 * 60, w.duration.count());
        }
    }
    TEST_ASSERT_TRUE(planned);
}

void test_ceiling_stops_farther_windows(void) {
    TwoProcessHost host;
    FakeActivityMonitor monitor;
    monitor.ceiling = 2;
    ScheduleRegistrar registrar(host.mainSide, monitor);

    const auto report = registrar.Reconcile(Today(), At(4, 0));

    TEST_ASSERT_TRUE(report.ceilingReached);
    TEST_ASSERT_EQUAL_size_t(2, report.registered.size());
    TEST_ASSERT_EQUAL_size_t(1, report.rejected.size());
    TEST_ASSERT_EQUAL_STRING(Window("Asr", At(15, 40)).id.c_str(), report.rejected[0].c_str());
    TEST_ASSERT_FALSE(report.needsAuthorization);
    TEST_ASSERT_FALSE(host.mainSide.NeedsAuthorization().active);
}

void test_authorization_refusal_sets_flag_until_success(void) {
    TwoProcessHost host;
    FakeActivityMonitor monitor;
    monitor.refuseWith = REGISTER_UNAUTHORIZED;
    ScheduleRegistrar registrar(host.mainSide, monitor);

    const auto refused = registrar.Reconcile(Today(), At(4, 0));

    TEST_ASSERT_TRUE(refused.needsAuthorization);
    TEST_ASSERT_EQUAL_size_t(3, refused.rejected.size());
    TEST_ASSERT_EQUAL_size_t(1, monitor.registerCalls.size());
    const AuthorizationFlag flag = host.agentSide.NeedsAuthorization();
    TEST_ASSERT_TRUE(flag.active);
    TEST_ASSERT_EQUAL_STRING("refused by fake host", flag.reason.c_str());
    TEST_ASSERT_TRUE(host.mainSide.RegisteredIds().empty());

    monitor.refuseWith = REGISTER_OK;
    const auto retried = registrar.Reconcile(Today(), At(4, 5));

    TEST_ASSERT_FALSE(retried.needsAuthorization);
    TEST_ASSERT_EQUAL_size_t(3, retried.registered.size());
    TEST_ASSERT_FALSE(host.mainSide.NeedsAuthorization().active);
}

void test_single_failure_does_not_stop_the_pass(void) {
    TwoProcessHost host;
    FakeActivityMonitor monitor;
    monitor.failing.insert(Window("Fajr", At(5, 0)).id);
    ScheduleRegistrar registrar(host.mainSide, monitor);

    const auto report = registrar.Reconcile(Today(), At(4, 0));

    TEST_ASSERT_EQUAL_size_t(2, report.registered.size());
    TEST_ASSERT_EQUAL_size_t(1, report.rejected.size());
    TEST_ASSERT_FALSE(Contains(host.mainSide.RegisteredIds(), Window("Fajr", At(5, 0)).id));
}

void test_duration_change_re_registers(void) {
    TwoProcessHost host;
    FakeActivityMonitor monitor;
    ScheduleRegistrar registrar(host.mainSide, monitor);
    registrar.Reconcile(Today(), At(4, 0));
    monitor.registerCalls.clear();

    std::vector<PrayerWindow> longer;
    for (const auto &w : Today()) {
        longer.push_back(Window(w.prayerName, w.startTime, 30));
    }
    const auto report = registrar.Reconcile(longer, At(4, 0));

    TEST_ASSERT_EQUAL_size_t(3, report.registered.size());
    TEST_ASSERT_EQUAL_size_t(3, monitor.registerCalls.size());
    TEST_ASSERT_EQUAL_INT64(30 * 60, host.agentSide.PlannedWindows()[0].duration.count());
}

void test_failed_unregister_keeps_tracking_the_id(void) {
    TwoProcessHost host;
    FakeActivityMonitor monitor;
    ScheduleRegistrar registrar(host.mainSide, monitor);
    registrar.Reconcile(Today(), At(4, 0));

    monitor.failUnregister = true;
    registrar.Reconcile({}, At(16, 0));

    TEST_ASSERT_EQUAL_size_t(3, host.mainSide.RegisteredIds().size());

    monitor.failUnregister = false;
    registrar.Reconcile({}, At(16, 5));
    TEST_ASSERT_TRUE(host.mainSide.RegisteredIds().empty());
    TEST_ASSERT_TRUE(monitor.registered.empty());
}

void test_stuck_unregister_survives_the_id_horizon(void) {
    TwoProcessHost host;
    FakeActivityMonitor monitor;
    ScheduleRegistrar registrar(host.mainSide, monitor);
    registrar.Reconcile(Today(), At(4, 0));

    // Days later the ids are far older than the list keeps.
    monitor.failUnregister = true;
    registrar.Reconcile({}, At(16, 0) + std::chrono::hours{72});

    TEST_ASSERT_EQUAL_size_t(3, host.mainSide.RegisteredIds().size());
    TEST_ASSERT_EQUAL_size_t(3, monitor.registered.size());

    monitor.failUnregister = false;
    registrar.Reconcile({}, At(16, 5) + std::chrono::hours{72});
    TEST_ASSERT_TRUE(host.mainSide.RegisteredIds().empty());
    TEST_ASSERT_TRUE(monitor.registered.empty());
}

// ============================================================================
// RUNNER
// ============================================================================
int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_fresh_plan_registers_every_window);
    RUN_TEST(test_identical_replan_is_a_no_op);
    RUN_TEST(test_stale_windows_are_unregistered);
    RUN_TEST(test_in_progress_window_stays_registered);
    RUN_TEST(test_ceiling_stops_farther_windows);
    RUN_TEST(test_authorization_refusal_sets_flag_until_success);
    RUN_TEST(test_single_failure_does_not_stop_the_pass);
    RUN_TEST(test_duration_change_re_registers);
    RUN_TEST(test_failed_unregister_keeps_tracking_the_id);
    RUN_TEST(test_stuck_unregister_survives_the_id_horizon);
    return UNITY_END();
}
