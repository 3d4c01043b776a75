/*
 * File: test/test_config/test_config.cpp
 * Description: Loading config.json: defaults, XDG locations, overrides and rejected files.
 */
#include <unity.h>
#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace {

std::filesystem::path g_Home;

std::filesystem::path WriteConfig(const std::string &text) {
    const auto path = g_Home / "config.json";
    std::ofstream out(path, std::ios::trunc);
    out << text;
    return path;
}

bool Rejects(const std::string &text) {
    const auto path = WriteConfig(text);
    try {
        LoadConfig(path);
    } catch (const ConfigError &) {
        return true;
    }
    return false;
}

} // namespace

void setUp(void) {
    g_Home = std::filesystem::temp_directory_path() /
             ("prayerguard-home-" + std::to_string(::getpid()));
    std::filesystem::remove_all(g_Home);
    std::filesystem::create_directories(g_Home);

    ::setenv("HOME", g_Home.c_str(), 1);
    ::unsetenv("XDG_CONFIG_HOME");
    ::unsetenv("XDG_DATA_HOME");
    ::unsetenv("XDG_STATE_HOME");
}

void tearDown(void) {
    std::error_code ec;
    std::filesystem::remove_all(g_Home, ec);
}

// ============================================================================
// TEST CASES
// ============================================================================

void test_missing_file_gives_defaults(void) {
    const Config config = LoadConfig(g_Home / "absent.json");

    TEST_ASSERT_EQUAL(LOG_INFO, config.logLevel);
    TEST_ASSERT_EQUAL_size_t(20, config.registrationCeiling);
    TEST_ASSERT_EQUAL_INT64(60, config.guard.count());
    TEST_ASSERT_EQUAL_INT64(60, config.preStartWarning.count());
    TEST_ASSERT_EQUAL_INT64(60, config.preEndWarning.count());
    TEST_ASSERT_EQUAL_INT(14, config.recordRetentionDays);
    TEST_ASSERT_EQUAL_INT64(60, config.replanInterval.count());
    TEST_ASSERT_TRUE(config.categories.empty());

    const auto data = g_Home / ".local/share/prayerguard";
    TEST_ASSERT_EQUAL_STRING((data / "state.sqlite").c_str(), config.dbPath.c_str());
    TEST_ASSERT_EQUAL_STRING((data / "prayer-times.json").c_str(),
                             config.prayerTimesPath.c_str());
    TEST_ASSERT_EQUAL_STRING((g_Home / ".local/state/prayerguard/shield.json").c_str(),
                             config.shieldPath.c_str());
    TEST_ASSERT_EQUAL_STRING((g_Home / ".config/systemd/user").c_str(), config.unitDir.c_str());
    TEST_ASSERT_TRUE(std::filesystem::is_directory(data));
}

void test_xdg_variables_take_precedence(void) {
    const auto xdgData = g_Home / "data";
    ::setenv("XDG_DATA_HOME", xdgData.c_str(), 1);
    ::setenv("XDG_CONFIG_HOME", (g_Home / "cfg").c_str(), 1);

    const Config config = LoadConfig(g_Home / "absent.json");

    TEST_ASSERT_EQUAL_STRING((xdgData / "prayerguard/state.sqlite").c_str(),
                             config.dbPath.c_str());
    TEST_ASSERT_EQUAL_STRING((g_Home / "cfg/prayerguard/config.json").c_str(),
                             DefaultConfigPath().c_str());
}

void test_overrides_are_read(void) {
    const auto path = WriteConfig(R"({
        "log_level": "debug",
        "db_path": "~/db/pg.sqlite",
        "registration_ceiling": 8,
        "guard_seconds": 120,
        "record_retention_days": 3,
        "categories": {"social": ["org.telegram.desktop", "com.discordapp.Discord"]}
    })");

    const Config config = LoadConfig(path);

    TEST_ASSERT_EQUAL(LOG_DEBUG, config.logLevel);
    TEST_ASSERT_EQUAL_STRING((g_Home / "db/pg.sqlite").c_str(), config.dbPath.c_str());
    TEST_ASSERT_EQUAL_size_t(8, config.registrationCeiling);
    TEST_ASSERT_EQUAL_INT64(120, config.guard.count());
    TEST_ASSERT_EQUAL_INT(3, config.recordRetentionDays);
    TEST_ASSERT_EQUAL_size_t(1, config.categories.size());
    TEST_ASSERT_EQUAL_size_t(2, config.categories.at("social").size());
    TEST_ASSERT_TRUE(std::filesystem::is_directory(g_Home / "db"));
}

void test_unknown_log_level_falls_back_to_info(void) {
    const Config config = LoadConfig(WriteConfig(R"({"log_level": "chatty"})"));
    TEST_ASSERT_EQUAL(LOG_INFO, config.logLevel);
}

void test_bad_files_are_rejected(void) {
    TEST_ASSERT_TRUE(Rejects("{ not json"));
    TEST_ASSERT_TRUE(Rejects("[1, 2, 3]"));
    TEST_ASSERT_TRUE(Rejects(R"({"registration_ceiling": 0})"));
    TEST_ASSERT_TRUE(Rejects(R"({"categories": ["social"]})"));
    TEST_ASSERT_FALSE(Rejects("{}"));
}

void test_log_level_names(void) {
    TEST_ASSERT_EQUAL(LOG_DEBUG, *LogLevelFromString("debug"));
    TEST_ASSERT_EQUAL(LOG_INFO, *LogLevelFromString("info"));
    TEST_ASSERT_EQUAL(LOG_OFF, *LogLevelFromString("off"));
    TEST_ASSERT_FALSE(LogLevelFromString("verbose").has_value());
}

// ============================================================================
// RUNNER
// ============================================================================
int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_missing_file_gives_defaults);
    RUN_TEST(test_xdg_variables_take_precedence);
    RUN_TEST(test_overrides_are_read);
    RUN_TEST(test_unknown_log_level_falls_back_to_info);
    RUN_TEST(test_bad_files_are_rejected);
    RUN_TEST(test_log_level_names);
    return UNITY_END();
}
