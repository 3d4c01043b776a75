#include "config.hpp"

#include "json.hpp"

#include <algorithm>
#include <fstream>
#include <limits.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace {

// ─────────────────────────────────────
std::filesystem::path XdgDir(const char *env, const std::filesystem::path &fallback) {
    const char *value = std::getenv(env);
    if (value && *value) {
        return value;
    }
    const char *home = std::getenv("HOME");
    if (!home || !*home) {
        throw ConfigError("HOME environment variable not set");
    }
    return std::filesystem::path(home) / fallback;
}

// ─────────────────────────────────────
std::filesystem::path DefaultAgentPath() {
    char buf[PATH_MAX];
    const ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len == -1) {
        return "prayerguard-agent";
    }
    buf[len] = '\0';
    return std::filesystem::path(buf).parent_path() / "prayerguard-agent";
}

// ─────────────────────────────────────
std::filesystem::path PathOr(const nlohmann::json &j, const std::string &key,
                             const std::filesystem::path &fallback) {
    JsonParse parse;
    const std::string value = parse.GetString(j, key, "");
    if (value.empty()) {
        return fallback;
    }
    if (value.rfind("~/", 0) == 0) {
        if (const char *home = std::getenv("HOME")) {
            return std::filesystem::path(home) / value.substr(2);
        }
    }
    return value;
}

} // namespace

// ─────────────────────────────────────
std::filesystem::path DefaultConfigPath() {
    return XdgDir("XDG_CONFIG_HOME", ".config") / "prayerguard" / "config.json";
}

// ─────────────────────────────────────
std::optional<LogLevel> LogLevelFromString(const std::string &s) {
    if (s == "debug") {
        return LOG_DEBUG;
    }
    if (s == "info") {
        return LOG_INFO;
    }
    if (s == "off") {
        return LOG_OFF;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
void ApplyLogLevel(LogLevel level) {
    if (level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
}

// ─────────────────────────────────────
Config LoadConfig(const std::filesystem::path &path) {
    nlohmann::json j = nlohmann::json::object();

    std::ifstream in(path);
    if (in) {
        try {
            in >> j;
        } catch (const std::exception &e) {
            throw ConfigError("config " + path.string() + " is not valid JSON: " + e.what());
        }
        if (!j.is_object()) {
            throw ConfigError("config " + path.string() + " must be a JSON object");
        }
        spdlog::debug("Config loaded from {}", path.string());
    } else {
        spdlog::debug("No config at {}, using defaults", path.string());
    }

    JsonParse parse;
    Config config;

    const std::string level = parse.GetString(j, "log_level", "info");
    if (auto parsed = LogLevelFromString(level)) {
        config.logLevel = *parsed;
    } else {
        spdlog::warn("Config: unknown log_level '{}', using info", level);
    }

    const auto dataDir = XdgDir("XDG_DATA_HOME", ".local/share") / "prayerguard";
    const auto stateDir = XdgDir("XDG_STATE_HOME", ".local/state") / "prayerguard";
    const auto configHome = XdgDir("XDG_CONFIG_HOME", ".config");

    config.dbPath = PathOr(j, "db_path", dataDir / "state.sqlite");
    config.prayerTimesPath = PathOr(j, "prayer_times_path", dataDir / "prayer-times.json");
    config.shieldPath = PathOr(j, "shield_path", stateDir / "shield.json");
    config.unitDir = PathOr(j, "unit_dir", configHome / "systemd" / "user");
    config.agentPath = PathOr(j, "agent_path", DefaultAgentPath());

    const int ceiling = parse.GetInt(j, "registration_ceiling", 20);
    if (ceiling < 1) {
        throw ConfigError("registration_ceiling must be at least 1");
    }
    config.registrationCeiling = static_cast<std::size_t>(ceiling);

    config.guard = Seconds{std::max(0, parse.GetInt(j, "guard_seconds", 60))};
    config.preStartWarning =
        Seconds{std::max(0, parse.GetInt(j, "pre_start_warning_seconds", 60))};
    config.preEndWarning =
        Seconds{std::max(0, parse.GetInt(j, "pre_end_warning_seconds", 60))};
    config.recordRetentionDays = std::max(1, parse.GetInt(j, "record_retention_days", 14));
    config.replanInterval =
        std::chrono::minutes{std::max(1, parse.GetInt(j, "replan_interval_minutes", 60))};
    config.observerFallback =
        Seconds{std::max(1, parse.GetInt(j, "observer_fallback_seconds", 30))};

    if (j.contains("categories")) {
        if (!j["categories"].is_object()) {
            throw ConfigError("categories must map names to lists of app ids");
        }
        for (const auto &item : j["categories"].items()) {
            config.categories[item.key()] = parse.JsonArray2String(item.value());
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(config.dbPath.parent_path(), ec);
    if (ec) {
        throw ConfigError("cannot create " + config.dbPath.parent_path().string() + ": " +
                          ec.message());
    }

    return config;
}
