#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "common.hpp"

class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct Config {
    LogLevel logLevel = LOG_INFO;
    std::filesystem::path dbPath;
    std::filesystem::path prayerTimesPath;
    std::filesystem::path shieldPath;
    std::filesystem::path unitDir;
    std::filesystem::path agentPath;

    std::size_t registrationCeiling = 20;
    Seconds guard{60};
    Seconds preStartWarning{60};
    Seconds preEndWarning{60};
    int recordRetentionDays = 14;
    std::chrono::minutes replanInterval{60};
    Seconds observerFallback{30};

    CategoryMap categories;
};

// $XDG_CONFIG_HOME/prayerguard/config.json
std::filesystem::path DefaultConfigPath();

// Missing file -> defaults. Unreadable or non-object JSON -> ConfigError.
Config LoadConfig(const std::filesystem::path &path);

std::optional<LogLevel> LogLevelFromString(const std::string &s);
void ApplyLogLevel(LogLevel level);
