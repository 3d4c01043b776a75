#include "json.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
int JsonParse::GetInt(const nlohmann::json &j, const std::string &key, int fallback) const {
    return static_cast<int>(GetInt64(j, key, fallback));
}

// ─────────────────────────────────────
int64_t JsonParse::GetInt64(const nlohmann::json &j, const std::string &key,
                            int64_t fallback) const {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (j.at(key).is_number_integer()) {
        return j.at(key).get<int64_t>();
    }
    if (j.at(key).is_number()) {
        int64_t val = static_cast<int64_t>(j.at(key).get<double>());
        spdlog::debug("JsonParse: Converted double to int for key '{}': {}", key, val);
        return val;
    }
    spdlog::warn("JsonParse: Key '{}' is not a number, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
double JsonParse::GetDouble(const nlohmann::json &j, const std::string &key,
                            double fallback) const {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (j.at(key).is_number()) {
        return j.at(key).get<double>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a number, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
bool JsonParse::GetBool(const nlohmann::json &j, const std::string &key, bool fallback) const {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (j.at(key).is_boolean()) {
        return j.at(key).get<bool>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a boolean, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key,
                                 const std::string &fallback) const {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback '{}'", key, fallback);
        return fallback;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a string, using fallback '{}'", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::vector<std::string> JsonParse::JsonArray2String(const nlohmann::json &arr) const {
    std::vector<std::string> out;
    if (!arr.is_array()) {
        spdlog::warn("JsonParse: Expected array, got {}", arr.type_name());
        return out;
    }
    for (const auto &v : arr) {
        if (v.is_string()) {
            out.push_back(v.get<std::string>());
        } else {
            spdlog::warn("JsonParse: Array element is not string, skipping");
        }
    }
    return out;
}

// ─────────────────────────────────────
std::set<std::string> JsonParse::JsonArray2Set(const nlohmann::json &arr) const {
    std::vector<std::string> items = JsonArray2String(arr);
    return std::set<std::string>(items.begin(), items.end());
}
