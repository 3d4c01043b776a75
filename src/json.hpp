#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class JsonParse {
  public:
    int GetInt(const nlohmann::json &j, const std::string &key, int fallback) const;
    int64_t GetInt64(const nlohmann::json &j, const std::string &key, int64_t fallback) const;
    double GetDouble(const nlohmann::json &j, const std::string &key, double fallback) const;
    bool GetBool(const nlohmann::json &j, const std::string &key, bool fallback) const;
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback) const;
    std::vector<std::string> JsonArray2String(const nlohmann::json &arr) const;
    std::set<std::string> JsonArray2Set(const nlohmann::json &arr) const;
};
