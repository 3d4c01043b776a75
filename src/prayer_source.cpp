#include "prayer_source.hpp"

#include "json.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
JsonPrayerTimeSource::JsonPrayerTimeSource(std::filesystem::path path,
                                           const std::chrono::time_zone *zone)
    : m_Path(std::move(path)), m_Zone(zone ? zone : std::chrono::current_zone()) {}

// ─────────────────────────────────────
std::optional<std::chrono::local_seconds>
JsonPrayerTimeSource::ParseLocalTime(const std::string &text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    char sep = 0;
    const int n = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d", &y, &mo, &d, &sep, &h,
                              &mi, &s);
    if (n < 6 || (sep != 'T' && sep != ' ')) {
        return std::nullopt;
    }
    if (h < 0 || h > 23 || mi < 0 || mi > 59 || s < 0 || s > 60) {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{std::chrono::year{y},
                                          std::chrono::month{static_cast<unsigned>(mo)},
                                          std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    return std::chrono::local_days{ymd} + std::chrono::hours{h} + std::chrono::minutes{mi} +
           std::chrono::seconds{s};
}

// ─────────────────────────────────────
std::vector<PrayerOccurrence> JsonPrayerTimeSource::Upcoming(TimePoint now) {
    std::vector<PrayerOccurrence> out;

    std::ifstream in(m_Path);
    if (!in) {
        spdlog::warn("Prayer times file {} not found", m_Path.string());
        return out;
    }

    nlohmann::json root;
    try {
        in >> root;
    } catch (const std::exception &e) {
        spdlog::error("Prayer times file {} is not valid JSON: {}", m_Path.string(), e.what());
        return out;
    }

    const nlohmann::json &list =
        root.is_object() && root.contains("prayers") ? root["prayers"] : root;
    if (!list.is_array()) {
        spdlog::error("Prayer times file {} has no prayer list", m_Path.string());
        return out;
    }

    JsonParse parse;
    for (const auto &item : list) {
        const std::string name = parse.GetString(item, "name", "");
        const std::string time = parse.GetString(item, "time", "");
        auto local = ParseLocalTime(time);
        if (name.empty() || !local) {
            spdlog::warn("Ignoring prayer entry '{}' at '{}'", name, time);
            continue;
        }

        // A wall time skipped by a DST jump maps to the instant the jump happens.
        const TimePoint sys = std::chrono::floor<Seconds>(
            m_Zone->to_sys(*local, std::chrono::choose::earliest));

        if (sys < now) {
            continue;
        }

        PrayerOccurrence occ;
        occ.name = name;
        occ.time = sys;
        occ.localDate = std::chrono::year_month_day{std::chrono::floor<std::chrono::days>(*local)};
        out.push_back(std::move(occ));
    }

    std::sort(out.begin(), out.end(), [](const PrayerOccurrence &a, const PrayerOccurrence &b) {
        return a.time < b.time;
    });
    spdlog::debug("Loaded {} upcoming prayer times from {}", out.size(), m_Path.string());
    return out;
}
