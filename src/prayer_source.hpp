#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common.hpp"

class PrayerTimeSource {
  public:
    virtual ~PrayerTimeSource() = default;

    // Occurrences at or after now, ascending.
    virtual std::vector<PrayerOccurrence> Upcoming(TimePoint now) = 0;
};

// Reads prayer times computed by an external calculator:
//   [{"name": "Fajr", "time": "2026-03-01T05:12"}, ...]
// or the same array under a "prayers" key. Times are wall-clock in the given zone.
class JsonPrayerTimeSource : public PrayerTimeSource {
  public:
    explicit JsonPrayerTimeSource(std::filesystem::path path,
                                  const std::chrono::time_zone *zone = nullptr);

    std::vector<PrayerOccurrence> Upcoming(TimePoint now) override;

    static std::optional<std::chrono::local_seconds> ParseLocalTime(const std::string &text);

  private:
    std::filesystem::path m_Path;
    const std::chrono::time_zone *m_Zone;
};
