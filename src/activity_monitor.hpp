#pragma once

#include <cstddef>
#include <string>

#include "common.hpp"

enum RegisterStatus { REGISTER_OK = 0, REGISTER_CEILING, REGISTER_UNAUTHORIZED, REGISTER_FAILED };

const char *RegisterStatusToString(RegisterStatus status);

// Host scheduler that calls the enforcement agent back at window boundaries.
class ActivityMonitor {
  public:
    virtual ~ActivityMonitor() = default;

    // Registering an id that is already registered replaces it.
    virtual RegisterStatus Register(const PrayerWindow &window, std::string &error) = 0;
    virtual bool Unregister(const std::string &windowId, std::string &error) = 0;
    virtual std::size_t Ceiling() const = 0;
};
