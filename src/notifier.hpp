#pragma once

#include <string>

class Notifier {
  public:
    virtual ~Notifier() = default;
    virtual void Notify(const std::string &icon, const std::string &summary,
                        const std::string &body) = 0;
};
