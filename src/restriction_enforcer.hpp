#pragma once

#include "common.hpp"

// Host facility that actually restricts applications. Last call wins; both calls are
// idempotent.
class RestrictionEnforcer {
  public:
    virtual ~RestrictionEnforcer() = default;

    virtual void Apply(const TokenSet &tokens) = 0;
    virtual void Clear() = 0;
    virtual TokenSet Current() = 0;
};
