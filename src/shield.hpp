#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "common.hpp"
#include "niri.hpp"
#include "restriction_enforcer.hpp"

struct ShieldState {
    bool active = false;
    TokenSet tokens;
    TimePoint updatedAt;
};

// Durable shield state shared by both processes through a small JSON file. Writes go to a
// temporary file first and are renamed into place, so readers never see a torn file.
class ShieldFile : public RestrictionEnforcer {
  public:
    explicit ShieldFile(std::filesystem::path path);

    void Apply(const TokenSet &tokens) override;
    void Clear() override;
    TokenSet Current() override;

    ShieldState Load() const;
    const std::filesystem::path &Path() const {
        return m_Path;
    }

  private:
    void Save(const ShieldState &state);

  private:
    std::filesystem::path m_Path;
};

// Decides whether a compositor window falls under the applied tokens.
class ShieldPolicy {
  public:
    ShieldPolicy(const TokenSet &tokens, const CategoryMap &categories);

    bool Blocks(const std::string &appId, const std::string &title) const;
    bool Empty() const;

  private:
    std::vector<std::string> m_AppIds;
    std::vector<std::string> m_Domains;
};

// Closes windows of shielded apps while a shield is active. Reacts to the niri event stream
// and to explicit Enforce() calls from the daemon loop.
class ShieldWatcher {
  public:
    ShieldWatcher(ShieldFile &shield, CategoryMap categories);
    ~ShieldWatcher();

    ShieldWatcher(const ShieldWatcher &) = delete;
    ShieldWatcher &operator=(const ShieldWatcher &) = delete;

    bool Start();
    void Stop();

    // Windows are only closed while enabled, i.e. while a blocking session is active.
    void SetEnabled(bool enabled);
    bool Enabled() const;

    // Returns the number of windows closed.
    std::size_t Enforce();

  private:
    ShieldFile &m_Shield;
    CategoryMap m_Categories;
    NiriIPC m_Niri;
    std::mutex m_Mutex;
    std::atomic<bool> m_Enabled{false};
    std::atomic<bool> m_WarnedUnavailable{false};
};
