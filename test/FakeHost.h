/*
 * File: test/FakeHost.h
 * Description: Spy implementations of the host ports and a throwaway two-connection store.
 */
#pragma once

#include "activity_monitor.hpp"
#include "agent.hpp"
#include "blocking_state.hpp"
#include "notifier.hpp"
#include "restriction_enforcer.hpp"
#include "selection_provider.hpp"
#include "shared_state.hpp"
#include "store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <vector>

#include <unistd.h>

// --- Time helpers ---

// 2026-03-01 hh:mm:00 UTC
inline TimePoint At(int hour, int minute, int second = 0) {
    using namespace std::chrono;
    return sys_days{year{2026} / March / 1} + hours{hour} + minutes{minute} + seconds{second};
}

inline TimePoint NextDayAt(int hour, int minute) {
    return At(hour, minute) + std::chrono::hours{24};
}

inline PrayerOccurrence Occurrence(const std::string &name, TimePoint time) {
    const auto day = std::chrono::floor<std::chrono::days>(time);
    return {name, time, std::chrono::year_month_day{day}};
}

inline PrayerWindow Window(const std::string &prayer, TimePoint start, int minutes = 15) {
    PrayerWindow w;
    w.id = MakeWindowId(prayer, start);
    w.prayerName = prayer;
    w.startTime = start;
    w.duration = std::chrono::minutes{minutes};
    return w;
}

// --- Ports ---

class FakeActivityMonitor : public ActivityMonitor {
  public:
    // Spy
    std::vector<std::string> registered;
    std::vector<std::string> registerCalls;
    std::vector<std::string> unregisterCalls;

    // Simulation
    std::size_t ceiling = 20;
    RegisterStatus refuseWith = REGISTER_OK;
    std::set<std::string> failing;
    bool failUnregister = false;

    RegisterStatus Register(const PrayerWindow &window, std::string &error) override {
        registerCalls.push_back(window.id);
        if (refuseWith != REGISTER_OK) {
            error = "refused by fake host";
            return refuseWith;
        }
        if (failing.count(window.id) > 0) {
            error = "fake failure";
            return REGISTER_FAILED;
        }
        if (!IsRegistered(window.id)) {
            registered.push_back(window.id);
        }
        return REGISTER_OK;
    }

    bool Unregister(const std::string &windowId, std::string &error) override {
        unregisterCalls.push_back(windowId);
        if (failUnregister) {
            error = "fake unregister failure";
            return false;
        }
        registered.erase(std::remove(registered.begin(), registered.end(), windowId),
                         registered.end());
        return true;
    }

    std::size_t Ceiling() const override {
        return ceiling;
    }

    bool IsRegistered(const std::string &id) const {
        return std::find(registered.begin(), registered.end(), id) != registered.end();
    }
};

class FakeEnforcer : public RestrictionEnforcer {
  public:
    TokenSet applied;
    int applyCalls = 0;
    int clearCalls = 0;

    // Each runs once, right after the next Apply / Clear.
    std::function<void()> afterApply;
    std::function<void()> afterClear;

    void Apply(const TokenSet &tokens) override {
        applied = tokens;
        ++applyCalls;
        if (afterApply) {
            auto hook = std::move(afterApply);
            afterApply = nullptr;
            hook();
        }
    }

    void Clear() override {
        applied = TokenSet{};
        ++clearCalls;
        if (afterClear) {
            auto hook = std::move(afterClear);
            afterClear = nullptr;
            hook();
        }
    }

    TokenSet Current() override {
        return applied;
    }

    bool Active() const {
        return !applied.Empty();
    }
};

class FakeSelection : public SelectionProvider {
  public:
    TokenSet tokens;

    TokenSet CurrentSelection() override {
        return tokens;
    }
};

class FakeNotifier : public Notifier {
  public:
    std::vector<std::string> summaries;

    void Notify(const std::string &, const std::string &summary, const std::string &) override {
        summaries.push_back(summary);
    }
};

// --- Store ---

// Unique database file under the temp dir, removed with its WAL side files.
class TempDb {
  public:
    TempDb() {
        static std::atomic<int> counter{0};
        m_Path = std::filesystem::temp_directory_path() /
                 ("prayerguard-test-" + std::to_string(::getpid()) + "-" +
                  std::to_string(counter.fetch_add(1)) + ".sqlite");
        Remove();
    }
    ~TempDb() {
        Remove();
    }

    std::string Path() const {
        return m_Path.string();
    }

  private:
    void Remove() {
        std::error_code ec;
        for (const char *suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(m_Path.string() + suffix, ec);
        }
    }

    std::filesystem::path m_Path;
};

// Both processes on one database: the daemon side and the agent side, sharing one enforcer the
// way both processes share the shield file.
struct TwoProcessHost {
    TempDb db;
    StateStore mainStore{db.Path(), ROLE_MAIN};
    StateStore agentStore{db.Path(), ROLE_AGENT};
    SharedState mainSide{mainStore};
    SharedState agentSide{agentStore};

    FakeEnforcer enforcer;
    FakeSelection selection;
    FakeNotifier notifier;

    EnforcementAgent agent{agentSide, enforcer, selection, notifier};
    BlockingController controller{mainSide, enforcer};

    void Plan(const std::vector<PrayerWindow> &windows) {
        mainSide.SetPlannedWindows(windows);
    }

    void Select(const std::string &app) {
        selection.tokens.applications.insert(app);
    }

    bool Start(const PrayerWindow &w, TimePoint now) {
        return agent.Handle(EVENT_INTERVAL_START, w.id, now);
    }

    bool End(const PrayerWindow &w, TimePoint now) {
        return agent.Handle(EVENT_INTERVAL_END, w.id, now);
    }
};
