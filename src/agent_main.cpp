#include "agent.hpp"
#include "config.hpp"
#include "notification.hpp"
#include "shared_state.hpp"
#include "shield.hpp"
#include "store.hpp"

#include <chrono>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

// Invoked by the systemd user timers: prayerguard-agent <event> <windowId>.
// Always exits 0. A failed callback is logged to the journal and never retried.
int main(int argc, char **argv) {
    if (argc != 3) {
        std::cerr << "Usage: prayerguard-agent start|end|warn-start|warn-end <windowId>\n";
        return 0;
    }

    const auto event = EventFromString(argv[1]);
    const std::string windowId = argv[2];
    if (!event) {
        spdlog::error("Agent: unknown event '{}' for {}", argv[1], windowId);
        return 0;
    }

    try {
        const Config config = LoadConfig(DefaultConfigPath());
        ApplyLogLevel(config.logLevel);

        StateStore store(config.dbPath.string(), ROLE_AGENT);
        SharedState state(store);
        ShieldFile shield(config.shieldPath);
        StoreSelectionProvider selection(state);
        Notification notification;

        const TimePoint now = Now();
        EnforcementAgent agent(state, shield, selection, notification);
        if (!agent.Handle(*event, windowId, now)) {
            spdlog::warn("Agent: {} {} left state unchanged", EventToString(*event), windowId);
        }

        state.PruneRecords(now, std::chrono::days{config.recordRetentionDays});
    } catch (const std::exception &e) {
        spdlog::error("Agent: {} {} failed: {}", argv[1], windowId, e.what());
    }
    return 0;
}
