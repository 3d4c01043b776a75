#include "config.hpp"
#include "prayerguard.hpp"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>
#include <signal.h>

namespace {

// ─────────────────────────────────────
void PrintUsage() {
    std::cerr << "Usage: prayerguard [--config <path>] [--log-level debug|info|off] <command>\n"
                 "\n"
                 "Commands:\n"
                 "  run                               run the daemon\n"
                 "  plan                              re-plan and register windows now\n"
                 "  status                            show the blocking session\n"
                 "  confirm                           end a strict-mode wait\n"
                 "  unlock                            early unlock (normal mode)\n"
                 "  mode normal|strict\n"
                 "  enable|disable <Prayer>           Fajr, Dhuhr, Asr, Maghrib, Isha\n"
                 "  duration <minutes>\n"
                 "  buffer <minutes>                  start windows before the prayer\n"
                 "  select|deselect app|category|domain <token>\n";
}

// ─────────────────────────────────────
bool ParseMinutes(const std::string &text, int min, int &out) {
    try {
        std::size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size() || value < min) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

// ─────────────────────────────────────
void ReplanAfterChange(PrayerGuard &guard) {
    try {
        const RegistrationReport report = guard.Replan(Now());
        std::cout << "Re-planned: " << report.registered.size() << " registered, "
                  << report.unregistered.size() << " unregistered\n";
    } catch (const std::exception &e) {
        std::cerr << "Saved, but re-planning failed: " << e.what() << "\n";
    }
}

// ─────────────────────────────────────
void PrintStatus(PrayerGuard &guard) {
    const TimePoint now = Now();
    const BlockingSession session = guard.Status(now);
    const StateSnapshot snapshot = guard.State().ReadSnapshot();

    std::cout << "Phase:     " << PhaseToString(session.phase) << "\n";
    std::cout << "Mode:      " << ModeToString(snapshot.mode) << "\n";
    if (!session.windowId.empty()) {
        std::cout << "Window:    " << session.windowId << " (" << session.prayerName << ")\n";
    }
    if (session.endTime) {
        std::cout << "Ends:      " << FormatTime(*session.endTime) << "\n";
    }
    if (session.isBlocking) {
        std::cout << "Remaining: " << session.timeRemaining.count() / 60 << "m "
                  << session.timeRemaining.count() % 60 << "s\n";
    }
    if (session.isWaitingConfirmation) {
        std::cout << "Waiting for confirmation (prayerguard confirm)\n";
    }
    if (session.earlyUnlockAvailable) {
        std::cout << "Early unlock available (prayerguard unlock)\n";
    } else if (session.earlyUnlockAvailableIn.count() > 0) {
        std::cout << "Early unlock in " << session.earlyUnlockAvailableIn.count() << "s\n";
    }

    std::cout << "Selection: " << snapshot.selection.applications.size() << " apps, "
              << snapshot.selection.categories.size() << " categories, "
              << snapshot.selection.webDomains.size() << " domains\n";

    std::cout << "Planned:\n";
    if (snapshot.plannedWindows.empty()) {
        std::cout << "  (none)\n";
    }
    for (const auto &w : snapshot.plannedWindows) {
        std::cout << "  " << w.prayerName << "  " << FormatTime(w.startTime) << "  "
                  << w.duration.count() / 60 << "m\n";
    }

    if (snapshot.needsAuthorization.active) {
        std::cout << "Needs authorization since " << FormatTime(snapshot.needsAuthorization.at)
                  << ": " << snapshot.needsAuthorization.reason << "\n";
    }
    if (snapshot.noSelectionWarning.active) {
        std::cout << "Nothing was selected at " << FormatTime(snapshot.noSelectionWarning.at)
                  << " (" << snapshot.noSelectionWarning.windowId << ")\n";
    }
}

// ─────────────────────────────────────
int EditSelection(PrayerGuard &guard, bool add, const std::string &kind,
                  const std::string &token) {
    TokenSet selection = guard.State().Selection();
    std::set<std::string> *group = nullptr;
    if (kind == "app") {
        group = &selection.applications;
    } else if (kind == "category") {
        group = &selection.categories;
    } else if (kind == "domain") {
        group = &selection.webDomains;
    } else {
        std::cerr << "Unknown selection kind '" << kind << "'\n";
        return 1;
    }

    if (add) {
        group->insert(token);
    } else {
        group->erase(token);
    }
    guard.State().SetSelection(selection);
    std::cout << "Selection: " << selection.Size() << " tokens\n";
    return 0;
}

// ─────────────────────────────────────
int RunDaemon(PrayerGuard &guard) {
    // SIGINT/SIGTERM are delivered to one waiting thread only.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::atomic<bool> signalled{false};
    std::thread waiter([&guard, &signalled, signals]() {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            signalled.store(true);
            spdlog::info("Received signal {}, shutting down", sig);
            guard.RequestShutdown();
        }
    });

    auto stopWaiter = [&]() {
        if (!signalled.load()) {
            pthread_kill(waiter.native_handle(), SIGTERM);
        }
        waiter.join();
    };

    try {
        guard.Run();
    } catch (...) {
        stopWaiter();
        throw;
    }
    stopWaiter();
    return 0;
}

// ─────────────────────────────────────
int Dispatch(PrayerGuard &guard, const std::vector<std::string> &args) {
    const std::string &cmd = args[0];
    const TimePoint now = Now();

    if (cmd == "run") {
        return RunDaemon(guard);
    }
    if (cmd == "plan") {
        const RegistrationReport report = guard.Replan(now);
        std::cout << "Registered " << report.registered.size() << ", unregistered "
                  << report.unregistered.size() << ", kept " << report.kept.size()
                  << ", rejected " << report.rejected.size() << "\n";
        if (report.needsAuthorization) {
            std::cout << "The systemd user manager refused registration\n";
        }
        return 0;
    }
    if (cmd == "status") {
        PrintStatus(guard);
        return 0;
    }
    if (cmd == "confirm") {
        if (guard.Confirm(now)) {
            std::cout << "Confirmed, restrictions lifted\n";
        } else {
            std::cout << "Nothing is waiting for confirmation\n";
        }
        return 0;
    }
    if (cmd == "unlock") {
        if (guard.RequestEarlyUnlock(now)) {
            std::cout << "Unlocked early\n";
        } else {
            const BlockingSession session = guard.Status(now);
            std::cout << "Early unlock not available";
            if (session.earlyUnlockAvailableIn.count() > 0) {
                std::cout << " for another " << session.earlyUnlockAvailableIn.count() << "s";
            }
            std::cout << "\n";
        }
        return 0;
    }

    if (args.size() < 2) {
        PrintUsage();
        return 1;
    }

    if (cmd == "mode") {
        auto mode = ModeFromString(args[1]);
        if (!mode) {
            std::cerr << "Mode must be normal or strict\n";
            return 1;
        }
        guard.State().SetMode(*mode);
        std::cout << "Mode: " << ModeToString(*mode) << "\n";
        return 0;
    }
    if (cmd == "enable" || cmd == "disable") {
        if (!IsCanonicalPrayer(args[1])) {
            std::cerr << "Unknown prayer '" << args[1] << "'\n";
            return 1;
        }
        FocusSettings settings = guard.State().Settings();
        settings.enabled[args[1]] = cmd == "enable";
        guard.State().SetSettings(settings);
        ReplanAfterChange(guard);
        return 0;
    }
    if (cmd == "duration" || cmd == "buffer") {
        int minutes = 0;
        if (!ParseMinutes(args[1], cmd == "duration" ? 1 : 0, minutes)) {
            std::cerr << "Invalid number of minutes '" << args[1] << "'\n";
            return 1;
        }
        FocusSettings settings = guard.State().Settings();
        if (cmd == "duration") {
            settings.duration = std::chrono::minutes{minutes};
            if (settings.duration < PrayerWindowPlanner::kMinimumDuration) {
                std::cout << "Windows last at least "
                          << PrayerWindowPlanner::kMinimumDuration.count() / 60 << " minutes\n";
            }
        } else {
            settings.prePrayerBuffer = std::chrono::minutes{minutes};
        }
        guard.State().SetSettings(settings);
        ReplanAfterChange(guard);
        return 0;
    }
    if (cmd == "select" || cmd == "deselect") {
        if (args.size() < 3) {
            PrintUsage();
            return 1;
        }
        return EditSelection(guard, cmd == "select", args[1], args[2]);
    }

    PrintUsage();
    return 1;
}

} // namespace

// ─────────────────────────────────────
int main(int argc, char **argv) {
    std::filesystem::path configPath;
    std::optional<LogLevel> cliLevel;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return 0;
        }
        if ((arg == "--config" || arg == "--log-level") && i + 1 >= argc) {
            std::cerr << arg << " needs a value\n";
            return 1;
        }
        if (arg == "--config") {
            configPath = argv[++i];
        } else if (arg == "--log-level") {
            cliLevel = LogLevelFromString(argv[++i]);
            if (!cliLevel) {
                std::cerr << "Log level must be debug, info or off\n";
                return 1;
            }
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        PrintUsage();
        return 1;
    }

    try {
        if (cliLevel) {
            ApplyLogLevel(*cliLevel);
        }
        const Config config = LoadConfig(configPath.empty() ? DefaultConfigPath() : configPath);
        ApplyLogLevel(cliLevel ? *cliLevel : config.logLevel);

        PrayerGuard guard(config);
        return Dispatch(guard, args);
    } catch (const std::exception &e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
