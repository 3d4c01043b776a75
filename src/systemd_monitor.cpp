#include "systemd_monitor.hpp"

#include <ctime>
#include <fstream>
#include <vector>

#include <spdlog/spdlog.h>

namespace {
constexpr const char *kUnitPrefix = "prayerguard-";

// ─────────────────────────────────────
std::string FormatCalendarUtc(TimePoint at) {
    const std::time_t t = static_cast<std::time_t>(ToUnix(at));
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &utc);
    return std::string(buf) + " UTC";
}

// ─────────────────────────────────────
bool IsAuthorizationError(const std::string &name) {
    return name == "org.freedesktop.DBus.Error.AccessDenied" ||
           name == "org.freedesktop.DBus.Error.InteractiveAuthorizationRequired" ||
           name == "org.freedesktop.systemd1.UnitMasked";
}
} // namespace

// ─────────────────────────────────────
SystemdActivityMonitor::SystemdActivityMonitor(SystemdMonitorOptions options)
    : m_Options(std::move(options)) {
    std::error_code ec;
    std::filesystem::create_directories(m_Options.unitDir, ec);
    if (ec) {
        spdlog::error("Failed to create unit directory {}: {}", m_Options.unitDir.string(),
                      ec.message());
    }
}

// ─────────────────────────────────────
SystemdActivityMonitor::~SystemdActivityMonitor() {
    if (m_Conn) {
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
    }
}

// ─────────────────────────────────────
std::size_t SystemdActivityMonitor::Ceiling() const {
    return m_Options.ceiling;
}

// ─────────────────────────────────────
bool SystemdActivityMonitor::Connect(std::string &error) {
    if (m_Conn) {
        return true;
    }

    DBusError err;
    dbus_error_init(&err);
    m_Conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err) || !m_Conn) {
        error = std::string("session bus unavailable: ") +
                (dbus_error_is_set(&err) ? err.message : "unknown");
        spdlog::error("Failed to connect to session bus: {}", error);
        dbus_error_free(&err);
        m_Conn = nullptr;
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool SystemdActivityMonitor::CallManager(const char *method, const std::string &unit,
                                         std::string &error, std::string &errorName) {
    errorName.clear();
    if (!Connect(error)) {
        return false;
    }

    DBusMessage *msg = dbus_message_new_method_call(
        "org.freedesktop.systemd1", "/org/freedesktop/systemd1",
        "org.freedesktop.systemd1.Manager", method);
    if (!msg) {
        error = "failed to create DBus message";
        return false;
    }

    if (!unit.empty()) {
        const char *unit_c = unit.c_str();
        const char *mode_c = "replace";
        dbus_message_append_args(msg, DBUS_TYPE_STRING, &unit_c, DBUS_TYPE_STRING, &mode_c,
                                 DBUS_TYPE_INVALID);
    }

    DBusError err;
    dbus_error_init(&err);
    DBusMessage *reply = dbus_connection_send_with_reply_and_block(m_Conn, msg, 5000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        errorName = err.name ? err.name : "";
        error = std::string(method) + " " + unit + ": " + (err.message ? err.message : "");
        dbus_error_free(&err);
        return false;
    }

    if (reply) {
        dbus_message_unref(reply);
    }
    return true;
}

// ─────────────────────────────────────
std::string SystemdActivityMonitor::UnitBaseName(AgentEvent event, const std::string &windowId) {
    return std::string(kUnitPrefix) + EventToString(event) + "-" + windowId;
}

// ─────────────────────────────────────
std::string SystemdActivityMonitor::TimerUnit(const std::string &base, TimePoint at) {
    std::string unit;
    unit += "[Unit]\n";
    unit += "Description=prayerguard timer " + base + "\n\n";
    unit += "[Timer]\n";
    unit += "OnCalendar=" + FormatCalendarUtc(at) + "\n";
    unit += "AccuracySec=1s\n";
    unit += "Persistent=true\n";
    unit += "Unit=" + base + ".service\n";
    return unit;
}

// ─────────────────────────────────────
std::string SystemdActivityMonitor::ServiceUnit(AgentEvent event,
                                                const std::string &windowId) const {
    std::string unit;
    unit += "[Unit]\n";
    unit += "Description=prayerguard " + std::string(EventToString(event)) + " for " + windowId +
            "\n\n";
    unit += "[Service]\n";
    unit += "Type=oneshot\n";
    unit += "ExecStart=\"" + m_Options.agentPath.string() + "\" " + EventToString(event) + " " +
            windowId + "\n";
    return unit;
}

// ─────────────────────────────────────
bool SystemdActivityMonitor::WriteUnit(const std::string &name, const std::string &content,
                                       std::string &error) {
    const std::filesystem::path path = m_Options.unitDir / name;
    const std::filesystem::path tmp = m_Options.unitDir / (name + ".tmp");

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            error = "cannot write " + tmp.string();
            return false;
        }
        out << content;
        if (!out.good()) {
            error = "short write to " + tmp.string();
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        error = "cannot install " + path.string() + ": " + ec.message();
        return false;
    }
    return true;
}

// ─────────────────────────────────────
std::size_t SystemdActivityMonitor::CountRegistered(const std::string &exceptId) const {
    const std::string prefix =
        std::string(kUnitPrefix) + EventToString(EVENT_INTERVAL_START) + "-";
    const std::string skip = UnitBaseName(EVENT_INTERVAL_START, exceptId) + ".timer";

    std::size_t count = 0;
    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator(m_Options.unitDir, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind(prefix, 0) == 0 && entry.path().extension() == ".timer" && name != skip) {
            ++count;
        }
    }
    return count;
}

// ─────────────────────────────────────
RegisterStatus SystemdActivityMonitor::Register(const PrayerWindow &window, std::string &error) {
    if (CountRegistered(window.id) >= m_Options.ceiling) {
        error = "already " + std::to_string(m_Options.ceiling) + " windows registered";
        return REGISTER_CEILING;
    }

    struct Planned {
        AgentEvent event;
        TimePoint at;
    };
    std::vector<Planned> timers;
    timers.push_back({EVENT_INTERVAL_START, window.startTime});
    timers.push_back({EVENT_INTERVAL_END, window.EndTime()});

    const TimePoint now = Now();
    const TimePoint warnStart = window.startTime - m_Options.preStartWarning;
    if (m_Options.preStartWarning > Seconds{0} && warnStart > now) {
        timers.push_back({EVENT_WILL_START_WARNING, warnStart});
    }
    const TimePoint warnEnd = window.EndTime() - m_Options.preEndWarning;
    if (m_Options.preEndWarning > Seconds{0} && warnEnd > window.startTime) {
        timers.push_back({EVENT_WILL_END_WARNING, warnEnd});
    }

    for (const auto &t : timers) {
        const std::string base = UnitBaseName(t.event, window.id);
        if (!WriteUnit(base + ".service", ServiceUnit(t.event, window.id), error) ||
            !WriteUnit(base + ".timer", TimerUnit(base, t.at), error)) {
            spdlog::error("systemd: {}", error);
            return REGISTER_FAILED;
        }
    }

    std::string errorName;
    if (!CallManager("Reload", "", error, errorName)) {
        spdlog::error("systemd: reload failed: {}", error);
        return IsAuthorizationError(errorName) ? REGISTER_UNAUTHORIZED : REGISTER_FAILED;
    }

    for (const auto &t : timers) {
        const std::string timer = UnitBaseName(t.event, window.id) + ".timer";
        if (!CallManager("StartUnit", timer, error, errorName)) {
            spdlog::error("systemd: starting {} failed: {}", timer, error);
            return IsAuthorizationError(errorName) ? REGISTER_UNAUTHORIZED : REGISTER_FAILED;
        }
        spdlog::debug("systemd: {} armed for {}", timer, FormatCalendarUtc(t.at));
    }
    return REGISTER_OK;
}

// ─────────────────────────────────────
bool SystemdActivityMonitor::Unregister(const std::string &windowId, std::string &error) {
    bool ok = true;
    std::string errorName;

    for (AgentEvent event : kEvents) {
        const std::string base = UnitBaseName(event, windowId);
        const std::filesystem::path timerPath = m_Options.unitDir / (base + ".timer");
        const std::filesystem::path servicePath = m_Options.unitDir / (base + ".service");
        if (!std::filesystem::exists(timerPath) && !std::filesystem::exists(servicePath)) {
            continue;
        }

        std::string callError;
        if (!CallManager("StopUnit", base + ".timer", callError, errorName) &&
            errorName != "org.freedesktop.systemd1.NoSuchUnit") {
            spdlog::warn("systemd: stopping {}.timer failed: {}", base, callError);
            error = callError;
            ok = false;
            continue;
        }

        std::error_code ec;
        std::filesystem::remove(timerPath, ec);
        std::filesystem::remove(servicePath, ec);
        if (ec) {
            error = "cannot remove units of " + base + ": " + ec.message();
            ok = false;
        }
    }

    std::string reloadError;
    if (!CallManager("Reload", "", reloadError, errorName)) {
        spdlog::warn("systemd: reload after removing {} failed: {}", windowId, reloadError);
    }
    return ok;
}
