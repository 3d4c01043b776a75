#include "niri.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

// ─────────────────────────────────────
NiriIPC::NiriIPC() : m_SocketPath(GetEnvSocketPath()) {}

// ─────────────────────────────────────
NiriIPC::~NiriIPC() {
    StopEventStream();
}

// ─────────────────────────────────────
std::string NiriIPC::GetEnvSocketPath() {
    const char *env = std::getenv("NIRI_SOCKET");
    if (env == nullptr) {
        return {};
    }
    return std::string(env);
}

// ─────────────────────────────────────
bool NiriIPC::IsAvailable() const {
    return !m_SocketPath.empty();
}

// ─────────────────────────────────────
bool NiriIPC::ConnectFd(int &fd) {
    if (!IsAvailable()) {
        return false;
    }

    if (fd >= 0) {
        return true;
    }

    const int new_fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (new_fd < 0) {
        spdlog::error("Failed to create niri socket: {}", std::strerror(errno));
        return false;
    }

    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    if (m_SocketPath.size() >= sizeof(addr.sun_path)) {
        spdlog::error("NIRI_SOCKET path too long");
        ::close(new_fd);
        return false;
    }

    std::strncpy(addr.sun_path, m_SocketPath.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(new_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        if (err != ENOENT && err != ECONNREFUSED) {
            spdlog::warn("Failed to connect to niri socket: {}", std::strerror(err));
        }
        ::close(new_fd);
        return false;
    }

    fd = new_fd;
    return true;
}

// ─────────────────────────────────────
void NiriIPC::CloseFd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// ─────────────────────────────────────
bool NiriIPC::SendAll(int fd, const void *data, std::size_t size) {
    const char *ptr = static_cast<const char *>(data);
    std::size_t remaining = size;

    while (remaining > 0) {
        const ssize_t sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (sent == 0) {
            return false;
        }
        ptr += static_cast<std::size_t>(sent);
        remaining -= static_cast<std::size_t>(sent);
    }

    return true;
}

// ─────────────────────────────────────
NiriIPC::ReadResult NiriIPC::ReadLine(int fd, std::string &out_line, std::string &buffer,
                                      std::chrono::milliseconds timeout) {
    out_line.clear();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto pos = buffer.find('\n'); pos != std::string::npos) {
            out_line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            return READ_LINE;
        }

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            return READ_TIMEOUT;
        }

        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        const int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc < 0) {
            return READ_CLOSED;
        }
        if (rc == 0) {
            return READ_TIMEOUT;
        }
        if ((pfd.revents & POLLIN) == 0) {
            return READ_CLOSED;
        }

        char tmp[8192];
        const ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) {
            return READ_CLOSED;
        }
        buffer.append(tmp, static_cast<std::size_t>(n));
    }
}

// ─────────────────────────────────────
std::optional<nlohmann::json> NiriIPC::Request(const nlohmann::json &request,
                                               std::chrono::milliseconds timeout) {
    int fd = -1;
    if (!ConnectFd(fd)) {
        return std::nullopt;
    }

    const std::string line = request.dump() + "\n";
    if (!SendAll(fd, line.data(), line.size())) {
        spdlog::warn("Failed to send niri IPC request");
        CloseFd(fd);
        return std::nullopt;
    }

    std::string buffer;
    std::string reply;
    const ReadResult got = ReadLine(fd, reply, buffer, timeout);
    CloseFd(fd);
    if (got != READ_LINE) {
        spdlog::debug("No response from niri IPC (timeout/disconnect)");
        return std::nullopt;
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(reply);
    } catch (const std::exception &e) {
        spdlog::warn("Failed to parse niri IPC response JSON: {}", e.what());
        return std::nullopt;
    }

    if (root.is_object() && root.contains("Err")) {
        spdlog::warn("niri refused {}: {}", request.dump(), root["Err"].dump());
        return std::nullopt;
    }
    if (!root.is_object() || !root.contains("Ok")) {
        spdlog::debug("Unexpected niri IPC response format");
        return std::nullopt;
    }
    return root["Ok"];
}

// ─────────────────────────────────────
std::optional<std::vector<CompositorWindow>> NiriIPC::Windows() {
    auto ok = Request("Windows");
    // Expected: { "Ok": { "Windows": [ {id, title, app_id, ...}, ... ] } }
    if (!ok || !ok->contains("Windows") || !(*ok)["Windows"].is_array()) {
        return std::nullopt;
    }

    std::vector<CompositorWindow> windows;
    for (const auto &w : (*ok)["Windows"]) {
        if (!w.is_object() || !w.contains("id") || !w["id"].is_number_unsigned()) {
            continue;
        }
        CompositorWindow cw;
        cw.id = w["id"].get<uint64_t>();
        if (w.contains("app_id") && w["app_id"].is_string()) {
            cw.appId = w["app_id"].get<std::string>();
        }
        if (w.contains("title") && w["title"].is_string()) {
            cw.title = w["title"].get<std::string>();
        }
        windows.push_back(std::move(cw));
    }
    return windows;
}

// ─────────────────────────────────────
bool NiriIPC::CloseWindow(uint64_t id) {
    const nlohmann::json action = {{"Action", {{"CloseWindow", {{"id", id}}}}}};
    return Request(action).has_value();
}

// ─────────────────────────────────────
bool NiriIPC::HasAnyOfKeys(const nlohmann::json &j, const std::vector<std::string> &keys) {
    if (!j.is_object()) {
        return false;
    }
    for (const auto &k : keys) {
        if (j.contains(k)) {
            return true;
        }
    }
    return false;
}

// ─────────────────────────────────────
bool NiriIPC::StartEventStream(std::function<void(const nlohmann::json &event)> callback,
                               std::vector<std::string> only_events,
                               std::chrono::milliseconds reconnect_delay) {
    if (m_StreamRunning.load()) {
        return true;
    }

    if (!IsAvailable()) {
        return false;
    }

    m_StopStream.store(false);
    m_StreamRunning.store(true);

    m_StreamThread = std::thread([this, callback, only_events = std::move(only_events),
                                  reconnect_delay]() {
        while (!m_StopStream.load()) {
            CloseFd(m_StreamFd);

            if (!ConnectFd(m_StreamFd)) {
                std::this_thread::sleep_for(reconnect_delay);
                continue;
            }

            const std::string subscribe = "\"EventStream\"\n";
            if (!SendAll(m_StreamFd, subscribe.data(), subscribe.size())) {
                spdlog::debug("Failed to subscribe to niri EventStream");
                CloseFd(m_StreamFd);
                std::this_thread::sleep_for(reconnect_delay);
                continue;
            }

            std::string buffer;
            std::string line;

            while (!m_StopStream.load()) {
                // Short timeout so StopEventStream() never waits long.
                const ReadResult got =
                    ReadLine(m_StreamFd, line, buffer, std::chrono::milliseconds(1000));
                if (got == READ_TIMEOUT) {
                    continue;
                }
                if (got == READ_CLOSED) {
                    spdlog::debug("niri event stream closed, reconnecting");
                    break;
                }

                if (line.empty()) {
                    continue;
                }

                nlohmann::json ev;
                try {
                    ev = nlohmann::json::parse(line);
                } catch (const std::exception &e) {
                    spdlog::debug("Ignoring non-JSON niri stream line: {}", e.what());
                    continue;
                }

                if (!only_events.empty() && !HasAnyOfKeys(ev, only_events)) {
                    continue;
                }

                try {
                    callback(ev);
                } catch (const std::exception &e) {
                    spdlog::error("niri event handler failed: {}", e.what());
                }
            }

            CloseFd(m_StreamFd);
            if (!m_StopStream.load()) {
                std::this_thread::sleep_for(reconnect_delay);
            }
        }

        CloseFd(m_StreamFd);
        m_StreamRunning.store(false);
    });

    return true;
}

// ─────────────────────────────────────
void NiriIPC::StopEventStream() {
    m_StopStream.store(true);

    if (m_StreamThread.joinable()) {
        m_StreamThread.join();
    }

    CloseFd(m_StreamFd);
    m_StreamRunning.store(false);
}
