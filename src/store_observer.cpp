#include "store_observer.hpp"

#include "store.hpp"

#include <cerrno>
#include <cstring>
#include <memory>

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
StoreObserver::StoreObserver(std::filesystem::path db_path, std::chrono::seconds fallback)
    : m_DbPath(std::move(db_path)), m_Fallback(fallback) {}

// ─────────────────────────────────────
StoreObserver::~StoreObserver() {
    Stop();
}

// ─────────────────────────────────────
bool StoreObserver::Start(std::function<void()> on_change) {
    if (m_Thread.joinable()) {
        return true;
    }

    m_StopFd = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (m_StopFd < 0) {
        spdlog::error("StoreObserver: eventfd failed: {}", std::strerror(errno));
        return false;
    }

    m_Stop.store(false);
    m_Thread = std::thread([this, cb = std::move(on_change)]() { Run(cb); });
    return true;
}

// ─────────────────────────────────────
void StoreObserver::Stop() {
    m_Stop.store(true);
    if (m_StopFd >= 0) {
        const uint64_t one = 1;
        if (::write(m_StopFd, &one, sizeof(one)) < 0) {
            spdlog::debug("StoreObserver: stop signal failed: {}", std::strerror(errno));
        }
    }
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    if (m_StopFd >= 0) {
        ::close(m_StopFd);
        m_StopFd = -1;
    }
}

// ─────────────────────────────────────
int StoreObserver::SetupInotify() {
    const int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        spdlog::warn("StoreObserver: inotify unavailable ({}), checking every {} s",
                     std::strerror(errno), m_Fallback.count());
        return -1;
    }

    const std::string dir = m_DbPath.parent_path().string();
    if (::inotify_add_watch(fd, dir.c_str(), IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO) < 0) {
        spdlog::warn("StoreObserver: cannot watch {} ({}), checking every {} s", dir,
                     std::strerror(errno), m_Fallback.count());
        ::close(fd);
        return -1;
    }
    return fd;
}

// ─────────────────────────────────────
void StoreObserver::Run(std::function<void()> on_change) {
    std::unique_ptr<StateStore> store;
    int64_t lastVersion = 0;
    try {
        // Own connection: data_version only moves for commits made by other connections.
        store = std::make_unique<StateStore>(m_DbPath.string(), ROLE_MAIN);
        lastVersion = store->DataVersion();
    } catch (const std::exception &e) {
        spdlog::error("StoreObserver: cannot open {}: {}", m_DbPath.string(), e.what());
        return;
    }

    const int inotifyFd = SetupInotify();
    const std::string dbName = m_DbPath.filename().string();

    while (!m_Stop.load()) {
        pollfd fds[2];
        fds[0] = {m_StopFd, POLLIN, 0};
        fds[1] = {inotifyFd, POLLIN, 0};
        const nfds_t count = inotifyFd >= 0 ? 2 : 1;
        const int timeoutMs = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(m_Fallback).count());

        const int rc = ::poll(fds, count, timeoutMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("StoreObserver: poll failed: {}", std::strerror(errno));
            break;
        }
        if (m_Stop.load() || (fds[0].revents & POLLIN) != 0) {
            break;
        }

        if (rc > 0 && inotifyFd >= 0 && (fds[1].revents & POLLIN) != 0) {
            alignas(inotify_event) char buf[4096];
            bool relevant = false;
            ssize_t n;
            while ((n = ::read(inotifyFd, buf, sizeof(buf))) > 0) {
                for (char *p = buf; p < buf + n;) {
                    const auto *ev = reinterpret_cast<const inotify_event *>(p);
                    if (ev->len > 0 && std::string(ev->name).rfind(dbName, 0) == 0) {
                        relevant = true;
                    }
                    p += sizeof(inotify_event) + ev->len;
                }
            }
            if (!relevant) {
                continue;
            }
        }

        try {
            const int64_t version = store->DataVersion();
            if (version == lastVersion) {
                continue;
            }
            lastVersion = version;
        } catch (const std::exception &e) {
            spdlog::warn("StoreObserver: data_version check failed: {}", e.what());
            continue;
        }

        spdlog::debug("StoreObserver: store changed");
        on_change();
    }

    if (inotifyFd >= 0) {
        ::close(inotifyFd);
    }
}
