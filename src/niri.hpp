#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct CompositorWindow {
    uint64_t id = 0;
    std::string appId;
    std::string title;
};

// Client for the niri compositor socket ($NIRI_SOCKET). niri answers one request per
// connection, so every query opens its own socket; the event stream keeps a dedicated one.
class NiriIPC {
  public:
    NiriIPC();
    ~NiriIPC();

    NiriIPC(const NiriIPC &) = delete;
    NiriIPC &operator=(const NiriIPC &) = delete;

    bool IsAvailable() const;

    // Sends one serde-encoded request ("\"Windows\"" or {"Action":{...}}) and returns the
    // "Ok" payload of the reply.
    std::optional<nlohmann::json> Request(const nlohmann::json &request,
                                          std::chrono::milliseconds timeout =
                                              std::chrono::milliseconds(1000));

    std::optional<std::vector<CompositorWindow>> Windows();
    bool CloseWindow(uint64_t id);

    // Event stream connection (long-lived). Reconnects until stopped.
    bool StartEventStream(std::function<void(const nlohmann::json &event)> callback,
                          std::vector<std::string> only_events,
                          std::chrono::milliseconds reconnect_delay =
                              std::chrono::milliseconds(1000));
    void StopEventStream();

  private:
    static std::string GetEnvSocketPath();
    bool ConnectFd(int &fd);
    static void CloseFd(int &fd);
    bool SendAll(int fd, const void *data, std::size_t size);
    enum ReadResult { READ_LINE, READ_TIMEOUT, READ_CLOSED };
    ReadResult ReadLine(int fd, std::string &out_line, std::string &buffer,
                        std::chrono::milliseconds timeout);
    static bool HasAnyOfKeys(const nlohmann::json &j, const std::vector<std::string> &keys);

  private:
    std::string m_SocketPath;

    std::atomic<bool> m_StreamRunning{false};
    std::atomic<bool> m_StopStream{false};
    std::thread m_StreamThread;
    int m_StreamFd = -1;
};
