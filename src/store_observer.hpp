#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <thread>

// Calls back when another connection committed to the state database. inotify on the database
// directory triggers a PRAGMA data_version check; without inotify the check runs on a slow timer.
class StoreObserver {
  public:
    StoreObserver(std::filesystem::path db_path, std::chrono::seconds fallback);
    ~StoreObserver();

    StoreObserver(const StoreObserver &) = delete;
    StoreObserver &operator=(const StoreObserver &) = delete;

    bool Start(std::function<void()> on_change);
    void Stop();

  private:
    void Run(std::function<void()> on_change);
    int SetupInotify();

  private:
    std::filesystem::path m_DbPath;
    std::chrono::seconds m_Fallback;
    std::thread m_Thread;
    std::atomic<bool> m_Stop{false};
    int m_StopFd = -1;
};
