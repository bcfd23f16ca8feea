#ifndef GPGRAB_KEEPALIVE_H
#define GPGRAB_KEEPALIVE_H

#include "CancelToken.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace gpgrab {

class CameraHttpClient;

// Background loop that runs tick() every interval until stopped.
class PeriodicTask
{
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval,
                 std::function<void()> tick, std::function<void()> onExit = {});
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();

    // Signals the loop and waits at most timeout for it to finish. Returns
    // false on timeout; the worker is then joined by a later stop() or the
    // destructor.
    bool stop(std::chrono::milliseconds timeout);

    bool isRunning() const;

private:
    struct State
    {
        std::string name;
        std::chrono::milliseconds interval;
        std::function<void()> tick;
        std::function<void()> onExit;
        StopSignal stop;
        std::atomic<bool> running{false};
        std::promise<void> finished;
    };

    static void run(std::shared_ptr<State> state);

    std::shared_ptr<State> m_state;
    std::future<void> m_finished;
    std::thread m_thread;
};

const char* const kDiskKeepAliveFile = ".disk_keep_alive";

// Pings the camera so it does not drop the Wi-Fi link.
std::unique_ptr<PeriodicTask> makeNetworkKeepAlive(CameraHttpClient& http,
                                                   std::chrono::milliseconds interval = std::chrono::seconds(15));

// Real writes (not a metadata touch) to a sentinel file in dir so the disk
// does not spin down; the sentinel is removed when the loop ends. Returns
// nullptr when dir does not exist.
std::unique_ptr<PeriodicTask> makeDiskKeepAlive(const std::filesystem::path& dir,
                                                std::chrono::milliseconds interval = std::chrono::seconds(60));

void writeDiskSentinel(const std::filesystem::path& file);

} // namespace gpgrab

#endif // GPGRAB_KEEPALIVE_H
