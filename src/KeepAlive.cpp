#include "KeepAlive.h"

#include "CameraHttp.h"
#include "Errors.h"
#include "Log.h"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace gpgrab {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> tick, std::function<void()> onExit)
    : m_state(std::make_shared<State>())
{
    m_state->name = std::move(name);
    m_state->interval = interval;
    m_state->tick = std::move(tick);
    m_state->onExit = std::move(onExit);
    m_finished = m_state->finished.get_future();
}

PeriodicTask::~PeriodicTask()
{
    // the tick may hold references, so the worker always ends before we do
    m_state->stop.set();
    if (m_thread.joinable()) m_thread.join();
}

void PeriodicTask::start()
{
    if (m_thread.joinable()) return;
    m_state->running = true;
    m_thread = std::thread(&PeriodicTask::run, m_state);
}

void PeriodicTask::run(std::shared_ptr<State> state)
{
    LOGD(state->name << " started");
    while (!state->stop.waitFor(state->interval)) {
        try {
            state->tick();
        } catch (const std::exception& e) {
            LOGW(state->name << " failed: " << e.what());
        }
    }
    if (state->onExit) {
        try {
            state->onExit();
        } catch (const std::exception& e) {
            LOGW(state->name << " cleanup failed: " << e.what());
        }
    }
    LOGD(state->name << " stopped");
    state->running = false;
    state->finished.set_value();
}

bool PeriodicTask::stop(std::chrono::milliseconds timeout)
{
    m_state->stop.set();
    if (!m_thread.joinable()) return true;

    if (m_finished.wait_for(timeout) != std::future_status::ready) {
        LOGW(m_state->name << " did not stop in time");
        return false;
    }
    m_thread.join();
    return true;
}

bool PeriodicTask::isRunning() const
{
    return m_state->running;
}

// ----- Keep-alive tasks -----

std::unique_ptr<PeriodicTask> makeNetworkKeepAlive(CameraHttpClient& http, std::chrono::milliseconds interval)
{
    return std::make_unique<PeriodicTask>("Wi-Fi keep-alive", interval, [&http] {
        LOGD("Sending Wi-Fi keep-alive ping...");
        http.ping();
    });
}

void writeDiskSentinel(const fs::path& file)
{
    int fd = ::open(file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw Error(ErrorKind::IOFailure, "Cannot open '" + file.string() + "': " + std::strerror(errno));
    }
    char stamp[64];
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    size_t len = std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S\n", &local);

    bool ok = ::write(fd, stamp, len) == static_cast<ssize_t>(len);
    // push past the page cache so the disk itself is touched
    ok = (::fsync(fd) == 0) && ok;
    int savedErrno = errno;
    ::close(fd);
    if (!ok) {
        throw Error(ErrorKind::IOFailure, "Writing '" + file.string() + "' failed: " + std::strerror(savedErrno));
    }
}

std::unique_ptr<PeriodicTask> makeDiskKeepAlive(const fs::path& dir, std::chrono::milliseconds interval)
{
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        LOGW("Disk keep-alive: destination folder '" << dir.string() << "' does not exist, not starting.");
        return nullptr;
    }
    fs::path sentinel = dir / kDiskKeepAliveFile;
    return std::make_unique<PeriodicTask>(
        "Disk keep-alive", interval,
        [sentinel] {
            LOGD("Disk keep-alive: touching the disk to keep it awake...");
            writeDiskSentinel(sentinel);
        },
        [sentinel] {
            std::error_code rmEc;
            fs::remove(sentinel, rmEc);
        });
}

} // namespace gpgrab
