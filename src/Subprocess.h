// Child process helpers (fork/exec) for nmcli, ffmpeg and friends.

#ifndef GPGRAB_SUBPROCESS_H
#define GPGRAB_SUBPROCESS_H

#include <sys/types.h>

#include <chrono>
#include <string>
#include <vector>

namespace gpgrab {

struct ProcessResult
{
    bool started = false;      // false when the executable could not be run
    bool timedOut = false;
    int exitCode = -1;
    std::string output;        // stdout
    std::string errorOutput;   // stderr

    bool ok() const { return started && !timedOut && exitCode == 0; }
};

// Runs argv[0] (PATH lookup) and captures its output. The child is killed
// when the timeout elapses.
ProcessResult runProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout = std::chrono::seconds(30));

// Background child owned for the lifetime of the object.
class ChildProcess
{
public:
    ChildProcess() = default;
    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // stdout/stderr of the child go to /dev/null. Returns false if the
    // executable could not be started.
    bool start(const std::vector<std::string>& argv);
    bool running();
    // SIGTERM, then SIGKILL after grace; always reaps.
    void terminate(std::chrono::milliseconds grace = std::chrono::seconds(2));

private:
    pid_t m_pid = -1;
};

} // namespace gpgrab

#endif // GPGRAB_SUBPROCESS_H
