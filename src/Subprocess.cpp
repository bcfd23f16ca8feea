#include "Subprocess.h"

#include "Log.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace gpgrab {

static std::vector<char*> makeArgv(const std::vector<std::string>& args)
{
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

// The parent may block signals for its sigwait thread; children start
// with an empty mask.
static void resetChildSignals()
{
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
}

// Exit code 127 from the child means exec failed.
static int decodeStatus(int status)
{
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

ProcessResult runProcess(const std::vector<std::string>& args, std::chrono::milliseconds timeout)
{
    ProcessResult result;
    if (args.empty()) return result;

    int outPipe[2];
    int errPipe[2];
    if (pipe2(outPipe, O_CLOEXEC) != 0) return result;
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        close(outPipe[0]); close(outPipe[1]);
        return result;
    }

    std::vector<char*> argv = makeArgv(args);
    pid_t pid = fork();
    if (pid < 0) {
        close(outPipe[0]); close(outPipe[1]);
        close(errPipe[0]); close(errPipe[1]);
        LOGD("fork failed: " << std::strerror(errno));
        return result;
    }
    if (pid == 0) {
        resetChildSignals();
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    close(outPipe[1]);
    close(errPipe[1]);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    struct pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    int openFds = 2;
    char buf[4096];
    while (openFds > 0) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            result.timedOut = true;
            break;
        }
        int rc = poll(fds, 2, static_cast<int>(std::min<long long>(left.count(), 200)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                (i == 0 ? result.output : result.errorOutput).append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --openFds;
            }
        }
    }
    for (auto& f : fds) {
        if (f.fd >= 0) close(f.fd);
    }

    int status = 0;
    if (result.timedOut) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        LOGD("'" << args[0] << "' timed out");
        result.started = true;
        return result;
    }
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return result;
    }
    result.exitCode = decodeStatus(status);
    result.started = result.exitCode != 127;
    return result;
}

// ----- ChildProcess -----

ChildProcess::~ChildProcess()
{
    terminate();
}

bool ChildProcess::start(const std::vector<std::string>& args)
{
    if (args.empty() || m_pid > 0) return false;

    // report exec failure through a close-on-exec pipe
    int errPipe[2];
    if (pipe2(errPipe, O_CLOEXEC) != 0) return false;

    std::vector<char*> argv = makeArgv(args);
    pid_t pid = fork();
    if (pid < 0) {
        close(errPipe[0]); close(errPipe[1]);
        return false;
    }
    if (pid == 0) {
        resetChildSignals();
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        execvp(argv[0], argv.data());
        int e = errno;
        ssize_t ignored = write(errPipe[1], &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }
    close(errPipe[1]);
    int childErr = 0;
    ssize_t n;
    do {
        n = read(errPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    close(errPipe[0]);
    if (n > 0) {
        waitpid(pid, nullptr, 0);
        LOGD("Cannot start '" << args[0] << "': " << std::strerror(childErr));
        return false;
    }
    m_pid = pid;
    return true;
}

bool ChildProcess::running()
{
    if (m_pid <= 0) return false;
    int status = 0;
    pid_t rc = waitpid(m_pid, &status, WNOHANG);
    if (rc == 0) return true;
    m_pid = -1;
    return false;
}

void ChildProcess::terminate(std::chrono::milliseconds grace)
{
    if (m_pid <= 0) return;
    kill(m_pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (waitpid(m_pid, nullptr, WNOHANG) != 0) {
            m_pid = -1;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    kill(m_pid, SIGKILL);
    waitpid(m_pid, nullptr, 0);
    m_pid = -1;
}

} // namespace gpgrab
