#ifndef GPGRAB_CANCELTOKEN_H
#define GPGRAB_CANCELTOKEN_H

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace gpgrab {

// One-shot cancellation shared by the session, the key listener and the
// signal watcher. Once cancelled it stays cancelled.
class CancelToken
{
public:
    void cancel(const std::string& reason = "cancelled");
    bool isCancelled() const;
    std::string reason() const;

    // throws Error(Interrupted) when cancelled
    void throwIfCancelled() const;

    // Interruptible sleep. Throws Error(Interrupted) if cancelled before or
    // during the wait.
    void sleepFor(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    bool m_cancelled = false;
    std::string m_reason;
};

// One-shot stop event for background loops.
class StopSignal
{
public:
    void set();
    // returns true if the signal was set before the duration elapsed
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    bool m_set = false;
};

} // namespace gpgrab

#endif // GPGRAB_CANCELTOKEN_H
