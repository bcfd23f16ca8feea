#include "CancelToken.h"

#include "Errors.h"

namespace gpgrab {

void CancelToken::cancel(const std::string& reason)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled) return;
        m_cancelled = true;
        m_reason = reason;
    }
    m_cv.notify_all();
}

bool CancelToken::isCancelled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

std::string CancelToken::reason() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reason;
}

void CancelToken::throwIfCancelled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_cancelled) throw Error(ErrorKind::Interrupted, m_reason);
}

void CancelToken::sleepFor(std::chrono::milliseconds duration) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_cv.wait_for(lock, duration, [this] { return m_cancelled; })) {
        throw Error(ErrorKind::Interrupted, m_reason);
    }
}

void StopSignal::set()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_set = true;
    }
    m_cv.notify_all();
}

bool StopSignal::waitFor(std::chrono::milliseconds duration) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, duration, [this] { return m_set; });
}

} // namespace gpgrab
