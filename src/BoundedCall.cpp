#include "BoundedCall.h"

#include "Log.h"

namespace gpgrab {

BoundedCall::~BoundedCall()
{
    if (m_worker.joinable()) m_worker.join();
}

bool BoundedCall::run(std::function<void()> fn, std::chrono::milliseconds timeout)
{
    if (m_worker.joinable()) {
        LOGD("Waiting for the previous overrun call to return...");
        m_worker.join();
    }

    std::promise<void> finished;
    m_done = finished.get_future();
    m_worker = std::thread([fn = std::move(fn), finished = std::move(finished)]() mutable {
        try {
            fn();
            finished.set_value();
        } catch (...) {
            finished.set_exception(std::current_exception());
        }
    });

    if (m_done.wait_for(timeout) != std::future_status::ready) return false;
    m_worker.join();
    m_done.get();
    return true;
}

} // namespace gpgrab
