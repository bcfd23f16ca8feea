#ifndef GPGRAB_BOUNDEDCALL_H
#define GPGRAB_BOUNDEDCALL_H

#include <chrono>
#include <functional>
#include <future>
#include <thread>

namespace gpgrab {

// Runs a blocking call on a worker thread and waits for it at most a given
// time. A call that overruns keeps its worker, which is joined before the
// next call starts and by the destructor.
class BoundedCall
{
public:
    BoundedCall() = default;
    ~BoundedCall();

    BoundedCall(const BoundedCall&) = delete;
    BoundedCall& operator=(const BoundedCall&) = delete;

    // Returns false if fn did not finish within timeout. Rethrows what fn
    // threw when it did.
    bool run(std::function<void()> fn, std::chrono::milliseconds timeout);

private:
    std::thread m_worker;
    std::future<void> m_done;
};

} // namespace gpgrab

#endif // GPGRAB_BOUNDEDCALL_H
