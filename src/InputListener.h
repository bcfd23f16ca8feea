#ifndef GPGRAB_INPUTLISTENER_H
#define GPGRAB_INPUTLISTENER_H

#include "CancelToken.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <termios.h>
#include <thread>

namespace gpgrab {

// Keystrokes from the listener thread to the prompt. Each entry is one
// UTF-8 character.
class InputQueue
{
public:
    void push(std::string key);
    std::optional<std::string> pop(std::chrono::milliseconds timeout);
    void clear();
    bool empty() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::string> m_keys;
};

// Watches the terminal for Escape (cancels the token) and forwards every
// other key to the queue. Escape sequences such as arrow keys are dropped.
class InputListener
{
public:
    InputListener(CancelToken& cancel, InputQueue& queue, int fd = 0, bool requireTerminal = true);
    ~InputListener();

    InputListener(const InputListener&) = delete;
    InputListener& operator=(const InputListener&) = delete;

    // false when fd is not a terminal (and one is required)
    bool start();
    void stop();
    bool isRunning() const { return m_running; }

private:
    void run();
    void handleByte(unsigned char c);

    CancelToken& m_cancel;
    InputQueue& m_queue;
    int m_fd;
    bool m_requireTerminal;

    struct termios m_savedAttrs{};
    bool m_attrsSaved = false;
    std::atomic<bool> m_stop{false};
    std::atomic<bool> m_running{false};
    std::thread m_thread;
    std::string m_pending;   // partial UTF-8 character
    size_t m_pendingLen = 0;
};

} // namespace gpgrab

#endif // GPGRAB_INPUTLISTENER_H
