#include "InputListener.h"

#include "Log.h"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace gpgrab {

// ----- InputQueue -----

void InputQueue::push(std::string key)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_keys.push_back(std::move(key));
    }
    m_cv.notify_one();
}

std::optional<std::string> InputQueue::pop(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_cv.wait_for(lock, timeout, [this] { return !m_keys.empty(); })) return std::nullopt;
    std::string key = std::move(m_keys.front());
    m_keys.pop_front();
    return key;
}

void InputQueue::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_keys.clear();
}

bool InputQueue::empty() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_keys.empty();
}

// ----- InputListener -----

static const int kPollMs = 100;
static const int kEscapeFollowMs = 50;

InputListener::InputListener(CancelToken& cancel, InputQueue& queue, int fd, bool requireTerminal)
    : m_cancel(cancel), m_queue(queue), m_fd(fd), m_requireTerminal(requireTerminal)
{
}

InputListener::~InputListener()
{
    stop();
}

bool InputListener::start()
{
    if (m_thread.joinable()) return true;

    if (isatty(m_fd)) {
        if (tcgetattr(m_fd, &m_savedAttrs) == 0) {
            m_attrsSaved = true;
            struct termios raw = m_savedAttrs;
            raw.c_lflag &= ~(ICANON | ECHO);
            raw.c_cc[VMIN] = 1;
            raw.c_cc[VTIME] = 0;
            if (tcsetattr(m_fd, TCSANOW, &raw) != 0) {
                LOGD("Cannot switch the terminal to raw input: " << std::strerror(errno));
            }
        }
    } else if (m_requireTerminal) {
        LOGD("Input is not a terminal, Escape cancellation disabled");
        return false;
    }

    m_stop = false;
    m_running = true;
    m_thread = std::thread(&InputListener::run, this);
    LOGD("Input listener started (press Esc to cancel)");
    return true;
}

void InputListener::stop()
{
    m_stop = true;
    if (m_thread.joinable()) m_thread.join();
    if (m_attrsSaved) {
        tcsetattr(m_fd, TCSANOW, &m_savedAttrs);
        m_attrsSaved = false;
    }
}

void InputListener::run()
{
    while (!m_stop) {
        struct pollfd pfd{m_fd, POLLIN, 0};
        int rc = poll(&pfd, 1, kPollMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOGD("Input listener poll failed: " << std::strerror(errno));
            break;
        }
        if (rc == 0) continue;
        if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL) && !(pfd.revents & POLLIN)) break;

        unsigned char c;
        ssize_t n = read(m_fd, &c, 1);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            break;
        }

        if (c != 0x1b) {
            handleByte(c);
            continue;
        }

        // lone Escape, or the start of a key sequence?
        struct pollfd more{m_fd, POLLIN, 0};
        if (poll(&more, 1, kEscapeFollowMs) > 0 && (more.revents & POLLIN)) {
            unsigned char discard[32];
            while (poll(&more, 1, 0) > 0 && (more.revents & POLLIN)) {
                if (read(m_fd, discard, sizeof(discard)) <= 0) break;
            }
            continue;
        }
        if (!m_cancel.isCancelled()) {
            LOGW("Escape pressed. Cancelling...");
            m_cancel.cancel("cancelled by user (Escape)");
        }
        break;
    }
    m_running = false;
    LOGD("Input listener stopped");
}

void InputListener::handleByte(unsigned char c)
{
    if (m_pendingLen == 0) {
        size_t len = 1;
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        if (len == 1) {
            m_queue.push(std::string(1, static_cast<char>(c)));
            return;
        }
        m_pending.assign(1, static_cast<char>(c));
        m_pendingLen = len;
        return;
    }
    m_pending += static_cast<char>(c);
    if (m_pending.size() >= m_pendingLen) {
        m_queue.push(m_pending);
        m_pending.clear();
        m_pendingLen = 0;
    }
}

} // namespace gpgrab
