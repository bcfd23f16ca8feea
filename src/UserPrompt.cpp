#include "UserPrompt.h"

#include "Log.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <poll.h>
#include <unistd.h>

namespace gpgrab {

// Cyrillic letters on the same keys as Y and X, plus "д" (da)
static const char* const kYesKeys[] = {"y", "Y", "\xd0\xbd", "\xd0\x9d", "\xd0\xb4", "\xd0\x94"};
static const char* const kGiveUpKeys[] = {"x", "X", "\xd1\x85", "\xd0\xa5"};

ConsolePrompt::ConsolePrompt(InputQueue& queue, const CancelToken& cancel, std::function<bool()> listenerActive)
    : m_queue(queue), m_cancel(cancel), m_listenerActive(std::move(listenerActive))
{
}

bool ConsolePrompt::isYes(const std::string& key)
{
    for (const char* k : kYesKeys) {
        if (key == k) return true;
    }
    return false;
}

bool ConsolePrompt::isGiveUp(const std::string& key)
{
    for (const char* k : kGiveUpKeys) {
        if (key == k) return true;
    }
    return false;
}

static std::string trimmed(const std::string& s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<std::string> ConsolePrompt::readLine(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!m_cancel.isCancelled()) {
        if (std::cin.rdbuf()->in_avail() > 0) break;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return std::nullopt;
        struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(std::min<long long>(left.count(), 100)));
        if (rc > 0) break;
    }
    m_cancel.throwIfCancelled();

    std::string line;
    if (!std::getline(std::cin, line)) return std::nullopt;
    return line;
}

bool ConsolePrompt::askYesNo(const std::string& question, std::chrono::seconds timeout)
{
    progressEnd();
    std::cout << "\n" << question << " (y/n, " << timeout.count() << " s to answer): ";
    std::cout.flush();

    std::optional<std::string> answer;
    if (m_listenerActive && m_listenerActive()) {
        // stray key presses before the question do not count
        m_queue.clear();
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!answer) {
            m_cancel.throwIfCancelled();
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) break;
            answer = m_queue.pop(std::min(left, std::chrono::milliseconds(100)));
        }
        if (answer) std::cout << *answer << "\n";
    } else {
        answer = readLine(timeout);
        if (answer) answer = trimmed(*answer);
    }

    if (!answer) {
        std::cout << "\nTimed out. Default answer: no.\n";
        std::cout.flush();
        return false;
    }
    std::cout.flush();
    return isYes(*answer);
}

ManualJoinChoice ConsolePrompt::waitForManualJoin()
{
    progressEnd();
    std::cout << "Press Enter to check the connection again, or 'x' to give up: ";
    std::cout.flush();

    if (m_listenerActive && m_listenerActive()) {
        for (;;) {
            m_cancel.throwIfCancelled();
            std::optional<std::string> key = m_queue.pop(std::chrono::milliseconds(100));
            if (!key) {
                // listener ended (Escape or input closed)
                if (!m_listenerActive()) {
                    m_cancel.throwIfCancelled();
                    return ManualJoinChoice::GiveUp;
                }
                continue;
            }
            if (*key == "\n" || *key == "\r") {
                std::cout << "\n";
                return ManualJoinChoice::CheckAgain;
            }
            if (isGiveUp(*key)) {
                std::cout << *key << "\n";
                return ManualJoinChoice::GiveUp;
            }
        }
    }

    for (;;) {
        std::optional<std::string> line = readLine(std::chrono::hours(24));
        if (!line) {
            if (std::cin.eof()) return ManualJoinChoice::GiveUp;
            continue;
        }
        std::string t = trimmed(*line);
        if (isGiveUp(t)) return ManualJoinChoice::GiveUp;
        return ManualJoinChoice::CheckAgain;
    }
}

} // namespace gpgrab
