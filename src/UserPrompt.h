#ifndef GPGRAB_USERPROMPT_H
#define GPGRAB_USERPROMPT_H

#include "CancelToken.h"
#include "InputListener.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace gpgrab {

enum class ManualJoinChoice { CheckAgain, GiveUp };

class UserPrompt
{
public:
    virtual ~UserPrompt() = default;

    // false on "no", any other key, or timeout
    virtual bool askYesNo(const std::string& question, std::chrono::seconds timeout) = 0;
    virtual ManualJoinChoice waitForManualJoin() = 0;
};

// Reads keys from the listener queue while the listener runs, otherwise
// whole lines from stdin.
class ConsolePrompt : public UserPrompt
{
public:
    ConsolePrompt(InputQueue& queue, const CancelToken& cancel, std::function<bool()> listenerActive);

    bool askYesNo(const std::string& question, std::chrono::seconds timeout) override;
    ManualJoinChoice waitForManualJoin() override;

    static bool isYes(const std::string& key);
    static bool isGiveUp(const std::string& key);

private:
    std::optional<std::string> readLine(std::chrono::milliseconds timeout);

    InputQueue& m_queue;
    const CancelToken& m_cancel;
    std::function<bool()> m_listenerActive;
};

} // namespace gpgrab

#endif // GPGRAB_USERPROMPT_H
