#ifndef GPGRAB_POWERINHIBITOR_H
#define GPGRAB_POWERINHIBITOR_H

#include "Subprocess.h"

#include <string>
#include <vector>

namespace gpgrab {

// Keeps the host from sleeping while the session runs by holding a
// systemd-inhibit child process.
class PowerInhibitor
{
public:
    PowerInhibitor();
    explicit PowerInhibitor(std::vector<std::string> command);
    ~PowerInhibitor();

    bool acquire();
    void release();
    bool held();

private:
    std::vector<std::string> m_command;
    ChildProcess m_child;
    bool m_held = false;
};

} // namespace gpgrab

#endif // GPGRAB_POWERINHIBITOR_H
