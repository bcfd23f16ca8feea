#include "PowerInhibitor.h"

#include "Log.h"

namespace gpgrab {

PowerInhibitor::PowerInhibitor()
    : m_command{"systemd-inhibit", "--what=sleep:idle", "--who=gpgrab",
                "--why=Downloading media from the camera", "--mode=block", "sleep", "infinity"}
{
}

PowerInhibitor::PowerInhibitor(std::vector<std::string> command)
    : m_command(std::move(command))
{
}

PowerInhibitor::~PowerInhibitor()
{
    release();
}

bool PowerInhibitor::acquire()
{
    if (m_held) return true;
    if (!m_child.start(m_command)) {
        LOGD("Could not inhibit system sleep ('" << m_command.front() << "' unavailable)");
        return false;
    }
    m_held = true;
    LOGD("System sleep inhibited for the session");
    return true;
}

void PowerInhibitor::release()
{
    if (!m_held) return;
    m_child.terminate();
    m_held = false;
    LOGD("System sleep inhibition released");
}

bool PowerInhibitor::held()
{
    return m_held && m_child.running();
}

} // namespace gpgrab
