#ifndef GPGRAB_ORCHESTRATOR_H
#define GPGRAB_ORCHESTRATOR_H

#include "CameraHttp.h"
#include "CancelToken.h"
#include "Config.h"
#include "ControlLink.h"
#include "InputListener.h"
#include "KeepAlive.h"
#include "MediaProcessor.h"
#include "PowerInhibitor.h"
#include "UserPrompt.h"
#include "WifiManager.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gpgrab {

enum class SessionState {
    Idle,
    Discovering,
    LinkConnected,
    NetworkEnabling,
    NetworkJoining,
    Transferring,
    Cleaning,
    Done,
    Aborted,
};

const char* sessionStateName(SessionState state);

enum class RunOutcome {
    Completed,
    NotFound,    // camera never showed up
    Cancelled,   // Escape, signal, or the user gave up
    Failed,
};

struct SessionTiming
{
    std::chrono::milliseconds afterWifiEnable{1000};
    std::chrono::milliseconds afterDisconnect{1000};
    std::chrono::milliseconds stabilization{3000};
    std::chrono::milliseconds networkKeepAlive{15000};
    std::chrono::milliseconds diskKeepAlive{60000};
    std::chrono::milliseconds diskStopTimeout{2000};
    std::chrono::milliseconds networkStopTimeout{3000};
    std::chrono::seconds deleteQuestionTimeout{15};
    std::chrono::milliseconds restoreTimeout{15000};
    std::chrono::milliseconds networkScanTimeout{30000};
};

// What the run did so far; read by the cleanup phase.
struct SessionRecord
{
    std::string originalNetwork;
    bool joinAttempted = false;       // the host may have left originalNetwork
    bool connectedToDeviceNetwork = false;
    bool networkChanged = false;
    bool completed = false;
    int downloadedCount = 0;
    std::vector<RemoteFile> downloaded;
    std::vector<RemoteFile> remote;
    int deletedCount = 0;
    bool restoreAttempted = false;
    std::string restoreTarget;
    bool processed = false;
};

// Drives one grab session: BLE discovery and Wi-Fi enable, joining the
// camera network, the transfer, and a cleanup phase that always runs.
class Orchestrator
{
public:
    Orchestrator(const Settings& settings, const CancelToken& cancel, ControlLink& link, WifiManager& wifi,
                 CameraHttpClient& http, UserPrompt& prompt, MediaTool& media, SessionTiming timing = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Optional collaborators; both are started by run() and stopped during
    // cleanup.
    void setPowerInhibitor(PowerInhibitor* power) { m_power = power; }
    void setInputListener(InputListener* listener) { m_listener = listener; }

    // Learned identifier and home network are written here. Empty disables
    // persisting.
    void setConfigPath(std::string path) { m_configPath = std::move(path); }

    RunOutcome run();

    SessionState state() const { return m_state; }
    const std::vector<SessionState>& history() const { return m_history; }
    const SessionRecord& record() const { return m_record; }

    bool keepAlivesStopped() const;
    std::filesystem::path sentinelPath() const;

private:
    RunOutcome runSession();
    DeviceHandle connectControlLink();
    WifiCredentials enableCameraWifi();
    bool joinCameraNetwork(const WifiCredentials& creds, const DeviceHandle& device);
    bool manualJoin();
    void transfer();
    void decideDeletion();
    void powerDownCamera();

    void learnHomeNetwork();
    void learnIdentifier(const DeviceHandle& device);
    void noteNetworkChange();

    void cleanup();
    void stopListener();
    void releasePower();
    void stopDiskKeepAlive();
    void stopNetworkKeepAlive();
    void finalizeFiles();
    void restoreNetwork();

    void setState(SessionState state);

    const Settings& m_settings;
    const CancelToken& m_cancel;
    ControlLink& m_link;
    WifiManager& m_wifi;
    CameraHttpClient& m_http;
    UserPrompt& m_prompt;
    MediaTool& m_media;
    SessionTiming m_timing;

    PowerInhibitor* m_power = nullptr;
    InputListener* m_listener = nullptr;
    std::string m_configPath;

    std::string m_identifier;
    std::string m_homeWifi;
    ConfigUpdates m_learned;

    SessionState m_state = SessionState::Idle;
    std::vector<SessionState> m_history;
    SessionRecord m_record;

    std::unique_ptr<PeriodicTask> m_networkKeepAlive;
    std::unique_ptr<PeriodicTask> m_diskKeepAlive;
};

} // namespace gpgrab

#endif // GPGRAB_ORCHESTRATOR_H
