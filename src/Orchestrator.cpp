#include "Orchestrator.h"

#include "Errors.h"
#include "GoProProtocol.h"
#include "Log.h"

#include <regex>

namespace fs = std::filesystem;

namespace gpgrab {

const char* sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::Idle: return "Idle";
    case SessionState::Discovering: return "Discovering";
    case SessionState::LinkConnected: return "LinkConnected";
    case SessionState::NetworkEnabling: return "NetworkEnabling";
    case SessionState::NetworkJoining: return "NetworkJoining";
    case SessionState::Transferring: return "Transferring";
    case SessionState::Cleaning: return "Cleaning";
    case SessionState::Done: return "Done";
    case SessionState::Aborted: return "Aborted";
    }
    return "?";
}

static std::string lastToken(const std::string& name)
{
    size_t pos = name.find_last_of(' ');
    return pos == std::string::npos ? name : name.substr(pos + 1);
}

Orchestrator::Orchestrator(const Settings& settings, const CancelToken& cancel, ControlLink& link,
                           WifiManager& wifi, CameraHttpClient& http, UserPrompt& prompt, MediaTool& media,
                           SessionTiming timing)
    : m_settings(settings), m_cancel(cancel), m_link(link), m_wifi(wifi), m_http(http), m_prompt(prompt),
      m_media(media), m_timing(timing), m_identifier(settings.identifier), m_homeWifi(settings.homeWifi)
{
    m_history.push_back(m_state);
}

Orchestrator::~Orchestrator()
{
    // run() normally stopped them already
    if (m_diskKeepAlive) m_diskKeepAlive->stop(m_timing.diskStopTimeout);
    if (m_networkKeepAlive) m_networkKeepAlive->stop(m_timing.networkStopTimeout);
}

void Orchestrator::setState(SessionState state)
{
    if (state == m_state) return;
    LOGD("Session state: " << sessionStateName(m_state) << " -> " << sessionStateName(state));
    m_state = state;
    m_history.push_back(state);
}

bool Orchestrator::keepAlivesStopped() const
{
    return (!m_diskKeepAlive || !m_diskKeepAlive->isRunning())
        && (!m_networkKeepAlive || !m_networkKeepAlive->isRunning());
}

fs::path Orchestrator::sentinelPath() const
{
    return fs::path(m_settings.outputFolder) / kDiskKeepAliveFile;
}

// ----- Main sequence -----

RunOutcome Orchestrator::run()
{
    if (m_power) m_power->acquire();
    if (m_listener && !m_listener->start()) {
        LOGD("stdin is not a terminal, Escape cancellation is not available");
    }

    RunOutcome outcome = RunOutcome::Failed;
    bool aborted = true;
    try {
        outcome = runSession();
        aborted = outcome != RunOutcome::Completed;
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::Interrupted || m_cancel.isCancelled()) {
            LOGI("Operation interrupted (" << m_cancel.reason() << "). Cleaning up...");
            outcome = RunOutcome::Cancelled;
        } else {
            LOGE(errorKindName(e.kind()) << ": " << e.what());
            if (!e.remediation().empty()) LOGE(e.remediation());
            outcome = e.kind() == ErrorKind::NotFound && m_state == SessionState::Discovering
                ? RunOutcome::NotFound : RunOutcome::Failed;
            // no camera means nothing was started; the run still ends normally
            aborted = outcome != RunOutcome::NotFound;
        }
    } catch (const std::exception& e) {
        LOGE("Critical error in the main sequence: " << e.what());
        outcome = m_cancel.isCancelled() ? RunOutcome::Cancelled : RunOutcome::Failed;
    }

    cleanup();
    setState(aborted ? SessionState::Aborted : SessionState::Done);
    return outcome;
}

RunOutcome Orchestrator::runSession()
{
    learnHomeNetwork();
    if (!m_wifi.supported() || !m_wifi.primaryWirelessInterface()) {
        LOGW("No usable Wi-Fi interface; you will be asked to join the camera network by hand.");
    }

    if (m_settings.mode == ProcessingMode::ProcessOnly) {
        LOGI("Mode 'process_only': skipping the camera, processing files already in '"
             << m_settings.outputFolder << "'.");
        m_record.completed = true;
        return RunOutcome::Completed;
    }

    DeviceHandle device = connectControlLink();
    WifiCredentials creds = enableCameraWifi();

    setState(SessionState::NetworkJoining);
    if (!joinCameraNetwork(creds, device)) {
        LOGI("Cancelled by user. Finishing.");
        return RunOutcome::Cancelled;
    }

    LOGD("Wi-Fi connection established. Waiting for the network to settle ("
         << m_timing.stabilization.count() << " ms)...");
    m_cancel.sleepFor(m_timing.stabilization);
    m_networkKeepAlive = makeNetworkKeepAlive(m_http, m_timing.networkKeepAlive);
    m_networkKeepAlive->start();

    setState(SessionState::Transferring);
    transfer();
    decideDeletion();
    powerDownCamera();
    return RunOutcome::Completed;
}

DeviceHandle Orchestrator::connectControlLink()
{
    setState(SessionState::Discovering);
    std::string pattern = m_identifier.empty() ? gopro::kDefaultNamePattern : m_identifier;
    DeviceHandle device = m_link.discover(pattern);

    m_link.connect(device);
    setState(SessionState::LinkConnected);

    learnIdentifier(device);
    if (!m_learned.empty() && !m_configPath.empty()) {
        if (updateConfigFile(m_configPath, m_learned)) LOGD("Learned settings saved to " << m_configPath);
    }
    return device;
}

WifiCredentials Orchestrator::enableCameraWifi()
{
    setState(SessionState::NetworkEnabling);
    LOGI("Turning on the camera Wi-Fi...");
    WifiCredentials creds = m_link.readWifiCredentials();
    m_link.enableWifi();
    m_cancel.sleepFor(m_timing.afterWifiEnable);

    // BLE is not needed for the transfer
    m_link.disconnect();
    m_cancel.sleepFor(m_timing.afterDisconnect);
    return creds;
}

bool Orchestrator::joinCameraNetwork(const WifiCredentials& creds, const DeviceHandle& device)
{
    std::chrono::milliseconds wait = std::chrono::seconds(m_settings.wifiWaitSeconds);
    m_record.joinAttempted = true;
    m_wifi.setReachabilityProbe([this](std::chrono::milliseconds budget) { return m_http.probeReachable(budget); });

    if (m_wifi.supported()) {
        if (!creds.ssid.empty()) {
            LOGD("Connecting directly to SSID '" << creds.ssid << "' reported by the camera");
            if (m_wifi.connect(creds.ssid, creds.password, wait, true)) m_record.connectedToDeviceNetwork = true;
        } else {
            LOGW("Could not get the SSID from the camera over BLE. Scanning for its network...");
            std::string fragment = m_identifier.empty() ? lastToken(device.name) : m_identifier;
            std::optional<std::string> ssid = m_wifi.scanForNetworkContaining(fragment, m_timing.networkScanTimeout);
            if (ssid && m_wifi.connect(*ssid, creds.password, wait, true)) m_record.connectedToDeviceNetwork = true;
        }
        noteNetworkChange();
    }

    if (m_record.connectedToDeviceNetwork) return true;
    return manualJoin();
}

bool Orchestrator::manualJoin()
{
    LOGI(std::string(60, '='));
    LOGI("ACTION: could not join the camera Wi-Fi automatically.");
    LOGI("Please connect this computer to the camera Wi-Fi network by hand.");
    LOGI(std::string(60, '='));

    for (;;) {
        m_cancel.throwIfCancelled();
        if (m_prompt.waitForManualJoin() == ManualJoinChoice::GiveUp) return false;

        LOGI("Checking the Wi-Fi connection to the camera...");
        if (m_http.probeReachable()) {
            LOGI("Connection to the camera established.");
            m_record.connectedToDeviceNetwork = true;
            m_record.networkChanged = true;
            return true;
        }
        LOGE("Could not reach the camera at " << m_http.baseUrl() << ".");
        LOGI("  Make sure you are connected to the GoPro Wi-Fi network and try again.");
    }
}

void Orchestrator::transfer()
{
    fs::path dir(m_settings.outputFolder);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw Error(ErrorKind::IOFailure, "Cannot create '" + dir.string() + "': " + ec.message());

    m_diskKeepAlive = makeDiskKeepAlive(dir, m_timing.diskKeepAlive);
    if (m_diskKeepAlive) m_diskKeepAlive->start();

    TransferResult result = m_http.downloadAll(dir);
    m_record.completed = result.completed;
    m_record.downloadedCount = result.downloadedCount;
    m_record.downloaded = std::move(result.downloaded);
    m_record.remote = std::move(result.remote);

    stopDiskKeepAlive();
    LOGI("Download finished. New files downloaded: " << m_record.downloadedCount << ".");
    if (!m_record.completed) LOGW("The download was interrupted. Processing and deletion are skipped.");
}

void Orchestrator::decideDeletion()
{
    if (!m_record.completed || m_record.remote.empty()) return;

    fs::path dir(m_settings.outputFolder);
    std::vector<RemoteFile> onDisk;
    for (const auto& f : m_record.remote) {
        std::error_code ec;
        if (fs::exists(dir / f.name, ec)) onDisk.push_back(f);
    }
    if (onDisk.empty()) {
        LOGD("No fully downloaded files to delete.");
        return;
    }

    bool shouldDelete = false;
    switch (m_settings.deleteAfterDownload) {
    case DeletePolicy::Yes:
        shouldDelete = true;
        break;
    case DeletePolicy::Ask:
        shouldDelete = m_prompt.askYesNo("Delete " + std::to_string(onDisk.size())
                                         + " files already on disk from the camera?",
                                         m_timing.deleteQuestionTimeout);
        break;
    case DeletePolicy::No:
        break;
    }

    if (!shouldDelete) {
        LOGI("Skipping deletion of files on the camera.");
        return;
    }

    LOGD("Sending an extra keep-alive ping before deleting...");
    if (!m_http.ping()) LOGW("Keep-alive before deletion failed (the camera may have gone to sleep)");
    m_record.deletedCount = m_http.deleteRemote(onDisk);
}

void Orchestrator::powerDownCamera()
{
    if (!m_settings.shutdownAfterComplete) return;
    try {
        m_link.sleepCamera();
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::Interrupted) throw;
        LOGW("Could not power off the camera: " << e.what());
    }
    m_link.disconnect();
}

// ----- Learned settings -----

void Orchestrator::learnHomeNetwork()
{
    std::optional<std::string> current = m_wifi.currentNetworkName();
    m_record.originalNetwork = current.value_or("");
    if (m_record.originalNetwork.empty()) {
        LOGD("No active Wi-Fi network at start");
        return;
    }
    LOGD("Current Wi-Fi network: '" << m_record.originalNetwork << "'");

    if (m_homeWifi.empty() && m_record.originalNetwork.compare(0, 2, "GP") != 0) {
        m_homeWifi = m_record.originalNetwork;
        m_learned[{"General", "home_wifi"}] = m_homeWifi;
        LOGI("Home Wi-Fi network detected: '" << m_homeWifi << "'");
    }
}

void Orchestrator::learnIdentifier(const DeviceHandle& device)
{
    if (!m_identifier.empty()) return;
    static const std::regex suffix("([A-Z0-9]{4})$");
    std::smatch m;
    if (std::regex_search(device.name, m, suffix)) {
        m_identifier = m[1].str();
        m_learned[{"General", "identifier"}] = m_identifier;
        LOGI("Camera identifier detected: '" << m_identifier << "'");
    }
}

void Orchestrator::noteNetworkChange()
{
    if (m_record.connectedToDeviceNetwork) {
        m_record.networkChanged = true;
        return;
    }
    // a failed join can still leave the host on another network
    std::optional<std::string> current = m_wifi.currentNetworkName();
    if (current && *current != m_record.originalNetwork) m_record.networkChanged = true;
}

// ----- Cleanup -----

void Orchestrator::cleanup()
{
    setState(SessionState::Cleaning);
    LOGD("Cleanup started");

    const std::vector<std::pair<const char*, std::function<void()>>> actions = {
        {"input listener", [this] { stopListener(); }},
        {"power management", [this] { releasePower(); }},
        {"disk keep-alive", [this] { stopDiskKeepAlive(); }},
        {"Wi-Fi keep-alive", [this] { stopNetworkKeepAlive(); }},
        {"media processing", [this] { finalizeFiles(); }},
        {"network restore", [this] { restoreNetwork(); }},
    };
    for (const auto& action : actions) {
        try {
            action.second();
        } catch (const std::exception& e) {
            LOGE("Cleanup step '" << action.first << "' failed: " << e.what());
        }
    }
    LOGD("Cleanup finished");
}

void Orchestrator::stopListener()
{
    if (m_listener && m_listener->isRunning()) {
        LOGD("Stopping the Escape listener...");
        m_listener->stop();
    }
}

void Orchestrator::releasePower()
{
    if (m_power) m_power->release();
}

void Orchestrator::stopDiskKeepAlive()
{
    if (!m_diskKeepAlive) return;
    if (m_diskKeepAlive->isRunning()) LOGD("Stopping disk keep-alive...");
    if (!m_diskKeepAlive->stop(m_timing.diskStopTimeout)) LOGW("Disk keep-alive did not stop in time.");

    std::error_code ec;
    fs::remove(sentinelPath(), ec);
}

void Orchestrator::stopNetworkKeepAlive()
{
    if (!m_networkKeepAlive) return;
    if (m_networkKeepAlive->isRunning()) LOGD("Stopping Wi-Fi keep-alive...");
    if (!m_networkKeepAlive->stop(m_timing.networkStopTimeout)) LOGW("Wi-Fi keep-alive did not stop in time.");
}

void Orchestrator::finalizeFiles()
{
    bool processOnly = m_settings.mode == ProcessingMode::ProcessOnly;
    if (!m_record.completed) return;
    if (m_record.downloadedCount == 0 && !processOnly) {
        LOGI("Skipping media processing (no new files were downloaded).");
        return;
    }
    processMedia(fs::path(m_settings.outputFolder), m_record.downloaded, m_settings, m_media);
    m_record.processed = true;
}

void Orchestrator::restoreNetwork()
{
    // a join cut short by cancellation or an error can still have switched
    if (!m_record.networkChanged && m_record.joinAttempted) noteNetworkChange();
    if (!m_record.networkChanged) {
        LOGD("Returning to the original Wi-Fi is not needed (the network was not switched).");
        return;
    }
    std::string target = m_homeWifi.empty() ? m_record.originalNetwork : m_homeWifi;
    if (target.empty()) {
        LOGW("No original network name known. Reconnect to your Wi-Fi by hand.");
        return;
    }
    LOGI("Returning to the original network '" << target << "'...");
    m_record.restoreAttempted = true;
    m_record.restoreTarget = target;
    if (!m_wifi.restore(target, m_timing.restoreTimeout)) {
        LOGW("Could not return to '" << target << "'. Reconnect by hand.");
    }
}

} // namespace gpgrab
