// gpgrab: pulls new media off a GoPro over BLE + Wi-Fi and hands the
// host back its original network when done.

#include "CameraHttp.h"
#include "CancelToken.h"
#include "Config.h"
#include "ControlLink.h"
#include "Errors.h"
#include "InputListener.h"
#include "Log.h"
#include "MediaProcessor.h"
#include "Orchestrator.h"
#include "PowerInhibitor.h"
#include "SimpleBleTransport.h"
#include "UserPrompt.h"
#include "WifiManager.h"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace gpgrab;

static const char* const kHelp = R"(
gpgrab - automatic media downloader for GoPro cameras.

Usage:
  gpgrab [--config <path>] [--verbose|-v] [--help|-h]

Arguments:
  --config <path>  Configuration file (default: config.ini in the current directory).
  --verbose, -v    Debug logging.
  --help, -h       Show this help message and exit.

Description:
  Finds the GoPro over Bluetooth, turns on its Wi-Fi, joins the camera
  network, downloads new media files, processes them (joins sessions and
  renames them by date) and switches the computer back to the original
  Wi-Fi network. Press Escape (or Ctrl+C) at any time to stop; the
  network is restored either way.

  The configuration file is created with defaults on the first run.

Settings (config.ini):

  [General]
  - identifier:        Last 4 characters of the camera name (part of the network name).
                       Leave it commented out for automatic detection.
  - output_folder:     Folder where media is saved.
  - home_wifi:         Wi-Fi network to return to after downloading.
                       Leave it commented out to use the network active at start.

  [Processing]
  - mode:              What to do after downloading:
      - full:            download, join sessions and rename by date (default)
      - rename_only:     download and rename EACH file by date, no joining
      - download_only:   only download, keeping the camera file names
      - touch_only:      download and set each file's date to the shooting date
      - process_only:    no camera, only process files already in the folder
  - session_gap_hours: Gap in hours that starts a new shooting session.
  - filename_format:   File name format (strftime directives, e.g. %Y-%m-%d_%H-%M).
  - ffmpeg_path:       Path to the ffmpeg executable.

  [Advanced]
  - wifi_wait:         Seconds to wait for the Wi-Fi connection.
  - media_port:        HTTP port of the camera media server.
  - auto_close_window: Close the window when finished (yes/no).

  [Deletion]
  - delete_after_download: Delete downloaded files from the camera (yes/ask/no).

  [Power]
  - shutdown_after_complete: Turn the camera off when finished (yes/no).
)";

// ----- Signals -----

// SIGINT/SIGTERM are blocked in every thread and picked up here with
// sigwait; SIGUSR1 only ends the watcher.
class SignalWatcher
{
public:
    explicit SignalWatcher(CancelToken& cancel) : m_cancel(cancel)
    {
        sigemptyset(&m_set);
        sigaddset(&m_set, SIGINT);
        sigaddset(&m_set, SIGTERM);
        sigaddset(&m_set, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &m_set, nullptr);
        m_thread = std::thread([this] { run(); });
    }

    ~SignalWatcher()
    {
        pthread_kill(m_thread.native_handle(), SIGUSR1);
        m_thread.join();
    }

private:
    void run()
    {
        for (;;) {
            int sig = 0;
            if (sigwait(&m_set, &sig) != 0) return;
            if (sig == SIGUSR1) return;
            m_cancel.cancel(sig == SIGINT ? "interrupted (Ctrl+C)" : "terminated by signal");
        }
    }

    CancelToken& m_cancel;
    sigset_t m_set;
    std::thread m_thread;
};

// ----- Helpers -----

static fs::path executableDir()
{
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return fs::path();
    return exe.parent_path();
}

static bool needsFfmpeg(ProcessingMode mode)
{
    return mode == ProcessingMode::Full || mode == ProcessingMode::RenameOnly || mode == ProcessingMode::ProcessOnly;
}

static void printHelp()
{
    std::cout << kHelp << std::endl;
}

int main(int argc, char* argv[])
{
    std::string configPath = "config.ini";
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printHelp();
            return 0;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printHelp();
            return 1;
        }
    }
    setLogLevel(verbose ? LogLevel::Debug : LogLevel::Info);

    std::cout << "\n" << std::string(80, '=') << "\n"
              << "    (Press Escape at any time to cancel the operation)\n"
              << std::string(80, '=') << std::endl;

    Settings settings;
    try {
        settings = loadSettings(configPath);
    } catch (const Error& e) {
        LOGE(e.what());
        if (!e.remediation().empty()) LOGE(e.remediation());
        return 1;
    }
    LOGD("Mode: " << processingModeName(settings.mode) << ", output folder: '" << settings.outputFolder << "'");
    LOGD("auto_close_window=" << (settings.autoCloseWindow ? "yes" : "no") << " (terminal windows are left to the shell)");

    if (needsFfmpeg(settings.mode)) {
        std::string resolved = resolveFfmpeg(settings.ffmpegPath, executableDir());
        if (resolved.empty()) {
            LOGW("ffmpeg not found at '" << settings.ffmpegPath << "' or next to gpgrab. "
                 "Install ffmpeg (e.g. apt install ffmpeg) or set ffmpeg_path in " << configPath << ".");
        } else {
            if (resolved != settings.ffmpegPath) LOGD("Using ffmpeg at '" << resolved << "'");
            settings.ffmpegPath = resolved;
        }
    }

    CancelToken cancel;
    SignalWatcher signals(cancel);

    InputQueue keys;
    InputListener listener(cancel, keys);
    ConsolePrompt prompt(keys, cancel, [&listener] { return listener.isRunning(); });

    std::unique_ptr<WifiManager> wifi;
    if (NmcliWifiManager::available()) {
        wifi = std::make_unique<NmcliWifiManager>(cancel);
    } else {
        LOGW("NetworkManager (nmcli) not available; automatic Wi-Fi switching is disabled.");
        wifi = std::make_unique<UnsupportedWifiManager>(cancel);
    }

    SimpleBleTransport ble;
    ControlLink link(ble, cancel);
    CameraHttpClient http(settings, cancel);
    FfmpegTool ffmpeg(settings.ffmpegPath);
    PowerInhibitor power;

    Orchestrator session(settings, cancel, link, *wifi, http, prompt, ffmpeg);
    session.setPowerInhibitor(&power);
    session.setInputListener(&listener);
    session.setConfigPath(configPath);

    RunOutcome outcome = session.run();
    switch (outcome) {
    case RunOutcome::Completed:
        LOGI("All done.");
        return 0;
    case RunOutcome::NotFound:
        LOGI("Camera not found. Nothing was done.");
        return 0;
    case RunOutcome::Cancelled:
        LOGI("Stopped.");
        return 0;
    case RunOutcome::Failed:
        break;
    }
    return 1;
}
