#ifndef GPGRAB_CONFIG_H
#define GPGRAB_CONFIG_H

#include <map>
#include <string>
#include <utility>

namespace gpgrab {

enum class ProcessingMode { Full, RenameOnly, DownloadOnly, TouchOnly, ProcessOnly };
enum class DeletePolicy { Yes, Ask, No };

const char* processingModeName(ProcessingMode mode);

// Immutable run configuration. Built once by loadSettings() and passed by
// const reference to every component.
struct Settings
{
    // General
    std::string identifier;           // empty means auto-detect
    std::string outputFolder = "GoPro_Media";
    std::string homeWifi;             // empty means use the network active at start

    // Processing
    ProcessingMode mode = ProcessingMode::Full;
    int sessionGapHours = 2;
    std::string filenameFormat = "%Y-%m-%d_%H_%M";
    std::string ffmpegPath = "ffmpeg";

    // Advanced
    int wifiWaitSeconds = 30;
    std::string mediaPort = "8080";
    bool autoCloseWindow = false;

    // Deletion
    DeletePolicy deleteAfterDownload = DeletePolicy::Ask;

    // Power
    bool shutdownAfterComplete = true;

    std::string deviceHost = "10.5.5.9";

    // mediaPort when it is all digits, else 80
    int devicePort() const;
    std::string baseUrl() const;
};

// Parsed INI: section -> key -> value. Commented keys are absent.
using IniData = std::map<std::string, std::map<std::string, std::string>>;

IniData parseIni(const std::string& text);

// Builds Settings from parsed INI values. Throws Error(ConfigInvalid) for
// an unknown mode or deletion policy.
Settings settingsFromIni(const IniData& ini);

// Loads path, creating it from the default template when missing.
Settings loadSettings(const std::string& path);

const std::string& defaultConfigText();

using ConfigUpdates = std::map<std::pair<std::string, std::string>, std::string>;

// Rewrites only the lines holding the given keys; every other line is kept
// as it is. Keys present only as "#key = ..." are uncommented in place,
// keys missing from their section are appended at the end of the section.
// Returns false (and logs a warning) on I/O failure.
bool updateConfigFile(const std::string& path, const ConfigUpdates& updates);

// Pure form of updateConfigFile() used on in-memory text.
std::string applyConfigUpdates(const std::string& text, const ConfigUpdates& updates);

} // namespace gpgrab

#endif // GPGRAB_CONFIG_H
