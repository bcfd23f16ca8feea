#include "Config.h"

#include "Errors.h"
#include "Log.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace gpgrab {

// ----- Default template -----

static const std::string kDefaultConfig = R"([General]
# Identifier: last 4 characters of the camera serial number (part of its network name).
# Keep this line commented out (with # at the start) to detect it automatically.
#identifier =

# OutputFolder: folder where media is saved.
output_folder = GoPro_Media

# HomeWifi: name of the home Wi-Fi network to return to after downloading.
# Keep this line commented out to return to the network that was active at start.
#home_wifi =

[Processing]
# Mode: what to do with files after downloading.
# full:          download, join recording sessions and rename by date (default).
# rename_only:   download and rename EACH file by date without joining.
# download_only: only download, keep the original names.
# touch_only:    download and set the file time to the capture time.
# process_only:  do not download, only process files already in the folder.
mode = full

# SessionGapHours: gap in hours that starts a new recording session.
session_gap_hours = 2

# FileNameFormat: output file name, strftime directives.
# Characters invalid in file names (\ / : * ? " < > |) are replaced with '_'.
# %y=year(2), %Y=year(4), %m=month, %d=day, %H=hour, %M=minute, %S=second
# Example for '2025-09-09_10-02.mp4': %Y-%m-%d_%H-%M
filename_format = %Y-%m-%d_%H_%M

# FfmpegPath: path to the ffmpeg executable.
ffmpeg_path = ffmpeg

[Advanced]
# WifiWait: seconds to wait for one automatic Wi-Fi connection attempt.
wifi_wait = 30

# AutoCloseWindow: close the console window when finished (console hosts only).
# yes: close automatically.
# no:  wait for Enter before closing (default).
auto_close_window = no

# MediaPort: port used to download media.
# Cameras before HERO9 use 8080.
# HERO9 and newer may leave it empty to use the standard port 80.
media_port = 8080

[Deletion]
# DeleteAfterDownload: delete files from the camera after a successful download.
# no:  never delete.
# ask: ask every time (default).
# yes: always delete without asking.
delete_after_download = ask

[Power]
# ShutdownAfterComplete: power the camera off when everything is done.
# yes: power off.
# no:  leave it on (it turns itself off on its own timer).
shutdown_after_complete = yes
)";

const std::string& defaultConfigText()
{
    return kDefaultConfig;
}

// ----- Helpers -----

static std::string trim(const std::string& s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

static bool isAllDigits(const std::string& s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

static bool isCommentLine(const std::string& stripped)
{
    return !stripped.empty() && (stripped[0] == '#' || stripped[0] == ';');
}

static bool parseSectionHeader(const std::string& stripped, std::string& name)
{
    if (stripped.size() < 2 || stripped.front() != '[') return false;
    size_t close = stripped.find(']');
    if (close == std::string::npos) return false;
    name = trim(stripped.substr(1, close - 1));
    return true;
}

// "key = value" -> key (lowercased). Empty when the line holds no key.
static std::string keyOf(const std::string& stripped)
{
    size_t eq = stripped.find('=');
    if (eq == std::string::npos) return "";
    return toLower(trim(stripped.substr(0, eq)));
}

// "#key = value" -> key, only when the text after the comment marker looks
// like an assignment to a plain identifier.
static std::string commentedKeyOf(const std::string& stripped)
{
    if (!isCommentLine(stripped)) return "";
    std::string rest = trim(stripped.substr(1));
    std::string key = keyOf(rest);
    if (key.empty()) return "";
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return "";
    }
    return key;
}

static std::vector<std::string> splitLines(const std::string& text)
{
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (start < text.size()) {
        std::string::size_type nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

// ----- Parsing -----

IniData parseIni(const std::string& text)
{
    IniData data;
    std::string section;
    for (const std::string& line : splitLines(text)) {
        std::string stripped = trim(line);
        if (stripped.empty() || isCommentLine(stripped)) continue;

        std::string name;
        if (parseSectionHeader(stripped, name)) {
            section = name;
            data[section];
            continue;
        }
        if (section.empty()) continue;

        size_t eq = stripped.find('=');
        if (eq == std::string::npos) continue;
        std::string key = toLower(trim(stripped.substr(0, eq)));
        if (key.empty()) continue;
        data[section][key] = trim(stripped.substr(eq + 1));
    }
    return data;
}

static std::string lookup(const IniData& ini, const std::string& section, const std::string& key, const std::string& fallback)
{
    auto s = ini.find(section);
    if (s == ini.end()) return fallback;
    auto k = s->second.find(key);
    if (k == s->second.end()) return fallback;
    return k->second;
}

static int lookupInt(const IniData& ini, const std::string& section, const std::string& key, int fallback)
{
    std::string value = lookup(ini, section, key, "");
    if (value.empty()) return fallback;
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used == value.size()) return v;
    } catch (const std::exception&) {
    }
    LOGW("Invalid value '" << value << "' for " << section << "." << key << ", using " << fallback);
    return fallback;
}

Settings settingsFromIni(const IniData& ini)
{
    Settings s;
    s.identifier = lookup(ini, "General", "identifier", "");
    s.outputFolder = lookup(ini, "General", "output_folder", s.outputFolder);
    s.homeWifi = lookup(ini, "General", "home_wifi", "");

    std::string mode = toLower(lookup(ini, "Processing", "mode", "full"));
    if (mode == "full") s.mode = ProcessingMode::Full;
    else if (mode == "rename_only") s.mode = ProcessingMode::RenameOnly;
    else if (mode == "download_only") s.mode = ProcessingMode::DownloadOnly;
    else if (mode == "touch_only") s.mode = ProcessingMode::TouchOnly;
    else if (mode == "process_only") s.mode = ProcessingMode::ProcessOnly;
    else throw Error(ErrorKind::ConfigInvalid, "Unknown processing mode '" + mode + "'",
                     "Use one of: full, rename_only, download_only, touch_only, process_only");

    s.sessionGapHours = lookupInt(ini, "Processing", "session_gap_hours", s.sessionGapHours);
    s.filenameFormat = lookup(ini, "Processing", "filename_format", s.filenameFormat);
    s.ffmpegPath = lookup(ini, "Processing", "ffmpeg_path", s.ffmpegPath);
    if (s.ffmpegPath.empty()) s.ffmpegPath = "ffmpeg";

    s.wifiWaitSeconds = lookupInt(ini, "Advanced", "wifi_wait", s.wifiWaitSeconds);
    s.mediaPort = lookup(ini, "Advanced", "media_port", s.mediaPort);
    s.autoCloseWindow = toLower(lookup(ini, "Advanced", "auto_close_window", "no")) == "yes";

    std::string del = toLower(lookup(ini, "Deletion", "delete_after_download", "ask"));
    if (del == "yes") s.deleteAfterDownload = DeletePolicy::Yes;
    else if (del == "ask") s.deleteAfterDownload = DeletePolicy::Ask;
    else if (del == "no") s.deleteAfterDownload = DeletePolicy::No;
    else throw Error(ErrorKind::ConfigInvalid, "Unknown delete_after_download value '" + del + "'",
                     "Use one of: yes, ask, no");

    s.shutdownAfterComplete = toLower(lookup(ini, "Power", "shutdown_after_complete", "yes")) == "yes";
    return s;
}

int Settings::devicePort() const
{
    if (isAllDigits(mediaPort)) {
        try {
            return std::stoi(mediaPort);
        } catch (const std::exception&) {
        }
    }
    return 80;
}

std::string Settings::baseUrl() const
{
    if (isAllDigits(mediaPort)) return "http://" + deviceHost + ":" + mediaPort;
    return "http://" + deviceHost;
}

const char* processingModeName(ProcessingMode mode)
{
    switch (mode) {
    case ProcessingMode::Full:         return "full";
    case ProcessingMode::RenameOnly:   return "rename_only";
    case ProcessingMode::DownloadOnly: return "download_only";
    case ProcessingMode::TouchOnly:    return "touch_only";
    case ProcessingMode::ProcessOnly:  return "process_only";
    }
    return "full";
}

Settings loadSettings(const std::string& path)
{
    if (!fs::exists(path)) {
        std::ofstream out(path, std::ios::binary);
        if (!out) {
            throw Error(ErrorKind::IOFailure, "Cannot create configuration file '" + path + "'");
        }
        out << kDefaultConfig;
        out.close();
        if (!out) throw Error(ErrorKind::IOFailure, "Cannot write configuration file '" + path + "'");
        LOGI("Created configuration file '" << path << "'. Review it and adjust if needed.");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) throw Error(ErrorKind::ConfigInvalid, "Cannot read configuration file '" + path + "'");
    std::stringstream ss;
    ss << in.rdbuf();
    return settingsFromIni(parseIni(ss.str()));
}

// ----- In-place update -----

std::string applyConfigUpdates(const std::string& text, const ConfigUpdates& updates)
{
    if (updates.empty()) return text;

    std::vector<std::string> lines = splitLines(text);
    bool trailingNewline = !text.empty() && text.back() == '\n';

    // pass 1: locate the line to rewrite for every key
    std::map<std::pair<std::string, std::string>, size_t> activeLine;
    std::map<std::pair<std::string, std::string>, size_t> commentedLine;
    std::map<std::string, size_t> sectionEnd;  // last non-blank line of the section
    std::string section;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string stripped = trim(lines[i]);
        if (stripped.empty()) continue;
        std::string name;
        if (!isCommentLine(stripped) && parseSectionHeader(stripped, name)) {
            section = name;
            sectionEnd[section] = i;
            continue;
        }
        if (section.empty()) continue;
        sectionEnd[section] = i;

        if (isCommentLine(stripped)) {
            std::string key = commentedKeyOf(stripped);
            auto id = std::make_pair(section, key);
            if (!key.empty() && updates.count(id) && !commentedLine.count(id)) commentedLine[id] = i;
            continue;
        }
        std::string key = keyOf(stripped);
        auto id = std::make_pair(section, key);
        if (!key.empty() && updates.count(id) && !activeLine.count(id)) activeLine[id] = i;
    }

    std::map<size_t, std::string> replaced;
    std::map<size_t, std::vector<std::string>> appendAfter;
    std::vector<std::pair<std::string, std::string>> newSections;
    for (const auto& u : updates) {
        const std::string& sec = u.first.first;
        const std::string& key = u.first.second;
        size_t idx;
        if (activeLine.count(u.first)) {
            idx = activeLine[u.first];
        } else if (commentedLine.count(u.first)) {
            idx = commentedLine[u.first];
        } else if (sectionEnd.count(sec)) {
            appendAfter[sectionEnd[sec]].push_back(key + " = " + u.second);
            continue;
        } else {
            newSections.emplace_back(sec, key + " = " + u.second);
            continue;
        }
        const std::string& line = lines[idx];
        std::string indent = line.substr(0, line.find_first_not_of(" \t"));
        std::string cr = (!line.empty() && line.back() == '\r') ? "\r" : "";
        replaced[idx] = indent + key + " = " + u.second + cr;
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        out += replaced.count(i) ? replaced[i] : lines[i];
        if (i + 1 < lines.size() || trailingNewline) out += "\n";
        auto a = appendAfter.find(i);
        if (a != appendAfter.end()) {
            if (i + 1 == lines.size() && !trailingNewline) out += "\n";
            for (const std::string& l : a->second) out += l + "\n";
        }
    }
    std::string lastSection;
    for (const auto& ns : newSections) {
        if (!out.empty() && out.back() != '\n') out += "\n";
        if (ns.first != lastSection) {
            out += "\n[" + ns.first + "]\n";
            lastSection = ns.first;
        }
        out += ns.second + "\n";
    }
    return out;
}

bool updateConfigFile(const std::string& path, const ConfigUpdates& updates)
{
    if (updates.empty()) return true;

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        LOGW("Could not update configuration file '" << path << "': cannot open it");
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    in.close();

    std::string updated = applyConfigUpdates(ss.str(), updates);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        LOGW("Could not update configuration file '" << path << "': cannot write it");
        return false;
    }
    out << updated;
    out.close();
    if (!out) {
        LOGW("Could not update configuration file '" << path << "': write failed");
        return false;
    }
    LOGD("Configuration file '" << path << "' updated to speed up future runs.");
    return true;
}

} // namespace gpgrab
