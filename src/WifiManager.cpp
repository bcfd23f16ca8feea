#include "WifiManager.h"

#include "Log.h"
#include "Subprocess.h"

#include <algorithm>
#include <pwd.h>
#include <sstream>
#include <unistd.h>

namespace gpgrab {

using Clock = std::chrono::steady_clock;

static std::chrono::milliseconds remaining(Clock::time_point end)
{
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(end - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

static std::chrono::milliseconds elapsedSince(Clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

WifiManager::WifiManager(const CancelToken& cancel, JoinTiming timing)
    : m_cancel(cancel), m_timing(timing)
{
}

std::optional<std::string> WifiManager::scanForNetworkContaining(const std::string& fragment,
                                                                 std::chrono::milliseconds timeout)
{
    if (!primaryWirelessInterface()) {
        LOGW("No Wi-Fi interface found");
        return std::nullopt;
    }

    LOGI("Looking for the camera Wi-Fi network (up to "
         << std::chrono::duration_cast<std::chrono::seconds>(timeout).count() << " seconds)...");
    auto end = Clock::now() + timeout;
    while (Clock::now() < end) {
        m_cancel.throwIfCancelled();
        LOGD("Starting a new Wi-Fi scan...");
        if (!triggerScan()) LOGW("Could not start a Wi-Fi scan");

        for (int i = 0; i < m_timing.scanRoundPolls; ++i) {
            if (Clock::now() >= end) break;
            m_cancel.sleepFor(std::min(m_timing.pollInterval, remaining(end)));
            for (const std::string& ssid : visibleNetworks()) {
                if (ssid.find(fragment) != std::string::npos) {
                    LOGI("Found camera network by identifier: '" << ssid << "'");
                    return ssid;
                }
            }
        }
    }
    LOGW("No Wi-Fi network containing '" << fragment << "' found");
    return std::nullopt;
}

bool WifiManager::connect(const std::string& ssid, const std::string& password,
                          std::chrono::milliseconds timeout, bool verifyAgainstDevice)
{
    return join(ssid, password, timeout, verifyAgainstDevice, m_cancel);
}

bool WifiManager::restore(const std::string& ssid, std::chrono::milliseconds timeout)
{
    CancelToken uncancellable;
    return join(ssid, "", timeout, false, uncancellable);
}

bool WifiManager::join(const std::string& ssid, const std::string& password,
                       std::chrono::milliseconds timeout, bool verifyAgainstDevice, const CancelToken& cancel)
{
    if (!password.empty()) {
        LOGD("Updating Wi-Fi profile for '" << ssid << "'...");
        deleteProfile(ssid);
        if (!createProfile(ssid, password, ProfileScope::User)) {
            LOGW("Could not create a per-user profile, trying a system-wide one (may need privileges)...");
            if (!createProfile(ssid, password, ProfileScope::System)) return false;
        }
        LOGD("Wi-Fi profile for '" << ssid << "' created");
    } else if (!profileExists(ssid)) {
        LOGE("No saved profile for the home Wi-Fi network '" << ssid << "'.");
        LOGE("Could not return to the original network. Please connect manually.");
        return false;
    }

    if (verifyAgainstDevice) {
        LOGI("Connecting to Wi-Fi '" << ssid << "'...");
    } else {
        LOGD("Connecting to Wi-Fi '" << ssid << "'...");
    }

    auto end = Clock::now() + timeout;
    bool issued = false;
    Clock::time_point lastIssue;
    // longest observed duration of each blocking step
    std::chrono::milliseconds requestCost{0};
    std::chrono::milliseconds probeCost{0};
    while (Clock::now() < end) {
        cancel.throwIfCancelled();
        if (!issued || Clock::now() - lastIssue >= m_timing.reissueInterval) {
            std::chrono::milliseconds left = remaining(end);
            if (left > requestCost) {
                issued = true;
                lastIssue = Clock::now();
                LOGD("Requesting connection to '" << ssid << "'...");
                if (!requestConnect(ssid, left)) {
                    LOGD("Connect request failed; normal while the network is not visible yet");
                }
                requestCost = std::max(requestCost, elapsedSince(lastIssue));
            }
        }

        cancel.sleepFor(std::min(m_timing.pollInterval, remaining(end)));
        std::optional<std::string> current = currentNetworkName();
        if (current && *current == ssid) {
            if (!verifyAgainstDevice) {
                LOGD("Connected to Wi-Fi: " << ssid);
                return true;
            }
            if (!m_probe) {
                LOGI("Connected to Wi-Fi '" << ssid << "'.");
                return true;
            }
            std::chrono::milliseconds left = remaining(end);
            if (left.count() > 0 && left > probeCost) {
                auto probeStart = Clock::now();
                bool reachable = m_probe(left);
                probeCost = std::max(probeCost, elapsedSince(probeStart));
                if (reachable) {
                    LOGI("Connected to Wi-Fi '" << ssid << "'.");
                    return true;
                }
            }
        }
    }

    LOGE("Timed out: could not connect to and verify '" << ssid << "' within "
         << std::chrono::duration_cast<std::chrono::seconds>(timeout).count() << " seconds.");
    return false;
}

// ----- nmcli backend -----

std::vector<std::string> splitTerseFields(const std::string& line)
{
    std::vector<std::string> fields(1);
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            fields.back() += line[++i];
        } else if (c == ':') {
            fields.emplace_back();
        } else {
            fields.back() += c;
        }
    }
    return fields;
}

static std::vector<std::string> outputLines(const std::string& out)
{
    std::vector<std::string> lines;
    std::istringstream ss(out);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

static ProcessResult nmcli(const std::vector<std::string>& args,
                           std::chrono::milliseconds timeout = std::chrono::seconds(15))
{
    std::vector<std::string> argv{"nmcli"};
    argv.insert(argv.end(), args.begin(), args.end());
    ProcessResult r = runProcess(argv, timeout);
    if (!r.ok()) {
        std::string err = r.errorOutput;
        while (!err.empty() && (err.back() == '\n' || err.back() == '\r')) err.pop_back();
        LOGD("nmcli " << args.front() << " failed (" << r.exitCode << "): " << err);
    }
    return r;
}

static std::string loginName()
{
    char buf[256];
    if (getlogin_r(buf, sizeof(buf)) == 0) return buf;
    struct passwd* pw = getpwuid(geteuid());
    return pw ? pw->pw_name : "";
}

NmcliWifiManager::NmcliWifiManager(const CancelToken& cancel, JoinTiming timing)
    : WifiManager(cancel, timing)
{
}

bool NmcliWifiManager::available()
{
    return runProcess({"nmcli", "--version"}, std::chrono::seconds(5)).ok();
}

std::optional<std::string> NmcliWifiManager::primaryWirelessInterface()
{
    ProcessResult r = nmcli({"-t", "-f", "DEVICE,TYPE", "device"});
    if (!r.ok()) return std::nullopt;
    for (const auto& line : outputLines(r.output)) {
        auto f = splitTerseFields(line);
        if (f.size() >= 2 && f[1] == "wifi") return f[0];
    }
    return std::nullopt;
}

std::optional<std::string> NmcliWifiManager::currentNetworkName()
{
    ProcessResult r = nmcli({"-t", "-f", "ACTIVE,SSID", "device", "wifi", "list", "--rescan", "no"});
    if (!r.ok()) {
        LOGW("Could not read the current Wi-Fi network from nmcli");
        return std::nullopt;
    }
    for (const auto& line : outputLines(r.output)) {
        auto f = splitTerseFields(line);
        if (f.size() >= 2 && f[0] == "yes" && !f[1].empty()) return f[1];
    }
    return std::nullopt;
}

bool NmcliWifiManager::triggerScan()
{
    return nmcli({"device", "wifi", "rescan"}).ok();
}

std::vector<std::string> NmcliWifiManager::visibleNetworks()
{
    std::vector<std::string> ssids;
    ProcessResult r = nmcli({"-t", "-f", "SSID", "device", "wifi", "list", "--rescan", "no"});
    if (!r.ok()) return ssids;
    for (const auto& line : outputLines(r.output)) {
        auto f = splitTerseFields(line);
        if (!f[0].empty() && std::find(ssids.begin(), ssids.end(), f[0]) == ssids.end()) ssids.push_back(f[0]);
    }
    return ssids;
}

bool NmcliWifiManager::profileExists(const std::string& ssid)
{
    ProcessResult r = nmcli({"-t", "-f", "NAME", "connection", "show"});
    if (!r.ok()) {
        LOGW("Could not check the Wi-Fi profile for '" << ssid << "'");
        return false;
    }
    for (const auto& line : outputLines(r.output)) {
        if (splitTerseFields(line)[0] == ssid) return true;
    }
    return false;
}

void NmcliWifiManager::deleteProfile(const std::string& ssid)
{
    // a missing profile is fine here
    nmcli({"connection", "delete", "id", ssid});
}

bool NmcliWifiManager::createProfile(const std::string& ssid, const std::string& password, ProfileScope scope)
{
    std::vector<std::string> args{"connection", "add", "type", "wifi", "con-name", ssid};
    std::optional<std::string> iface = primaryWirelessInterface();
    if (iface) {
        args.push_back("ifname");
        args.push_back(*iface);
    }
    args.insert(args.end(), {"ssid", ssid, "wifi-sec.key-mgmt", "wpa-psk", "wifi-sec.psk", password});
    if (scope == ProfileScope::User) {
        std::string user = loginName();
        if (!user.empty()) {
            args.push_back("connection.permissions");
            args.push_back("user:" + user);
        }
    }
    return nmcli(args).ok();
}

bool NmcliWifiManager::requestConnect(const std::string& ssid, std::chrono::milliseconds budget)
{
    // nmcli waits in whole seconds; the process timeout enforces the rest
    long long waitSeconds = std::max<long long>(1, std::min<long long>(3, budget.count() / 1000));
    return nmcli({"--wait", std::to_string(waitSeconds), "connection", "up", "id", ssid}, budget).ok();
}

} // namespace gpgrab
