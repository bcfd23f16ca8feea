#ifndef GPGRAB_WIFIMANAGER_H
#define GPGRAB_WIFIMANAGER_H

#include "CancelToken.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gpgrab {

struct JoinTiming
{
    std::chrono::milliseconds pollInterval{1000};
    // connect requests are re-issued at this interval, not on every poll
    std::chrono::milliseconds reissueInterval{4000};
    int scanRoundPolls = 5;
};

enum class ProfileScope { User, System };

// Must return within the given budget.
using ReachabilityProbe = std::function<bool(std::chrono::milliseconds budget)>;

// Host wireless network control. Subclasses provide the platform
// primitives; scanning and joining are built on top of them here.
class WifiManager
{
public:
    explicit WifiManager(const CancelToken& cancel, JoinTiming timing = {});
    virtual ~WifiManager() = default;

    virtual bool supported() const { return true; }

    virtual std::optional<std::string> currentNetworkName() = 0;
    virtual std::optional<std::string> primaryWirelessInterface() = 0;
    virtual bool triggerScan() = 0;
    virtual std::vector<std::string> visibleNetworks() = 0;
    virtual bool profileExists(const std::string& ssid) = 0;
    virtual void deleteProfile(const std::string& ssid) = 0;
    virtual bool createProfile(const std::string& ssid, const std::string& password, ProfileScope scope) = 0;
    // Must return within budget.
    virtual bool requestConnect(const std::string& ssid, std::chrono::milliseconds budget) = 0;

    // Used by connect() when verifying against the device.
    void setReachabilityProbe(ReachabilityProbe probe) { m_probe = std::move(probe); }

    std::optional<std::string> scanForNetworkContaining(const std::string& fragment,
                                                        std::chrono::milliseconds timeout);

    // With a password the profile for ssid is recreated first; without one
    // a saved profile must already exist. Returns false on timeout. Connect
    // requests and probes get only the time left, and are skipped when they
    // took longer than that before.
    bool connect(const std::string& ssid, const std::string& password,
                 std::chrono::milliseconds timeout, bool verifyAgainstDevice);

    // Best-effort switch back to a saved network. Ignores cancellation so
    // it can run after the session was interrupted.
    bool restore(const std::string& ssid, std::chrono::milliseconds timeout);

protected:
    bool join(const std::string& ssid, const std::string& password, std::chrono::milliseconds timeout,
              bool verifyAgainstDevice, const CancelToken& cancel);

    const CancelToken& m_cancel;
    JoinTiming m_timing;
    ReachabilityProbe m_probe;
};

// NetworkManager backend driven through nmcli.
class NmcliWifiManager : public WifiManager
{
public:
    explicit NmcliWifiManager(const CancelToken& cancel, JoinTiming timing = {});

    std::optional<std::string> currentNetworkName() override;
    std::optional<std::string> primaryWirelessInterface() override;
    bool triggerScan() override;
    std::vector<std::string> visibleNetworks() override;
    bool profileExists(const std::string& ssid) override;
    void deleteProfile(const std::string& ssid) override;
    bool createProfile(const std::string& ssid, const std::string& password, ProfileScope scope) override;
    bool requestConnect(const std::string& ssid, std::chrono::milliseconds budget) override;

    // nmcli is installed and answers
    static bool available();
};

// Hosts without a supported network backend. Every primitive reports
// nothing so joining falls back to the manual prompt.
class UnsupportedWifiManager : public WifiManager
{
public:
    using WifiManager::WifiManager;

    bool supported() const override { return false; }
    std::optional<std::string> currentNetworkName() override { return std::nullopt; }
    std::optional<std::string> primaryWirelessInterface() override { return std::nullopt; }
    bool triggerScan() override { return false; }
    std::vector<std::string> visibleNetworks() override { return {}; }
    bool profileExists(const std::string&) override { return false; }
    void deleteProfile(const std::string&) override {}
    bool createProfile(const std::string&, const std::string&, ProfileScope) override { return false; }
    bool requestConnect(const std::string&, std::chrono::milliseconds) override { return false; }
};

// nmcli terse output: fields split on ':' honouring "\:" and "\\" escapes.
std::vector<std::string> splitTerseFields(const std::string& line);

} // namespace gpgrab

#endif // GPGRAB_WIFIMANAGER_H
