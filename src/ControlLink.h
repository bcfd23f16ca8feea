#ifndef GPGRAB_CONTROLLINK_H
#define GPGRAB_CONTROLLINK_H

#include "BleTransport.h"
#include "CancelToken.h"

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace gpgrab {

struct ControlLinkTiming
{
    int discoveryAttempts = 3;
    std::chrono::milliseconds scanDuration{5000};
    std::chrono::milliseconds scanGap{1000};
    std::chrono::milliseconds scanErrorGap{2000};
    std::chrono::milliseconds connectTimeout{12000};
    std::chrono::milliseconds settleDelay{1000};
    int serviceAttempts = 4;
    std::chrono::milliseconds servicePollInterval{1000};
    std::chrono::milliseconds reconnectTimeout{15000};
    std::chrono::milliseconds reconnectSettle{200};
    std::chrono::milliseconds commandTimeout{10000};
    std::chrono::milliseconds registerTimeout{2000};
};

struct WifiCredentials
{
    std::string ssid;
    std::string password;

    bool complete() const { return !ssid.empty() && !password.empty(); }
};

// Command/response channel to the camera over BLE.
//
// Every command registers a one-shot result slot keyed by opcode; the
// notification handler resolves it from the response frame
// [len][opcode][status]. Replies for absent or already resolved slots are
// ignored.
class ControlLink
{
public:
    ControlLink(BleTransport& transport, const CancelToken& cancel, ControlLinkTiming timing = {});
    ~ControlLink();

    // Throws Error(NotFound) after the configured attempts.
    DeviceHandle discover(const std::string& namePattern);

    // Connects, waits for the GoPro characteristics, enables notifications
    // and registers as a client. Throws Error(AuthDesync) for a pairing
    // mismatch, Error(NotFound) when the services never show up.
    void connect(const DeviceHandle& device);

    void ensureConnected();
    void disconnect();
    bool isConnected();

    // Returns the reply status. Throws Error(Timeout) when no reply arrives.
    uint8_t sendCommand(uint8_t opcode, const Bytes& payload);
    uint8_t sendCommand(uint8_t opcode, const Bytes& payload, std::chrono::milliseconds timeout);

    // Best effort; empty fields when unavailable.
    WifiCredentials readWifiCredentials();

    // Throws Error(ProtocolError) on a non-zero status.
    void enableWifi();
    // Logs failures, returns false.
    bool sleepCamera();

    void onNotification(const std::string& charUuid, const Bytes& data);

    const DeviceHandle& device() const { return m_device; }
    size_t pendingCount();

private:
    void enableNotifications();
    void registerClient();
    void reconnect();
    void writeCommand(const Bytes& frame);
    void dropPending(uint8_t opcode, const std::shared_ptr<std::promise<uint8_t>>& slot);

    BleTransport& m_transport;
    const CancelToken& m_cancel;
    ControlLinkTiming m_timing;
    DeviceHandle m_device;
    bool m_haveDevice = false;

    std::mutex m_pendingMutex;
    std::map<uint8_t, std::shared_ptr<std::promise<uint8_t>>> m_pending;
};

} // namespace gpgrab

#endif // GPGRAB_CONTROLLINK_H
