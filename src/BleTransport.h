// Bluetooth LE central, as seen by the control link.

#ifndef GPGRAB_BLETRANSPORT_H
#define GPGRAB_BLETRANSPORT_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace gpgrab {

struct DeviceHandle
{
    std::string name;
    std::string address;
};

using Bytes = std::vector<uint8_t>;

// Called from the transport's own thread with the characteristic UUID
// (lowercase) and the notified value.
using NotifyHandler = std::function<void(const std::string& charUuid, const Bytes& data)>;

// Implementations report failures as gpgrab::Error(TransportFailure) and
// keep the stack's own message text in what().
class BleTransport
{
public:
    virtual ~BleTransport() = default;

    virtual std::vector<DeviceHandle> scan(std::chrono::milliseconds duration) = 0;
    virtual void connect(const DeviceHandle& device, std::chrono::milliseconds timeout) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() = 0;

    // true once service discovery exposes the characteristic
    virtual bool hasCharacteristic(const std::string& charUuid) = 0;
    virtual void subscribe(const std::string& charUuid, NotifyHandler handler) = 0;
    virtual void write(const std::string& charUuid, const Bytes& data) = 0;
    virtual Bytes read(const std::string& charUuid) = 0;
};

} // namespace gpgrab

#endif // GPGRAB_BLETRANSPORT_H
