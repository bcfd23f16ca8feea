#ifndef GPGRAB_SIMPLEBLETRANSPORT_H
#define GPGRAB_SIMPLEBLETRANSPORT_H

#include "BleTransport.h"
#include "BoundedCall.h"

#include <simpleble/SimpleBLE.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gpgrab {

// BleTransport on the first host adapter reported by SimpleBLE.
class SimpleBleTransport : public BleTransport
{
public:
    SimpleBleTransport();
    ~SimpleBleTransport() override;

    std::vector<DeviceHandle> scan(std::chrono::milliseconds duration) override;
    void connect(const DeviceHandle& device, std::chrono::milliseconds timeout) override;
    void disconnect() override;
    bool isConnected() override;

    bool hasCharacteristic(const std::string& charUuid) override;
    void subscribe(const std::string& charUuid, NotifyHandler handler) override;
    void write(const std::string& charUuid, const Bytes& data) override;
    Bytes read(const std::string& charUuid) override;

private:
    SimpleBLE::Adapter& adapter();
    void refreshServices();
    std::string serviceFor(const std::string& charUuid);

    std::optional<SimpleBLE::Adapter> m_adapter;
    std::vector<SimpleBLE::Peripheral> m_seen;
    std::optional<SimpleBLE::Peripheral> m_peripheral;
    std::map<std::string, std::string> m_serviceOf;   // characteristic -> service
    std::mutex m_mutex;
    BoundedCall m_connectCall;
};

} // namespace gpgrab

#endif // GPGRAB_SIMPLEBLETRANSPORT_H
