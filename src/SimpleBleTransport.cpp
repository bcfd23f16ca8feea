#include "SimpleBleTransport.h"

#include "Errors.h"
#include "Log.h"

#include <algorithm>
#include <cctype>

namespace gpgrab {

static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

static SimpleBLE::ByteArray toByteArray(const Bytes& data)
{
    return SimpleBLE::ByteArray(std::string(data.begin(), data.end()));
}

template <typename T>
static Bytes toBytes(const T& payload)
{
    return Bytes(payload.begin(), payload.end());
}

SimpleBleTransport::SimpleBleTransport() = default;

SimpleBleTransport::~SimpleBleTransport()
{
    disconnect();
}

SimpleBLE::Adapter& SimpleBleTransport::adapter()
{
    if (m_adapter) return *m_adapter;
    try {
        if (!SimpleBLE::Adapter::bluetooth_enabled()) {
            throw Error(ErrorKind::TransportFailure, "Bluetooth is disabled on this computer");
        }
        std::vector<SimpleBLE::Adapter> adapters = SimpleBLE::Adapter::get_adapters();
        if (adapters.empty()) throw Error(ErrorKind::TransportFailure, "No Bluetooth adapter found");
        m_adapter = adapters.front();
        LOGD("Using Bluetooth adapter " << m_adapter->identifier() << " [" << m_adapter->address() << "]");
    } catch (const SimpleBLE::Exception::BaseException& e) {
        throw Error(ErrorKind::TransportFailure, e.what());
    }
    return *m_adapter;
}

std::vector<DeviceHandle> SimpleBleTransport::scan(std::chrono::milliseconds duration)
{
    SimpleBLE::Adapter& a = adapter();
    std::vector<DeviceHandle> found;
    try {
        a.scan_for(static_cast<int>(duration.count()));
        m_seen = a.scan_get_results();
        for (auto& p : m_seen) {
            found.push_back(DeviceHandle{p.identifier(), p.address()});
        }
    } catch (const SimpleBLE::Exception::BaseException& e) {
        throw Error(ErrorKind::TransportFailure, e.what());
    }
    return found;
}

void SimpleBleTransport::connect(const DeviceHandle& device, std::chrono::milliseconds timeout)
{
    LOGD("Connecting to " << device.address << " (timeout " << timeout.count() << " ms)");
    auto it = std::find_if(m_seen.begin(), m_seen.end(),
                           [&device](SimpleBLE::Peripheral& p) { return p.address() == device.address; });
    if (it == m_seen.end()) {
        scan(std::chrono::seconds(3));
        it = std::find_if(m_seen.begin(), m_seen.end(),
                          [&device](SimpleBLE::Peripheral& p) { return p.address() == device.address; });
        if (it == m_seen.end()) {
            throw Error(ErrorKind::TransportFailure, "Device " + device.address + " is not advertising");
        }
    }

    SimpleBLE::Peripheral peripheral = *it;
    bool finished = false;
    try {
        finished = m_connectCall.run([peripheral]() mutable { peripheral.connect(); }, timeout);
    } catch (const SimpleBLE::Exception::BaseException& e) {
        throw Error(ErrorKind::TransportFailure, e.what());
    }
    if (!finished) {
        try {
            peripheral.disconnect();
        } catch (const SimpleBLE::Exception::BaseException& e) {
            LOGD("SimpleBLE disconnect after connect timeout: " << e.what());
        }
        throw Error(ErrorKind::Timeout, "Connecting to " + device.address + " timed out after "
                    + std::to_string(timeout.count()) + " ms");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_peripheral = peripheral;
    m_serviceOf.clear();
}

void SimpleBleTransport::disconnect()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_peripheral) return;
    try {
        if (m_peripheral->is_connected()) m_peripheral->disconnect();
    } catch (const SimpleBLE::Exception::BaseException& e) {
        LOGD("SimpleBLE disconnect: " << e.what());
    }
    m_peripheral.reset();
    m_serviceOf.clear();
}

bool SimpleBleTransport::isConnected()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        return m_peripheral && m_peripheral->is_connected();
    } catch (const SimpleBLE::Exception::BaseException& e) {
        LOGD("SimpleBLE is_connected: " << e.what());
        return false;
    }
}

void SimpleBleTransport::refreshServices()
{
    m_serviceOf.clear();
    for (auto& service : m_peripheral->services()) {
        for (auto& characteristic : service.characteristics()) {
            m_serviceOf[lower(characteristic.uuid())] = lower(service.uuid());
        }
    }
}

std::string SimpleBleTransport::serviceFor(const std::string& charUuid)
{
    if (!m_peripheral) throw Error(ErrorKind::TransportFailure, "Not connected");
    std::string key = lower(charUuid);
    auto it = m_serviceOf.find(key);
    if (it == m_serviceOf.end()) {
        try {
            refreshServices();
        } catch (const SimpleBLE::Exception::BaseException& e) {
            throw Error(ErrorKind::TransportFailure, e.what());
        }
        it = m_serviceOf.find(key);
        if (it == m_serviceOf.end()) throw Error(ErrorKind::TransportFailure, "Characteristic " + key + " not found");
    }
    return it->second;
}

bool SimpleBleTransport::hasCharacteristic(const std::string& charUuid)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_peripheral) return false;
    try {
        refreshServices();
    } catch (const SimpleBLE::Exception::BaseException& e) {
        LOGD("Service discovery: " << e.what());
        return false;
    }
    return m_serviceOf.count(lower(charUuid)) > 0;
}

void SimpleBleTransport::subscribe(const std::string& charUuid, NotifyHandler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string service = serviceFor(charUuid);
    std::string characteristic = lower(charUuid);
    try {
        m_peripheral->notify(service, characteristic, [handler, characteristic](SimpleBLE::ByteArray payload) {
            handler(characteristic, toBytes(payload));
        });
    } catch (const SimpleBLE::Exception::BaseException& e) {
        throw Error(ErrorKind::TransportFailure, e.what());
    }
}

void SimpleBleTransport::write(const std::string& charUuid, const Bytes& data)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string service = serviceFor(charUuid);
    try {
        m_peripheral->write_request(service, lower(charUuid), toByteArray(data));
    } catch (const SimpleBLE::Exception::BaseException& e) {
        throw Error(ErrorKind::TransportFailure, e.what());
    }
}

Bytes SimpleBleTransport::read(const std::string& charUuid)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string service = serviceFor(charUuid);
    try {
        return toBytes(m_peripheral->read(service, lower(charUuid)));
    } catch (const SimpleBLE::Exception::BaseException& e) {
        throw Error(ErrorKind::TransportFailure, e.what());
    }
}

} // namespace gpgrab
