#include "ControlLink.h"

#include "Errors.h"
#include "GoProProtocol.h"
#include "Log.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <regex>

namespace gpgrab {

static std::string hexString(const Bytes& data)
{
    std::string out;
    char buf[4];
    for (uint8_t b : data) {
        snprintf(buf, sizeof(buf), "%02x", b);
        out += buf;
    }
    return out;
}

static std::string hexByte(uint8_t v)
{
    char buf[8];
    snprintf(buf, sizeof(buf), "0x%02x", v);
    return buf;
}

static std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

static bool looksLikeAuthDesync(const std::string& message)
{
    std::string m = toLower(message);
    return m.find("insufficient authentication") != std::string::npos
        || m.find("protocol error 0x05") != std::string::npos
        || m.find("authentication") != std::string::npos;
}

static std::string decodeText(const Bytes& raw)
{
    std::string s(raw.begin(), raw.end());
    while (!s.empty() && s.back() == '\0') s.pop_back();
    return s;
}

ControlLink::ControlLink(BleTransport& transport, const CancelToken& cancel, ControlLinkTiming timing)
    : m_transport(transport), m_cancel(cancel), m_timing(timing)
{
}

ControlLink::~ControlLink()
{
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    m_pending.clear();
}

// ----- Discovery and connection -----

DeviceHandle ControlLink::discover(const std::string& namePattern)
{
    LOGI("Searching for the GoPro camera...");
    LOGD("BLE name pattern: '" << namePattern << "'");

    std::regex token;
    try {
        token = std::regex(namePattern);
    } catch (const std::regex_error& e) {
        throw Error(ErrorKind::ConfigInvalid, "Invalid device name pattern '" + namePattern + "': " + e.what());
    }

    for (int attempt = 1; attempt <= m_timing.discoveryAttempts; ++attempt) {
        m_cancel.throwIfCancelled();
        LOGD("BLE scan attempt " << attempt << "/" << m_timing.discoveryAttempts << "...");

        std::vector<DeviceHandle> devices;
        try {
            devices = m_transport.scan(m_timing.scanDuration);
        } catch (const Error& e) {
            if (e.kind() != ErrorKind::TransportFailure) throw;
            LOGE("Bluetooth scan failed: " << e.what() << ". Check that Bluetooth is enabled on this computer.");
            m_cancel.sleepFor(m_timing.scanErrorGap);
            continue;
        }

        std::string seen;
        for (const auto& d : devices) {
            if (d.name.empty()) continue;
            if (std::regex_search(d.name, token)) {
                LOGI("Found camera: " << d.name << " (" << d.address << ")");
                m_device = d;
                m_haveDevice = true;
                return d;
            }
            if (!seen.empty()) seen += ", ";
            seen += d.name;
        }

        LOGD("Camera not found, scanning again...");
        if (!seen.empty()) {
            LOGD("  (seen devices: " << seen << ")");
        } else {
            LOGD("  (no named devices seen; make sure Bluetooth is enabled)");
        }
        if (attempt < m_timing.discoveryAttempts) m_cancel.sleepFor(m_timing.scanGap);
    }

    throw Error(ErrorKind::NotFound, "GoPro camera not found",
                "Make sure the camera is on and paired with this computer.");
}

void ControlLink::connect(const DeviceHandle& device)
{
    m_device = device;
    m_haveDevice = true;

    LOGD("Opening BLE connection to " << device.name << "...");
    m_transport.connect(device, m_timing.connectTimeout);
    LOGD("BLE connection established");

    m_cancel.sleepFor(m_timing.settleDelay);

    // services may appear late after connecting or pairing
    bool found = false;
    for (int attempt = 1; attempt <= m_timing.serviceAttempts; ++attempt) {
        if (!m_transport.isConnected()) {
            throw Error(ErrorKind::TransportFailure, "Connection to the camera was lost while waiting for services");
        }
        LOGD("Service discovery attempt " << attempt << "/" << m_timing.serviceAttempts << "...");
        if (m_transport.hasCharacteristic(gopro::kCommandResponseUuid)) {
            found = true;
            break;
        }
        LOGD("Characteristics not found yet, waiting...");
        m_cancel.sleepFor(m_timing.servicePollInterval);
    }
    if (!found) {
        throw Error(ErrorKind::NotFound, "GoPro services not found",
                    "The camera may have gone to sleep, or the model is not supported.");
    }

    enableNotifications();
    registerClient();
    LOGD("BLE control link ready");
}

void ControlLink::enableNotifications()
{
    NotifyHandler handler = [this](const std::string& charUuid, const Bytes& data) { onNotification(charUuid, data); };
    try {
        LOGD("Enabling camera notifications (this may trigger pairing)...");
        m_transport.subscribe(gopro::kCommandResponseUuid, handler);
        m_transport.subscribe(gopro::kSettingsResponseUuid, handler);
        LOGD("Notifications enabled");
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::TransportFailure && looksLikeAuthDesync(e.what())) {
            throw Error(ErrorKind::AuthDesync,
                        std::string("Pairing with the camera is out of sync: ") + e.what(),
                        "This usually happens when the pairing was removed on the computer but not on the camera.\n"
                        "  1. Remove the GoPro from this computer's Bluetooth devices (bluetoothctl remove "
                        + m_device.address + ").\n"
                        "  2. On the camera: Preferences -> Connections -> Reset Connections.\n"
                        "  3. Run gpgrab again to create a fresh pairing.");
        }
        throw;
    }
}

void ControlLink::registerClient()
{
    LOGD("Registering as third party client...");
    try {
        uint8_t status = sendCommand(gopro::kCmdClientInfo, {0x00}, m_timing.registerTimeout);
        if (status == gopro::kStatusSuccess) LOGD("Registered as third party client");
    } catch (const Error& e) {
        // older models never answer
        if (e.kind() != ErrorKind::Timeout) throw;
        LOGD("No reply to client registration, continuing");
    }
}

void ControlLink::ensureConnected()
{
    if (m_transport.isConnected()) return;
    if (!m_haveDevice) throw Error(ErrorKind::TransportFailure, "No camera to reconnect to");

    LOGD("Reconnecting to the camera over BLE...");
    m_transport.connect(m_device, m_timing.reconnectTimeout);
    m_cancel.sleepFor(m_timing.reconnectSettle);
    enableNotifications();
    LOGD("BLE reconnect done");
}

void ControlLink::reconnect()
{
    try {
        m_transport.disconnect();
    } catch (const Error& e) {
        LOGD("Disconnect before reconnect failed: " << e.what());
    }
    ensureConnected();
}

void ControlLink::disconnect()
{
    try {
        if (m_transport.isConnected()) {
            m_transport.disconnect();
            LOGD("BLE disconnected");
        }
    } catch (const Error& e) {
        LOGW("BLE disconnect failed: " << e.what());
    }
}

bool ControlLink::isConnected()
{
    return m_transport.isConnected();
}

// ----- Commands -----

void ControlLink::writeCommand(const Bytes& frame)
{
    try {
        ensureConnected();
        m_transport.write(gopro::kCommandRequestUuid, frame);
    } catch (const Error& e) {
        if (e.kind() != ErrorKind::TransportFailure) throw;
        LOGW("BLE write failed: " << e.what() << ". Reconnecting and sending again...");
        reconnect();
        m_transport.write(gopro::kCommandRequestUuid, frame);
    }
}

void ControlLink::dropPending(uint8_t opcode, const std::shared_ptr<std::promise<uint8_t>>& slot)
{
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    auto it = m_pending.find(opcode);
    if (it != m_pending.end() && it->second == slot) m_pending.erase(it);
}

uint8_t ControlLink::sendCommand(uint8_t opcode, const Bytes& payload)
{
    return sendCommand(opcode, payload, m_timing.commandTimeout);
}

uint8_t ControlLink::sendCommand(uint8_t opcode, const Bytes& payload, std::chrono::milliseconds timeout)
{
    auto slot = std::make_shared<std::promise<uint8_t>>();
    std::future<uint8_t> reply = slot->get_future();
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        m_pending[opcode] = slot;
    }

    Bytes frame = gopro::commandFrame(opcode, payload);
    LOGD("Sending command " << hexByte(opcode) << ": " << hexString(frame));
    try {
        writeCommand(frame);
    } catch (const std::exception&) {
        dropPending(opcode, slot);
        throw;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (reply.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (m_cancel.isCancelled()) {
            dropPending(opcode, slot);
            m_cancel.throwIfCancelled();
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            dropPending(opcode, slot);
            throw Error(ErrorKind::Timeout, "No reply to command " + hexByte(opcode));
        }
    }
    return reply.get();
}

void ControlLink::onNotification(const std::string& charUuid, const Bytes& data)
{
    LOGD("Notification from " << charUuid << ": " << hexString(data));
    if (toLower(charUuid) != gopro::kCommandResponseUuid || data.size() <= 2) return;

    uint8_t opcode = data[1];
    uint8_t status = data[2];

    std::shared_ptr<std::promise<uint8_t>> slot;
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        auto it = m_pending.find(opcode);
        if (it == m_pending.end()) return;
        slot = it->second;
        m_pending.erase(it);
    }
    slot->set_value(status);

    if (status != gopro::kStatusSuccess) {
        if (gopro::isBenignStatus(opcode, status)) {
            LOGD("Camera answered command " << hexByte(opcode) << " with status " << int(status)
                 << " (NOT_SUPPORTED), expected on some models");
        } else {
            LOGE("Camera answered command " << hexByte(opcode) << " with error " << int(status));
        }
    }
}

size_t ControlLink::pendingCount()
{
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    return m_pending.size();
}

WifiCredentials ControlLink::readWifiCredentials()
{
    WifiCredentials creds;
    try {
        LOGD("Reading Wi-Fi credentials from the camera...");
        creds.ssid = decodeText(m_transport.read(gopro::kWifiSsidUuid));
        creds.password = decodeText(m_transport.read(gopro::kWifiPasswordUuid));
        if (creds.complete()) LOGD("Got Wi-Fi credentials: SSID='" << creds.ssid << "'");
    } catch (const Error& e) {
        LOGW("Could not read Wi-Fi credentials: " << e.what() << ". Continuing with saved profiles.");
        creds = WifiCredentials();
    }
    return creds;
}

void ControlLink::enableWifi()
{
    LOGD("Sending Wi-Fi AP ON command...");
    uint8_t status;
    try {
        status = sendCommand(gopro::kCmdSetWifiAp, {0x01, 0x01});
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::Timeout) {
            throw Error(ErrorKind::Timeout, "Timed out waiting for the Wi-Fi AP command reply");
        }
        throw;
    }
    if (status != gopro::kStatusSuccess) {
        throw Error(ErrorKind::ProtocolError, "Setting Wi-Fi AP state failed, status " + std::to_string(status));
    }
    LOGD("Wi-Fi AP ON command done");
}

bool ControlLink::sleepCamera()
{
    LOGI("Sending power off command to the camera...");
    try {
        uint8_t status = sendCommand(gopro::kCmdSleep, {});
        if (status != gopro::kStatusSuccess) {
            LOGE("Power off command failed, status " << int(status));
            return false;
        }
    } catch (const Error& e) {
        if (e.kind() != ErrorKind::Timeout) throw;
        LOGE("Timed out waiting for the power off reply");
        return false;
    }
    LOGD("Power off command sent");
    return true;
}

} // namespace gpgrab
