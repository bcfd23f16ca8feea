// Open GoPro BLE identifiers and command frames.

#ifndef GPGRAB_GOPROPROTOCOL_H
#define GPGRAB_GOPROPROTOCOL_H

#include <cstdint>
#include <string>
#include <vector>

namespace gpgrab {
namespace gopro {

inline std::string uuid(const char* id)
{
    return std::string("b5f9") + id + "-aa8d-11e3-9046-0002a5d5c51b";
}

const std::string kCommandRequestUuid  = uuid("0072");
const std::string kCommandResponseUuid = uuid("0073");
const std::string kSettingsResponseUuid = uuid("0075");
const std::string kWifiSsidUuid        = uuid("0002");
const std::string kWifiPasswordUuid    = uuid("0003");

const uint8_t kCmdSleep      = 0x05;
const uint8_t kCmdSetWifiAp  = 0x17;
const uint8_t kCmdGetHwInfo  = 0x3C;
const uint8_t kCmdClientInfo = 0x56;

const uint8_t kStatusSuccess      = 0;
const uint8_t kStatusNotSupported = 2;

const char* const kDefaultNamePattern = "GoPro [A-Z0-9]{4}";
const char* const kDeviceHost = "10.5.5.9";

// [len][opcode][payload...]
inline std::vector<uint8_t> commandFrame(uint8_t opcode, const std::vector<uint8_t>& payload)
{
    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + 2);
    frame.push_back(static_cast<uint8_t>(payload.size() + 1));
    frame.push_back(opcode);
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

// Replies that only mean "not supported on this model".
inline bool isBenignStatus(uint8_t opcode, uint8_t status)
{
    return status == kStatusNotSupported && (opcode == kCmdClientInfo || opcode == kCmdGetHwInfo);
}

} // namespace gopro
} // namespace gpgrab

#endif // GPGRAB_GOPROPROTOCOL_H
