// Fakes shared by the gpgrab test suites.

#ifndef GPGRAB_TESTS_TESTSUPPORT_H
#define GPGRAB_TESTS_TESTSUPPORT_H

#include "BleTransport.h"
#include "Config.h"
#include "ControlLink.h"
#include "Errors.h"
#include "GoProProtocol.h"
#include "MediaProcessor.h"
#include "UserPrompt.h"
#include "WifiManager.h"

#include "httplib.h"  // https://github.com/yhirose/cpp-httplib
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace gpgrab {
namespace test {

// ----- Filesystem -----

class TempDir
{
public:
    TempDir()
    {
        std::string pattern = (std::filesystem::temp_directory_path() / "gpgrab_test_XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) throw std::runtime_error("mkdtemp failed");
        m_path = buf.data();
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline void writeFile(const std::filesystem::path& p, const std::string& content)
{
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const std::filesystem::path& p)
{
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline ControlLinkTiming fastLinkTiming()
{
    ControlLinkTiming t;
    t.scanDuration = std::chrono::milliseconds(1);
    t.scanGap = std::chrono::milliseconds(1);
    t.scanErrorGap = std::chrono::milliseconds(1);
    t.connectTimeout = std::chrono::milliseconds(10);
    t.settleDelay = std::chrono::milliseconds(1);
    t.servicePollInterval = std::chrono::milliseconds(1);
    t.reconnectTimeout = std::chrono::milliseconds(10);
    t.reconnectSettle = std::chrono::milliseconds(1);
    t.commandTimeout = std::chrono::milliseconds(300);
    t.registerTimeout = std::chrono::milliseconds(50);
    return t;
}

// ----- BLE -----

// In-memory camera. Command frames written to 0072 are answered on 0073
// from the replies table unless the opcode is listed as silent.
class FakeBleTransport : public BleTransport
{
public:
    std::vector<DeviceHandle> devices;
    std::set<std::string> characteristics{gopro::kCommandRequestUuid, gopro::kCommandResponseUuid,
                                          gopro::kSettingsResponseUuid, gopro::kWifiSsidUuid,
                                          gopro::kWifiPasswordUuid};
    std::map<std::string, Bytes> values;
    std::map<uint8_t, uint8_t> replies{{gopro::kCmdSetWifiAp, 0}, {gopro::kCmdSleep, 0},
                                       {gopro::kCmdClientInfo, gopro::kStatusNotSupported}};
    std::set<uint8_t> silent;
    // called with each command opcode before it is answered
    std::function<void(uint8_t)> onCommand;
    std::string subscribeError;
    int writeFailures = 0;

    int scanCount = 0;
    int connectCount = 0;
    int disconnectCount = 0;
    std::vector<Bytes> writes;

    std::vector<DeviceHandle> scan(std::chrono::milliseconds) override
    {
        ++scanCount;
        return devices;
    }

    void connect(const DeviceHandle&, std::chrono::milliseconds) override
    {
        ++connectCount;
        m_connected = true;
    }

    void disconnect() override
    {
        ++disconnectCount;
        m_connected = false;
    }

    bool isConnected() override { return m_connected; }

    bool hasCharacteristic(const std::string& uuid) override { return m_connected && characteristics.count(uuid) > 0; }

    void subscribe(const std::string& uuid, NotifyHandler handler) override
    {
        if (!subscribeError.empty()) throw Error(ErrorKind::TransportFailure, subscribeError);
        m_handlers[uuid] = std::move(handler);
    }

    void write(const std::string& uuid, const Bytes& data) override
    {
        if (writeFailures > 0) {
            --writeFailures;
            m_connected = false;
            throw Error(ErrorKind::TransportFailure, "Write failed: not connected");
        }
        if (!m_connected) throw Error(ErrorKind::TransportFailure, "Not connected");
        writes.push_back(data);
        if (uuid != gopro::kCommandRequestUuid || data.size() < 2) return;
        uint8_t opcode = data[1];
        if (onCommand) onCommand(opcode);
        auto reply = replies.find(opcode);
        if (reply == replies.end() || silent.count(opcode)) return;
        notify(gopro::kCommandResponseUuid, {2, opcode, reply->second});
    }

    Bytes read(const std::string& uuid) override
    {
        auto it = values.find(uuid);
        if (it == values.end()) throw Error(ErrorKind::TransportFailure, "Read not permitted");
        return it->second;
    }

    void notify(const std::string& uuid, const Bytes& data)
    {
        auto it = m_handlers.find(uuid);
        if (it != m_handlers.end()) it->second(uuid, data);
    }

    bool wroteOpcode(uint8_t opcode) const
    {
        for (const auto& w : writes) {
            if (w.size() >= 2 && w[1] == opcode) return true;
        }
        return false;
    }

    void setCredentials(const std::string& ssid, const std::string& password)
    {
        values[gopro::kWifiSsidUuid] = Bytes(ssid.begin(), ssid.end());
        values[gopro::kWifiPasswordUuid] = Bytes(password.begin(), password.end());
    }

private:
    bool m_connected = false;
    std::map<std::string, NotifyHandler> m_handlers;
};

// ----- Wi-Fi -----

// Host network whose connect requests succeed for the networks listed in
// reachable (after an optional delay). Each request blocks for requestDelay.
class ScriptedWifiManager : public WifiManager
{
public:
    using WifiManager::WifiManager;

    std::optional<std::string> current;
    bool hasInterface = true;
    std::vector<std::string> visible;
    std::set<std::string> profiles;
    std::set<std::string> reachable;
    std::chrono::milliseconds failFor{0};
    std::chrono::milliseconds requestDelay{0};
    bool userScopeRefused = false;
    bool systemScopeRefused = false;
    // runs after a successful switch, outside the lock
    std::function<void(const std::string&)> onConnectRequest;

    std::vector<std::string> connectRequests;
    std::vector<std::chrono::milliseconds> requestBudgets;
    std::vector<std::string> createdProfiles;
    std::vector<ProfileScope> createdScopes;

    std::optional<std::string> currentNetworkName() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return current;
    }
    std::optional<std::string> primaryWirelessInterface() override
    {
        if (!hasInterface) return std::nullopt;
        return std::string("wlan0");
    }
    bool triggerScan() override { return true; }
    std::vector<std::string> visibleNetworks() override { return visible; }
    bool profileExists(const std::string& ssid) override { return profiles.count(ssid) > 0; }
    void deleteProfile(const std::string& ssid) override { profiles.erase(ssid); }
    bool createProfile(const std::string& ssid, const std::string&, ProfileScope scope) override
    {
        if (scope == ProfileScope::User && userScopeRefused) return false;
        if (scope == ProfileScope::System && systemScopeRefused) return false;
        profiles.insert(ssid);
        createdProfiles.push_back(ssid);
        createdScopes.push_back(scope);
        return true;
    }
    bool requestConnect(const std::string& ssid, std::chrono::milliseconds budget) override
    {
        if (requestDelay.count() > 0) std::this_thread::sleep_for(std::min(requestDelay, budget));
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (connectRequests.empty()) m_firstRequest = std::chrono::steady_clock::now();
            connectRequests.push_back(ssid);
            requestBudgets.push_back(budget);
            if (!reachable.count(ssid)) return false;
            if (std::chrono::steady_clock::now() - m_firstRequest < failFor) return false;
            current = ssid;
        }
        if (onConnectRequest) onConnectRequest(ssid);
        return true;
    }

private:
    std::mutex m_mutex;
    std::chrono::steady_clock::time_point m_firstRequest;
};

inline JoinTiming fastJoinTiming()
{
    JoinTiming t;
    t.pollInterval = std::chrono::milliseconds(10);
    t.reissueInterval = std::chrono::milliseconds(40);
    t.scanRoundPolls = 2;
    return t;
}

// ----- Prompt -----

class ScriptedPrompt : public UserPrompt
{
public:
    bool answer = false;
    std::deque<ManualJoinChoice> manualChoices;
    int questions = 0;
    int manualWaits = 0;
    std::string lastQuestion;

    bool askYesNo(const std::string& question, std::chrono::seconds) override
    {
        ++questions;
        lastQuestion = question;
        return answer;
    }

    ManualJoinChoice waitForManualJoin() override
    {
        ++manualWaits;
        if (manualChoices.empty()) return ManualJoinChoice::GiveUp;
        ManualJoinChoice c = manualChoices.front();
        manualChoices.pop_front();
        return c;
    }
};

// ----- Media tool -----

class FakeMediaTool : public MediaTool
{
public:
    bool isAvailable = true;
    std::map<std::string, ProbeResult> probes;   // by file name
    bool concatSucceeds = true;
    std::vector<std::string> concatLists;        // list file contents
    std::vector<std::filesystem::path> concatOutputs;

    bool available() override { return isAvailable; }

    ProbeResult probe(const std::filesystem::path& file) override
    {
        auto it = probes.find(file.filename().string());
        if (it == probes.end()) return ProbeResult{};
        return it->second;
    }

    bool concat(const std::filesystem::path& listFile, const std::filesystem::path& output) override
    {
        concatLists.push_back(readFile(listFile));
        concatOutputs.push_back(output);
        if (!concatSucceeds) return false;
        writeFile(output, "joined");
        return true;
    }
};

inline ProbeResult probedAt(std::time_t t)
{
    ProbeResult r;
    r.status = ProbeResult::Status::Ok;
    r.captureTime = t;
    return r;
}

// ----- Camera HTTP endpoint -----

struct FakeMedia
{
    std::string directory;
    std::string name;
    std::string content;
    int64_t modified = 0;
};

// The camera's HTTP API on 127.0.0.1 and an ephemeral port.
class FakeCameraServer
{
public:
    // (file name, offset) before each streamed chunk
    std::function<void(const std::string&, size_t)> onChunk;
    bool sizesAsStrings = false;

    std::atomic<int> listRequests{0};
    std::atomic<int> downloadRequests{0};
    std::atomic<int> keepAlives{0};
    std::atomic<int> stateRequests{0};

    FakeCameraServer()
    {
        m_server.Get("/gopro/media/list", [this](const httplib::Request&, httplib::Response& res) {
            ++listRequests;
            res.set_content(listing(), "application/json");
        });
        m_server.Get(R"(/videos/DCIM/([^/]+)/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            ++downloadRequests;
            std::string name = req.matches[2];
            std::string body;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_files.find(name);
                if (it == m_files.end()) {
                    res.status = 404;
                    return;
                }
                body = it->second.content;
            }
            res.set_content_provider(body.size(), "video/mp4",
                [this, name, body](size_t offset, size_t length, httplib::DataSink& sink) {
                    if (onChunk) onChunk(name, offset);
                    size_t n = std::min<size_t>(length, 1024);
                    return sink.write(body.data() + offset, n);
                });
        });
        m_server.Get("/gopro/media/delete/file", [this](const httplib::Request& req, httplib::Response& res) {
            std::string path = req.get_param_value("path");
            std::string name = path.substr(path.find('/') + 1);
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_files.erase(name)) {
                res.status = 404;
                return;
            }
            m_deleted.push_back(path);
            res.set_content("{}", "application/json");
        });
        m_server.Get("/gopro/camera/keep_alive", [this](const httplib::Request&, httplib::Response& res) {
            ++keepAlives;
            res.set_content("{}", "application/json");
        });
        m_server.Get("/gopro/camera/state", [this](const httplib::Request&, httplib::Response& res) {
            ++stateRequests;
            res.set_content("{\"status\":{}}", "application/json");
        });

        m_port = m_server.bind_to_any_port("127.0.0.1");
        m_thread = std::thread([this] { m_server.listen_after_bind(); });
        m_server.wait_until_ready();
    }

    ~FakeCameraServer()
    {
        m_server.stop();
        if (m_thread.joinable()) m_thread.join();
    }

    void add(const std::string& directory, const std::string& name, const std::string& content, int64_t modified)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_order.push_back(name);
        m_files[name] = FakeMedia{directory, name, content, modified};
    }

    std::vector<std::string> deleted()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_deleted;
    }

    int port() const { return m_port; }

    Settings settings(const std::filesystem::path& outputFolder) const
    {
        Settings s;
        s.deviceHost = "127.0.0.1";
        s.mediaPort = std::to_string(m_port);
        s.outputFolder = outputFolder.string();
        return s;
    }

private:
    std::string listing()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        nlohmann::json dirs = nlohmann::json::array();
        std::map<std::string, nlohmann::json> byDir;
        std::vector<std::string> dirOrder;
        for (const auto& name : m_order) {
            auto it = m_files.find(name);
            if (it == m_files.end()) continue;
            const FakeMedia& m = it->second;
            nlohmann::json f;
            f["n"] = m.name;
            if (sizesAsStrings) {
                f["s"] = std::to_string(m.content.size());
                f["mod"] = std::to_string(m.modified);
            } else {
                f["s"] = m.content.size();
                f["mod"] = m.modified;
            }
            if (!byDir.count(m.directory)) dirOrder.push_back(m.directory);
            byDir[m.directory].push_back(f);
        }
        for (const auto& d : dirOrder) dirs.push_back({{"d", d}, {"fs", byDir[d]}});
        return nlohmann::json{{"id", "1"}, {"media", dirs}}.dump();
    }

    httplib::Server m_server;
    std::thread m_thread;
    int m_port = 0;
    std::mutex m_mutex;
    std::vector<std::string> m_order;
    std::map<std::string, FakeMedia> m_files;
    std::vector<std::string> m_deleted;
};

} // namespace test
} // namespace gpgrab

#endif // GPGRAB_TESTS_TESTSUPPORT_H
