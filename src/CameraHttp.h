#ifndef GPGRAB_CAMERAHTTP_H
#define GPGRAB_CAMERAHTTP_H

#include "CancelToken.h"
#include "Config.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gpgrab {

struct RemoteFile
{
    std::string directory;   // "100GOPRO"
    std::string name;        // "GH010001.MP4"
    uint64_t size = 0;
    int64_t modified = 0;    // unix time as reported by the camera
};

struct TransferResult
{
    int downloadedCount = 0;
    bool completed = false;
    std::vector<RemoteFile> downloaded;
    std::vector<RemoteFile> remote;   // full listing snapshot
};

struct HttpTimeouts
{
    std::chrono::seconds connect{10};
    std::chrono::seconds read{15};
    std::chrono::seconds write{10};
    int retries = 3;
    std::chrono::seconds request{10};   // delete, keep-alive
    std::chrono::seconds probe{5};
};

// Flattens {"media":[{"d":..,"fs":[{"n":..,"s":..,"mod":..}]}]}. "s" and
// "mod" may be numbers or decimal strings. Throws Error(ProtocolError).
std::vector<RemoteFile> parseMediaList(const std::string& body);

// Remote files whose name does not exist in dir.
std::vector<RemoteFile> computePendingSet(const std::vector<RemoteFile>& remote,
                                          const std::filesystem::path& dir);

// "MM:SS", or "HH:MM:SS" from one hour up.
std::string formatRemaining(double seconds);

// Aggregate throughput over a download batch.
class BatchProgress
{
public:
    explicit BatchProgress(uint64_t totalBytes);

    void update(const std::string& name, uint64_t fileDone, uint64_t fileTotal);
    void fileFinished(uint64_t fileBytes);
    void finish();

    // empty until at least a second has passed
    std::string remainingText() const;

private:
    using Clock = std::chrono::steady_clock;
    uint64_t m_total;
    uint64_t m_doneBefore = 0;   // bytes of finished files
    uint64_t m_inFile = 0;
    Clock::time_point m_start;
    Clock::time_point m_lastRefresh;
    bool m_refreshed = false;
};

// HTTP side of the camera: listing, download, delete, keep-alive.
class CameraHttpClient
{
public:
    CameraHttpClient(const Settings& settings, const CancelToken& cancel, HttpTimeouts timeouts = {});

    // Throws Error(TransportFailure) or Error(ProtocolError).
    std::vector<RemoteFile> listRemoteFiles();

    // Streams one file into destDir. The partial file is removed on any
    // failure. Throws Error(Interrupted), Error(TransportFailure) or
    // Error(IOFailure).
    void download(const RemoteFile& file, const std::filesystem::path& destDir,
                  BatchProgress* progress = nullptr);

    // List, skip files already present, download the rest in order.
    // Interrupted propagates; any other failure stops the batch with
    // completed == false.
    TransferResult downloadAll(const std::filesystem::path& destDir);

    // One request per file; failures are logged. Returns the number deleted.
    int deleteRemote(const std::vector<RemoteFile>& files);

    bool ping();
    bool probeReachable();
    // Same check, finished within budget.
    bool probeReachable(std::chrono::milliseconds budget);

    const std::string& baseUrl() const { return m_baseUrl; }

private:
    const Settings& m_settings;
    const CancelToken& m_cancel;
    HttpTimeouts m_timeouts;
    std::string m_baseUrl;
};

} // namespace gpgrab

#endif // GPGRAB_CAMERAHTTP_H
