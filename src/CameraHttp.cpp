#include "CameraHttp.h"

#include "Errors.h"
#include "Log.h"

#include "httplib.h"  // https://github.com/yhirose/cpp-httplib
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <functional>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace gpgrab {

// ----- Listing -----

static uint64_t jsonUnsigned(const json& v)
{
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer()) {
        int64_t i = v.get<int64_t>();
        return i > 0 ? static_cast<uint64_t>(i) : 0;
    }
    if (v.is_number_float()) return static_cast<uint64_t>(v.get<double>());
    if (v.is_string()) {
        const std::string& s = v.get_ref<const std::string&>();
        try {
            return s.empty() ? 0 : std::stoull(s);
        } catch (const std::exception&) {
            throw Error(ErrorKind::ProtocolError, "Invalid number in media list: '" + s + "'");
        }
    }
    return 0;
}

std::vector<RemoteFile> parseMediaList(const std::string& body)
{
    std::vector<RemoteFile> files;
    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        throw Error(ErrorKind::ProtocolError, std::string("Media list is not valid JSON: ") + e.what());
    }
    if (!doc.is_object() || !doc.contains("media")) return files;

    try {
        for (const auto& media : doc.at("media")) {
            std::string dir = media.at("d").get<std::string>();
            if (!media.contains("fs")) continue;
            for (const auto& f : media.at("fs")) {
                RemoteFile rf;
                rf.directory = dir;
                rf.name = f.at("n").get<std::string>();
                if (f.contains("s")) rf.size = jsonUnsigned(f.at("s"));
                if (f.contains("mod")) rf.modified = static_cast<int64_t>(jsonUnsigned(f.at("mod")));
                files.push_back(rf);
            }
        }
    } catch (const json::exception& e) {
        throw Error(ErrorKind::ProtocolError, std::string("Unexpected media list layout: ") + e.what());
    }
    return files;
}

std::vector<RemoteFile> computePendingSet(const std::vector<RemoteFile>& remote, const fs::path& dir)
{
    std::vector<RemoteFile> pending;
    for (const auto& f : remote) {
        std::error_code ec;
        if (!fs::exists(dir / f.name, ec)) pending.push_back(f);
    }
    return pending;
}

// ----- Progress -----

std::string formatRemaining(double seconds)
{
    if (seconds < 0) seconds = 0;
    long total = static_cast<long>(seconds);
    long h = total / 3600;
    long m = (total % 3600) / 60;
    long s = total % 60;
    char buf[32];
    if (h > 0) {
        snprintf(buf, sizeof(buf), "%02ld:%02ld:%02ld", h, m, s);
    } else {
        snprintf(buf, sizeof(buf), "%02ld:%02ld", m, s);
    }
    return buf;
}

BatchProgress::BatchProgress(uint64_t totalBytes)
    : m_total(totalBytes), m_start(Clock::now())
{
}

std::string BatchProgress::remainingText() const
{
    double elapsed = std::chrono::duration<double>(Clock::now() - m_start).count();
    if (elapsed <= 1.0) return "";
    double done = static_cast<double>(m_doneBefore + m_inFile);
    double speed = done / elapsed;
    if (speed <= 0) return "";
    double left = m_total > done ? (m_total - done) / speed : 0;
    return formatRemaining(left);
}

void BatchProgress::update(const std::string& name, uint64_t fileDone, uint64_t fileTotal)
{
    m_inFile = fileDone;
    auto now = Clock::now();
    // at most once per second, plus the final chunk of a file
    if (m_refreshed && now - m_lastRefresh < std::chrono::seconds(1) && fileDone < fileTotal) return;
    m_refreshed = true;
    m_lastRefresh = now;

    double elapsed = std::chrono::duration<double>(now - m_start).count();
    double speedMb = elapsed > 0 ? (m_doneBefore + m_inFile) / elapsed / (1024.0 * 1024.0) : 0;
    int pct = fileTotal > 0 ? static_cast<int>(fileDone * 100 / fileTotal) : 0;

    char buf[256];
    snprintf(buf, sizeof(buf), "%s %3d%% | %.1f MB/s", name.c_str(), pct, speedMb);
    std::string line = buf;
    std::string left = remainingText();
    if (!left.empty()) line += " | total " + left;
    progressUpdate(line);
}

void BatchProgress::fileFinished(uint64_t fileBytes)
{
    m_doneBefore += fileBytes;
    m_inFile = 0;
}

void BatchProgress::finish()
{
    progressEnd();
}

// ----- Client -----

static const std::chrono::milliseconds kCancelPoll(100);

// Runs onCancel on a side thread once the token is cancelled, so a blocked
// transfer can be torn down without waiting for its read timeout.
class CancelWatcher
{
public:
    CancelWatcher(const CancelToken& cancel, std::function<void()> onCancel)
        : m_thread([this, &cancel, onCancel] {
              while (!m_done.waitFor(kCancelPoll)) {
                  if (cancel.isCancelled()) {
                      onCancel();
                      return;
                  }
              }
          })
    {
    }

    ~CancelWatcher()
    {
        m_done.set();
        m_thread.join();
    }

private:
    StopSignal m_done;
    std::thread m_thread;
};

static bool isSuccess(const httplib::Result& res)
{
    return res && res->status >= 200 && res->status < 300;
}

static httplib::Result getWithRetry(httplib::Client& cli, const std::string& path, int attempts)
{
    httplib::Result res = cli.Get(path);
    for (int i = 1; i < attempts && !res; ++i) {
        LOGD("GET " << path << " failed (" << httplib::to_string(res.error()) << "), retrying...");
        res = cli.Get(path);
    }
    return res;
}

CameraHttpClient::CameraHttpClient(const Settings& settings, const CancelToken& cancel, HttpTimeouts timeouts)
    : m_settings(settings), m_cancel(cancel), m_timeouts(timeouts), m_baseUrl(settings.baseUrl())
{
}

std::vector<RemoteFile> CameraHttpClient::listRemoteFiles()
{
    httplib::Client cli(m_settings.deviceHost, m_settings.devicePort());
    cli.set_connection_timeout(m_timeouts.connect.count(), 0);
    cli.set_read_timeout(m_timeouts.read.count(), 0);
    cli.set_write_timeout(m_timeouts.write.count(), 0);

    httplib::Result res = getWithRetry(cli, "/gopro/media/list", m_timeouts.retries);
    if (!res) {
        throw Error(ErrorKind::TransportFailure, "Media list request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw Error(ErrorKind::TransportFailure, "Media list request returned HTTP " + std::to_string(res->status));
    }
    return parseMediaList(res->body);
}

void CameraHttpClient::download(const RemoteFile& file, const fs::path& destDir, BatchProgress* progress)
{
    fs::path localPath = destDir / file.name;
    std::string url = "/videos/DCIM/" + file.directory + "/" + file.name;

    httplib::Client cli(m_settings.deviceHost, m_settings.devicePort());
    cli.set_connection_timeout(m_timeouts.connect.count(), 0);
    // short read timeout detects a dropped network promptly
    cli.set_read_timeout(m_timeouts.read.count(), 0);
    cli.set_write_timeout(m_timeouts.write.count(), 0);

    std::ofstream out(localPath, std::ios::binary | std::ios::trunc);
    if (!out) throw Error(ErrorKind::IOFailure, "Cannot create '" + localPath.string() + "'");

    uint64_t total = file.size;
    uint64_t received = 0;
    int badStatus = 0;
    bool writeFailed = false;
    bool cancelled = false;

    httplib::Result res = [&] {
        CancelWatcher watcher(m_cancel, [&cli] { cli.stop(); });
        return cli.Get(
            url,
            [&](const httplib::Response& r) {
                if (r.status != 200) {
                    badStatus = r.status;
                    return false;
                }
                std::string length = r.get_header_value("Content-Length");
                if (!length.empty()) {
                    try {
                        total = std::stoull(length);
                    } catch (const std::exception&) {
                        LOGD("Ignoring bad Content-Length '" << length << "'");
                    }
                }
                return true;
            },
            [&](const char* data, size_t len) {
                if (m_cancel.isCancelled()) {
                    cancelled = true;
                    return false;
                }
                out.write(data, static_cast<std::streamsize>(len));
                if (!out) {
                    writeFailed = true;
                    return false;
                }
                received += len;
                if (progress) progress->update(file.name, received, total);
                return true;
            });
    }();
    out.close();

    bool ok = res && !badStatus && !writeFailed && !cancelled && !m_cancel.isCancelled();
    if (ok && !out) writeFailed = true;
    if (ok && !writeFailed) {
        if (progress) {
            progress->update(file.name, total, total);
            progress->fileFinished(file.size);
        }
        return;
    }

    if (progress) progress->finish();
    if (cancelled || m_cancel.isCancelled()) {
        LOGW("Operation cancelled. Download of '" << file.name << "' stopped.");
    }

    std::error_code ec;
    if (fs::exists(localPath, ec)) {
        LOGW("Removing incomplete file '" << file.name << "'...");
        fs::remove(localPath, ec);
        if (ec) LOGE("Could not remove incomplete file: " << ec.message());
    }

    if (cancelled || m_cancel.isCancelled()) {
        throw Error(ErrorKind::Interrupted, "Download of '" + file.name + "' cancelled");
    }
    if (writeFailed) {
        throw Error(ErrorKind::IOFailure, "Writing '" + localPath.string() + "' failed");
    }
    if (badStatus) {
        throw Error(ErrorKind::TransportFailure,
                    "Download of '" + file.name + "' returned HTTP " + std::to_string(badStatus));
    }
    if (res.error() == httplib::Error::Read) {
        throw Error(ErrorKind::TransportFailure, "Connection to the camera lost while downloading '" + file.name + "'");
    }
    throw Error(ErrorKind::TransportFailure,
                "Download of '" + file.name + "' failed: " + httplib::to_string(res.error()));
}

TransferResult CameraHttpClient::downloadAll(const fs::path& destDir)
{
    TransferResult result;
    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec) throw Error(ErrorKind::IOFailure, "Cannot create '" + destDir.string() + "': " + ec.message());

    LOGI("Fetching the file list from the camera...");
    try {
        result.remote = listRemoteFiles();
    } catch (const Error& e) {
        LOGE("Could not get the file list from the camera: " << e.what());
        LOGE("Check the Wi-Fi connection to the camera.");
        return result;
    }

    std::vector<RemoteFile> pending = computePendingSet(result.remote, destDir);
    if (pending.empty()) {
        LOGI("All media from the camera is already downloaded.");
        result.completed = true;
        return result;
    }

    uint64_t totalBytes = 0;
    for (const auto& f : pending) totalBytes += f.size;
    char mb[32];
    snprintf(mb, sizeof(mb), "%.2f", totalBytes / (1024.0 * 1024.0));
    LOGI("Found " << pending.size() << " new files to download (total size: " << mb << " MB).");

    BatchProgress progress(totalBytes);
    for (const auto& f : pending) {
        m_cancel.throwIfCancelled();
        try {
            download(f, destDir, &progress);
        } catch (const Error& e) {
            if (e.kind() == ErrorKind::Interrupted) throw;
            LOGE("Error downloading " << f.name << ": " << e.what());
            LOGE("Download stopped. Run gpgrab again to resume.");
            return result;
        }
        result.downloadedCount++;
        result.downloaded.push_back(f);
    }
    progress.finish();
    result.completed = true;
    return result;
}

int CameraHttpClient::deleteRemote(const std::vector<RemoteFile>& files)
{
    if (files.empty()) return 0;

    LOGI("Deleting " << files.size() << " files from the camera...");
    httplib::Client cli(m_settings.deviceHost, m_settings.devicePort());
    cli.set_connection_timeout(m_timeouts.request.count(), 0);
    cli.set_read_timeout(m_timeouts.request.count(), 0);

    int deleted = 0;
    size_t index = 0;
    for (const auto& f : files) {
        ++index;
        progressUpdate("Deleting " + f.name + " (" + std::to_string(index) + "/" + std::to_string(files.size()) + ")");
        httplib::Result res = cli.Get("/gopro/media/delete/file?path=" + f.directory + "/" + f.name);
        if (isSuccess(res)) {
            LOGD("Deleted '" << f.name << "'");
            ++deleted;
        } else if (res) {
            LOGW("Could not delete '" << f.name << "': HTTP " << res->status);
        } else {
            LOGW("Could not delete '" << f.name << "': " << httplib::to_string(res.error()));
        }
    }
    progressEnd();
    LOGI("Deletion finished.");
    return deleted;
}

bool CameraHttpClient::ping()
{
    httplib::Client cli(m_settings.deviceHost, m_settings.devicePort());
    cli.set_connection_timeout(m_timeouts.request.count(), 0);
    cli.set_read_timeout(m_timeouts.request.count(), 0);
    httplib::Result res = cli.Get("/gopro/camera/keep_alive");
    if (!res) {
        LOGW("Wi-Fi keep-alive failed (connection may be lost): " << httplib::to_string(res.error()));
        return false;
    }
    return true;
}

bool CameraHttpClient::probeReachable()
{
    return probeReachable(2 * std::chrono::duration_cast<std::chrono::milliseconds>(m_timeouts.probe));
}

bool CameraHttpClient::probeReachable(std::chrono::milliseconds budget)
{
    // connect and read each get half of the budget
    std::chrono::milliseconds step = std::min(std::chrono::duration_cast<std::chrono::milliseconds>(m_timeouts.probe),
                                              budget / 2);
    if (step.count() <= 0) return false;
    time_t sec = static_cast<time_t>(step.count() / 1000);
    time_t usec = static_cast<time_t>((step.count() % 1000) * 1000);

    httplib::Client cli(m_settings.deviceHost, m_settings.devicePort());
    cli.set_connection_timeout(sec, usec);
    cli.set_read_timeout(sec, usec);
    cli.set_write_timeout(sec, usec);
    httplib::Result res = cli.Get("/gopro/camera/state");
    if (isSuccess(res)) {
        LOGD("Camera reachable over Wi-Fi");
        return true;
    }
    LOGD("Camera not reachable at " << m_baseUrl);
    return false;
}

} // namespace gpgrab
