#ifndef GPGRAB_MEDIAPROCESSOR_H
#define GPGRAB_MEDIAPROCESSOR_H

#include "CameraHttp.h"
#include "Config.h"

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gpgrab {

struct MediaFile
{
    std::filesystem::path path;
    std::time_t captureTime = 0;   // UTC
};

struct ProbeResult
{
    enum class Status { Ok, NoTimestamp, Failed };
    Status status = Status::Failed;
    std::time_t captureTime = 0;
};

// ffmpeg/ffprobe as a black box.
class MediaTool
{
public:
    virtual ~MediaTool() = default;
    virtual bool available() = 0;
    virtual ProbeResult probe(const std::filesystem::path& file) = 0;
    virtual bool concat(const std::filesystem::path& listFile, const std::filesystem::path& output) = 0;
};

class FfmpegTool : public MediaTool
{
public:
    explicit FfmpegTool(std::string ffmpegPath);

    bool available() override;
    ProbeResult probe(const std::filesystem::path& file) override;
    bool concat(const std::filesystem::path& listFile, const std::filesystem::path& output) override;

    const std::string& ffmpegPath() const { return m_ffmpeg; }
    const std::string& ffprobePath() const { return m_ffprobe; }

private:
    std::string m_ffmpeg;
    std::string m_ffprobe;
};

// "ffmpeg" in the file name part replaced by "ffprobe".
std::string ffprobePathFor(const std::string& ffmpegPath);

// First working ffmpeg among the configured path, <exeDir>/ffmpeg and
// <exeDir>/bin/ffmpeg. Empty when none answers -version.
std::string resolveFfmpeg(const std::string& configured, const std::filesystem::path& exeDir);

// GH010001.MP4 / GX020034.mp4
bool isRawCameraFile(const std::string& name);

// Parses "2024-05-21T15:30:00.000000Z" (or with a +HH:MM offset).
std::optional<std::time_t> parseCreationTime(const std::string& iso);

// format.tags.creation_time from ffprobe -show_format JSON.
std::optional<std::time_t> creationTimeFromProbeJson(const std::string& json);

std::string sanitizeFileName(const std::string& name);

// strftime in local time
std::string formatLocalTime(const std::string& format, std::time_t t);

// dir/base.mp4, else dir/base_1.mp4, dir/base_2.mp4, ...
std::filesystem::path uniqueOutputPath(const std::filesystem::path& dir, const std::string& base);

// Sorted by capture time and split where consecutive captures are more
// than gapHours apart; each session sorted by file name.
std::vector<std::vector<MediaFile>> groupSessions(std::vector<MediaFile> files, int gapHours);

// format + "_%S" + "_<chapter><number>" for rename_only
std::string renameOnlyBaseName(const std::string& format, const MediaFile& file);

struct ProcessSummary
{
    int renamed = 0;
    int joined = 0;     // output files produced by concatenation
    int skipped = 0;
    int touched = 0;
};

// Post-download processing for the configured mode.
ProcessSummary processMedia(const std::filesystem::path& folder, const std::vector<RemoteFile>& downloaded,
                            const Settings& settings, MediaTool& tool);

// Sets each downloaded file's modification time to its listing time.
int touchFiles(const std::filesystem::path& folder, const std::vector<RemoteFile>& downloaded);

} // namespace gpgrab

#endif // GPGRAB_MEDIAPROCESSOR_H
