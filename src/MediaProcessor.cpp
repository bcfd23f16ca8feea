#include "MediaProcessor.h"

#include "Log.h"
#include "Subprocess.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fcntl.h>
#include <fstream>
#include <regex>
#include <sys/stat.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace gpgrab {

// ----- Tool -----

std::string ffprobePathFor(const std::string& ffmpegPath)
{
    fs::path p(ffmpegPath);
    std::string name = p.filename().string();
    size_t pos = name.find("ffmpeg");
    if (pos == std::string::npos) return ffmpegPath;
    name.replace(pos, 6, "ffprobe");
    if (!p.has_parent_path()) return name;
    return (p.parent_path() / name).string();
}

FfmpegTool::FfmpegTool(std::string ffmpegPath)
    : m_ffmpeg(std::move(ffmpegPath)), m_ffprobe(ffprobePathFor(m_ffmpeg))
{
}

bool FfmpegTool::available()
{
    return runProcess({m_ffmpeg, "-version"}, std::chrono::seconds(10)).ok()
        && runProcess({m_ffprobe, "-version"}, std::chrono::seconds(10)).ok();
}

ProbeResult FfmpegTool::probe(const fs::path& file)
{
    ProbeResult result;
    ProcessResult r = runProcess({m_ffprobe, "-v", "quiet", "-print_format", "json", "-show_format", file.string()},
                                 std::chrono::seconds(60));
    if (!r.ok()) {
        LOGD("ffprobe stderr: " << r.errorOutput);
        result.status = ProbeResult::Status::Failed;
        return result;
    }
    std::optional<std::time_t> t = creationTimeFromProbeJson(r.output);
    if (!t) {
        result.status = ProbeResult::Status::NoTimestamp;
        return result;
    }
    result.status = ProbeResult::Status::Ok;
    result.captureTime = *t;
    return result;
}

bool FfmpegTool::concat(const fs::path& listFile, const fs::path& output)
{
    ProcessResult r = runProcess({m_ffmpeg, "-f", "concat", "-safe", "0", "-i", listFile.string(),
                                  "-c", "copy", "-y", output.string()},
                                 std::chrono::hours(4));
    if (!r.ok()) {
        LOGE("Joining failed (exit " << r.exitCode << ")\n" << r.errorOutput);
        return false;
    }
    return true;
}

std::string resolveFfmpeg(const std::string& configured, const fs::path& exeDir)
{
    std::vector<std::string> candidates{configured};
    if (!exeDir.empty()) {
        candidates.push_back((exeDir / "ffmpeg").string());
        candidates.push_back((exeDir / "bin" / "ffmpeg").string());
    }
    for (const auto& c : candidates) {
        FfmpegTool tool(c);
        if (tool.available()) return c;
    }
    return "";
}

// ----- Helpers -----

bool isRawCameraFile(const std::string& name)
{
    static const std::regex raw("G[HX][0-9]{6}\\.MP4", std::regex::icase);
    return std::regex_match(name, raw);
}

std::optional<std::time_t> parseCreationTime(const std::string& iso)
{
    int Y, M, D, h, m, s;
    int consumed = 0;
    if (std::sscanf(iso.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &Y, &M, &D, &h, &m, &s, &consumed) != 6) {
        return std::nullopt;
    }
    std::string rest = iso.substr(static_cast<size_t>(consumed));
    if (!rest.empty() && rest[0] == '.') {
        size_t i = 1;
        while (i < rest.size() && std::isdigit(static_cast<unsigned char>(rest[i]))) ++i;
        rest = rest.substr(i);
    }
    long offset = 0;
    if (!rest.empty() && (rest[0] == '+' || rest[0] == '-')) {
        int oh = 0, om = 0;
        if (std::sscanf(rest.c_str() + 1, "%2d:%2d", &oh, &om) < 1) return std::nullopt;
        offset = (oh * 3600L + om * 60L) * (rest[0] == '-' ? -1 : 1);
    } else if (!rest.empty() && rest[0] != 'Z' && rest[0] != 'z') {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = Y - 1900;
    tm.tm_mon = M - 1;
    tm.tm_mday = D;
    tm.tm_hour = h;
    tm.tm_min = m;
    tm.tm_sec = s;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return t - offset;
}

std::optional<std::time_t> creationTimeFromProbeJson(const std::string& text)
{
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;
    auto format = doc.find("format");
    if (format == doc.end() || !format->is_object()) return std::nullopt;
    auto tags = format->find("tags");
    if (tags == format->end() || !tags->is_object()) return std::nullopt;
    auto ct = tags->find("creation_time");
    if (ct == tags->end() || !ct->is_string()) return std::nullopt;
    return parseCreationTime(ct->get<std::string>());
}

std::string sanitizeFileName(const std::string& name)
{
    std::string out = name;
    for (char& c : out) {
        switch (c) {
        case '\\': case '/': case ':': case '*': case '?':
        case '"': case '<': case '>': case '|':
            c = '_';
            break;
        default:
            break;
        }
    }
    return out;
}

std::string formatLocalTime(const std::string& format, std::time_t t)
{
    std::tm local{};
    localtime_r(&t, &local);
    char buf[512];
    size_t n = std::strftime(buf, sizeof(buf), format.c_str(), &local);
    return std::string(buf, n);
}

fs::path uniqueOutputPath(const fs::path& dir, const std::string& base)
{
    fs::path out = dir / (base + ".mp4");
    std::error_code ec;
    for (int counter = 1; fs::exists(out, ec); ++counter) {
        out = dir / (base + "_" + std::to_string(counter) + ".mp4");
    }
    return out;
}

std::vector<std::vector<MediaFile>> groupSessions(std::vector<MediaFile> files, int gapHours)
{
    std::vector<std::vector<MediaFile>> sessions;
    std::stable_sort(files.begin(), files.end(),
                     [](const MediaFile& a, const MediaFile& b) { return a.captureTime < b.captureTime; });

    const std::time_t gap = static_cast<std::time_t>(gapHours) * 3600;
    for (size_t i = 0; i < files.size(); ++i) {
        if (i == 0 || files[i].captureTime - files[i - 1].captureTime > gap) sessions.emplace_back();
        sessions.back().push_back(files[i]);
    }
    // chapters in order
    for (auto& s : sessions) {
        std::sort(s.begin(), s.end(), [](const MediaFile& a, const MediaFile& b) {
            return a.path.filename().string() < b.path.filename().string();
        });
    }
    return sessions;
}

std::string renameOnlyBaseName(const std::string& format, const MediaFile& file)
{
    static const std::regex seq("G[HX]([0-9]{2})([0-9]{4})", std::regex::icase);
    std::string stem = file.path.stem().string();
    std::smatch m;
    std::string suffix;
    if (std::regex_search(stem, m, seq)) suffix = "_" + m[1].str() + m[2].str();
    return sanitizeFileName(formatLocalTime(format + "_%S", file.captureTime)) + suffix;
}

static std::string concatListEntry(const fs::path& p)
{
    std::string s = fs::absolute(p).string();
    std::string quoted;
    for (char c : s) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    return "file '" + quoted + "'\n";
}

static void renameFile(const fs::path& from, const fs::path& to, ProcessSummary& summary)
{
    LOGI("Renaming '" << from.filename().string() << "' -> '" << to.filename().string() << "'");
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        LOGE("Could not rename '" << from.filename().string() << "': " << ec.message());
        summary.skipped++;
    } else {
        summary.renamed++;
    }
}

static void joinSession(const fs::path& folder, const std::vector<MediaFile>& session, const fs::path& out,
                        MediaTool& tool, ProcessSummary& summary)
{
    LOGI("Joining " << session.size() << " files into '" << out.filename().string() << "'...");
    fs::path listFile = folder / "concat.txt";
    bool joined = false;
    {
        std::ofstream list(listFile, std::ios::binary | std::ios::trunc);
        if (!list) {
            LOGE("Cannot write '" << listFile.string() << "'");
        } else {
            for (const auto& f : session) list << concatListEntry(f.path);
            list.close();
            joined = list && tool.concat(listFile, out);
        }
    }
    std::error_code ec;
    fs::remove(listFile, ec);

    if (!joined) {
        summary.skipped += static_cast<int>(session.size());
        return;
    }
    LOGI("Join succeeded. Removing source files...");
    summary.joined++;
    for (const auto& f : session) {
        fs::remove(f.path, ec);
        if (ec) LOGE("Could not remove source file '" << f.path.filename().string() << "': " << ec.message());
    }
}

// ----- Processing -----

static std::time_t fileMtime(const fs::path& p)
{
    struct stat st{};
    if (::stat(p.c_str(), &st) != 0) return std::time(nullptr);
    return st.st_mtime;
}

ProcessSummary processMedia(const fs::path& folder, const std::vector<RemoteFile>& downloaded,
                            const Settings& settings, MediaTool& tool)
{
    ProcessSummary summary;
    ProcessingMode mode = settings.mode;

    if (mode == ProcessingMode::DownloadOnly) {
        LOGI("Mode 'download_only': skipping file processing.");
        return summary;
    }
    if (mode == ProcessingMode::TouchOnly) {
        summary.touched = touchFiles(folder, downloaded);
        return summary;
    }

    LOGI("Processing downloaded media...");
    if (!tool.available()) {
        LOGW("ffmpeg ('" << settings.ffmpegPath << "') or ffprobe not found. They are required for the "
             "'full', 'rename_only' and 'process_only' modes.");
        LOGW("Skipping file processing.");
        return summary;
    }

    // every raw file in the folder, so interrupted earlier runs get processed too
    std::vector<fs::path> raw;
    std::error_code ec;
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && isRawCameraFile(it->path().filename().string())) raw.push_back(it->path());
    }
    std::sort(raw.begin(), raw.end());
    if (raw.empty()) {
        LOGI("No unprocessed files (Gxxxxxxx.MP4) found, nothing to process.");
        return summary;
    }

    LOGD("Reading capture times...");
    std::vector<MediaFile> files;
    for (const auto& p : raw) {
        ProbeResult r = tool.probe(p);
        switch (r.status) {
        case ProbeResult::Status::Ok:
            files.push_back({p, r.captureTime});
            break;
        case ProbeResult::Status::NoTimestamp:
            LOGW("No capture time in the metadata of '" << p.filename().string()
                 << "'. Using the file time on disk.");
            files.push_back({p, fileMtime(p)});
            break;
        case ProbeResult::Status::Failed:
            LOGE("Could not read the metadata of '" << p.filename().string()
                 << "' (the file may be damaged). It will be skipped.");
            summary.skipped++;
            break;
        }
    }

    if (mode == ProcessingMode::RenameOnly) {
        LOGI("Mode 'rename_only': renaming each file on its own.");
        std::stable_sort(files.begin(), files.end(),
                         [](const MediaFile& a, const MediaFile& b) { return a.captureTime < b.captureTime; });
        for (const auto& f : files) {
            fs::path out = uniqueOutputPath(folder, renameOnlyBaseName(settings.filenameFormat, f));
            renameFile(f.path, out, summary);
        }
        return summary;
    }

    for (const auto& session : groupSessions(files, settings.sessionGapHours)) {
        std::string base = sanitizeFileName(formatLocalTime(settings.filenameFormat, session.front().captureTime));
        fs::path out = uniqueOutputPath(folder, base);
        if (session.size() == 1) {
            renameFile(session.front().path, out, summary);
        } else {
            joinSession(folder, session, out, tool, summary);
        }
    }
    return summary;
}

int touchFiles(const fs::path& folder, const std::vector<RemoteFile>& downloaded)
{
    LOGI("Mode 'touch_only': updating file times...");
    int touched = 0;
    for (const auto& f : downloaded) {
        fs::path p = folder / f.name;
        std::error_code ec;
        if (f.modified <= 0 || !fs::exists(p, ec)) continue;

        struct timespec times[2];
        times[0].tv_sec = static_cast<time_t>(f.modified);
        times[0].tv_nsec = 0;
        times[1] = times[0];
        if (utimensat(AT_FDCWD, p.c_str(), times, 0) == 0) {
            touched++;
        } else {
            LOGW("Could not update the time of '" << f.name << "'");
        }
    }
    LOGI("Updated file times for " << touched << " files.");
    return touched;
}

} // namespace gpgrab
