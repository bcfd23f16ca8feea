#include "MediaProcessor.h"

#include "TestSupport.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <ctime>
#include <sys/stat.h>

namespace fs = std::filesystem;
using namespace gpgrab;
using namespace gpgrab::test;

// 2024-05-21 10:00:00 UTC
static const std::time_t kBase = 1716285600;

class MediaProcessorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        setenv("TZ", "UTC", 1);
        tzset();
        settings.outputFolder = dir.path().string();
        settings.filenameFormat = "%Y-%m-%d_%H_%M";
    }

    void addRaw(const std::string& name, std::time_t captured)
    {
        writeFile(dir.path() / name, name);
        tool.probes[name] = probedAt(captured);
    }

    TempDir dir;
    Settings settings;
    FakeMediaTool tool;
};

TEST(MediaHelpersTest, RecognisesRawCameraFiles)
{
    EXPECT_TRUE(isRawCameraFile("GH010001.MP4"));
    EXPECT_TRUE(isRawCameraFile("GX020034.mp4"));
    EXPECT_FALSE(isRawCameraFile("2024-05-21_10_00.mp4"));
    EXPECT_FALSE(isRawCameraFile("GH010001.THM"));
    EXPECT_FALSE(isRawCameraFile("GL010001.LRV"));
}

TEST(MediaHelpersTest, ParsesCreationTime)
{
    EXPECT_EQ(parseCreationTime("2024-05-21T10:00:00.000000Z"), std::optional<std::time_t>(kBase));
    EXPECT_EQ(parseCreationTime("2024-05-21T12:00:00+02:00"), std::optional<std::time_t>(kBase));
    EXPECT_FALSE(parseCreationTime("yesterday").has_value());
}

TEST(MediaHelpersTest, CreationTimeFromProbeOutput)
{
    EXPECT_EQ(creationTimeFromProbeJson(R"({"format":{"tags":{"creation_time":"2024-05-21T10:00:00.000000Z"}}})"),
              std::optional<std::time_t>(kBase));
    EXPECT_FALSE(creationTimeFromProbeJson(R"({"format":{"tags":{}}})").has_value());
    EXPECT_FALSE(creationTimeFromProbeJson("garbage").has_value());
}

TEST(MediaHelpersTest, SanitizesFileNames)
{
    EXPECT_EQ(sanitizeFileName("a/b:c*d?e\"f<g>h|i\\j"), "a_b_c_d_e_f_g_h_i_j");
    EXPECT_EQ(sanitizeFileName("2024-05-21_10_00"), "2024-05-21_10_00");
}

TEST(MediaHelpersTest, FfprobeNextToFfmpeg)
{
    EXPECT_EQ(ffprobePathFor("ffmpeg"), "ffprobe");
    EXPECT_EQ(ffprobePathFor("/opt/ffmpeg/bin/ffmpeg"), "/opt/ffmpeg/bin/ffprobe");
    EXPECT_EQ(ffprobePathFor("/usr/local/bin/ffmpeg-6"), "/usr/local/bin/ffprobe-6");
}

TEST_F(MediaProcessorTest, UniqueOutputPathCountsUp)
{
    EXPECT_EQ(uniqueOutputPath(dir.path(), "clip"), dir.path() / "clip.mp4");
    writeFile(dir.path() / "clip.mp4", "x");
    EXPECT_EQ(uniqueOutputPath(dir.path(), "clip"), dir.path() / "clip_1.mp4");
    writeFile(dir.path() / "clip_1.mp4", "x");
    EXPECT_EQ(uniqueOutputPath(dir.path(), "clip"), dir.path() / "clip_2.mp4");
}

TEST_F(MediaProcessorTest, GroupsSessionsByGap)
{
    std::vector<MediaFile> files = {
        {"GH020001.MP4", kBase + 600},
        {"GH010002.MP4", kBase + 3 * 3600},
        {"GH010001.MP4", kBase},
    };
    auto sessions = groupSessions(files, 2);
    ASSERT_EQ(sessions.size(), 2u);
    ASSERT_EQ(sessions[0].size(), 2u);
    EXPECT_EQ(sessions[0][0].path, "GH010001.MP4");
    EXPECT_EQ(sessions[0][1].path, "GH020001.MP4");
    EXPECT_EQ(sessions[1][0].path, "GH010002.MP4");

    EXPECT_EQ(groupSessions(files, 4).size(), 1u);
}

TEST_F(MediaProcessorTest, RenameOnlyNameKeepsChapterAndNumber)
{
    MediaFile f{"GX020034.MP4", kBase + 5};
    EXPECT_EQ(renameOnlyBaseName("%Y-%m-%d_%H_%M", f), "2024-05-21_10_00_05_020034");
}

TEST_F(MediaProcessorTest, FullModeJoinsSessionsAndRenamesSingles)
{
    addRaw("GH010001.MP4", kBase);
    addRaw("GH020001.MP4", kBase + 600);
    addRaw("GH010002.MP4", kBase + 5 * 3600);
    writeFile(dir.path() / "notes.txt", "keep");

    ProcessSummary summary = processMedia(dir.path(), {}, settings, tool);

    EXPECT_EQ(summary.joined, 1);
    EXPECT_EQ(summary.renamed, 1);
    ASSERT_EQ(tool.concatLists.size(), 1u);
    std::string expectedList = "file '" + (dir.path() / "GH010001.MP4").string() + "'\n"
                             + "file '" + (dir.path() / "GH020001.MP4").string() + "'\n";
    EXPECT_EQ(tool.concatLists[0], expectedList);
    EXPECT_EQ(tool.concatOutputs[0], dir.path() / "2024-05-21_10_00.mp4");

    EXPECT_TRUE(fs::exists(dir.path() / "2024-05-21_10_00.mp4"));
    EXPECT_TRUE(fs::exists(dir.path() / "2024-05-21_15_00.mp4"));
    EXPECT_FALSE(fs::exists(dir.path() / "GH010001.MP4"));
    EXPECT_FALSE(fs::exists(dir.path() / "GH020001.MP4"));
    EXPECT_FALSE(fs::exists(dir.path() / "GH010002.MP4"));
    EXPECT_FALSE(fs::exists(dir.path() / "concat.txt"));
    EXPECT_TRUE(fs::exists(dir.path() / "notes.txt"));
}

TEST_F(MediaProcessorTest, FailedJoinKeepsSources)
{
    tool.concatSucceeds = false;
    addRaw("GH010001.MP4", kBase);
    addRaw("GH020001.MP4", kBase + 600);

    ProcessSummary summary = processMedia(dir.path(), {}, settings, tool);
    EXPECT_EQ(summary.joined, 0);
    EXPECT_EQ(summary.skipped, 2);
    EXPECT_TRUE(fs::exists(dir.path() / "GH010001.MP4"));
    EXPECT_TRUE(fs::exists(dir.path() / "GH020001.MP4"));
}

TEST_F(MediaProcessorTest, RenameOnlyRenamesEachFile)
{
    settings.mode = ProcessingMode::RenameOnly;
    addRaw("GH010001.MP4", kBase);
    addRaw("GH020001.MP4", kBase + 600);

    ProcessSummary summary = processMedia(dir.path(), {}, settings, tool);
    EXPECT_EQ(summary.renamed, 2);
    EXPECT_TRUE(tool.concatLists.empty());
    EXPECT_TRUE(fs::exists(dir.path() / "2024-05-21_10_00_00_010001.mp4"));
    EXPECT_TRUE(fs::exists(dir.path() / "2024-05-21_10_10_00_020001.mp4"));
}

TEST_F(MediaProcessorTest, UnreadableFileIsSkipped)
{
    addRaw("GH010001.MP4", kBase);
    writeFile(dir.path() / "GH010009.MP4", "broken");   // no probe entry -> Failed

    ProcessSummary summary = processMedia(dir.path(), {}, settings, tool);
    EXPECT_EQ(summary.renamed, 1);
    EXPECT_EQ(summary.skipped, 1);
    EXPECT_TRUE(fs::exists(dir.path() / "GH010009.MP4"));
}

TEST_F(MediaProcessorTest, NothingToProcessIsNotAnError)
{
    settings.mode = ProcessingMode::ProcessOnly;
    ProcessSummary summary = processMedia(dir.path(), {}, settings, tool);
    EXPECT_EQ(summary.renamed + summary.joined + summary.skipped, 0);
}

TEST_F(MediaProcessorTest, MissingToolSkipsProcessing)
{
    tool.isAvailable = false;
    addRaw("GH010001.MP4", kBase);
    ProcessSummary summary = processMedia(dir.path(), {}, settings, tool);
    EXPECT_EQ(summary.renamed, 0);
    EXPECT_TRUE(fs::exists(dir.path() / "GH010001.MP4"));
}

TEST_F(MediaProcessorTest, DownloadOnlyLeavesFilesAlone)
{
    settings.mode = ProcessingMode::DownloadOnly;
    addRaw("GH010001.MP4", kBase);
    processMedia(dir.path(), {}, settings, tool);
    EXPECT_TRUE(fs::exists(dir.path() / "GH010001.MP4"));
}

TEST_F(MediaProcessorTest, TouchOnlySetsListingTime)
{
    settings.mode = ProcessingMode::TouchOnly;
    writeFile(dir.path() / "GH010001.MP4", "x");
    std::vector<RemoteFile> downloaded = {{"100GOPRO", "GH010001.MP4", 1, kBase}, {"100GOPRO", "GH010404.MP4", 1, kBase}};

    ProcessSummary summary = processMedia(dir.path(), downloaded, settings, tool);
    EXPECT_EQ(summary.touched, 1);
    struct stat st{};
    ASSERT_EQ(::stat((dir.path() / "GH010001.MP4").c_str(), &st), 0);
    EXPECT_EQ(st.st_mtime, kBase);
}
