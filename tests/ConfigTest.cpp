#include "Config.h"

#include "Errors.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

#include <sstream>

using namespace gpgrab;
using namespace gpgrab::test;

static std::vector<std::string> lines(const std::string& text)
{
    std::vector<std::string> out;
    std::istringstream ss(text);
    std::string l;
    while (std::getline(ss, l)) out.push_back(l);
    return out;
}

TEST(ConfigTest, DefaultTemplateGivesDefaults)
{
    Settings s = settingsFromIni(parseIni(defaultConfigText()));
    EXPECT_TRUE(s.identifier.empty());
    EXPECT_TRUE(s.homeWifi.empty());
    EXPECT_EQ(s.outputFolder, "GoPro_Media");
    EXPECT_EQ(s.mode, ProcessingMode::Full);
    EXPECT_EQ(s.sessionGapHours, 2);
    EXPECT_EQ(s.filenameFormat, "%Y-%m-%d_%H_%M");
    EXPECT_EQ(s.ffmpegPath, "ffmpeg");
    EXPECT_EQ(s.wifiWaitSeconds, 30);
    EXPECT_EQ(s.mediaPort, "8080");
    EXPECT_FALSE(s.autoCloseWindow);
    EXPECT_EQ(s.deleteAfterDownload, DeletePolicy::Ask);
    EXPECT_TRUE(s.shutdownAfterComplete);
    EXPECT_EQ(s.baseUrl(), "http://10.5.5.9:8080");
}

TEST(ConfigTest, ParsesValuesAndIgnoresComments)
{
    IniData ini = parseIni("; top comment\n[General]\nidentifier = ABCD\n# home_wifi = Old\n"
                           "[Processing]\nMode = rename_only\nsession_gap_hours = 5\n"
                           "[Deletion]\ndelete_after_download = yes\n[Power]\nshutdown_after_complete = no\n"
                           "[Advanced]\nmedia_port =\n");
    Settings s = settingsFromIni(ini);
    EXPECT_EQ(s.identifier, "ABCD");
    EXPECT_TRUE(s.homeWifi.empty());
    EXPECT_EQ(s.mode, ProcessingMode::RenameOnly);
    EXPECT_EQ(s.sessionGapHours, 5);
    EXPECT_EQ(s.deleteAfterDownload, DeletePolicy::Yes);
    EXPECT_FALSE(s.shutdownAfterComplete);
    EXPECT_EQ(s.devicePort(), 80);
    EXPECT_EQ(s.baseUrl(), "http://10.5.5.9");
}

TEST(ConfigTest, UnknownModeIsRejected)
{
    try {
        settingsFromIni(parseIni("[Processing]\nmode = everything\n"));
        FAIL() << "expected ConfigInvalid";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigInvalid);
        EXPECT_NE(e.remediation().find("process_only"), std::string::npos);
    }
}

TEST(ConfigTest, UnknownDeletePolicyIsRejected)
{
    EXPECT_THROW(settingsFromIni(parseIni("[Deletion]\ndelete_after_download = maybe\n")), Error);
}

TEST(ConfigTest, BadNumberFallsBackToDefault)
{
    Settings s = settingsFromIni(parseIni("[Advanced]\nwifi_wait = soon\n"));
    EXPECT_EQ(s.wifiWaitSeconds, 30);
}

TEST(ConfigTest, SettingCommentedIdentifierChangesOnlyThatLine)
{
    std::string before = defaultConfigText();
    std::string after = applyConfigUpdates(before, {{{"General", "identifier"}, "ABCD"}});

    std::vector<std::string> a = lines(before);
    std::vector<std::string> b = lines(after);
    ASSERT_EQ(a.size(), b.size());
    int changed = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] == b[i]) continue;
        ++changed;
        EXPECT_EQ(a[i], "#identifier =");
        EXPECT_EQ(b[i], "identifier = ABCD");
    }
    EXPECT_EQ(changed, 1);
    EXPECT_EQ(settingsFromIni(parseIni(after)).identifier, "ABCD");
}

TEST(ConfigTest, ActiveValueIsReplacedInPlace)
{
    std::string text = "[General]\n  output_folder = Media  \nidentifier = OLD1\n";
    std::string out = applyConfigUpdates(text, {{{"General", "identifier"}, "NEW2"}});
    EXPECT_EQ(out, "[General]\n  output_folder = Media  \nidentifier = NEW2\n");
}

TEST(ConfigTest, MissingKeyIsAppendedToItsSection)
{
    std::string text = "[General]\noutput_folder = Media\n\n[Power]\nshutdown_after_complete = yes\n";
    std::string out = applyConfigUpdates(text, {{{"General", "home_wifi"}, "HomeNet"}});
    EXPECT_EQ(out, "[General]\noutput_folder = Media\nhome_wifi = HomeNet\n\n[Power]\nshutdown_after_complete = yes\n");
}

TEST(ConfigTest, MissingSectionIsAdded)
{
    std::string out = applyConfigUpdates("[Power]\nshutdown_after_complete = yes\n",
                                         {{{"General", "identifier"}, "ABCD"}});
    Settings s = settingsFromIni(parseIni(out));
    EXPECT_EQ(s.identifier, "ABCD");
    EXPECT_EQ(out.find("[Power]\nshutdown_after_complete = yes\n"), 0u);
}

TEST(ConfigTest, LoadCreatesDefaultFileAndUpdatesIt)
{
    TempDir dir;
    std::string path = (dir.path() / "config.ini").string();
    Settings s = loadSettings(path);
    EXPECT_EQ(s.mode, ProcessingMode::Full);
    EXPECT_EQ(readFile(path), defaultConfigText());

    ASSERT_TRUE(updateConfigFile(path, {{{"General", "identifier"}, "ABCD"}, {{"General", "home_wifi"}, "HomeNet"}}));
    Settings updated = loadSettings(path);
    EXPECT_EQ(updated.identifier, "ABCD");
    EXPECT_EQ(updated.homeWifi, "HomeNet");
}

TEST(ConfigTest, UpdatingMissingFileFails)
{
    TempDir dir;
    EXPECT_FALSE(updateConfigFile((dir.path() / "absent.ini").string(), {{{"General", "identifier"}, "ABCD"}}));
}
