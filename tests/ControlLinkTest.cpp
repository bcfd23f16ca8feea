#include "ControlLink.h"

#include "TestSupport.h"

#include <gtest/gtest.h>

using namespace gpgrab;
using namespace gpgrab::test;

class ControlLinkTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ble.devices = {{"Some Speaker", "AA:00:00:00:00:01"}, {"GoPro 1234", "AA:00:00:00:00:02"}};
    }

    FakeBleTransport ble;
    CancelToken cancel;
    ControlLink link{ble, cancel, fastLinkTiming()};
};

TEST_F(ControlLinkTest, DiscoverMatchesDefaultPattern)
{
    DeviceHandle d = link.discover(gopro::kDefaultNamePattern);
    EXPECT_EQ(d.name, "GoPro 1234");
    EXPECT_EQ(d.address, "AA:00:00:00:00:02");
    EXPECT_EQ(ble.scanCount, 1);
}

TEST_F(ControlLinkTest, DiscoverGivesUpAfterConfiguredAttempts)
{
    ble.devices = {{"Some Speaker", "AA:00:00:00:00:01"}};
    try {
        link.discover(gopro::kDefaultNamePattern);
        FAIL() << "expected NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
        EXPECT_FALSE(e.remediation().empty());
    }
    EXPECT_EQ(ble.scanCount, 3);
}

TEST_F(ControlLinkTest, DiscoverRejectsBadPattern)
{
    try {
        link.discover("GoPro [");
        FAIL() << "expected ConfigInvalid";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigInvalid);
    }
}

TEST_F(ControlLinkTest, ConnectRegistersClientAndToleratesNotSupported)
{
    link.connect(link.discover("1234"));
    EXPECT_TRUE(link.isConnected());
    EXPECT_TRUE(ble.wroteOpcode(gopro::kCmdClientInfo));
    // the NOT_SUPPORTED reply resolved and removed the slot
    EXPECT_EQ(link.pendingCount(), 0u);
}

TEST_F(ControlLinkTest, UnansweredRegistrationLeavesNoPendingSlot)
{
    ble.silent.insert(gopro::kCmdClientInfo);
    auto start = std::chrono::steady_clock::now();
    link.connect(ble.devices[1]);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
    EXPECT_TRUE(link.isConnected());
    EXPECT_EQ(link.pendingCount(), 0u);

    // a reply arriving after the wait finds nothing to resolve
    EXPECT_NO_THROW(link.onNotification(gopro::kCommandResponseUuid, {2, gopro::kCmdClientInfo, 0}));
    EXPECT_EQ(link.sendCommand(gopro::kCmdSetWifiAp, {0x01, 0x01}), 0);
}

TEST_F(ControlLinkTest, ConnectFailsWhenServicesNeverAppear)
{
    ble.characteristics.clear();
    try {
        link.connect(ble.devices[1]);
        FAIL() << "expected NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(ControlLinkTest, AuthenticationFailureBecomesAuthDesync)
{
    ble.subscribeError = "org.bluez.Error.Failed: Insufficient Authentication";
    try {
        link.connect(ble.devices[1]);
        FAIL() << "expected AuthDesync";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::AuthDesync);
        EXPECT_NE(e.remediation().find("Reset Connections"), std::string::npos);
    }
}

TEST_F(ControlLinkTest, OtherSubscribeFailuresStayTransportFailures)
{
    ble.subscribeError = "Operation already in progress";
    try {
        link.connect(ble.devices[1]);
        FAIL() << "expected TransportFailure";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransportFailure);
    }
}

TEST_F(ControlLinkTest, EnableWifiSendsApOnFrame)
{
    link.connect(ble.devices[1]);
    link.enableWifi();
    Bytes expected{0x03, gopro::kCmdSetWifiAp, 0x01, 0x01};
    EXPECT_EQ(ble.writes.back(), expected);
}

TEST_F(ControlLinkTest, EnableWifiErrorStatusIsProtocolError)
{
    ble.replies[gopro::kCmdSetWifiAp] = 1;
    link.connect(ble.devices[1]);
    try {
        link.enableWifi();
        FAIL() << "expected ProtocolError";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProtocolError);
    }
}

TEST_F(ControlLinkTest, CommandWithoutReplyTimesOut)
{
    link.connect(ble.devices[1]);
    ble.silent.insert(gopro::kCmdSetWifiAp);
    auto start = std::chrono::steady_clock::now();
    try {
        link.sendCommand(gopro::kCmdSetWifiAp, {0x01, 0x01}, std::chrono::milliseconds(200));
        FAIL() << "expected Timeout";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
    }
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(200));
    EXPECT_EQ(link.pendingCount(), 0u);
}

TEST_F(ControlLinkTest, DuplicateReplyIsIgnored)
{
    link.connect(ble.devices[1]);
    EXPECT_EQ(link.sendCommand(gopro::kCmdSetWifiAp, {0x01, 0x01}), 0);

    // second and late notifications for the same opcode find no slot
    EXPECT_NO_THROW(link.onNotification(gopro::kCommandResponseUuid, {2, gopro::kCmdSetWifiAp, 0}));
    EXPECT_NO_THROW(link.onNotification(gopro::kCommandResponseUuid, {2, gopro::kCmdSetWifiAp, 1}));
    EXPECT_EQ(link.pendingCount(), 0u);

    EXPECT_EQ(link.sendCommand(gopro::kCmdSleep, {}), 0);
}

TEST_F(ControlLinkTest, IgnoresShortFramesAndOtherCharacteristics)
{
    link.connect(ble.devices[1]);
    ble.silent.insert(gopro::kCmdSleep);
    std::thread replier([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        link.onNotification(gopro::kCommandResponseUuid, {1, gopro::kCmdSleep});
        link.onNotification(gopro::kSettingsResponseUuid, {2, gopro::kCmdSleep, 0});
        link.onNotification(gopro::kCommandResponseUuid, {2, gopro::kCmdSleep, 0});
    });
    EXPECT_EQ(link.sendCommand(gopro::kCmdSleep, {}, std::chrono::seconds(2)), 0);
    replier.join();
}

TEST_F(ControlLinkTest, WriteFailureRetriesOnceAfterReconnect)
{
    link.connect(ble.devices[1]);
    int connectsBefore = ble.connectCount;
    ble.writeFailures = 1;
    EXPECT_EQ(link.sendCommand(gopro::kCmdSleep, {}), 0);
    EXPECT_EQ(ble.connectCount, connectsBefore + 1);
}

TEST_F(ControlLinkTest, SecondWriteFailurePropagates)
{
    link.connect(ble.devices[1]);
    ble.writeFailures = 2;
    try {
        link.sendCommand(gopro::kCmdSleep, {});
        FAIL() << "expected TransportFailure";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransportFailure);
    }
    EXPECT_EQ(link.pendingCount(), 0u);
}

TEST_F(ControlLinkTest, CancelStopsWaitingForReply)
{
    link.connect(ble.devices[1]);
    ble.silent.insert(gopro::kCmdSleep);
    std::thread canceller([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel("test");
    });
    try {
        link.sendCommand(gopro::kCmdSleep, {}, std::chrono::seconds(5));
        FAIL() << "expected Interrupted";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Interrupted);
    }
    canceller.join();
}

TEST_F(ControlLinkTest, ReadsCredentialsWithoutTrailingNuls)
{
    link.connect(ble.devices[1]);
    ble.values[gopro::kWifiSsidUuid] = {'G', 'P', '2', '4', '5', 0, 0};
    ble.values[gopro::kWifiPasswordUuid] = {'p', 'w', 0};
    WifiCredentials creds = link.readWifiCredentials();
    EXPECT_EQ(creds.ssid, "GP245");
    EXPECT_EQ(creds.password, "pw");
    EXPECT_TRUE(creds.complete());
}

TEST_F(ControlLinkTest, UnreadableCredentialsAreEmpty)
{
    link.connect(ble.devices[1]);
    WifiCredentials creds = link.readWifiCredentials();
    EXPECT_TRUE(creds.ssid.empty());
    EXPECT_FALSE(creds.complete());
}

TEST_F(ControlLinkTest, SleepReconnectsWhenLinkWasDropped)
{
    link.connect(ble.devices[1]);
    link.disconnect();
    EXPECT_FALSE(link.isConnected());
    EXPECT_TRUE(link.sleepCamera());
    EXPECT_TRUE(ble.wroteOpcode(gopro::kCmdSleep));
}

TEST(GoProProtocolTest, BenignAllowList)
{
    EXPECT_TRUE(gopro::isBenignStatus(gopro::kCmdClientInfo, gopro::kStatusNotSupported));
    EXPECT_TRUE(gopro::isBenignStatus(gopro::kCmdGetHwInfo, gopro::kStatusNotSupported));
    EXPECT_FALSE(gopro::isBenignStatus(gopro::kCmdSetWifiAp, gopro::kStatusNotSupported));
    EXPECT_FALSE(gopro::isBenignStatus(gopro::kCmdClientInfo, 1));
}

TEST(GoProProtocolTest, CommandFrameLayout)
{
    EXPECT_EQ(gopro::commandFrame(gopro::kCmdSleep, {}), (Bytes{0x01, 0x05}));
    EXPECT_EQ(gopro::commandFrame(gopro::kCmdClientInfo, {0x00}), (Bytes{0x02, 0x56, 0x00}));
    EXPECT_EQ(gopro::kCommandRequestUuid, "b5f90072-aa8d-11e3-9046-0002a5d5c51b");
}
