// tests/test_BridgeTool.cpp
#include <gtest/gtest.h>
#include "BridgeTool.hpp"
#include "TestSupport.hpp"
#include <mirror-launcher/Constants.hpp>
#include <memory>

namespace mirror_launcher {
namespace testing {

class BridgeToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner = std::make_shared<ScriptedRunner>();
        bridge = std::make_unique<BridgeTool>("adb", runner);
    }

    std::shared_ptr<ScriptedRunner> runner;
    std::unique_ptr<BridgeTool> bridge;
};

TEST_F(BridgeToolTest, ParseDeviceListSkipsHeader) {
    const auto entries = BridgeTool::parseDeviceList(
        "List of devices attached\n"
        "ABC123\tdevice\n"
        "192.168.1.5:5555\toffline\n"
        "XYZ789\tunauthorized\n\n");

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].first, "ABC123");
    EXPECT_EQ(entries[0].second, "device");
    EXPECT_EQ(entries[1].first, "192.168.1.5:5555");
    EXPECT_EQ(entries[1].second, "offline");
    EXPECT_EQ(entries[2].second, "unauthorized");
}

TEST_F(BridgeToolTest, ParseDeviceListHandlesCrLfAndNoise) {
    const auto entries = BridgeTool::parseDeviceList(
        "List of devices attached\r\n"
        "* daemon started successfully\r\n"
        "ABC123\tdevice\r\n");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, "ABC123");
    EXPECT_EQ(entries[0].second, "device");
}

TEST_F(BridgeToolTest, ParseDeviceListEmpty) {
    EXPECT_TRUE(BridgeTool::parseDeviceList("List of devices attached\n").empty());
    EXPECT_TRUE(BridgeTool::parseDeviceList("").empty());
}

TEST_F(BridgeToolTest, WirelessSerialPattern) {
    EXPECT_TRUE(BridgeTool::isWirelessSerial("192.168.1.5:5555"));
    EXPECT_TRUE(BridgeTool::isWirelessSerial("10.0.0.12:41234"));
    EXPECT_FALSE(BridgeTool::isWirelessSerial("ABC123"));
    EXPECT_FALSE(BridgeTool::isWirelessSerial("192.168.1.5"));
    EXPECT_FALSE(BridgeTool::isWirelessSerial("emulator-5554"));
    EXPECT_FALSE(BridgeTool::isWirelessSerial("adb-XYZ._adb-tls-connect._tcp"));
}

TEST_F(BridgeToolTest, ParseScreenSizePrefersPhysical) {
    auto size = BridgeTool::parseScreenSize("Physical size: 1440x3200\nOverride size: 1080x2400\n");
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(size->width, 1440);
    EXPECT_EQ(size->height, 3200);

    size = BridgeTool::parseScreenSize("Override size: 720x1600");
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(size->width, 720);
    EXPECT_EQ(size->height, 1600);

    EXPECT_FALSE(BridgeTool::parseScreenSize("error: device offline").has_value());
}

TEST_F(BridgeToolTest, ParseWlanAddressBothLayouts) {
    auto address = BridgeTool::parseWlanAddress(
        "192.168.1.0/24 dev wlan0 proto kernel scope link src 192.168.1.42\n");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "192.168.1.42");

    address = BridgeTool::parseWlanAddress("default via 10.0.0.1 src 10.0.0.7 metric 5 wlan0\n");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "10.0.0.7");

    EXPECT_FALSE(BridgeTool::parseWlanAddress(
        "10.10.0.0/16 dev rmnet0 proto kernel scope link src 10.10.3.4\n").has_value());
}

TEST_F(BridgeToolTest, CommandsCarryTimeouts) {
    bridge->listDevices();
    bridge->getProperty("ABC123", "ro.product.model");
    bridge->enableTcpip("ABC123", WIRELESS_PORT);
    bridge->connect("192.168.1.5:5555");

    const auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 4u);

    EXPECT_EQ(calls[0].program, "adb");
    EXPECT_EQ(ScriptedRunner::join(calls[0].arguments), "devices");
    EXPECT_EQ(calls[0].timeoutMs, DEVICE_LIST_TIMEOUT);

    EXPECT_EQ(ScriptedRunner::join(calls[1].arguments), "-s ABC123 shell getprop ro.product.model");
    EXPECT_EQ(calls[1].timeoutMs, PROPERTY_TIMEOUT);

    EXPECT_EQ(ScriptedRunner::join(calls[2].arguments), "-s ABC123 tcpip 5555");
    EXPECT_EQ(calls[2].timeoutMs, TCPIP_TIMEOUT);

    EXPECT_EQ(ScriptedRunner::join(calls[3].arguments), "connect 192.168.1.5:5555");
    EXPECT_EQ(calls[3].timeoutMs, CONNECT_TIMEOUT);
}

TEST_F(BridgeToolTest, ProcessRunnerReportsMissingTool) {
    ProcessRunner processRunner;
    const auto result = processRunner.run("/nonexistent/path/to/adb", {"devices"}, 2000);
    EXPECT_EQ(result.status, ToolStatus::ToolNotFound);
    EXPECT_FALSE(result.ok());
}

#ifndef Q_OS_WIN
TEST_F(BridgeToolTest, ProcessRunnerCapturesOutputAndTimeout) {
    ScriptDirectory dir;
    ASSERT_TRUE(dir.isValid());
    const auto quick = dir.writeScript("quick", "echo out; echo err >&2; exit 3");
    const auto slow = dir.writeScript("slow", "exec sleep 5");

    ProcessRunner processRunner;
    auto result = processRunner.run(quick, {}, 5000);
    EXPECT_EQ(result.status, ToolStatus::Ok);
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_EQ(BridgeTool::trimmed(result.output), "out");
    EXPECT_EQ(BridgeTool::trimmed(result.errorOutput), "err");

    result = processRunner.run(slow, {}, 200);
    EXPECT_EQ(result.status, ToolStatus::Timeout);
}

TEST_F(BridgeToolTest, ProcessRunnerReportsUnstartableToolAsSpawnFailure) {
    ScriptDirectory dir;
    ASSERT_TRUE(dir.isValid());
    const auto adb = dir.writeScript("adb", "echo unreachable");
    ASSERT_TRUE(QFile::setPermissions(QString::fromStdString(adb),
                                      QFile::ReadOwner | QFile::WriteOwner));

    ProcessRunner processRunner;
    const auto result = processRunner.run(adb, {"devices"}, 2000);
    EXPECT_EQ(result.status, ToolStatus::SpawnFailure);
    EXPECT_FALSE(result.ok());
}
#endif

} // namespace testing
} // namespace mirror_launcher
