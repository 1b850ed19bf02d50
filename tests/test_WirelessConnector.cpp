// tests/test_WirelessConnector.cpp
#include <gtest/gtest.h>
#include "BridgeTool.hpp"
#include "WirelessConnector.hpp"
#include "TestSupport.hpp"
#include <memory>

namespace mirror_launcher {
namespace testing {

class WirelessConnectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner = std::make_shared<ScriptedRunner>();
        connector = std::make_unique<WirelessConnector>(
            std::make_shared<BridgeTool>("adb", runner), 0);
    }

    static DeviceRecord record(const std::string& serial, const std::string& label, bool wireless) {
        DeviceRecord device;
        device.serial = serial;
        device.displayLabel = label;
        device.isWireless = wireless;
        return device;
    }

    std::shared_ptr<ScriptedRunner> runner;
    std::unique_ptr<WirelessConnector> connector;
};

TEST_F(WirelessConnectorTest, TargetAppendsDefaultPort) {
    EXPECT_EQ(WirelessConnector::targetFor("192.168.1.5"), "192.168.1.5:5555");
    EXPECT_EQ(WirelessConnector::targetFor(" 192.168.1.5 "), "192.168.1.5:5555");
    EXPECT_EQ(WirelessConnector::targetFor("192.168.1.5:37000"), "192.168.1.5:37000");
}

TEST_F(WirelessConnectorTest, HostDropsPort) {
    EXPECT_EQ(WirelessConnector::hostOf("192.168.1.5:40000"), "192.168.1.5");
    EXPECT_EQ(WirelessConnector::hostOf("192.168.1.5"), "192.168.1.5");
    EXPECT_EQ(WirelessConnector::hostOf(" 10.0.0.7:5555 "), "10.0.0.7");
}

TEST_F(WirelessConnectorTest, ConnectSucceedsOnConnectedOutput) {
    runner->onOutput({"connect", "192.168.1.5:5555"}, "connected to 192.168.1.5:5555\n");

    const ConnectOutcome outcome = connector->connect("192.168.1.5", Language::English);

    EXPECT_TRUE(outcome.connected);
    EXPECT_EQ(outcome.target, "192.168.1.5:5555");
    EXPECT_EQ(outcome.status, ToolStatus::Ok);
    EXPECT_TRUE(recentLogsContain("[ADB] connected to 192.168.1.5:5555"));
}

TEST_F(WirelessConnectorTest, AlreadyConnectedCountsAsSuccess) {
    runner->onOutput({"connect", "192.168.1.5:5555"}, "already connected to 192.168.1.5:5555\n");
    EXPECT_TRUE(connector->connect("192.168.1.5", Language::English).connected);
}

TEST_F(WirelessConnectorTest, ConnectFailureAndTimeout) {
    runner->onOutput({"connect", "10.0.0.9:5555"},
                     "cannot reach 10.0.0.9:5555: No route to host\n");
    auto outcome = connector->connect("10.0.0.9", Language::English);
    EXPECT_FALSE(outcome.connected);
    EXPECT_EQ(outcome.status, ToolStatus::Ok);

    CommandResult timeout;
    timeout.status = ToolStatus::Timeout;
    runner->on({"connect", "10.0.0.9:5555"}, timeout);

    LogCounter errors(LogLevel::Error);
    outcome = connector->connect("10.0.0.9", Language::English);
    EXPECT_FALSE(outcome.connected);
    EXPECT_EQ(outcome.status, ToolStatus::Timeout);
    EXPECT_EQ(errors.count(), 1u);
}

TEST_F(WirelessConnectorTest, AutoConnectRunsTheWholeFlow) {
    runner->onOutput({"-s", "ABC123", "shell", "ip", "route"},
                     "192.168.1.0/24 dev wlan0 proto kernel scope link src 192.168.1.42\n");
    runner->onOutput({"-s", "ABC123", "tcpip", "5555"}, "restarting in TCP mode port: 5555\n");
    runner->onOutput({"connect", "192.168.1.42:5555"}, "connected to 192.168.1.42:5555\n");

    const AutoConnectOutcome outcome = connector->autoConnect("ABC123", Language::English);

    EXPECT_FALSE(outcome.needsManualAddress);
    EXPECT_EQ(outcome.address, "192.168.1.42");
    EXPECT_TRUE(outcome.connection.connected);
    EXPECT_EQ(outcome.connection.target, "192.168.1.42:5555");

    const auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(ScriptedRunner::join(calls[0].arguments), "-s ABC123 shell ip route");
    EXPECT_EQ(ScriptedRunner::join(calls[1].arguments), "-s ABC123 tcpip 5555");
    EXPECT_EQ(ScriptedRunner::join(calls[2].arguments), "connect 192.168.1.42:5555");
}

TEST_F(WirelessConnectorTest, AutoConnectAsksForAddressWhenUndetected) {
    runner->onOutput({"-s", "ABC123", "shell", "ip", "route"},
                     "10.10.0.0/16 dev rmnet0 proto kernel scope link src 10.10.3.4\n");

    const AutoConnectOutcome outcome = connector->autoConnect("ABC123", Language::English);

    EXPECT_TRUE(outcome.needsManualAddress);
    EXPECT_FALSE(outcome.connection.connected);
    EXPECT_EQ(runner->callCount({"-s", "ABC123", "tcpip", "5555"}), 0);
}

TEST_F(WirelessConnectorTest, AutoConnectStopsWhenTcpipFails) {
    runner->onOutput({"-s", "ABC123", "shell", "ip", "route"},
                     "192.168.1.0/24 dev wlan0 proto kernel scope link src 192.168.1.42\n");
    CommandResult timeout;
    timeout.status = ToolStatus::Timeout;
    runner->on({"-s", "ABC123", "tcpip", "5555"}, timeout);

    const AutoConnectOutcome outcome = connector->autoConnect("ABC123", Language::English);

    EXPECT_FALSE(outcome.needsManualAddress);
    EXPECT_FALSE(outcome.connection.connected);
    EXPECT_EQ(outcome.connection.status, ToolStatus::Timeout);
    EXPECT_EQ(runner->callCount({"connect", "192.168.1.42:5555"}), 0);
}

TEST_F(WirelessConnectorTest, UsbDevicesCannotBeDisconnected) {
    const auto usb = record("ABC123", "Sample X1 (ABC123)", false);
    EXPECT_FALSE(WirelessConnector::canDisconnect(usb));
    EXPECT_EQ(connector->disconnect(usb, Language::English), DisconnectOutcome::NotWireless);
    EXPECT_TRUE(runner->calls().empty());
}

TEST_F(WirelessConnectorTest, StaleEntriesCanBeDisconnected) {
    EXPECT_TRUE(WirelessConnector::canDisconnect(record("192.168.1.5:5555", "x", false)));
    EXPECT_TRUE(WirelessConnector::canDisconnect(record("adb-XYZ", "adb-XYZ (offline)", false)));
    EXPECT_TRUE(WirelessConnector::canDisconnect(record("XYZ789", "XYZ789 (Unauthorized)", false)));
    EXPECT_TRUE(WirelessConnector::canDisconnect(record("XYZ789", "XYZ789 (未授权)", false)));
}

TEST_F(WirelessConnectorTest, DisconnectIgnoresNonZeroExit) {
    CommandResult stale;
    stale.exitCode = 1;
    stale.output = "error: no such device '192.168.1.5:5555'";
    runner->on({"disconnect", "192.168.1.5:5555"}, stale);

    EXPECT_EQ(connector->disconnect(record("192.168.1.5:5555", "x", true), Language::English),
              DisconnectOutcome::Disconnected);

    CommandResult timeout;
    timeout.status = ToolStatus::Timeout;
    runner->on({"disconnect", "192.168.1.5:5555"}, timeout);
    EXPECT_EQ(connector->disconnect(record("192.168.1.5:5555", "x", true), Language::English),
              DisconnectOutcome::Failed);
}

TEST_F(WirelessConnectorTest, DisconnectAllSkipsUsb) {
    const std::vector<DeviceRecord> devices{
        record("ABC123", "Sample X1 (ABC123)", false),
        record("192.168.1.5:5555", "Sample X2 (Wireless)", true),
        record("192.168.1.6:5555", "Sample X3 (Wireless)", true)};

    EXPECT_EQ(connector->disconnectAll(devices, Language::English), 2);
    EXPECT_EQ(runner->callCount({"disconnect", "ABC123"}), 0);
    EXPECT_EQ(runner->callCount({"disconnect", "192.168.1.5:5555"}), 1);
    EXPECT_EQ(runner->callCount({"disconnect", "192.168.1.6:5555"}), 1);
}

} // namespace testing
} // namespace mirror_launcher
