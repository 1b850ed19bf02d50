// tests/test_SessionSupervisor.cpp
#include <gtest/gtest.h>
#include "SessionSupervisor.hpp"
#include "TestSupport.hpp"
#include <QDir>
#include <QStringList>
#include <algorithm>

namespace mirror_launcher {
namespace testing {

class SessionSupervisorTest : public ::testing::Test {
protected:
    static SessionSupervisor::Timing fastTiming() {
        SessionSupervisor::Timing timing;
        timing.pollIntervalMs = 20;
        timing.exitGraceMs = 10;
        return timing;
    }

    void watch(SessionSupervisor& supervisor) {
        QObject::connect(&supervisor, &SessionSupervisor::outputLine,
                         [this](const QString& line) { lines << line; });
        QObject::connect(&supervisor, &SessionSupervisor::sessionFinished,
                         [this](int code) { exitCodes.push_back(code); });
        QObject::connect(&supervisor, &SessionSupervisor::monitoringStarted,
                         [this]() { ++monitoring; });
        QObject::connect(&supervisor, &SessionSupervisor::silentStarted,
                         [this]() { ++silent; });
        QObject::connect(&supervisor, &SessionSupervisor::hostRestoreRequested,
                         [this]() { ++restored; });
        QObject::connect(&supervisor, &SessionSupervisor::shutdownRequested,
                         [this]() { ++shutdowns; });
    }

    static DeviceRecord device(const std::string& serial) {
        DeviceRecord record;
        record.serial = serial;
        record.displayLabel = "Sample X1 (" + serial + ")";
        return record;
    }

    QStringList lines;
    std::vector<int> exitCodes;
    int monitoring{0};
    int silent{0};
    int restored{0};
    int shutdowns{0};
};

TEST_F(SessionSupervisorTest, ArgumentsForDefaults) {
    const std::vector<std::string> expected{
        "-s", "ABC123", "-m", "1920", "--max-fps=60", "--video-codec=h264",
        "-b", "16M", "--shortcut-mod=lctrl"};
    EXPECT_EQ(SessionSupervisor::buildArguments("ABC123", StreamParameters{}, 1920), expected);
}

TEST_F(SessionSupervisorTest, ArgumentsWithEveryFlag) {
    StreamParameters params;
    params.maxDimension = MaxDimension::Size2560;
    params.maxFps = MaxFps::Fps120;
    params.bitrateMbps = 40;
    params.codec = VideoCodec::H265;
    params.screenOff = true;
    params.borderless = true;
    params.printFps = true;
    params.windowPosition = WindowPosition::TopRight;

    const std::vector<std::string> expected{
        "-s", "192.168.1.5:5555", "-m", "2560", "--max-fps=120", "--video-codec=h265",
        "-b", "40M", "--turn-screen-off", "--window-borderless", "--print-fps",
        "--window-x", "2060", "--window-y", "50", "--shortcut-mod=lctrl"};
    EXPECT_EQ(SessionSupervisor::buildArguments("192.168.1.5:5555", params, 2560), expected);
}

TEST_F(SessionSupervisorTest, NativeOmitsSizeAndTopLeftUsesOffset) {
    StreamParameters params;
    params.maxDimension = MaxDimension::Native;
    params.maxFps = MaxFps::Fps30;
    params.bitrateMbps = 4;
    params.windowPosition = WindowPosition::TopLeft;

    const std::vector<std::string> expected{
        "-s", "ABC123", "--max-fps=30", "--video-codec=h264", "-b", "4M",
        "--window-x", "50", "--window-y", "50", "--shortcut-mod=lctrl"};
    EXPECT_EQ(SessionSupervisor::buildArguments("ABC123", params, 1920), expected);
}

TEST_F(SessionSupervisorTest, BitrateIsClampedIntoRange) {
    StreamParameters params;
    params.bitrateMbps = 100;
    const auto args = SessionSupervisor::buildArguments("ABC123", params, 1920);
    EXPECT_NE(std::find(args.begin(), args.end(), "40M"), args.end());
}

TEST_F(SessionSupervisorTest, MissingToolIsReported) {
    SessionSupervisor supervisor("/nonexistent/path/to/scrcpy", fastTiming());
    LogCounter errors(LogLevel::Error);

    const int status = supervisor.launch(device("ABC123"), StreamParameters{},
                                         SupervisionMode::Silent, 1920, Language::English);

    EXPECT_EQ(status, ErrorCodes::TOOL_NOT_FOUND);
    EXPECT_EQ(supervisor.state(), SessionState::Idle);
    EXPECT_FALSE(supervisor.hasSession());
    EXPECT_GE(errors.count(), 1u);
}

TEST_F(SessionSupervisorTest, EmptySerialIsRejected) {
    SessionSupervisor supervisor("scrcpy", fastTiming());
    EXPECT_EQ(supervisor.launch(DeviceRecord{}, StreamParameters{}, SupervisionMode::Monitoring,
                                1920, Language::English),
              ErrorCodes::INVALID_DEVICE);
    EXPECT_FALSE(supervisor.hasSession());
}

#ifndef Q_OS_WIN
TEST_F(SessionSupervisorTest, MonitoringForwardsOutputAndRequestsShutdown) {
    ScriptDirectory dir;
    ASSERT_TRUE(dir.isValid());
    const auto scrcpy = dir.writeScript("scrcpy", "pwd -P\necho \"$@\"\nprintf 'tail'\nexit 0");

    SessionSupervisor supervisor(scrcpy, fastTiming());
    watch(supervisor);

    const int status = supervisor.launch(device("ABC123"), StreamParameters{},
                                         SupervisionMode::Monitoring, 1920, Language::English);
    ASSERT_EQ(status, ErrorCodes::SUCCESS);
    EXPECT_EQ(monitoring, 1);
    EXPECT_EQ(supervisor.state(), SessionState::Monitoring);
    EXPECT_TRUE(recentLogsContain("[Command] "));
    EXPECT_TRUE(recentLogsContain("--shortcut-mod=lctrl"));

    ASSERT_TRUE(waitFor([this]() { return shutdowns == 1; }));

    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[0], QDir(dir.path()).canonicalPath());
    EXPECT_EQ(lines[1], "-s ABC123 -m 1920 --max-fps=60 --video-codec=h264 -b 16M --shortcut-mod=lctrl");
    EXPECT_EQ(lines[2], "tail");
    ASSERT_EQ(exitCodes.size(), 1u);
    EXPECT_EQ(exitCodes[0], 0);
    EXPECT_EQ(restored, 0);
    EXPECT_EQ(supervisor.state(), SessionState::Idle);
    EXPECT_FALSE(supervisor.hasSession());
}

TEST_F(SessionSupervisorTest, SilentModeRestoresHostWithoutErrors) {
    ScriptDirectory dir;
    ASSERT_TRUE(dir.isValid());
    const auto scrcpy = dir.writeScript("scrcpy", "echo ignored\nsleep 0.2\nexit 0");

    SessionSupervisor supervisor(scrcpy, fastTiming());
    watch(supervisor);
    LogCounter warnings(LogLevel::Warning);

    ASSERT_EQ(supervisor.launch(device("ABC123"), StreamParameters{},
                                SupervisionMode::Silent, 1920, Language::English),
              ErrorCodes::SUCCESS);
    EXPECT_EQ(silent, 1);
    EXPECT_EQ(supervisor.state(), SessionState::Silent);

    ASSERT_TRUE(waitFor([this]() { return restored == 1; }));
    EXPECT_TRUE(lines.isEmpty());
    ASSERT_EQ(exitCodes.size(), 1u);
    EXPECT_EQ(exitCodes[0], 0);
    EXPECT_EQ(shutdowns, 0);
    EXPECT_EQ(warnings.count(), 0u);
    EXPECT_EQ(supervisor.state(), SessionState::Idle);
}

TEST_F(SessionSupervisorTest, NonZeroExitIsOnlyAWarning) {
    ScriptDirectory dir;
    ASSERT_TRUE(dir.isValid());
    const auto scrcpy = dir.writeScript("scrcpy", "exit 3");

    SessionSupervisor supervisor(scrcpy, fastTiming());
    watch(supervisor);
    LogCounter errors(LogLevel::Error);
    LogCounter warnings(LogLevel::Warning);

    ASSERT_EQ(supervisor.launch(device("ABC123"), StreamParameters{},
                                SupervisionMode::Silent, 1920, Language::English),
              ErrorCodes::SUCCESS);
    ASSERT_TRUE(waitFor([this]() { return restored == 1; }));

    ASSERT_EQ(exitCodes.size(), 1u);
    EXPECT_EQ(exitCodes[0], 3);
    EXPECT_EQ(warnings.count(), 1u);
    EXPECT_EQ(errors.count(), 0u);
}

TEST_F(SessionSupervisorTest, SecondLaunchWhileActiveIsRejected) {
    ScriptDirectory dir;
    ASSERT_TRUE(dir.isValid());
    const auto scrcpy = dir.writeScript("scrcpy", "exec sleep 5");

    SessionSupervisor supervisor(scrcpy, fastTiming());
    watch(supervisor);

    ASSERT_EQ(supervisor.launch(device("ABC123"), StreamParameters{},
                                SupervisionMode::Silent, 1920, Language::English),
              ErrorCodes::SUCCESS);
    EXPECT_TRUE(supervisor.hasSession());

    EXPECT_EQ(supervisor.launch(device("XYZ789"), StreamParameters{},
                                SupervisionMode::Monitoring, 1920, Language::English),
              ErrorCodes::SESSION_ACTIVE);
    EXPECT_EQ(supervisor.state(), SessionState::Silent);
    EXPECT_EQ(monitoring, 0);
}
#endif

} // namespace testing
} // namespace mirror_launcher
