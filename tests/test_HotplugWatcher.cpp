// tests/test_HotplugWatcher.cpp
#include <gtest/gtest.h>
#include "HotplugWatcher.hpp"
#include "TestSupport.hpp"
#include <atomic>

namespace mirror_launcher {
namespace testing {

class HotplugWatcherTest : public ::testing::Test {
protected:
    void watch(HotplugWatcher& watcher) {
        // Direct connections: the signals come from the watcher thread.
        QObject::connect(&watcher, &HotplugWatcher::trackingStarted, [this]() { ++started; });
        QObject::connect(&watcher, &HotplugWatcher::deviceSetChanged, [this]() { ++changes; });
        QObject::connect(&watcher, &HotplugWatcher::toolMissing, [this]() { ++missing; });
    }

    static HotplugWatcher::Timing fastTiming() {
        HotplugWatcher::Timing timing;
        timing.notFoundRetryMs = 100;
        timing.errorRetryMs = 50;
        timing.readSliceMs = 20;
        return timing;
    }

    std::atomic<int> started{0};
    std::atomic<int> changes{0};
    std::atomic<int> missing{0};
};

TEST_F(HotplugWatcherTest, MissingToolIsReportedAndRetried) {
    HotplugWatcher watcher("/nonexistent/path/to/adb", fastTiming());
    watch(watcher);
    watcher.start();

    ASSERT_TRUE(waitFor([this]() { return missing >= 2; }, 5000));
    EXPECT_EQ(started, 0);

    watcher.stop();
    EXPECT_TRUE(watcher.wait(3000));
}

#ifndef Q_OS_WIN
TEST_F(HotplugWatcherTest, FirstLineIsIgnored) {
    ScriptDirectory dir;
    ASSERT_TRUE(dir.isValid());
    const auto adb = dir.writeScript("adb",
        "echo 'initial'\n"
        "sleep 0.2\n"
        "echo 'ABC123 device'\n"
        "echo '192.168.1.5:5555 device'\n"
        "exec sleep 5");

    HotplugWatcher watcher(adb, fastTiming());
    watch(watcher);
    watcher.start();

    ASSERT_TRUE(waitFor([this]() { return changes >= 2; }, 5000));
    pumpEvents(100);
    EXPECT_EQ(started, 1);
    EXPECT_EQ(changes, 2);

    watcher.stop();
    EXPECT_TRUE(watcher.wait(3000));
    EXPECT_TRUE(watcher.stopRequested());
}

TEST_F(HotplugWatcherTest, RestartsAfterSubprocessExits) {
    ScriptDirectory dir;
    ASSERT_TRUE(dir.isValid());
    const auto adb = dir.writeScript("adb",
        "echo 'initial'\n"
        "echo 'changed'\n"
        "exit 1");

    HotplugWatcher watcher(adb, fastTiming());
    watch(watcher);
    watcher.start();

    // Every run skips its own first line and reports the second.
    ASSERT_TRUE(waitFor([this]() { return started >= 3 && changes >= 2; }, 5000));

    watcher.stop();
    EXPECT_TRUE(watcher.wait(3000));
}

TEST_F(HotplugWatcherTest, UnstartableToolIsNotReportedMissing) {
    ScriptDirectory dir;
    ASSERT_TRUE(dir.isValid());
    const auto adb = dir.writeScript("adb", "exec sleep 30");
    ASSERT_TRUE(QFile::setPermissions(QString::fromStdString(adb),
                                      QFile::ReadOwner | QFile::WriteOwner));

    LogCounter warnings(LogLevel::Warning);
    HotplugWatcher watcher(adb, fastTiming());
    watch(watcher);
    watcher.start();

    // Each failed start logs one warning and waits the short retry delay.
    ASSERT_TRUE(waitFor([&warnings]() { return warnings.count() >= 2; }, 5000));
    EXPECT_EQ(missing, 0);
    EXPECT_EQ(started, 0);

    watcher.stop();
    EXPECT_TRUE(watcher.wait(3000));
}

TEST_F(HotplugWatcherTest, StopTerminatesLongRunningTracker) {
    ScriptDirectory dir;
    ASSERT_TRUE(dir.isValid());
    const auto adb = dir.writeScript("adb", "exec sleep 30");

    HotplugWatcher watcher(adb, fastTiming());
    watch(watcher);
    watcher.start();
    ASSERT_TRUE(waitFor([this]() { return started == 1; }, 5000));

    watcher.stop();
    EXPECT_TRUE(watcher.wait(3000));
    EXPECT_EQ(changes, 0);
}
#endif

} // namespace testing
} // namespace mirror_launcher
