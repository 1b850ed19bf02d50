// tests/test_RecommendationEngine.cpp
#include <gtest/gtest.h>
#include "BridgeTool.hpp"
#include "RecommendationEngine.hpp"
#include "TestSupport.hpp"
#include <mirror-launcher/Constants.hpp>
#include <memory>

namespace mirror_launcher {
namespace testing {

class RecommendationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner = std::make_shared<ScriptedRunner>();
        bridge = std::make_shared<BridgeTool>("adb", runner);
    }

    std::shared_ptr<ScriptedRunner> runner;
    std::shared_ptr<BridgeTool> bridge;
};

TEST_F(RecommendationEngineTest, HighTierNeedsLargeScreenAndMemory) {
    auto result = RecommendationEngine::recommend(16, ScreenSize{1440, 3008});
    EXPECT_EQ(result.maxDimension, MaxDimension::Size2560);
    EXPECT_EQ(result.bitrateMbps, 20);
    EXPECT_EQ(result.fps, MaxFps::Fps60);
    EXPECT_EQ(result.codec, VideoCodec::H264);

    result = RecommendationEngine::recommend(8, ScreenSize{1440, 3008});
    EXPECT_EQ(result.maxDimension, MaxDimension::Size1920);
    EXPECT_EQ(result.bitrateMbps, 10);

    result = RecommendationEngine::recommend(32, ScreenSize{1080, 1920});
    EXPECT_EQ(result.maxDimension, MaxDimension::Size1920);
    EXPECT_EQ(result.bitrateMbps, 10);
}

TEST_F(RecommendationEngineTest, DimensionThresholdIsExclusive) {
    EXPECT_EQ(RecommendationEngine::recommend(16, ScreenSize{1080, 2500}).maxDimension,
              MaxDimension::Size1920);
    EXPECT_EQ(RecommendationEngine::recommend(16, ScreenSize{2501, 1080}).maxDimension,
              MaxDimension::Size2560);
}

TEST_F(RecommendationEngineTest, UnknownScreenUsesStandardTier) {
    const auto result = RecommendationEngine::recommend(64, std::nullopt);
    EXPECT_EQ(result.maxDimension, MaxDimension::Size1920);
    EXPECT_EQ(result.bitrateMbps, 10);
    EXPECT_FALSE(result.deviceScreenSize.has_value());
    EXPECT_EQ(result.hostRamGb, 64);
}

TEST_F(RecommendationEngineTest, GenerateQueriesDevice) {
    runner->onOutput({"-s", "ABC123", "shell", "wm", "size"}, "Physical size: 1440x3200\n");
    runner->onOutput({"-s", "ABC123", "shell", "getprop", "ro.product.model"}, "Pixel 7 Pro\n");

    RecommendationEngine engine(bridge, []() { return std::optional<int>(16); });
    const auto result = engine.generate("ABC123");

    EXPECT_EQ(result.maxDimension, MaxDimension::Size2560);
    EXPECT_EQ(result.bitrateMbps, 20);
    EXPECT_EQ(result.deviceModel, "Pixel 7 Pro");
    EXPECT_EQ(result.hostRamGb, 16);
    ASSERT_TRUE(result.deviceScreenSize.has_value());
    EXPECT_EQ(result.deviceScreenSize->width, 1440);
    EXPECT_EQ(result.deviceScreenSize->height, 3200);
}

TEST_F(RecommendationEngineTest, FailingProbesFallBackIndependently) {
    CommandResult timeout;
    timeout.status = ToolStatus::Timeout;
    runner->setFallback(timeout);

    RecommendationEngine engine(bridge, []() { return std::optional<int>(); });
    const auto result = engine.generate("ABC123");

    EXPECT_EQ(result.hostRamGb, DEFAULT_HOST_RAM_GB);
    EXPECT_EQ(result.deviceModel, "Unknown");
    EXPECT_FALSE(result.deviceScreenSize.has_value());
    EXPECT_EQ(result.maxDimension, MaxDimension::Size1920);
    EXPECT_EQ(result.bitrateMbps, 10);
}

TEST_F(RecommendationEngineTest, ScreenStillCountsWhenModelFails) {
    runner->onOutput({"-s", "ABC123", "shell", "wm", "size"}, "Physical size: 1600x2560\n");
    CommandResult missing;
    missing.status = ToolStatus::SpawnFailure;
    runner->on({"-s", "ABC123", "shell", "getprop", "ro.product.model"}, missing);

    RecommendationEngine engine(bridge, []() { return std::optional<int>(16); });
    const auto result = engine.generate("ABC123");

    EXPECT_EQ(result.deviceModel, "Unknown");
    EXPECT_EQ(result.maxDimension, MaxDimension::Size2560);
}

TEST_F(RecommendationEngineTest, HostProbeReportsSomething) {
    const auto ram = RecommendationEngine::detectHostRamGb();
    if (ram) {
        EXPECT_GE(*ram, 0);
    }

    RecommendationEngine engine(bridge);
    EXPECT_GT(engine.hostRamGb(), 0);
}

} // namespace testing
} // namespace mirror_launcher
