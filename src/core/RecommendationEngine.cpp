#include "RecommendationEngine.hpp"
#include "BridgeTool.hpp"
#include "Logger.hpp"
#include <mirror-launcher/Constants.hpp>
#include <QtGlobal>
#include <algorithm>

#if defined(Q_OS_WIN)
#include <windows.h>
#elif defined(Q_OS_MACOS)
#include <sys/sysctl.h>
#include <sys/types.h>
#elif defined(Q_OS_UNIX)
#include <unistd.h>
#endif

namespace mirror_launcher {

class RecommendationEngine::Private {
public:
    std::shared_ptr<const BridgeTool> bridge;
    RamProbe ramProbe;
};

RecommendationEngine::RecommendationEngine(std::shared_ptr<const BridgeTool> bridge, RamProbe ramProbe)
    : d(std::make_unique<Private>()) {
    d->bridge = std::move(bridge);
    d->ramProbe = std::move(ramProbe);
}

RecommendationEngine::~RecommendationEngine() = default;

RecommendationResult RecommendationEngine::generate(const std::string& serial) const {
    const int ram = hostRamGb();
    const auto screen = screenSize(serial);

    RecommendationResult result = recommend(ram, screen);
    result.deviceModel = deviceModel(serial);
    return result;
}

int RecommendationEngine::hostRamGb() const {
    const auto ram = d->ramProbe ? d->ramProbe() : std::nullopt;
    if (!ram || *ram <= 0) {
        LOG_DEBUG("Host memory size unavailable, assuming " +
                  std::to_string(DEFAULT_HOST_RAM_GB) + " GB");
        return DEFAULT_HOST_RAM_GB;
    }
    return *ram;
}

std::optional<ScreenSize> RecommendationEngine::screenSize(const std::string& serial) const {
    const CommandResult result = d->bridge->windowSize(serial);
    if (!result.ok()) {
        return std::nullopt;
    }
    return BridgeTool::parseScreenSize(result.output);
}

std::string RecommendationEngine::deviceModel(const std::string& serial) const {
    const CommandResult result = d->bridge->getProperty(serial, "ro.product.model");
    const std::string model = result.ok() ? BridgeTool::trimmed(result.output) : std::string();
    return model.empty() ? "Unknown" : model;
}

RecommendationResult RecommendationEngine::recommend(int hostRamGb, std::optional<ScreenSize> screen) {
    RecommendationResult result;
    result.hostRamGb = hostRamGb;
    result.deviceScreenSize = screen;

    const int maxDimension = screen ? std::max(screen->width, screen->height) : 0;
    if (maxDimension > HIGH_TIER_MIN_DIMENSION && hostRamGb >= HIGH_TIER_MIN_RAM_GB) {
        result.maxDimension = MaxDimension::Size2560;
        result.bitrateMbps = 20;
    } else {
        result.maxDimension = MaxDimension::Size1920;
        result.bitrateMbps = 10;
    }

    // Stability first: these two do not depend on the hardware.
    result.fps = MaxFps::Fps60;
    result.codec = VideoCodec::H264;
    return result;
}

std::optional<int> RecommendationEngine::detectHostRamGb() {
    constexpr unsigned long long kGiB = 1024ULL * 1024ULL * 1024ULL;

#if defined(Q_OS_WIN)
    MEMORYSTATUSEX status{};
    status.dwLength = sizeof(status);
    if (GlobalMemoryStatusEx(&status)) {
        return static_cast<int>(status.ullTotalPhys / kGiB);
    }
#elif defined(Q_OS_MACOS)
    int64_t bytes = 0;
    size_t length = sizeof(bytes);
    if (sysctlbyname("hw.memsize", &bytes, &length, nullptr, 0) == 0) {
        return static_cast<int>(static_cast<unsigned long long>(bytes) / kGiB);
    }
#elif defined(Q_OS_UNIX)
    const long pages = sysconf(_SC_PHYS_PAGES);
    const long pageSize = sysconf(_SC_PAGE_SIZE);
    if (pages > 0 && pageSize > 0) {
        return static_cast<int>(static_cast<unsigned long long>(pages) *
                                static_cast<unsigned long long>(pageSize) / kGiB);
    }
#endif
    return std::nullopt;
}

} // namespace mirror_launcher
