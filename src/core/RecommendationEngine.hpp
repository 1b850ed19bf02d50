#pragma once
#include <mirror-launcher/Types.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mirror_launcher {

class BridgeTool;

// Suggests stream parameters from host memory and device screen size.
// Each probe falls back to its own default, so a failing probe never keeps
// the others from contributing.
class RecommendationEngine {
public:
    using RamProbe = std::function<std::optional<int>()>;

    explicit RecommendationEngine(std::shared_ptr<const BridgeTool> bridge,
                                  RamProbe ramProbe = &RecommendationEngine::detectHostRamGb);
    ~RecommendationEngine();

    RecommendationResult generate(const std::string& serial) const;

    int hostRamGb() const;
    std::optional<ScreenSize> screenSize(const std::string& serial) const;
    std::string deviceModel(const std::string& serial) const;

    // The decision rule alone; no I/O.
    static RecommendationResult recommend(int hostRamGb, std::optional<ScreenSize> screen);

    static std::optional<int> detectHostRamGb();

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
