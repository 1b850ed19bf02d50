#include "StreamOptions.hpp"
#include <mirror-launcher/Constants.hpp>
#include <algorithm>

namespace mirror_launcher {

int pixels(MaxDimension dimension) {
    return static_cast<int>(dimension);
}

int framesPerSecond(MaxFps fps) {
    return static_cast<int>(fps);
}

std::string dimensionName(MaxDimension dimension) {
    switch (dimension) {
        case MaxDimension::Size2560: return "2K (2560)";
        case MaxDimension::Size1920: return "1080P (1920)";
        case MaxDimension::Size1280: return "720P (1280)";
        case MaxDimension::Native:   return "Native";
    }
    return "Native";
}

std::string codecName(VideoCodec codec) {
    return codec == VideoCodec::H265 ? "h265" : "h264";
}

std::string positionName(WindowPosition position) {
    switch (position) {
        case WindowPosition::TopLeft:  return "top-left";
        case WindowPosition::TopRight: return "top-right";
        case WindowPosition::Center:   return "center";
    }
    return "center";
}

std::optional<MaxDimension> dimensionFromPixels(int value) {
    for (auto dimension : kMaxDimensions) {
        if (pixels(dimension) == value) {
            return dimension;
        }
    }
    return std::nullopt;
}

std::optional<MaxFps> fpsFromValue(int value) {
    for (auto fps : kMaxFpsValues) {
        if (framesPerSecond(fps) == value) {
            return fps;
        }
    }
    return std::nullopt;
}

std::optional<VideoCodec> codecFromName(const std::string& name) {
    for (auto codec : kVideoCodecs) {
        if (codecName(codec) == name) {
            return codec;
        }
    }
    return std::nullopt;
}

std::optional<WindowPosition> positionFromName(const std::string& name) {
    for (auto position : kWindowPositions) {
        if (positionName(position) == name) {
            return position;
        }
    }
    return std::nullopt;
}

int clampBitrate(int mbps) {
    return std::clamp(mbps, MIN_BITRATE_MBPS, MAX_BITRATE_MBPS);
}

} // namespace mirror_launcher
