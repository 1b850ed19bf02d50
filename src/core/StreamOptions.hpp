#pragma once
#include <mirror-launcher/Types.hpp>
#include <array>
#include <optional>
#include <string>

namespace mirror_launcher {

// The discrete choices the panel offers, in display order.
constexpr std::array<MaxDimension, 4> kMaxDimensions{
    MaxDimension::Size2560, MaxDimension::Size1920, MaxDimension::Size1280, MaxDimension::Native};
constexpr std::array<MaxFps, 4> kMaxFpsValues{
    MaxFps::Fps120, MaxFps::Fps90, MaxFps::Fps60, MaxFps::Fps30};
constexpr std::array<VideoCodec, 2> kVideoCodecs{VideoCodec::H264, VideoCodec::H265};
constexpr std::array<WindowPosition, 3> kWindowPositions{
    WindowPosition::Center, WindowPosition::TopLeft, WindowPosition::TopRight};

int pixels(MaxDimension dimension);
int framesPerSecond(MaxFps fps);

// "2K (2560)", "1080P (1920)", "720P (1280)", "Native"
std::string dimensionName(MaxDimension dimension);
std::string codecName(VideoCodec codec);       // "h264" / "h265"
std::string positionName(WindowPosition position); // "center" / "top-left" / "top-right"

std::optional<MaxDimension> dimensionFromPixels(int pixels);
std::optional<MaxFps> fpsFromValue(int fps);
std::optional<VideoCodec> codecFromName(const std::string& name);
std::optional<WindowPosition> positionFromName(const std::string& name);

int clampBitrate(int mbps);

}
