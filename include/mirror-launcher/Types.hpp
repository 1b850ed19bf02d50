#pragma once
#include <optional>
#include <string>
#include <vector>

namespace mirror_launcher {

enum class ToolStatus {
    Ok,
    ToolNotFound,
    Timeout,
    SpawnFailure
};

struct CommandResult {
    ToolStatus status{ToolStatus::Ok};
    int exitCode{0};
    std::string output;       // stdout
    std::string errorOutput;  // stderr

    bool ok() const { return status == ToolStatus::Ok; }
};

struct DeviceRecord {
    std::string serial;
    bool isWireless{false};
    std::string displayLabel;

    bool operator==(const DeviceRecord& other) const {
        return serial == other.serial &&
               isWireless == other.isWireless &&
               displayLabel == other.displayLabel;
    }
};

// Values are the pixel argument passed to the mirroring tool; Native passes none.
enum class MaxDimension {
    Native = 0,
    Size2560 = 2560,
    Size1920 = 1920,
    Size1280 = 1280
};

enum class MaxFps {
    Fps120 = 120,
    Fps90 = 90,
    Fps60 = 60,
    Fps30 = 30
};

enum class VideoCodec {
    H264,
    H265
};

enum class WindowPosition {
    Center,
    TopLeft,
    TopRight
};

struct StreamParameters {
    MaxDimension maxDimension{MaxDimension::Size1920};
    MaxFps maxFps{MaxFps::Fps60};
    int bitrateMbps{16};
    VideoCodec codec{VideoCodec::H264};
    bool screenOff{false};
    bool borderless{false};
    WindowPosition windowPosition{WindowPosition::Center};
    bool printFps{false};

    bool operator==(const StreamParameters& other) const {
        return maxDimension == other.maxDimension &&
               maxFps == other.maxFps &&
               bitrateMbps == other.bitrateMbps &&
               codec == other.codec &&
               screenOff == other.screenOff &&
               borderless == other.borderless &&
               windowPosition == other.windowPosition &&
               printFps == other.printFps;
    }
    bool operator!=(const StreamParameters& other) const { return !(*this == other); }
};

struct ScreenSize {
    int width{0};
    int height{0};
};

struct RecommendationResult {
    MaxDimension maxDimension{MaxDimension::Size1920};
    int bitrateMbps{10};
    MaxFps fps{MaxFps::Fps60};
    VideoCodec codec{VideoCodec::H264};
    std::string deviceModel;
    int hostRamGb{0};
    std::optional<ScreenSize> deviceScreenSize;
};

enum class SessionState {
    Idle,
    Monitoring,
    Silent
};

enum class SupervisionMode {
    Monitoring,
    Silent
};

enum class Language {
    English,
    Chinese
};

}
