#pragma once
#include <string>

namespace mirror_launcher {

class ConfigManager;

struct ToolPaths {
    std::string bridge;     // adb
    std::string mirroring;  // scrcpy
};

// Resolution order: path pinned in the settings, the bundled copy under
// internal/ beside the executable, then the bare name for a PATH lookup.
ToolPaths locateTools(const std::string& applicationDir, const ConfigManager& config);

std::string bundledToolPath(const std::string& applicationDir, const std::string& baseName);

// True when the program names an existing file, or a bare name found on PATH.
// Says nothing about whether it can be started.
bool toolPresent(const std::string& program);

}
