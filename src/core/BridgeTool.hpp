#pragma once
#include <mirror-launcher/Types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mirror_launcher {

class CommandRunner;

// Typed front for the adb command line. Every call is blocking and bounded
// by the timeout from Constants.hpp; none of them throws.
class BridgeTool {
public:
    BridgeTool(std::string program, std::shared_ptr<CommandRunner> runner);
    ~BridgeTool();

    const std::string& program() const;

    CommandResult listDevices() const;
    CommandResult getProperty(const std::string& serial, const std::string& key) const;
    CommandResult windowSize(const std::string& serial) const;
    CommandResult ipRoute(const std::string& serial) const;
    CommandResult enableTcpip(const std::string& serial, int port) const;
    CommandResult connect(const std::string& target) const;
    CommandResult disconnect(const std::string& target) const;

    static std::vector<std::string> trackDevicesArguments();

    // (serial, status) pairs from `adb devices`, header line skipped.
    static std::vector<std::pair<std::string, std::string>> parseDeviceList(const std::string& output);
    static bool isWirelessSerial(const std::string& serial);
    // Prefers "Physical size: WxH", falls back to the first WxH.
    static std::optional<ScreenSize> parseScreenSize(const std::string& output);
    static std::optional<std::string> parseWlanAddress(const std::string& routeOutput);
    static std::string trimmed(const std::string& text);

private:
    std::string m_program;
    std::shared_ptr<CommandRunner> m_runner;
};

}
