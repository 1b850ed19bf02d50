#pragma once
#include <mirror-launcher/Constants.hpp>
#include <mirror-launcher/Types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mirror_launcher {

class BridgeTool;

struct ConnectOutcome {
    bool connected{false};
    std::string target;   // ip:port handed to adb
    ToolStatus status{ToolStatus::Ok};
    std::string output;
};

struct AutoConnectOutcome {
    // Set when the device address could not be detected; the caller asks
    // the user for it instead.
    bool needsManualAddress{false};
    std::string address;
    ConnectOutcome connection;
};

enum class DisconnectOutcome {
    Disconnected,
    Failed,
    NotWireless
};

// Blocking adb-over-TCP flows. Meant to run off the GUI thread.
class WirelessConnector {
public:
    explicit WirelessConnector(std::shared_ptr<const BridgeTool> bridge,
                               int restartDelayMs = TCPIP_RESTART_DELAY);
    ~WirelessConnector();

    ConnectOutcome connect(const std::string& address, Language language) const;

    std::optional<std::string> detectAddress(const std::string& usbSerial, Language language) const;

    AutoConnectOutcome autoConnect(const std::string& usbSerial, Language language) const;

    DisconnectOutcome disconnect(const DeviceRecord& device, Language language) const;

    // Returns how many devices were disconnected.
    int disconnectAll(const std::vector<DeviceRecord>& devices, Language language) const;

    static std::string targetFor(const std::string& address);
    // "192.168.1.5:40000" -> "192.168.1.5"
    static std::string hostOf(const std::string& target);
    static bool looksConnected(const std::string& output);
    // Wireless serials, plus stale entries whose label reports them offline
    // or unauthorized.
    static bool canDisconnect(const DeviceRecord& device);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
