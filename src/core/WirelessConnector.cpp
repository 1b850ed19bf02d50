#include "WirelessConnector.hpp"
#include "BridgeTool.hpp"
#include "CommandRunner.hpp"
#include "Logger.hpp"
#include "Messages.hpp"
#include <QString>
#include <QThread>

namespace mirror_launcher {

class WirelessConnector::Private {
public:
    std::shared_ptr<const BridgeTool> bridge;
    int restartDelayMs{TCPIP_RESTART_DELAY};

    static std::string combinedOutput(const CommandResult& result) {
        return BridgeTool::trimmed(result.output + "\n" + result.errorOutput);
    }
};

WirelessConnector::WirelessConnector(std::shared_ptr<const BridgeTool> bridge, int restartDelayMs)
    : d(std::make_unique<Private>()) {
    d->bridge = std::move(bridge);
    d->restartDelayMs = restartDelayMs;
}

WirelessConnector::~WirelessConnector() = default;

ConnectOutcome WirelessConnector::connect(const std::string& address, Language language) const {
    ConnectOutcome outcome;
    outcome.target = targetFor(address);

    LOG_INFO(message(MessageId::LogConnecting, language)
        .arg(QString::fromStdString(outcome.target)).toStdString());

    const CommandResult result = d->bridge->connect(outcome.target);
    outcome.status = result.status;
    outcome.output = Private::combinedOutput(result);

    switch (result.status) {
        case ToolStatus::Ok:
            break;
        case ToolStatus::Timeout:
            LOG_ERROR(message(MessageId::LogConnectTimeout, language).toStdString());
            return outcome;
        case ToolStatus::ToolNotFound:
            LOG_ERROR(message(MessageId::LogAdbNotFound, language).toStdString());
            return outcome;
        case ToolStatus::SpawnFailure:
            LOG_ERROR(message(MessageId::LogConnectFailed, language)
                .arg(QString::fromStdString(toolStatusName(result.status))).toStdString());
            return outcome;
    }

    LOG_INFO("[ADB] " + outcome.output);
    outcome.connected = looksConnected(outcome.output);
    if (outcome.connected) {
        LOG_INFO(message(MessageId::LogConnected, language)
            .arg(QString::fromStdString(outcome.target)).toStdString());
    } else {
        LOG_WARNING(message(MessageId::LogConnectFailedOutput, language)
            .arg(QString::fromStdString(outcome.output)).toStdString());
    }
    return outcome;
}

std::optional<std::string> WirelessConnector::detectAddress(const std::string& usbSerial,
                                                            Language language) const {
    const CommandResult route = d->bridge->ipRoute(usbSerial);
    if (!route.ok()) {
        LOG_WARNING("ip route failed on " + usbSerial + ": " + toolStatusName(route.status));
        return std::nullopt;
    }

    auto address = BridgeTool::parseWlanAddress(route.output);
    if (!address) {
        LOG_WARNING(message(MessageId::LogIpNotFound, language).toStdString());
        return std::nullopt;
    }

    LOG_INFO(message(MessageId::LogDetectedIp, language)
        .arg(QString::fromStdString(*address)).toStdString());
    return address;
}

AutoConnectOutcome WirelessConnector::autoConnect(const std::string& usbSerial, Language language) const {
    AutoConnectOutcome outcome;

    LOG_INFO(message(MessageId::LogUsbDetected, language)
        .arg(QString::fromStdString(usbSerial)).toStdString());

    const auto address = detectAddress(usbSerial, language);
    if (!address) {
        LOG_WARNING(message(MessageId::LogIpFallback, language).toStdString());
        outcome.needsManualAddress = true;
        return outcome;
    }
    outcome.address = *address;

    LOG_INFO(message(MessageId::LogEnablingTcpip, language)
        .arg(QString::fromStdString(usbSerial)).toStdString());
    const CommandResult tcpip = d->bridge->enableTcpip(usbSerial, WIRELESS_PORT);
    if (!tcpip.ok()) {
        LOG_ERROR(message(MessageId::LogTcpipFailed, language)
            .arg(QString::fromStdString(toolStatusName(tcpip.status))).toStdString());
        outcome.connection.target = targetFor(*address);
        outcome.connection.status = tcpip.status;
        return outcome;
    }
    const std::string tcpipOutput = Private::combinedOutput(tcpip);
    LOG_INFO("[ADB] " + (tcpipOutput.empty() ? std::string("TCP/IP mode enabled") : tcpipOutput));

    // adbd restarts in TCP mode before it accepts connections.
    LOG_INFO(message(MessageId::LogWaitingRestart, language).toStdString());
    if (d->restartDelayMs > 0) {
        QThread::msleep(static_cast<unsigned long>(d->restartDelayMs));
    }

    outcome.connection = connect(*address, language);
    return outcome;
}

DisconnectOutcome WirelessConnector::disconnect(const DeviceRecord& device, Language language) const {
    if (!canDisconnect(device)) {
        LOG_WARNING(message(MessageId::LogUsbCannotDisconnect, language).toStdString());
        return DisconnectOutcome::NotWireless;
    }

    LOG_INFO(message(MessageId::LogAttemptingDisconnect, language)
        .arg(QString::fromStdString(device.serial)).toStdString());

    const CommandResult result = d->bridge->disconnect(device.serial);
    if (result.status == ToolStatus::Timeout) {
        LOG_ERROR(message(MessageId::LogAdbTimeout, language).toStdString());
        return DisconnectOutcome::Failed;
    }
    if (!result.ok()) {
        LOG_ERROR(message(MessageId::LogDisconnectFailed, language)
            .arg(QString::fromStdString(toolStatusName(result.status))).toStdString());
        return DisconnectOutcome::Failed;
    }
    // adb reports a stale target with a non-zero exit; the entry is gone either way.
    if (result.exitCode != 0) {
        LOG_DEBUG("adb disconnect " + device.serial + ": " + Private::combinedOutput(result));
    }

    LOG_INFO(message(MessageId::LogDisconnected, language)
        .arg(QString::fromStdString(device.serial)).toStdString());
    return DisconnectOutcome::Disconnected;
}

int WirelessConnector::disconnectAll(const std::vector<DeviceRecord>& devices, Language language) const {
    int count = 0;
    for (const auto& device : devices) {
        if (device.isWireless && disconnect(device, language) == DisconnectOutcome::Disconnected) {
            ++count;
        }
    }
    LOG_INFO(message(MessageId::LogAllWirelessDisconnected, language).toStdString());
    return count;
}

std::string WirelessConnector::targetFor(const std::string& address) {
    const std::string trimmedAddress = BridgeTool::trimmed(address);
    if (trimmedAddress.find(':') != std::string::npos) {
        return trimmedAddress;
    }
    return trimmedAddress + ":" + std::to_string(WIRELESS_PORT);
}

std::string WirelessConnector::hostOf(const std::string& target) {
    const std::string trimmedTarget = BridgeTool::trimmed(target);
    return trimmedTarget.substr(0, trimmedTarget.find(':'));
}

bool WirelessConnector::looksConnected(const std::string& output) {
    return QString::fromStdString(output).contains(QStringLiteral("connected"), Qt::CaseInsensitive);
}

bool WirelessConnector::canDisconnect(const DeviceRecord& device) {
    if (device.isWireless || BridgeTool::isWirelessSerial(device.serial)) {
        return true;
    }

    const QString label = QString::fromStdString(device.displayLabel);
    if (label.contains(QStringLiteral("offline"), Qt::CaseInsensitive) ||
        label.contains(QString::fromUtf8("离线"))) {
        return true;
    }
    for (auto language : {Language::English, Language::Chinese}) {
        if (label.contains(message(MessageId::DeviceUnauthorized, language), Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

} // namespace mirror_launcher
