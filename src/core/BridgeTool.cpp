#include "BridgeTool.hpp"
#include "CommandRunner.hpp"
#include <mirror-launcher/Constants.hpp>
#include <QRegularExpression>
#include <QString>
#include <QStringList>

namespace mirror_launcher {

namespace {

const QRegularExpression& wirelessSerialPattern() {
    static const QRegularExpression pattern(
        QStringLiteral("^\\d+\\.\\d+\\.\\d+\\.\\d+:\\d+$"));
    return pattern;
}

} // namespace

BridgeTool::BridgeTool(std::string program, std::shared_ptr<CommandRunner> runner)
    : m_program(std::move(program))
    , m_runner(std::move(runner)) {
}

BridgeTool::~BridgeTool() = default;

const std::string& BridgeTool::program() const {
    return m_program;
}

CommandResult BridgeTool::listDevices() const {
    return m_runner->run(m_program, {"devices"}, DEVICE_LIST_TIMEOUT);
}

CommandResult BridgeTool::getProperty(const std::string& serial, const std::string& key) const {
    return m_runner->run(m_program, {"-s", serial, "shell", "getprop", key}, PROPERTY_TIMEOUT);
}

CommandResult BridgeTool::windowSize(const std::string& serial) const {
    return m_runner->run(m_program, {"-s", serial, "shell", "wm", "size"}, PROPERTY_TIMEOUT);
}

CommandResult BridgeTool::ipRoute(const std::string& serial) const {
    return m_runner->run(m_program, {"-s", serial, "shell", "ip", "route"}, IP_ROUTE_TIMEOUT);
}

CommandResult BridgeTool::enableTcpip(const std::string& serial, int port) const {
    return m_runner->run(m_program, {"-s", serial, "tcpip", std::to_string(port)}, TCPIP_TIMEOUT);
}

CommandResult BridgeTool::connect(const std::string& target) const {
    return m_runner->run(m_program, {"connect", target}, CONNECT_TIMEOUT);
}

CommandResult BridgeTool::disconnect(const std::string& target) const {
    return m_runner->run(m_program, {"disconnect", target}, DISCONNECT_TIMEOUT);
}

std::vector<std::string> BridgeTool::trackDevicesArguments() {
    return {"track-devices"};
}

std::vector<std::pair<std::string, std::string>> BridgeTool::parseDeviceList(const std::string& output) {
    std::vector<std::pair<std::string, std::string>> entries;

    const QStringList lines = QString::fromStdString(output).trimmed().split('\n');
    for (int i = 1; i < lines.size(); ++i) {
        const QString line = lines[i].trimmed();
        const int tab = line.indexOf('\t');
        if (line.isEmpty() || tab < 0) {
            continue;
        }
        entries.emplace_back(line.left(tab).toStdString(),
                             line.mid(tab + 1).trimmed().toStdString());
    }

    return entries;
}

bool BridgeTool::isWirelessSerial(const std::string& serial) {
    return wirelessSerialPattern().match(QString::fromStdString(serial)).hasMatch();
}

std::optional<ScreenSize> BridgeTool::parseScreenSize(const std::string& output) {
    static const QRegularExpression physical(QStringLiteral("Physical size:\\s*(\\d+)x(\\d+)"));
    static const QRegularExpression any(QStringLiteral("(\\d+)x(\\d+)"));

    const QString text = QString::fromStdString(output).trimmed();
    auto match = physical.match(text);
    if (!match.hasMatch()) {
        match = any.match(text);
    }
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return ScreenSize{match.captured(1).toInt(), match.captured(2).toInt()};
}

std::optional<std::string> BridgeTool::parseWlanAddress(const std::string& routeOutput) {
    static const QRegularExpression devFirst(
        QStringLiteral("dev\\s+wlan0\\s+.*?src\\s+(\\d+\\.\\d+\\.\\d+\\.\\d+)"));
    static const QRegularExpression srcFirst(
        QStringLiteral("src\\s+(\\d+\\.\\d+\\.\\d+\\.\\d+)\\s+.*?wlan0"));

    const QString text = QString::fromStdString(routeOutput);
    for (const auto* pattern : {&devFirst, &srcFirst}) {
        const auto match = pattern->match(text);
        if (match.hasMatch()) {
            return match.captured(1).toStdString();
        }
    }
    return std::nullopt;
}

std::string BridgeTool::trimmed(const std::string& text) {
    return QString::fromStdString(text).trimmed().toStdString();
}

} // namespace mirror_launcher
