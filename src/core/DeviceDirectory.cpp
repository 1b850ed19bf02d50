#include "DeviceDirectory.hpp"
#include "BridgeTool.hpp"
#include "CommandRunner.hpp"
#include "Logger.hpp"
#include "Messages.hpp"

namespace mirror_launcher {

class DeviceDirectory::Private {
public:
    std::shared_ptr<const BridgeTool> bridge;

    static std::string suffixed(const std::string& serial, MessageId suffix, Language language) {
        return serial + " (" + message(suffix, language).toStdString() + ")";
    }
};

DeviceDirectory::DeviceDirectory(std::shared_ptr<const BridgeTool> bridge)
    : d(std::make_unique<Private>()) {
    d->bridge = std::move(bridge);
}

DeviceDirectory::~DeviceDirectory() = default;

Enumeration DeviceDirectory::enumerate(Language language) const {
    Enumeration result;

    const CommandResult listing = d->bridge->listDevices();
    result.status = listing.status;

    switch (listing.status) {
        case ToolStatus::Ok:
            break;
        case ToolStatus::ToolNotFound:
            LOG_ERROR(message(MessageId::LogAdbNotFound, language).toStdString());
            LOG_WARNING(message(MessageId::LogNoDevice, language).toStdString());
            return result;
        case ToolStatus::Timeout:
            LOG_ERROR(message(MessageId::LogAdbTimeout, language).toStdString());
            LOG_WARNING(message(MessageId::LogNoDevice, language).toStdString());
            return result;
        case ToolStatus::SpawnFailure:
            LOG_ERROR(message(MessageId::LogScanFailed, language)
                .arg(QString::fromStdString(toolStatusName(listing.status))).toStdString());
            LOG_WARNING(message(MessageId::LogNoDevice, language).toStdString());
            return result;
    }

    std::vector<std::string> ready;
    for (const auto& [serial, status] : BridgeTool::parseDeviceList(listing.output)) {
        if (status == "device") {
            ready.push_back(serial);
        } else {
            LOG_DEBUG("Skipping " + serial + " in state " + status);
        }
    }

    if (ready.empty()) {
        LOG_WARNING(message(MessageId::LogNoDevice, language).toStdString());
        return result;
    }

    LOG_INFO(message(MessageId::LogGettingInfo, language).toStdString());
    for (const auto& serial : ready) {
        result.devices.push_back(describe(serial, language));
    }

    LOG_INFO(message(MessageId::LogFoundDevices, language)
        .arg(static_cast<int>(result.devices.size())).toStdString());
    return result;
}

DeviceRecord DeviceDirectory::describe(const std::string& serial, Language language) const {
    DeviceRecord record;
    record.serial = serial;
    record.isWireless = BridgeTool::isWirelessSerial(serial);

    const CommandResult manufacturer = d->bridge->getProperty(serial, "ro.product.manufacturer");
    if (manufacturer.status == ToolStatus::Timeout) {
        record.displayLabel = makeDisplayLabel(serial, "", "", true, language);
        return record;
    }

    const CommandResult model = d->bridge->getProperty(serial, "ro.product.model");
    if (model.status == ToolStatus::Timeout) {
        record.displayLabel = makeDisplayLabel(serial, "", "", true, language);
        return record;
    }

    record.displayLabel = makeDisplayLabel(
        serial,
        manufacturer.ok() ? BridgeTool::trimmed(manufacturer.output) : std::string(),
        model.ok() ? BridgeTool::trimmed(model.output) : std::string(),
        false,
        language);
    return record;
}

std::string DeviceDirectory::makeDisplayLabel(const std::string& serial,
                                              const std::string& manufacturer,
                                              const std::string& model,
                                              bool queryTimedOut,
                                              Language language) {
    const bool wireless = BridgeTool::isWirelessSerial(serial);

    if (queryTimedOut) {
        // An unanswered property query usually means an unauthorized device.
        return Private::suffixed(serial,
            wireless ? MessageId::DeviceWireless : MessageId::DeviceUnauthorized, language);
    }

    if (!manufacturer.empty() && !model.empty()) {
        const std::string name = manufacturer + " " + model;
        return wireless
            ? Private::suffixed(name, MessageId::DeviceWireless, language)
            : name + " (" + serial + ")";
    }

    return wireless ? Private::suffixed(serial, MessageId::DeviceWireless, language) : serial;
}

} // namespace mirror_launcher
