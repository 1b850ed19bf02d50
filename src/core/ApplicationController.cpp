#include "ApplicationController.hpp"
#include "BridgeTool.hpp"
#include "CommandRunner.hpp"
#include "DeviceDirectory.hpp"
#include "Logger.hpp"
#include "Messages.hpp"
#include "RefreshDebouncer.hpp"
#include "StreamOptions.hpp"
#include "WirelessConnector.hpp"
#include "../utils/ConfigManager.hpp"
#include <QMetaObject>
#include <QThreadPool>
#include <QTimer>
#include <algorithm>
#include <iterator>

namespace mirror_launcher {

namespace {

// Runs work() on the pool and hands its result to apply() on the receiver's
// thread. Posted calls are dropped if the receiver is gone by then.
template<typename Work, typename Apply>
void runInBackground(QThreadPool& pool, QObject* receiver, Work work, Apply apply) {
    pool.start([receiver, work, apply]() {
        auto result = work();
        QMetaObject::invokeMethod(receiver, [apply, result]() { apply(result); },
                                  Qt::QueuedConnection);
    });
}

} // namespace

class ApplicationController::Private {
public:
    ConfigManager* config{nullptr};
    Options options;
    ApplicationState state;

    std::shared_ptr<const BridgeTool> bridge;
    std::shared_ptr<const DeviceDirectory> directory;
    std::shared_ptr<const RecommendationEngine> recommender;
    std::shared_ptr<const WirelessConnector> connector;

    HotplugWatcher* watcher{nullptr};
    RefreshDebouncer* debouncer{nullptr};
    SessionSupervisor* supervisor{nullptr};
    QThreadPool pool;

    bool shutDown{false};

    const DeviceRecord* findDevice(const std::string& serial) const {
        auto it = std::find_if(state.devices.begin(), state.devices.end(),
                               [&serial](const DeviceRecord& device) { return device.serial == serial; });
        return it == state.devices.end() ? nullptr : &*it;
    }

    std::string log(MessageId id) const {
        return message(id, state.language).toStdString();
    }
};

ApplicationController::ApplicationController(ConfigManager& config, Options options, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->config = &config;
    d->options = std::move(options);

    d->state.params = config.streamParameters();
    d->state.lastIp = config.lastIp();
    d->state.language = config.language();
    d->state.showOnboarding = config.showOnboarding();

    auto runner = d->options.runner ? d->options.runner : std::make_shared<ProcessRunner>();
    auto ramProbe = d->options.ramProbe ? d->options.ramProbe
                                        : RecommendationEngine::RamProbe(&RecommendationEngine::detectHostRamGb);

    d->bridge = std::make_shared<BridgeTool>(d->options.tools.bridge, runner);
    d->directory = std::make_shared<DeviceDirectory>(d->bridge);
    d->recommender = std::make_shared<RecommendationEngine>(d->bridge, ramProbe);
    d->connector = std::make_shared<WirelessConnector>(d->bridge, d->options.tcpipRestartDelayMs);

    d->debouncer = new RefreshDebouncer(d->options.refreshDebounceMs, this);
    connect(d->debouncer, &RefreshDebouncer::refreshDue, this, [this]() {
        LOG_INFO(d->log(MessageId::LogDeviceChangeDetected));
        refreshDevices();
    });

    d->watcher = new HotplugWatcher(d->options.tools.bridge, d->options.watcherTiming, this);
    connect(d->watcher, &HotplugWatcher::deviceSetChanged, d->debouncer, &RefreshDebouncer::request);
    connect(d->watcher, &HotplugWatcher::trackingStarted, this, []() {
        LOG_DEBUG("Tracking device changes");
    });
    connect(d->watcher, &HotplugWatcher::toolMissing, this, []() {
        LOG_DEBUG("Hotplug tracking unavailable, bridge tool not found");
    });

    d->supervisor = new SessionSupervisor(d->options.tools.mirroring, d->options.sessionTiming, this);
    connect(d->supervisor, &SessionSupervisor::outputLine, this, [](const QString& line) {
        LOG_INFO("[SCRCPY] " + line.toStdString());
    });
    connect(d->supervisor, &SessionSupervisor::stateChanged, this, [this](SessionState session) {
        d->state.session = session;
        emit sessionStateChanged(session);
    });
    connect(d->supervisor, &SessionSupervisor::monitoringStarted, this, &ApplicationController::monitoringStarted);
    connect(d->supervisor, &SessionSupervisor::silentStarted, this, &ApplicationController::hostHideRequested);
    connect(d->supervisor, &SessionSupervisor::hostRestoreRequested, this, &ApplicationController::hostRestoreRequested);
    connect(d->supervisor, &SessionSupervisor::shutdownRequested, this, [this]() {
        shutdown();
        emit quitRequested();
    });
}

ApplicationController::~ApplicationController() {
    d->pool.clear();
    d->pool.waitForDone();
    d->watcher->stop();
    d->watcher->wait();
}

const ApplicationState& ApplicationController::state() const {
    return d->state;
}

const DeviceRecord* ApplicationController::selectedDevice() const {
    return d->findDevice(d->state.selectedSerial);
}

std::vector<DeviceRecord> ApplicationController::wirelessDevices() const {
    std::vector<DeviceRecord> wireless;
    std::copy_if(d->state.devices.begin(), d->state.devices.end(), std::back_inserter(wireless),
                 [](const DeviceRecord& device) { return device.isWireless; });
    return wireless;
}

QString ApplicationController::text(MessageId id) const {
    return message(id, d->state.language);
}

SessionSupervisor* ApplicationController::supervisor() const {
    return d->supervisor;
}

void ApplicationController::start() {
    LOG_DEBUG("Bridge tool: " + d->options.tools.bridge +
              ", mirroring tool: " + d->options.tools.mirroring);

    QTimer::singleShot(d->options.initialScanDelayMs, this, &ApplicationController::refreshDevices);

    if (d->options.watchHotplug) {
        d->watcher->start();
        LOG_INFO(d->log(MessageId::LogHotplugStarted));
    }
}

bool ApplicationController::saveSettings() {
    d->config->setStreamParameters(d->state.params);
    d->config->setLastIp(d->state.lastIp);
    d->config->setLanguage(d->state.language);
    d->config->setShowOnboarding(d->state.showOnboarding);

    if (d->options.configPath.empty()) {
        return false;
    }
    return d->config->saveToFile(d->options.configPath);
}

void ApplicationController::refreshDevices() {
    if (d->shutDown) {
        return;
    }

    if (d->state.scansInFlight++ == 0) {
        emit scanningChanged(true);
    }

    auto directory = d->directory;
    const Language language = d->state.language;
    runInBackground(d->pool, this,
        [directory, language]() { return directory->enumerate(language); },
        [this](const Enumeration& result) {
            if (--d->state.scansInFlight == 0) {
                emit scanningChanged(false);
            }

            d->state.devices = result.devices;
            if (d->state.devices.empty()) {
                d->state.selectedSerial.clear();
                emit devicesChanged();
                emit selectionChanged(QString());
                return;
            }

            bool autoSelected = false;
            if (!d->state.pendingSelect.empty()) {
                if (const DeviceRecord* pending = d->findDevice(d->state.pendingSelect)) {
                    d->state.selectedSerial = pending->serial;
                    d->state.pendingSelect.clear();
                    autoSelected = true;
                    LOG_INFO(text(MessageId::LogAutoSelect)
                        .arg(QString::fromStdString(pending->displayLabel)).toStdString());
                }
            }
            if (!autoSelected && !d->findDevice(d->state.selectedSerial)) {
                d->state.selectedSerial = d->state.devices.front().serial;
            }

            emit devicesChanged();
            emit selectionChanged(QString::fromStdString(d->state.selectedSerial));

            auto recommender = d->recommender;
            const std::string serial = d->state.selectedSerial;
            runInBackground(d->pool, this,
                [recommender, serial]() { return recommender->generate(serial); },
                [this, serial](const RecommendationResult& rec) {
                    // A newer enumeration may have moved the selection.
                    if (d->state.selectedSerial != serial) {
                        return;
                    }

                    d->state.params.maxDimension = rec.maxDimension;
                    d->state.params.maxFps = rec.fps;
                    d->state.params.bitrateMbps = clampBitrate(rec.bitrateMbps);
                    d->state.params.codec = rec.codec;
                    d->state.recommendationHint = text(MessageId::AutoConfigHint)
                        .arg(QString::fromStdString(rec.deviceModel))
                        .arg(rec.hostRamGb);

                    const QString screen = rec.deviceScreenSize
                        ? QString("%1x%2").arg(rec.deviceScreenSize->width).arg(rec.deviceScreenSize->height)
                        : QStringLiteral("Unknown");
                    LOG_INFO(text(MessageId::LogAutoConfigDevice)
                        .arg(QString::fromStdString(rec.deviceModel), screen)
                        .arg(rec.hostRamGb).toStdString());
                    LOG_INFO(text(MessageId::LogAutoConfigRecommended)
                        .arg(QString::fromStdString(dimensionName(rec.maxDimension)))
                        .arg(framesPerSecond(rec.fps))
                        .arg(rec.bitrateMbps)
                        .arg(QString::fromStdString(codecName(rec.codec))).toStdString());

                    emit streamParametersChanged();
                    emit recommendationHintChanged(d->state.recommendationHint);
                });
        });
}

void ApplicationController::requestRefresh() {
    LOG_INFO(d->log(MessageId::LogRefreshing));
    refreshDevices();
}

void ApplicationController::selectDevice(const std::string& serial) {
    if (serial == d->state.selectedSerial || !d->findDevice(serial)) {
        return;
    }
    d->state.selectedSerial = serial;
    emit selectionChanged(QString::fromStdString(serial));
}

void ApplicationController::setStreamParameters(const StreamParameters& params) {
    StreamParameters normalized = params;
    normalized.bitrateMbps = clampBitrate(params.bitrateMbps);
    if (normalized == d->state.params) {
        return;
    }

    d->state.params = normalized;
    emit streamParametersChanged();

    if (!d->state.recommendationHint.isEmpty()) {
        d->state.recommendationHint.clear();
        emit recommendationHintChanged(QString());
    }
}

void ApplicationController::setShowLog(bool show) {
    if (d->state.showLog == show) {
        return;
    }
    d->state.showLog = show;
    emit showLogChanged(show);
}

void ApplicationController::setLanguage(Language language) {
    if (d->state.language == language) {
        return;
    }
    d->state.language = language;
    d->config->setLanguage(language);
    emit languageChanged();

    // Labels carry localized suffixes.
    refreshDevices();
}

void ApplicationController::dismissOnboarding(bool dontShowAgain) {
    if (!dontShowAgain) {
        return;
    }
    d->state.showOnboarding = false;
    saveSettings();
    LOG_INFO("Onboarding disabled for future launches");
}

int ApplicationController::launchSession(int screenWidth) {
    const DeviceRecord* device = selectedDevice();
    if (!device) {
        LOG_WARNING(d->log(MessageId::LogNoValidDevice));
        return ErrorCodes::INVALID_DEVICE;
    }

    const SupervisionMode mode = d->state.showLog ? SupervisionMode::Monitoring : SupervisionMode::Silent;
    return d->supervisor->launch(*device, d->state.params, mode, screenWidth, d->state.language);
}

void ApplicationController::beginWirelessSetup() {
    auto usb = std::find_if(d->state.devices.begin(), d->state.devices.end(),
                            [](const DeviceRecord& device) { return !device.isWireless; });
    if (usb != d->state.devices.end()) {
        autoConnectWireless(usb->serial);
        return;
    }

    if (!d->state.lastIp.empty() || !wirelessDevices().empty()) {
        LOG_INFO(d->log(MessageId::LogNoUsbManual));
        emit manualAddressRequested(QString::fromStdString(d->state.lastIp));
        return;
    }

    LOG_WARNING(d->log(MessageId::LogFirstTimeWireless));
    emit firstTimeWirelessPrompt();
}

void ApplicationController::connectWireless(const std::string& address, bool notify) {
    const std::string trimmedAddress = BridgeTool::trimmed(address);
    if (trimmedAddress.empty()) {
        return;
    }
    d->state.lastIp = trimmedAddress;

    auto connector = d->connector;
    const Language language = d->state.language;
    runInBackground(d->pool, this,
        [connector, trimmedAddress, language]() { return connector->connect(trimmedAddress, language); },
        [this, trimmedAddress, notify](const ConnectOutcome& outcome) {
            if (!outcome.connected) {
                return;
            }
            d->state.pendingSelect = outcome.target;
            d->state.lastIp = trimmedAddress;
            saveSettings();
            QTimer::singleShot(d->options.rescanAfterConnectMs, this, &ApplicationController::refreshDevices);
            if (notify) {
                emit wirelessConnected(QString::fromStdString(outcome.target));
            }
        });
}

void ApplicationController::autoConnectWireless(const std::string& usbSerial) {
    auto connector = d->connector;
    const Language language = d->state.language;
    runInBackground(d->pool, this,
        [connector, usbSerial, language]() { return connector->autoConnect(usbSerial, language); },
        [this](const AutoConnectOutcome& outcome) {
            if (outcome.needsManualAddress) {
                emit manualAddressRequested(QString::fromStdString(d->state.lastIp));
                return;
            }
            d->state.lastIp = outcome.address;
            if (!outcome.connection.connected) {
                return;
            }
            d->state.pendingSelect = outcome.connection.target;
            saveSettings();
            QTimer::singleShot(d->options.rescanAfterConnectMs, this, &ApplicationController::refreshDevices);
            emit wirelessConnected(QString::fromStdString(outcome.connection.target));
        });
}

void ApplicationController::disconnectSelected() {
    if (d->state.selectedSerial.empty()) {
        LOG_WARNING(d->log(MessageId::LogNoDeviceToDisconnect));
        return;
    }
    disconnectDevice(d->state.selectedSerial);
}

void ApplicationController::disconnectDevice(const std::string& serial) {
    DeviceRecord device;
    if (const DeviceRecord* known = d->findDevice(serial)) {
        device = *known;
    } else {
        device.serial = serial;
        device.isWireless = BridgeTool::isWirelessSerial(serial);
        device.displayLabel = serial;
    }

    if (!WirelessConnector::canDisconnect(device)) {
        LOG_WARNING(d->log(MessageId::LogUsbCannotDisconnect));
        return;
    }

    auto connector = d->connector;
    const Language language = d->state.language;
    runInBackground(d->pool, this,
        [connector, device, language]() { return connector->disconnect(device, language); },
        [this, serial](DisconnectOutcome outcome) {
            if (outcome != DisconnectOutcome::Disconnected) {
                return;
            }
            if (!d->state.lastIp.empty() &&
                WirelessConnector::hostOf(d->state.lastIp) == WirelessConnector::hostOf(serial)) {
                d->state.lastIp.clear();
            }
            if (d->state.pendingSelect == serial) {
                d->state.pendingSelect.clear();
            }
            saveSettings();
            refreshDevices();
        });
}

void ApplicationController::disconnectAllWireless() {
    auto connector = d->connector;
    const auto devices = wirelessDevices();
    const Language language = d->state.language;
    runInBackground(d->pool, this,
        [connector, devices, language]() { return connector->disconnectAll(devices, language); },
        [this](int) {
            d->state.lastIp.clear();
            d->state.pendingSelect.clear();
            saveSettings();
            QTimer::singleShot(d->options.rescanAfterConnectMs, this, &ApplicationController::refreshDevices);
        });
}

void ApplicationController::shutdown() {
    if (d->shutDown) {
        return;
    }
    d->shutDown = true;

    d->debouncer->cancel();
    d->watcher->stop();
    d->watcher->wait();
    saveSettings();
    Logger::instance().flush();
}

}
