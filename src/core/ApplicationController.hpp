#pragma once
#include "HotplugWatcher.hpp"
#include "RecommendationEngine.hpp"
#include "SessionSupervisor.hpp"
#include "../utils/ToolLocator.hpp"
#include <mirror-launcher/Constants.hpp>
#include <mirror-launcher/Types.hpp>
#include <QObject>
#include <QString>
#include <memory>
#include <string>
#include <vector>

namespace mirror_launcher {

class CommandRunner;
class ConfigManager;
enum class MessageId;

struct ApplicationState {
    std::vector<DeviceRecord> devices;
    std::string selectedSerial;
    // Wireless target to select once it shows up in an enumeration.
    std::string pendingSelect;
    StreamParameters params;
    std::string lastIp;
    Language language{Language::English};
    bool showOnboarding{true};
    bool showLog{true};
    SessionState session{SessionState::Idle};
    // Empty once the user edits a parameter.
    QString recommendationHint;
    int scansInFlight{0};
};

// Owns every component and the application state. All state changes happen
// on the thread the controller lives on; blocking adb work runs on a private
// thread pool and its results are posted back.
class ApplicationController : public QObject {
    Q_OBJECT

public:
    struct Options {
        ToolPaths tools;
        std::string configPath;
        std::shared_ptr<CommandRunner> runner;       // ProcessRunner when null
        RecommendationEngine::RamProbe ramProbe;     // host probe when null
        HotplugWatcher::Timing watcherTiming;
        SessionSupervisor::Timing sessionTiming;
        int refreshDebounceMs{REFRESH_DEBOUNCE};
        int rescanAfterConnectMs{RESCAN_AFTER_CONNECT};
        int tcpipRestartDelayMs{TCPIP_RESTART_DELAY};
        int initialScanDelayMs{INITIAL_SCAN_DELAY};
        bool watchHotplug{true};
    };

    ApplicationController(ConfigManager& config, Options options, QObject* parent = nullptr);
    ~ApplicationController();

    const ApplicationState& state() const;
    const DeviceRecord* selectedDevice() const;
    std::vector<DeviceRecord> wirelessDevices() const;
    QString text(MessageId id) const;

    SessionSupervisor* supervisor() const;

    void start();
    bool saveSettings();

public slots:
    void refreshDevices();
    void requestRefresh();
    void selectDevice(const std::string& serial);
    void setStreamParameters(const mirror_launcher::StreamParameters& params);
    void setShowLog(bool show);
    void setLanguage(mirror_launcher::Language language);
    void dismissOnboarding(bool dontShowAgain);

    int launchSession(int screenWidth);

    void beginWirelessSetup();
    void connectWireless(const std::string& address, bool notify = false);
    void autoConnectWireless(const std::string& usbSerial);
    void disconnectSelected();
    void disconnectDevice(const std::string& serial);
    void disconnectAllWireless();

    void shutdown();

signals:
    void devicesChanged();
    void scanningChanged(bool scanning);
    void selectionChanged(const QString& serial);
    void streamParametersChanged();
    void recommendationHintChanged(const QString& hint);
    void languageChanged();
    void showLogChanged(bool show);

    void manualAddressRequested(const QString& prefill);
    void firstTimeWirelessPrompt();
    void wirelessConnected(const QString& target);

    void sessionStateChanged(mirror_launcher::SessionState state);
    void monitoringStarted();
    void hostHideRequested();
    void hostRestoreRequested();
    void quitRequested();

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
