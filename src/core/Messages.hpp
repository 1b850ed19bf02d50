#pragma once
#include <mirror-launcher/Types.hpp>
#include <QString>
#include <string>

namespace mirror_launcher {

// One entry per user-visible text. Order must match the table in Messages.cpp.
enum class MessageId {
    // Window and panel text
    WindowTitle,
    MonitoringTitle,
    DeviceLabel,
    Scanning,
    NoDevice,
    RefreshButton,
    WirelessButton,
    DisconnectButton,
    ManageWirelessButton,
    HelpButton,
    LanguageLabel,
    ParamsTitle,
    LabelResolution,
    LabelFps,
    LabelCodec,
    LabelBitrate,
    LabelPosition,
    ResolutionNative,
    CodecH264,
    CodecH265,
    PositionCenter,
    PositionTopLeft,
    PositionTopRight,
    ScreenOff,
    ScreenOffWarning,
    Borderless,
    ShowLog,
    PrintFps,
    StartButton,
    LogTitle,
    ClearLogsButton,
    AutoConfigHint,
    DeviceWireless,
    DeviceUnauthorized,

    // Dialogs
    WirelessTitle,
    WirelessPrompt,
    WirelessSuccessTitle,
    WirelessSuccessMessage,
    WirelessFirstTimeTitle,
    WirelessFirstTimeMessage,
    ManageTitle,
    ManageDisconnect,
    ManageDisconnectAll,
    ManageEmpty,
    ManageConfirmTitle,
    ManageConfirmMessage,
    OnboardingTitle,
    OnboardingDontShow,
    OnboardingPrevious,
    OnboardingNext,
    OnboardingDone,
    OnboardingModesTitle,
    OnboardingModesBody,
    OnboardingSetupTitle,
    OnboardingSetupBody,
    OnboardingWirelessTitle,
    OnboardingWirelessBody,
    OnboardingShortcutsTitle,
    OnboardingShortcutsBody,

    // Log lines
    LogHotplugStarted,
    LogFoundDevices,
    LogNoDevice,
    LogRefreshing,
    LogDeviceChangeDetected,
    LogGettingInfo,
    LogAutoSelect,
    LogAdbNotFound,
    LogAdbTimeout,
    LogScanFailed,
    LogConnecting,
    LogConnected,
    LogConnectFailedOutput,
    LogConnectTimeout,
    LogConnectFailed,
    LogEnablingTcpip,
    LogTcpipFailed,
    LogWaitingRestart,
    LogDetectedIp,
    LogIpNotFound,
    LogIpFallback,
    LogUsbDetected,
    LogNoUsbManual,
    LogFirstTimeWireless,
    LogAttemptingDisconnect,
    LogDisconnected,
    LogDisconnectFailed,
    LogUsbCannotDisconnect,
    LogNoDeviceToDisconnect,
    LogAllWirelessDisconnected,
    LogNoValidDevice,
    LogSessionActive,
    LogScrcpyNotFound,
    LogLaunchFailed,
    LogLaunched,
    LogMonitoringEntered,
    LogSilentMode,
    LogExited,
    LogExitCode,
    LogSessionClosedExiting,
    LogSessionEndedRestored,
    LogAutoConfigDevice,
    LogAutoConfigRecommended,

    Count
};

QString message(MessageId id, Language language);

std::string languageCode(Language language);
Language languageFromCode(const std::string& code, Language fallback);

}
