#include "MainWindow.hpp"
#include "OnboardingDialog.hpp"
#include "WirelessDevicesDialog.hpp"
#include "../core/ApplicationController.hpp"
#include "../core/Logger.hpp"
#include "../core/Messages.hpp"
#include "../core/StreamOptions.hpp"

#include <QApplication>
#include <QCheckBox>
#include <QCloseEvent>
#include <QComboBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QGuiApplication>
#include <QHBoxLayout>
#include <QInputDialog>
#include <QLabel>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QScreen>
#include <QSignalBlocker>
#include <QSlider>
#include <QTimer>
#include <QVBoxLayout>
#include <iterator>

namespace mirror_launcher {

namespace {

constexpr int kMonitoringWidth = 850;
constexpr int kMonitoringHeight = 300;

int primaryScreenWidth() {
    const QScreen* screen = QGuiApplication::primaryScreen();
    return screen ? screen->geometry().width() : 1920;
}

void selectData(QComboBox* combo, int value) {
    const int index = combo->findData(value);
    if (index >= 0) {
        combo->setCurrentIndex(index);
    }
}

} // namespace

class MainWindow::Private {
public:
    ApplicationController* controller{nullptr};

    QWidget* setupWidget{nullptr};

    // Top section
    QLabel* deviceLabel{nullptr};
    QComboBox* deviceCombo{nullptr};
    QPushButton* refreshButton{nullptr};
    QPushButton* wirelessButton{nullptr};
    QPushButton* disconnectButton{nullptr};
    QPushButton* manageButton{nullptr};
    QPushButton* helpButton{nullptr};
    QLabel* languageLabel{nullptr};
    QComboBox* languageCombo{nullptr};

    // Parameters
    QGroupBox* paramsGroup{nullptr};
    QFormLayout* paramsForm{nullptr};
    QComboBox* resolutionCombo{nullptr};
    QComboBox* fpsCombo{nullptr};
    QComboBox* codecCombo{nullptr};
    QSlider* bitrateSlider{nullptr};
    QLabel* bitrateValue{nullptr};
    QComboBox* positionCombo{nullptr};
    QLabel* hintLabel{nullptr};
    QCheckBox* screenOffCheck{nullptr};
    QLabel* screenOffWarning{nullptr};
    QCheckBox* borderlessCheck{nullptr};
    QCheckBox* showLogCheck{nullptr};
    QCheckBox* printFpsCheck{nullptr};
    QPushButton* startButton{nullptr};

    // Log
    QGroupBox* logGroup{nullptr};
    QPlainTextEdit* logView{nullptr};
    QPushButton* clearLogsButton{nullptr};

    bool scanning{false};

    QString text(MessageId id) const {
        return controller->text(id);
    }
};

MainWindow::MainWindow(ApplicationController* controller, QWidget* parent)
    : QMainWindow(parent)
    , d(std::make_unique<Private>()) {
    d->controller = controller;

    resize(720, 760);

    setupUi();
    setupConnections();
    retranslateUi();
    handleStreamParametersChanged();
    handleDevicesChanged();

    QTimer::singleShot(ONBOARDING_DELAY, this, &MainWindow::showOnboardingIfNeeded);
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi() {
    auto central = new QWidget(this);
    auto layout = new QVBoxLayout(central);

    d->setupWidget = new QWidget(central);
    auto setupLayout = new QVBoxLayout(d->setupWidget);
    setupLayout->setContentsMargins(0, 0, 0, 0);
    layout->addWidget(d->setupWidget);

    setupTopSection();
    setupParameterSection();
    setupLogSection();

    layout->addWidget(d->logGroup, 1);
    setCentralWidget(central);
}

void MainWindow::setupTopSection() {
    auto row = new QHBoxLayout;

    d->deviceLabel = new QLabel(d->setupWidget);
    d->deviceCombo = new QComboBox(d->setupWidget);
    d->deviceCombo->setSizeAdjustPolicy(QComboBox::AdjustToContents);
    d->deviceCombo->setMinimumWidth(260);
    d->refreshButton = new QPushButton(d->setupWidget);
    d->wirelessButton = new QPushButton(d->setupWidget);
    d->disconnectButton = new QPushButton(d->setupWidget);
    d->manageButton = new QPushButton(d->setupWidget);
    d->helpButton = new QPushButton(d->setupWidget);
    d->languageLabel = new QLabel(d->setupWidget);
    d->languageCombo = new QComboBox(d->setupWidget);
    d->languageCombo->addItem("English", static_cast<int>(Language::English));
    d->languageCombo->addItem(QString::fromUtf8("中文"), static_cast<int>(Language::Chinese));

    row->addWidget(d->deviceLabel);
    row->addWidget(d->deviceCombo, 1);
    row->addWidget(d->refreshButton);
    row->addWidget(d->wirelessButton);
    row->addWidget(d->disconnectButton);
    row->addWidget(d->manageButton);
    row->addStretch();
    row->addWidget(d->helpButton);
    row->addWidget(d->languageLabel);
    row->addWidget(d->languageCombo);

    static_cast<QVBoxLayout*>(d->setupWidget->layout())->addLayout(row);
}

void MainWindow::setupParameterSection() {
    d->paramsGroup = new QGroupBox(d->setupWidget);
    auto groupLayout = new QVBoxLayout(d->paramsGroup);

    d->paramsForm = new QFormLayout;

    d->resolutionCombo = new QComboBox(d->paramsGroup);
    for (auto dimension : kMaxDimensions) {
        d->resolutionCombo->addItem(QString::fromStdString(dimensionName(dimension)), pixels(dimension));
    }

    d->fpsCombo = new QComboBox(d->paramsGroup);
    for (auto fps : kMaxFpsValues) {
        d->fpsCombo->addItem(QString("%1 fps").arg(framesPerSecond(fps)), framesPerSecond(fps));
    }

    d->codecCombo = new QComboBox(d->paramsGroup);
    for (auto codec : kVideoCodecs) {
        d->codecCombo->addItem(QString(), static_cast<int>(codec));
    }

    d->bitrateSlider = new QSlider(Qt::Horizontal, d->paramsGroup);
    d->bitrateSlider->setRange(MIN_BITRATE_MBPS, MAX_BITRATE_MBPS);
    d->bitrateSlider->setSingleStep(1);
    d->bitrateSlider->setPageStep(4);
    d->bitrateValue = new QLabel(d->paramsGroup);
    d->bitrateValue->setMinimumWidth(70);
    auto bitrateRow = new QHBoxLayout;
    bitrateRow->addWidget(d->bitrateSlider, 1);
    bitrateRow->addWidget(d->bitrateValue);

    d->positionCombo = new QComboBox(d->paramsGroup);
    for (auto position : kWindowPositions) {
        d->positionCombo->addItem(QString(), static_cast<int>(position));
    }

    d->paramsForm->addRow(QString(), d->resolutionCombo);
    d->paramsForm->addRow(QString(), d->fpsCombo);
    d->paramsForm->addRow(QString(), d->codecCombo);
    d->paramsForm->addRow(QString(), bitrateRow);
    d->paramsForm->addRow(QString(), d->positionCombo);
    groupLayout->addLayout(d->paramsForm);

    d->hintLabel = new QLabel(d->paramsGroup);
    d->hintLabel->setStyleSheet("color: #2E8B57;");
    d->hintLabel->hide();
    groupLayout->addWidget(d->hintLabel);

    auto checks = new QHBoxLayout;
    d->screenOffCheck = new QCheckBox(d->paramsGroup);
    d->borderlessCheck = new QCheckBox(d->paramsGroup);
    d->showLogCheck = new QCheckBox(d->paramsGroup);
    d->printFpsCheck = new QCheckBox(d->paramsGroup);
    checks->addWidget(d->screenOffCheck);
    checks->addWidget(d->borderlessCheck);
    checks->addWidget(d->showLogCheck);
    checks->addWidget(d->printFpsCheck);
    checks->addStretch();
    groupLayout->addLayout(checks);

    d->screenOffWarning = new QLabel(d->paramsGroup);
    d->screenOffWarning->setWordWrap(true);
    d->screenOffWarning->setStyleSheet("color: #CC7A00;");
    d->screenOffWarning->hide();
    groupLayout->addWidget(d->screenOffWarning);

    d->startButton = new QPushButton(d->paramsGroup);
    d->startButton->setMinimumHeight(40);
    groupLayout->addWidget(d->startButton);

    static_cast<QVBoxLayout*>(d->setupWidget->layout())->addWidget(d->paramsGroup);
}

void MainWindow::setupLogSection() {
    d->logGroup = new QGroupBox(this);
    auto layout = new QVBoxLayout(d->logGroup);

    d->logView = new QPlainTextEdit(d->logGroup);
    d->logView->setReadOnly(true);
    d->logView->setMaximumBlockCount(5000);
    QFont mono("Monospace");
    mono.setStyleHint(QFont::TypeWriter);
    d->logView->setFont(mono);

    d->clearLogsButton = new QPushButton(d->logGroup);

    auto buttons = new QHBoxLayout;
    buttons->addStretch();
    buttons->addWidget(d->clearLogsButton);

    layout->addWidget(d->logView, 1);
    layout->addLayout(buttons);
}

void MainWindow::setupConnections() {
    auto controller = d->controller;

    connect(&Logger::instance(), &Logger::logAdded, this,
            [this](LogLevel level, const QString& message) {
        appendLog("[" + Logger::levelTag(level) + "] " + message);
    });

    connect(controller, &ApplicationController::devicesChanged, this, &MainWindow::handleDevicesChanged);
    connect(controller, &ApplicationController::selectionChanged, this, &MainWindow::handleSelectionChanged);
    connect(controller, &ApplicationController::scanningChanged, this, [this](bool scanning) {
        d->scanning = scanning;
        if (d->controller->state().devices.empty()) {
            handleDevicesChanged();
        }
    });
    connect(controller, &ApplicationController::streamParametersChanged,
            this, &MainWindow::handleStreamParametersChanged);
    connect(controller, &ApplicationController::recommendationHintChanged, this, [this](const QString& hint) {
        d->hintLabel->setText(hint);
        d->hintLabel->setVisible(!hint.isEmpty());
    });
    connect(controller, &ApplicationController::languageChanged, this, &MainWindow::retranslateUi);
    connect(controller, &ApplicationController::sessionStateChanged, this, &MainWindow::updateStartButton);
    connect(controller, &ApplicationController::monitoringStarted, this, &MainWindow::enterMonitoringMode);
    connect(controller, &ApplicationController::hostHideRequested, this, &MainWindow::hideForSession);
    connect(controller, &ApplicationController::hostRestoreRequested, this, &MainWindow::restoreAfterSession);
    connect(controller, &ApplicationController::quitRequested, this, &QWidget::close);
    connect(controller, &ApplicationController::manualAddressRequested, this, &MainWindow::askForAddress);
    connect(controller, &ApplicationController::firstTimeWirelessPrompt,
            this, &MainWindow::showFirstTimeWirelessPrompt);
    connect(controller, &ApplicationController::wirelessConnected, this, &MainWindow::showWirelessConnected);

    connect(d->deviceCombo, QOverload<int>::of(&QComboBox::activated), this, [this](int index) {
        const QVariant serial = d->deviceCombo->itemData(index);
        if (serial.isValid()) {
            d->controller->selectDevice(serial.toString().toStdString());
        }
    });
    connect(d->refreshButton, &QPushButton::clicked, controller, &ApplicationController::requestRefresh);
    connect(d->wirelessButton, &QPushButton::clicked, controller, &ApplicationController::beginWirelessSetup);
    connect(d->disconnectButton, &QPushButton::clicked, controller, &ApplicationController::disconnectSelected);
    connect(d->manageButton, &QPushButton::clicked, this, &MainWindow::showWirelessDevices);
    connect(d->helpButton, &QPushButton::clicked, this, &MainWindow::showOnboarding);
    connect(d->languageCombo, QOverload<int>::of(&QComboBox::activated),
            this, &MainWindow::handleLanguageSelected);

    for (auto combo : {d->resolutionCombo, d->fpsCombo, d->codecCombo, d->positionCombo}) {
        connect(combo, QOverload<int>::of(&QComboBox::currentIndexChanged),
                this, &MainWindow::handleParameterEdited);
    }
    connect(d->bitrateSlider, &QSlider::valueChanged, this, [this](int value) {
        d->bitrateValue->setText(QString("%1 Mbps").arg(value));
        handleParameterEdited();
    });
    for (auto check : {d->screenOffCheck, d->borderlessCheck, d->printFpsCheck}) {
        connect(check, &QCheckBox::toggled, this, &MainWindow::handleParameterEdited);
    }
    connect(d->screenOffCheck, &QCheckBox::toggled, d->screenOffWarning, &QWidget::setVisible);
    connect(d->showLogCheck, &QCheckBox::toggled, controller, &ApplicationController::setShowLog);

    connect(d->startButton, &QPushButton::clicked, this, &MainWindow::startStream);
    connect(d->clearLogsButton, &QPushButton::clicked, d->logView, &QPlainTextEdit::clear);
}

void MainWindow::retranslateUi() {
    const auto& state = d->controller->state();

    setWindowTitle(d->text(state.session == SessionState::Monitoring
                               ? MessageId::MonitoringTitle : MessageId::WindowTitle));

    d->deviceLabel->setText(d->text(MessageId::DeviceLabel));
    d->refreshButton->setText(d->text(MessageId::RefreshButton));
    d->wirelessButton->setText(d->text(MessageId::WirelessButton));
    d->disconnectButton->setText(d->text(MessageId::DisconnectButton));
    d->manageButton->setText(d->text(MessageId::ManageWirelessButton));
    d->helpButton->setText(d->text(MessageId::HelpButton));
    d->languageLabel->setText(d->text(MessageId::LanguageLabel));
    {
        const QSignalBlocker blocker(d->languageCombo);
        selectData(d->languageCombo, static_cast<int>(state.language));
    }

    d->paramsGroup->setTitle(d->text(MessageId::ParamsTitle));
    const MessageId rowLabels[] = {
        MessageId::LabelResolution, MessageId::LabelFps, MessageId::LabelCodec,
        MessageId::LabelBitrate, MessageId::LabelPosition
    };
    for (int row = 0; row < static_cast<int>(std::size(rowLabels)); ++row) {
        auto item = d->paramsForm->itemAt(row, QFormLayout::LabelRole);
        if (auto label = item ? qobject_cast<QLabel*>(item->widget()) : nullptr) {
            label->setText(d->text(rowLabels[row]));
        }
    }

    d->resolutionCombo->setItemText(d->resolutionCombo->findData(pixels(MaxDimension::Native)),
                                    d->text(MessageId::ResolutionNative));
    d->codecCombo->setItemText(d->codecCombo->findData(static_cast<int>(VideoCodec::H264)),
                               d->text(MessageId::CodecH264));
    d->codecCombo->setItemText(d->codecCombo->findData(static_cast<int>(VideoCodec::H265)),
                               d->text(MessageId::CodecH265));
    d->positionCombo->setItemText(d->positionCombo->findData(static_cast<int>(WindowPosition::Center)),
                                  d->text(MessageId::PositionCenter));
    d->positionCombo->setItemText(d->positionCombo->findData(static_cast<int>(WindowPosition::TopLeft)),
                                  d->text(MessageId::PositionTopLeft));
    d->positionCombo->setItemText(d->positionCombo->findData(static_cast<int>(WindowPosition::TopRight)),
                                  d->text(MessageId::PositionTopRight));

    d->screenOffCheck->setText(d->text(MessageId::ScreenOff));
    d->screenOffWarning->setText(d->text(MessageId::ScreenOffWarning));
    d->borderlessCheck->setText(d->text(MessageId::Borderless));
    d->showLogCheck->setText(d->text(MessageId::ShowLog));
    d->printFpsCheck->setText(d->text(MessageId::PrintFps));
    d->startButton->setText(d->text(MessageId::StartButton));

    d->logGroup->setTitle(d->text(MessageId::LogTitle));
    d->clearLogsButton->setText(d->text(MessageId::ClearLogsButton));

    handleDevicesChanged();
}

void MainWindow::handleDevicesChanged() {
    const auto& state = d->controller->state();
    const QSignalBlocker blocker(d->deviceCombo);

    d->deviceCombo->clear();
    if (state.devices.empty()) {
        d->deviceCombo->addItem(d->text(d->scanning ? MessageId::Scanning : MessageId::NoDevice));
        d->deviceCombo->setEnabled(false);
    } else {
        for (const auto& device : state.devices) {
            d->deviceCombo->addItem(QString::fromStdString(device.displayLabel),
                                    QString::fromStdString(device.serial));
        }
        d->deviceCombo->setEnabled(true);
    }

    handleSelectionChanged();
}

void MainWindow::handleSelectionChanged() {
    const QSignalBlocker blocker(d->deviceCombo);
    const int index = d->deviceCombo->findData(QString::fromStdString(d->controller->state().selectedSerial));
    if (index >= 0) {
        d->deviceCombo->setCurrentIndex(index);
    }
    updateStartButton();
}

void MainWindow::handleStreamParametersChanged() {
    const auto& state = d->controller->state();
    const StreamParameters& params = state.params;

    const QSignalBlocker b1(d->resolutionCombo);
    const QSignalBlocker b2(d->fpsCombo);
    const QSignalBlocker b3(d->codecCombo);
    const QSignalBlocker b4(d->bitrateSlider);
    const QSignalBlocker b5(d->positionCombo);
    const QSignalBlocker b6(d->screenOffCheck);
    const QSignalBlocker b7(d->borderlessCheck);
    const QSignalBlocker b8(d->printFpsCheck);
    const QSignalBlocker b9(d->showLogCheck);

    selectData(d->resolutionCombo, pixels(params.maxDimension));
    selectData(d->fpsCombo, framesPerSecond(params.maxFps));
    selectData(d->codecCombo, static_cast<int>(params.codec));
    d->bitrateSlider->setValue(params.bitrateMbps);
    d->bitrateValue->setText(QString("%1 Mbps").arg(params.bitrateMbps));
    selectData(d->positionCombo, static_cast<int>(params.windowPosition));
    d->screenOffCheck->setChecked(params.screenOff);
    d->screenOffWarning->setVisible(params.screenOff);
    d->borderlessCheck->setChecked(params.borderless);
    d->printFpsCheck->setChecked(params.printFps);
    d->showLogCheck->setChecked(state.showLog);
}

void MainWindow::handleParameterEdited() {
    d->controller->setStreamParameters(collectParameters());
}

StreamParameters MainWindow::collectParameters() const {
    StreamParameters params = d->controller->state().params;

    if (auto dimension = dimensionFromPixels(d->resolutionCombo->currentData().toInt())) {
        params.maxDimension = *dimension;
    }
    if (auto fps = fpsFromValue(d->fpsCombo->currentData().toInt())) {
        params.maxFps = *fps;
    }
    params.codec = static_cast<VideoCodec>(d->codecCombo->currentData().toInt());
    params.bitrateMbps = d->bitrateSlider->value();
    params.windowPosition = static_cast<WindowPosition>(d->positionCombo->currentData().toInt());
    params.screenOff = d->screenOffCheck->isChecked();
    params.borderless = d->borderlessCheck->isChecked();
    params.printFps = d->printFpsCheck->isChecked();
    return params;
}

void MainWindow::handleLanguageSelected(int index) {
    const auto language = static_cast<Language>(d->languageCombo->itemData(index).toInt());
    d->controller->setLanguage(language);
}

void MainWindow::appendLog(const QString& line) {
    d->logView->appendPlainText(line);
}

void MainWindow::updateStartButton() {
    const bool idle = d->controller->state().session == SessionState::Idle;
    d->startButton->setEnabled(idle && d->controller->selectedDevice() != nullptr);
}

void MainWindow::startStream() {
    const int result = d->controller->launchSession(primaryScreenWidth());
    if (result != ErrorCodes::SUCCESS) {
        LOG_DEBUG("Launch returned " + std::to_string(result));
    }
}

void MainWindow::enterMonitoringMode() {
    d->setupWidget->hide();
    setWindowTitle(d->text(MessageId::MonitoringTitle));
    setMinimumSize(400, 200);
    resize(kMonitoringWidth, kMonitoringHeight);

    if (const QScreen* screen = QGuiApplication::primaryScreen()) {
        const QRect available = screen->availableGeometry();
        move(available.x() + (available.width() - kMonitoringWidth) / 2,
             available.y() + (available.height() - kMonitoringHeight) / 2);
    }
}

void MainWindow::hideForSession() {
    hide();
}

void MainWindow::restoreAfterSession() {
    show();
    setWindowState(windowState() & ~Qt::WindowMinimized);
    raise();
    activateWindow();
    updateStartButton();
}

void MainWindow::askForAddress(const QString& prefill) {
    bool ok = false;
    const QString address = QInputDialog::getText(
        this,
        d->text(MessageId::WirelessTitle),
        d->text(MessageId::WirelessPrompt),
        QLineEdit::Normal,
        prefill,
        &ok);
    if (ok && !address.trimmed().isEmpty()) {
        d->controller->connectWireless(address.trimmed().toStdString());
    }
}

void MainWindow::showFirstTimeWirelessPrompt() {
    const auto answer = QMessageBox::question(
        this,
        d->text(MessageId::WirelessFirstTimeTitle),
        d->text(MessageId::WirelessFirstTimeMessage));
    if (answer == QMessageBox::Yes) {
        askForAddress(QString::fromStdString(d->controller->state().lastIp));
    }
}

void MainWindow::showWirelessConnected(const QString& target) {
    QMessageBox::information(this,
        d->text(MessageId::WirelessSuccessTitle),
        d->text(MessageId::WirelessSuccessMessage).arg(target));
}

void MainWindow::showWirelessDevices() {
    WirelessDevicesDialog dialog(d->controller, this);
    dialog.exec();
}

void MainWindow::showOnboarding() {
    OnboardingDialog dialog(d->controller->state().language, this);
    dialog.exec();
    d->controller->dismissOnboarding(dialog.dontShowAgain());
}

void MainWindow::showOnboardingIfNeeded() {
    if (d->controller->state().showOnboarding && isVisible()) {
        showOnboarding();
    }
}

void MainWindow::closeEvent(QCloseEvent* event) {
    d->controller->shutdown();
    event->accept();
}

} // namespace mirror_launcher
