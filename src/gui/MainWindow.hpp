#pragma once
#include <mirror-launcher/Types.hpp>
#include <QMainWindow>
#include <memory>

namespace mirror_launcher {

class ApplicationController;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(ApplicationController* controller, QWidget* parent = nullptr);
    ~MainWindow();

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void handleDevicesChanged();
    void handleSelectionChanged();
    void handleStreamParametersChanged();
    void handleParameterEdited();
    void handleLanguageSelected(int index);
    void appendLog(const QString& line);
    void startStream();
    void enterMonitoringMode();
    void hideForSession();
    void restoreAfterSession();
    void askForAddress(const QString& prefill);
    void showFirstTimeWirelessPrompt();
    void showWirelessConnected(const QString& target);
    void showWirelessDevices();
    void showOnboarding();
    void showOnboardingIfNeeded();

private:
    void setupUi();
    void setupTopSection();
    void setupParameterSection();
    void setupLogSection();
    void setupConnections();
    void retranslateUi();
    void updateStartButton();
    StreamParameters collectParameters() const;

    class Private;
    std::unique_ptr<Private> d;
};

} // namespace mirror_launcher
