#pragma once
#include <QDialog>
#include <memory>

namespace mirror_launcher {

class ApplicationController;

// Lists the connected wireless devices and disconnects one or all of them.
class WirelessDevicesDialog : public QDialog {
    Q_OBJECT

public:
    explicit WirelessDevicesDialog(ApplicationController* controller, QWidget* parent = nullptr);
    ~WirelessDevicesDialog();

public slots:
    void refresh();

private slots:
    void disconnectSelected();
    void disconnectAll();
    void handleItemSelectionChanged();

private:
    class Private;
    std::unique_ptr<Private> d;
};

} // namespace mirror_launcher
