#include "WirelessDevicesDialog.hpp"
#include "../core/ApplicationController.hpp"
#include "../core/Messages.hpp"
#include <QDialogButtonBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QTreeWidget>
#include <QVBoxLayout>

namespace mirror_launcher {

class WirelessDevicesDialog::Private {
public:
    ApplicationController* controller{nullptr};
    QTreeWidget* tree{nullptr};
    QLabel* emptyLabel{nullptr};
    QPushButton* disconnectButton{nullptr};
    QPushButton* disconnectAllButton{nullptr};
};

WirelessDevicesDialog::WirelessDevicesDialog(ApplicationController* controller, QWidget* parent)
    : QDialog(parent)
    , d(std::make_unique<Private>()) {
    d->controller = controller;

    setWindowTitle(controller->text(MessageId::ManageTitle));
    resize(480, 320);

    d->tree = new QTreeWidget(this);
    d->tree->setHeaderLabels({
        controller->text(MessageId::DeviceLabel),
        "Serial"
    });
    d->tree->setUniformRowHeights(true);
    d->tree->setAlternatingRowColors(true);
    d->tree->setRootIsDecorated(false);
    d->tree->header()->setSectionResizeMode(QHeaderView::ResizeToContents);
    d->tree->header()->setStretchLastSection(true);

    d->emptyLabel = new QLabel(controller->text(MessageId::ManageEmpty), this);
    d->emptyLabel->setAlignment(Qt::AlignCenter);
    d->emptyLabel->setWordWrap(true);

    d->disconnectButton = new QPushButton(controller->text(MessageId::ManageDisconnect), this);
    d->disconnectAllButton = new QPushButton(controller->text(MessageId::ManageDisconnectAll), this);
    auto buttons = new QDialogButtonBox(QDialogButtonBox::Close, this);

    auto actions = new QHBoxLayout;
    actions->addWidget(d->disconnectButton);
    actions->addWidget(d->disconnectAllButton);
    actions->addStretch();
    actions->addWidget(buttons);

    auto layout = new QVBoxLayout(this);
    layout->addWidget(d->tree);
    layout->addWidget(d->emptyLabel);
    layout->addLayout(actions);

    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(d->disconnectButton, &QPushButton::clicked, this, &WirelessDevicesDialog::disconnectSelected);
    connect(d->disconnectAllButton, &QPushButton::clicked, this, &WirelessDevicesDialog::disconnectAll);
    connect(d->tree, &QTreeWidget::itemSelectionChanged,
            this, &WirelessDevicesDialog::handleItemSelectionChanged);

    // The list follows every enumeration while the dialog is open.
    connect(controller, &ApplicationController::devicesChanged, this, &WirelessDevicesDialog::refresh);

    refresh();
}

WirelessDevicesDialog::~WirelessDevicesDialog() = default;

void WirelessDevicesDialog::refresh() {
    d->tree->clear();

    const auto devices = d->controller->wirelessDevices();
    for (const auto& device : devices) {
        auto item = new QTreeWidgetItem(d->tree);
        item->setText(0, QString::fromStdString(device.displayLabel));
        item->setText(1, QString::fromStdString(device.serial));
        item->setData(0, Qt::UserRole, QString::fromStdString(device.serial));
    }

    const bool empty = devices.empty();
    d->tree->setVisible(!empty);
    d->emptyLabel->setVisible(empty);
    d->disconnectAllButton->setEnabled(!empty);
    handleItemSelectionChanged();
}

void WirelessDevicesDialog::disconnectSelected() {
    const auto items = d->tree->selectedItems();
    if (items.isEmpty()) {
        return;
    }

    const QString serial = items.first()->data(0, Qt::UserRole).toString();
    const auto answer = QMessageBox::question(
        this,
        d->controller->text(MessageId::ManageConfirmTitle),
        d->controller->text(MessageId::ManageConfirmMessage).arg(serial));
    if (answer != QMessageBox::Yes) {
        return;
    }

    d->controller->disconnectDevice(serial.toStdString());
}

void WirelessDevicesDialog::disconnectAll() {
    const auto answer = QMessageBox::question(
        this,
        d->controller->text(MessageId::ManageConfirmTitle),
        d->controller->text(MessageId::ManageDisconnectAll) + "?");
    if (answer != QMessageBox::Yes) {
        return;
    }

    d->controller->disconnectAllWireless();
    accept();
}

void WirelessDevicesDialog::handleItemSelectionChanged() {
    d->disconnectButton->setEnabled(!d->tree->selectedItems().isEmpty());
}

} // namespace mirror_launcher
