#include "OnboardingDialog.hpp"
#include "../core/Messages.hpp"
#include <QCheckBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>
#include <iterator>
#include <utility>

namespace mirror_launcher {

namespace {

constexpr std::pair<MessageId, MessageId> kPages[] = {
    {MessageId::OnboardingModesTitle, MessageId::OnboardingModesBody},
    {MessageId::OnboardingSetupTitle, MessageId::OnboardingSetupBody},
    {MessageId::OnboardingWirelessTitle, MessageId::OnboardingWirelessBody},
    {MessageId::OnboardingShortcutsTitle, MessageId::OnboardingShortcutsBody},
};

} // namespace

class OnboardingDialog::Private {
public:
    Language language{Language::English};
    int page{0};

    QLabel* titleLabel{nullptr};
    QLabel* bodyLabel{nullptr};
    QLabel* pageLabel{nullptr};
    QCheckBox* dontShowAgain{nullptr};
    QPushButton* previousButton{nullptr};
    QPushButton* nextButton{nullptr};
};

OnboardingDialog::OnboardingDialog(Language language, QWidget* parent)
    : QDialog(parent)
    , d(std::make_unique<Private>()) {
    d->language = language;

    setWindowTitle(message(MessageId::OnboardingTitle, language));
    setModal(true);
    resize(520, 420);

    d->titleLabel = new QLabel(this);
    QFont titleFont = d->titleLabel->font();
    titleFont.setPointSize(titleFont.pointSize() + 4);
    titleFont.setBold(true);
    d->titleLabel->setFont(titleFont);

    d->bodyLabel = new QLabel(this);
    d->bodyLabel->setWordWrap(true);
    d->bodyLabel->setAlignment(Qt::AlignLeft | Qt::AlignTop);

    d->pageLabel = new QLabel(this);
    d->pageLabel->setAlignment(Qt::AlignCenter);

    d->dontShowAgain = new QCheckBox(message(MessageId::OnboardingDontShow, language), this);
    d->previousButton = new QPushButton(message(MessageId::OnboardingPrevious, language), this);
    d->nextButton = new QPushButton(this);

    auto navigation = new QHBoxLayout;
    navigation->addWidget(d->dontShowAgain);
    navigation->addStretch();
    navigation->addWidget(d->previousButton);
    navigation->addWidget(d->nextButton);

    auto layout = new QVBoxLayout(this);
    layout->addWidget(d->titleLabel);
    layout->addWidget(d->bodyLabel, 1);
    layout->addWidget(d->pageLabel);
    layout->addLayout(navigation);

    connect(d->previousButton, &QPushButton::clicked, this, &OnboardingDialog::showPreviousPage);
    connect(d->nextButton, &QPushButton::clicked, this, &OnboardingDialog::showNextPage);

    updatePage();
}

OnboardingDialog::~OnboardingDialog() = default;

bool OnboardingDialog::dontShowAgain() const {
    return d->dontShowAgain->isChecked();
}

int OnboardingDialog::currentPage() const {
    return d->page;
}

int OnboardingDialog::pageCount() const {
    return static_cast<int>(std::size(kPages));
}

void OnboardingDialog::showPreviousPage() {
    if (d->page > 0) {
        --d->page;
        updatePage();
    }
}

void OnboardingDialog::showNextPage() {
    if (d->page + 1 >= pageCount()) {
        accept();
        return;
    }
    ++d->page;
    updatePage();
}

void OnboardingDialog::updatePage() {
    const auto& [title, body] = kPages[d->page];
    d->titleLabel->setText(message(title, d->language));
    d->bodyLabel->setText(message(body, d->language));
    d->pageLabel->setText(QString("%1 / %2").arg(d->page + 1).arg(pageCount()));

    d->previousButton->setEnabled(d->page > 0);
    const bool last = d->page + 1 == pageCount();
    d->nextButton->setText(message(last ? MessageId::OnboardingDone : MessageId::OnboardingNext,
                                   d->language));
}

} // namespace mirror_launcher
