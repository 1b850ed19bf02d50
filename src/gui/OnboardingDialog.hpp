#pragma once
#include <mirror-launcher/Types.hpp>
#include <QDialog>
#include <memory>

namespace mirror_launcher {

// Paged getting-started guide.
class OnboardingDialog : public QDialog {
    Q_OBJECT

public:
    explicit OnboardingDialog(Language language, QWidget* parent = nullptr);
    ~OnboardingDialog();

    bool dontShowAgain() const;
    int currentPage() const;
    int pageCount() const;

public slots:
    void showPreviousPage();
    void showNextPage();

private:
    void updatePage();

    class Private;
    std::unique_ptr<Private> d;
};

} // namespace mirror_launcher
