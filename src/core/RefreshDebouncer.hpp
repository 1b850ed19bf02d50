#pragma once
#include <QObject>
#include <chrono>
#include <memory>

namespace mirror_launcher {

// Coalesces bursts of refresh requests into one refreshDue() signal.
// Each request() pushes the single timer's deadline out by the interval.
class RefreshDebouncer : public QObject {
    Q_OBJECT

public:
    explicit RefreshDebouncer(int intervalMs, QObject* parent = nullptr);
    ~RefreshDebouncer();

    bool isPending() const;
    int interval() const;
    std::chrono::steady_clock::time_point lastRequest() const;

public slots:
    void request();
    void cancel();

signals:
    void refreshDue();

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
