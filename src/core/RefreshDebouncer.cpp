#include "RefreshDebouncer.hpp"
#include <QTimer>

namespace mirror_launcher {

class RefreshDebouncer::Private {
public:
    QTimer* timer{nullptr};
    std::chrono::steady_clock::time_point lastRequest;
};

RefreshDebouncer::RefreshDebouncer(int intervalMs, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {

    d->timer = new QTimer(this);
    d->timer->setSingleShot(true);
    d->timer->setInterval(intervalMs);
    connect(d->timer, &QTimer::timeout, this, &RefreshDebouncer::refreshDue);
}

RefreshDebouncer::~RefreshDebouncer() = default;

bool RefreshDebouncer::isPending() const {
    return d->timer->isActive();
}

int RefreshDebouncer::interval() const {
    return d->timer->interval();
}

std::chrono::steady_clock::time_point RefreshDebouncer::lastRequest() const {
    return d->lastRequest;
}

void RefreshDebouncer::request() {
    d->lastRequest = std::chrono::steady_clock::now();
    // start() on an active timer restarts it with a fresh deadline.
    d->timer->start();
}

void RefreshDebouncer::cancel() {
    d->timer->stop();
}

} // namespace mirror_launcher
