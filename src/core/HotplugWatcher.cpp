#include "HotplugWatcher.hpp"
#include "BridgeTool.hpp"
#include "Logger.hpp"
#include "../utils/ToolLocator.hpp"
#include <QMutex>
#include <QMutexLocker>
#include <QProcess>
#include <QStringList>
#include <QWaitCondition>
#include <atomic>

namespace mirror_launcher {

class HotplugWatcher::Private {
public:
    std::string program;
    Timing timing;
    std::atomic<bool> stopRequested{false};
    QMutex sleepMutex;
    QWaitCondition wakeUp;

    static void terminate(QProcess& process) {
        if (process.state() == QProcess::NotRunning) {
            return;
        }
        process.terminate();
        if (!process.waitForFinished(1000)) {
            process.kill();
            process.waitForFinished(1000);
        }
    }
};

HotplugWatcher::HotplugWatcher(std::string program, QObject* parent)
    : HotplugWatcher(std::move(program), Timing{}, parent) {
}

HotplugWatcher::HotplugWatcher(std::string program, Timing timing, QObject* parent)
    : QThread(parent)
    , d(std::make_unique<Private>()) {
    d->program = std::move(program);
    d->timing = timing;
}

HotplugWatcher::~HotplugWatcher() {
    stop();
    wait();
}

void HotplugWatcher::stop() {
    d->stopRequested = true;
    QMutexLocker lock(&d->sleepMutex);
    d->wakeUp.wakeAll();
}

bool HotplugWatcher::stopRequested() const {
    return d->stopRequested;
}

bool HotplugWatcher::sleepUnlessStopped(int ms) {
    QMutexLocker lock(&d->sleepMutex);
    if (!d->stopRequested) {
        d->wakeUp.wait(&d->sleepMutex, static_cast<unsigned long>(ms));
    }
    return !d->stopRequested;
}

void HotplugWatcher::run() {
    QStringList arguments;
    for (const auto& arg : BridgeTool::trackDevicesArguments()) {
        arguments << QString::fromStdString(arg);
    }

    while (!d->stopRequested) {
        QProcess process;
        process.start(QString::fromStdString(d->program), arguments);

        if (!process.waitForStarted()) {
            if (process.error() == QProcess::FailedToStart && !toolPresent(d->program)) {
                LOG_WARNING("Device tracking unavailable, adb not found: " + d->program);
                emit toolMissing();
                sleepUnlessStopped(d->timing.notFoundRetryMs);
            } else {
                LOG_WARNING("Device tracking failed to start: " +
                            process.errorString().toStdString());
                sleepUnlessStopped(d->timing.errorRetryMs);
            }
            continue;
        }

        emit trackingStarted();

        // The first line only reports the devices that were already attached.
        bool firstLine = true;
        while (!d->stopRequested) {
            if (!process.canReadLine()) {
                if (process.state() == QProcess::NotRunning) {
                    break;
                }
                process.waitForReadyRead(d->timing.readSliceMs);
                continue;
            }

            const QString line = QString::fromUtf8(process.readLine()).trimmed();
            if (firstLine) {
                firstLine = false;
                continue;
            }
            if (!line.isEmpty()) {
                emit deviceSetChanged();
            }
        }

        Private::terminate(process);

        if (!d->stopRequested) {
            LOG_WARNING("Device tracking exited with code " +
                        std::to_string(process.exitCode()) + ", restarting");
            sleepUnlessStopped(d->timing.errorRetryMs);
        }
    }

    LOG_DEBUG("Device tracking stopped");
}

} // namespace mirror_launcher
