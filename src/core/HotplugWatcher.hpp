#pragma once
#include <mirror-launcher/Constants.hpp>
#include <QThread>
#include <memory>
#include <string>

namespace mirror_launcher {

// Keeps `adb track-devices` running on its own thread and reports every
// change line after the first one of each run. The tracking subprocess is
// created, read and terminated on this thread only.
class HotplugWatcher : public QThread {
    Q_OBJECT

public:
    struct Timing {
        int notFoundRetryMs{TRACK_RETRY_NOT_FOUND};
        int errorRetryMs{TRACK_RETRY_ERROR};
        int readSliceMs{TRACK_READ_SLICE};
    };

    explicit HotplugWatcher(std::string program, QObject* parent = nullptr);
    HotplugWatcher(std::string program, Timing timing, QObject* parent = nullptr);
    ~HotplugWatcher() override;

    // Cooperative: observed once per read slice or retry wait.
    void stop();
    bool stopRequested() const;

signals:
    void trackingStarted();
    void deviceSetChanged();
    void toolMissing();

protected:
    void run() override;

private:
    bool sleepUnlessStopped(int ms);

    class Private;
    std::unique_ptr<Private> d;
};

}
