#pragma once
#include <mirror-launcher/Constants.hpp>
#include <mirror-launcher/Types.hpp>
#include <QObject>
#include <QString>
#include <memory>
#include <string>
#include <vector>

namespace mirror_launcher {

// Owns the single mirroring child process. The process handle exists exactly
// while state() != SessionState::Idle.
class SessionSupervisor : public QObject {
    Q_OBJECT

public:
    struct Timing {
        int pollIntervalMs{SILENT_POLL_INTERVAL};
        int exitGraceMs{EXIT_GRACE_DELAY};
    };

    explicit SessionSupervisor(std::string program, QObject* parent = nullptr);
    SessionSupervisor(std::string program, Timing timing, QObject* parent = nullptr);
    ~SessionSupervisor();

    // Returns one of ErrorCodes::SUCCESS, TOOL_NOT_FOUND, LAUNCH_FAILED,
    // SESSION_ACTIVE or INVALID_DEVICE.
    int launch(const DeviceRecord& device,
               const StreamParameters& params,
               SupervisionMode mode,
               int screenWidth,
               Language language);

    SessionState state() const;
    bool hasSession() const;
    const std::string& program() const;

    static std::vector<std::string> buildArguments(const std::string& serial,
                                                   const StreamParameters& params,
                                                   int screenWidth);

signals:
    void stateChanged(mirror_launcher::SessionState state);
    void monitoringStarted();
    void silentStarted();
    void outputLine(const QString& line);
    void sessionFinished(int exitCode);
    void hostRestoreRequested();
    void shutdownRequested();

private slots:
    void readOutput();
    void pollLiveness();

private:
    void finishSession();
    void setState(SessionState state);

    class Private;
    std::unique_ptr<Private> d;
};

}

Q_DECLARE_METATYPE(mirror_launcher::SessionState)
