#include "SessionSupervisor.hpp"
#include "Logger.hpp"
#include "Messages.hpp"
#include "StreamOptions.hpp"
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <QStringList>
#include <QTimer>

namespace mirror_launcher {

class SessionSupervisor::Private {
public:
    std::string program;
    Timing timing;
    SessionState state{SessionState::Idle};
    Language language{Language::English};
    std::unique_ptr<QProcess> process;
    QTimer* pollTimer{nullptr};

    // Empty when the program cannot be found.
    QString resolveProgram() const {
        const QString name = QString::fromStdString(program);
        if (name.contains('/') || name.contains('\\')) {
            const QFileInfo info(name);
            return info.isFile() && info.isExecutable() ? info.absoluteFilePath() : QString();
        }
        return QStandardPaths::findExecutable(name);
    }

    QString text(MessageId id) const {
        return message(id, language);
    }
};

SessionSupervisor::SessionSupervisor(std::string program, QObject* parent)
    : SessionSupervisor(std::move(program), Timing{}, parent) {
}

SessionSupervisor::SessionSupervisor(std::string program, Timing timing, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    qRegisterMetaType<mirror_launcher::SessionState>("mirror_launcher::SessionState");

    d->program = std::move(program);
    d->timing = timing;

    d->pollTimer = new QTimer(this);
    d->pollTimer->setInterval(d->timing.pollIntervalMs);
    connect(d->pollTimer, &QTimer::timeout, this, &SessionSupervisor::pollLiveness);
}

SessionSupervisor::~SessionSupervisor() {
    if (d->process) {
        d->process->disconnect(this);
    }
}

SessionState SessionSupervisor::state() const {
    return d->state;
}

bool SessionSupervisor::hasSession() const {
    return d->process != nullptr;
}

const std::string& SessionSupervisor::program() const {
    return d->program;
}

int SessionSupervisor::launch(const DeviceRecord& device,
                              const StreamParameters& params,
                              SupervisionMode mode,
                              int screenWidth,
                              Language language) {
    d->language = language;

    if (d->process) {
        LOG_WARNING(d->text(MessageId::LogSessionActive).toStdString());
        return ErrorCodes::SESSION_ACTIVE;
    }

    if (device.serial.empty()) {
        LOG_ERROR(d->text(MessageId::LogNoValidDevice).toStdString());
        return ErrorCodes::INVALID_DEVICE;
    }

    const QString resolved = d->resolveProgram();
    if (resolved.isEmpty()) {
        LOG_ERROR(d->text(MessageId::LogScrcpyNotFound)
            .arg(QString::fromStdString(d->program)).toStdString());
        return ErrorCodes::TOOL_NOT_FOUND;
    }

    const auto arguments = buildArguments(device.serial, params, screenWidth);
    QStringList args;
    std::string commandLine = resolved.toStdString();
    for (const auto& arg : arguments) {
        args << QString::fromStdString(arg);
        commandLine += " " + arg;
    }

    const std::string separator(50, '=');
    LOG_INFO(separator);
    LOG_INFO("[Device] " + device.displayLabel);
    LOG_INFO("[Params] " + dimensionName(params.maxDimension) + " | " +
             std::to_string(framesPerSecond(params.maxFps)) + " fps | " +
             codecName(params.codec) + " | " + std::to_string(params.bitrateMbps) + "M");
    LOG_INFO("[Command] " + commandLine);
    LOG_INFO(separator);

    auto process = std::make_unique<QProcess>();
    process->setProgram(resolved);
    process->setArguments(args);
    // The tool loads its server and libraries from its own directory.
    process->setWorkingDirectory(QFileInfo(resolved).absolutePath());
    process->setProcessChannelMode(QProcess::MergedChannels);

    if (mode == SupervisionMode::Monitoring) {
        connect(process.get(), &QProcess::readyReadStandardOutput,
                this, &SessionSupervisor::readOutput);
        connect(process.get(), QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
                this, [this](int, QProcess::ExitStatus) { finishSession(); });
    } else {
        process->setStandardOutputFile(QProcess::nullDevice());
    }

    process->start();
    if (!process->waitForStarted()) {
        const QString reason = process->errorString();
        process->disconnect(this);
        if (process->error() == QProcess::FailedToStart && !QFileInfo::exists(resolved)) {
            LOG_ERROR(d->text(MessageId::LogScrcpyNotFound).arg(resolved).toStdString());
            return ErrorCodes::TOOL_NOT_FOUND;
        }
        LOG_ERROR(d->text(MessageId::LogLaunchFailed).arg(reason).toStdString());
        return ErrorCodes::LAUNCH_FAILED;
    }

    d->process = std::move(process);
    LOG_INFO(d->text(MessageId::LogLaunched).toStdString());

    if (mode == SupervisionMode::Monitoring) {
        setState(SessionState::Monitoring);
        LOG_INFO(d->text(MessageId::LogMonitoringEntered).toStdString());
        emit monitoringStarted();
    } else {
        setState(SessionState::Silent);
        LOG_INFO(d->text(MessageId::LogSilentMode).toStdString());
        emit silentStarted();
        d->pollTimer->start();
    }

    return ErrorCodes::SUCCESS;
}

std::vector<std::string> SessionSupervisor::buildArguments(const std::string& serial,
                                                           const StreamParameters& params,
                                                           int screenWidth) {
    std::vector<std::string> args{"-s", serial};

    if (params.maxDimension != MaxDimension::Native) {
        args.push_back("-m");
        args.push_back(std::to_string(pixels(params.maxDimension)));
    }

    args.push_back("--max-fps=" + std::to_string(framesPerSecond(params.maxFps)));
    args.push_back("--video-codec=" + codecName(params.codec));
    args.push_back("-b");
    args.push_back(std::to_string(clampBitrate(params.bitrateMbps)) + "M");

    if (params.screenOff) {
        args.push_back("--turn-screen-off");
    }
    if (params.borderless) {
        args.push_back("--window-borderless");
    }
    if (params.printFps) {
        args.push_back("--print-fps");
    }

    switch (params.windowPosition) {
        case WindowPosition::TopLeft:
            args.insert(args.end(), {"--window-x", std::to_string(WINDOW_CORNER_OFFSET),
                                     "--window-y", std::to_string(WINDOW_CORNER_OFFSET)});
            break;
        case WindowPosition::TopRight:
            args.insert(args.end(), {"--window-x", std::to_string(screenWidth - TOP_RIGHT_WINDOW_MARGIN),
                                     "--window-y", std::to_string(WINDOW_CORNER_OFFSET)});
            break;
        case WindowPosition::Center:
            break;
    }

    // Left Ctrl keeps the tool's shortcuts clear of Alt-drag window helpers.
    args.push_back("--shortcut-mod=lctrl");
    return args;
}

void SessionSupervisor::readOutput() {
    if (!d->process) {
        return;
    }
    while (d->process->canReadLine()) {
        const QString line = QString::fromUtf8(d->process->readLine()).trimmed();
        if (!line.isEmpty()) {
            emit outputLine(line);
        }
    }
}

void SessionSupervisor::pollLiveness() {
    if (!d->process) {
        d->pollTimer->stop();
        return;
    }
    if (d->process->state() == QProcess::NotRunning) {
        finishSession();
    }
}

void SessionSupervisor::finishSession() {
    if (!d->process) {
        return;
    }

    const SessionState endedState = d->state;
    d->pollTimer->stop();

    if (endedState == SessionState::Monitoring) {
        readOutput();
        // A last line without a trailing newline.
        const QString rest = QString::fromUtf8(d->process->readAll()).trimmed();
        if (!rest.isEmpty()) {
            emit outputLine(rest);
        }
    }

    const bool crashed = d->process->exitStatus() == QProcess::CrashExit;
    const int exitCode = crashed ? -1 : d->process->exitCode();
    if (exitCode == 0) {
        LOG_INFO(d->text(MessageId::LogExited).toStdString());
    } else {
        LOG_WARNING(d->text(MessageId::LogExitCode).arg(exitCode).toStdString());
    }

    d->process->disconnect(this);
    d->process.release()->deleteLater();
    setState(SessionState::Idle);
    emit sessionFinished(exitCode);

    if (endedState == SessionState::Monitoring) {
        LOG_INFO(d->text(MessageId::LogSessionClosedExiting).toStdString());
        // Give the log view a moment to show the final lines.
        QTimer::singleShot(d->timing.exitGraceMs, this, [this]() { emit shutdownRequested(); });
    } else {
        LOG_INFO(d->text(MessageId::LogSessionEndedRestored).toStdString());
        emit hostRestoreRequested();
    }
}

void SessionSupervisor::setState(SessionState state) {
    if (d->state == state) {
        return;
    }
    d->state = state;
    emit stateChanged(state);
}

} // namespace mirror_launcher
