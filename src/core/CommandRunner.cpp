#include "CommandRunner.hpp"
#include "../utils/ToolLocator.hpp"
#include <QProcess>
#include <QStringList>

namespace mirror_launcher {

CommandResult ProcessRunner::run(const std::string& program,
                                 const std::vector<std::string>& arguments,
                                 int timeoutMs) {
    CommandResult result;

    QStringList args;
    for (const auto& arg : arguments) {
        args << QString::fromStdString(arg);
    }

    QProcess process;
    process.start(QString::fromStdString(program), args);

    if (!process.waitForStarted(timeoutMs)) {
        // FailedToStart also covers a present file that is not executable.
        result.status = process.error() == QProcess::FailedToStart && !toolPresent(program)
            ? ToolStatus::ToolNotFound
            : ToolStatus::SpawnFailure;
        result.errorOutput = process.errorString().toStdString();
        return result;
    }

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(1000);
        result.status = ToolStatus::Timeout;
        return result;
    }

    result.exitCode = process.exitCode();
    result.output = QString::fromUtf8(process.readAllStandardOutput()).toStdString();
    result.errorOutput = QString::fromUtf8(process.readAllStandardError()).toStdString();
    if (process.exitStatus() == QProcess::CrashExit) {
        result.status = ToolStatus::SpawnFailure;
    }
    return result;
}

std::string toolStatusName(ToolStatus status) {
    switch (status) {
        case ToolStatus::Ok:           return "ok";
        case ToolStatus::ToolNotFound: return "tool not found";
        case ToolStatus::Timeout:      return "timeout";
        case ToolStatus::SpawnFailure: return "spawn failure";
    }
    return "unknown";
}

} // namespace mirror_launcher
