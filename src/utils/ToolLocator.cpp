#include "ToolLocator.hpp"
#include "ConfigManager.hpp"
#include "../core/Logger.hpp"
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QString>

namespace mirror_launcher {

namespace {

#ifdef Q_OS_WIN
constexpr const char* kExecutableSuffix = ".exe";
#else
constexpr const char* kExecutableSuffix = "";
#endif

std::string pick(const std::string& pinned,
                 const std::string& applicationDir,
                 const std::string& bundledName,
                 const std::string& pathName) {
    if (!pinned.empty()) {
        if (!QFileInfo::exists(QString::fromStdString(pinned))) {
            LOG_WARNING("Configured tool path does not exist: " + pinned);
        }
        return pinned;
    }

    const std::string bundled = bundledToolPath(applicationDir, bundledName);
    if (QFileInfo(QString::fromStdString(bundled)).isFile()) {
        return bundled;
    }
    return pathName;
}

} // namespace

std::string bundledToolPath(const std::string& applicationDir, const std::string& baseName) {
    const QDir dir(QString::fromStdString(applicationDir));
    return QDir::toNativeSeparators(
        dir.filePath(QStringLiteral("internal/") +
                     QString::fromStdString(baseName + kExecutableSuffix))).toStdString();
}

bool toolPresent(const std::string& program) {
    const QString name = QString::fromStdString(program);
    if (name.contains('/') || name.contains('\\')) {
        return QFileInfo(name).isFile();
    }
    return !QStandardPaths::findExecutable(name).isEmpty();
}

ToolPaths locateTools(const std::string& applicationDir, const ConfigManager& config) {
    ToolPaths paths;
    paths.bridge = pick(config.adbPath(), applicationDir, "adb", "adb");
    paths.mirroring = pick(config.scrcpyPath(), applicationDir, "scrcpy-core", "scrcpy");

    LOG_DEBUG("Bridge tool: " + paths.bridge);
    LOG_DEBUG("Mirroring tool: " + paths.mirroring);
    return paths;
}

}
