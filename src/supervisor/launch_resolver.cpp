#include "supervisor/launch_resolver.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStringList>

namespace officebridge {

namespace {

#ifdef _WIN32
const char *const kPackagedBinary = "dist/office-local-bridge-win.exe";
#else
const char *const kPackagedBinary = "dist/office-local-bridge";
#endif

const char *const kNodeScript = "dist/server.js";
const char *const kDevMarker = "src/server.ts";

QString firstExistingDir(const QString &baseDir, const QStringList &relCandidates)
{
    for (const QString &relPath : relCandidates) {
        const QString candidate = QDir::cleanPath(QDir(baseDir).absoluteFilePath(relPath));
        if (QFileInfo(candidate).isDir()) {
            return candidate;
        }
    }
    return QString();
}

} // namespace

QString resolveServiceLocation(const QString &envOverride,
                               const QString &applicationDir,
                               const QString &workingDir)
{
    if (!envOverride.isEmpty()) {
        return envOverride;
    }

    if (!applicationDir.isEmpty()) {
        const QString packaged = firstExistingDir(applicationDir, {
            QStringLiteral("bridge-service"),
            QStringLiteral("../share/office-bridge/bridge-service"),
        });
        if (!packaged.isEmpty()) {
            return packaged;
        }
    }

    const QString devRoot = QDir::cleanPath(QDir(workingDir).absoluteFilePath(QStringLiteral("../..")));
    if (QFileInfo::exists(QDir(devRoot).filePath(QLatin1String(kDevMarker)))) {
        return devRoot;
    }

    return QDir(workingDir).absolutePath();
}

QString resolveServiceLocation()
{
    const QString appDir = QCoreApplication::instance()
        ? QCoreApplication::applicationDirPath()
        : QString();
    return resolveServiceLocation(qEnvironmentVariable("BRIDGE_SERVICE_PATH"),
                                  appDir,
                                  QDir::currentPath());
}

LaunchCommand resolveLaunchCommand(const QString &serviceDir)
{
    const QDir dir(serviceDir);
    LaunchCommand command;
    command.workingDirectory = serviceDir;

    const QFileInfo binary(dir.filePath(QLatin1String(kPackagedBinary)));
    if (binary.exists()) {
        command.program = binary.absoluteFilePath();
        return command;
    }

    const QFileInfo script(dir.filePath(QLatin1String(kNodeScript)));
    if (script.exists()) {
        command.program = QStringLiteral("node");
        command.args = {script.absoluteFilePath()};
        return command;
    }

    command.program = QStringLiteral("npm");
    command.args = {QStringLiteral("run"), QStringLiteral("dev")};
    return command;
}

} // namespace officebridge
