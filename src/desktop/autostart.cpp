#include "desktop/autostart.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QTextStream>

#include "common/logging.hpp"

namespace officebridge {

namespace {

const char *const kEntryFileName = "office-bridge-desktop.desktop";

QString quoteExec(const QString &path)
{
    if (!path.contains(QLatin1Char(' '))) {
        return path;
    }
    return QLatin1Char('"') + path + QLatin1Char('"');
}

void logAutostartChange(const QString &what, const QString &path)
{
    OBLOG_INFO(QStringLiteral("Autostart"),
               what,
               QStringLiteral("autostart_changed"),
               QStringLiteral("user_action"),
               QStringLiteral("xdg_autostart"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"entry", path.toStdString()}}));
}

} // namespace

Autostart::Autostart()
    : Autostart(defaultEntryDir(),
                QCoreApplication::instance() ? QCoreApplication::applicationFilePath() : QString())
{
}

Autostart::Autostart(QString entryDir, QString executablePath)
    : m_entryDir(std::move(entryDir))
    , m_executablePath(std::move(executablePath))
{
}

QString Autostart::defaultEntryDir()
{
    QString configHome = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (configHome.isEmpty()) {
        configHome = qEnvironmentVariable("HOME") + QStringLiteral("/.config");
    }
    return configHome + QStringLiteral("/autostart");
}

QString Autostart::entryPath() const
{
    return QDir(m_entryDir).filePath(QLatin1String(kEntryFileName));
}

Status Autostart::enable() const
{
    if (m_executablePath.isEmpty()) {
        return makeError(ErrorKind::IoFailure,
                         "failed to enable autostart: application path is unknown");
    }
    if (!QDir().mkpath(m_entryDir)) {
        return makeError(ErrorKind::IoFailure,
                         "failed to create autostart directory: " + m_entryDir.toStdString());
    }

    QSaveFile file(entryPath());
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return makeError(ErrorKind::IoFailure,
                         "failed to write autostart entry: " + file.errorString().toStdString());
    }

    QTextStream out(&file);
    out << "[Desktop Entry]\n"
        << "Type=Application\n"
        << "Name=Office Bridge\n"
        << "Comment=Local bridge between Office add-ins and AI providers\n"
        << "Exec=" << quoteExec(m_executablePath) << "\n"
        << "Terminal=false\n"
        << "X-GNOME-Autostart-enabled=true\n";
    out.flush();

    if (!file.commit()) {
        return makeError(ErrorKind::IoFailure,
                         "failed to write autostart entry: " + file.errorString().toStdString());
    }

    logAutostartChange(QStringLiteral("enable"), entryPath());
    return std::nullopt;
}

Status Autostart::disable() const
{
    QFile file(entryPath());
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.remove()) {
        return makeError(ErrorKind::IoFailure,
                         "failed to remove autostart entry: " + file.errorString().toStdString());
    }

    logAutostartChange(QStringLiteral("disable"), entryPath());
    return std::nullopt;
}

bool Autostart::isEnabled() const
{
    QFile file(entryPath());
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return false;
    }

    QTextStream in(&file);
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        if (line.compare(QLatin1String("Hidden=true"), Qt::CaseInsensitive) == 0) {
            return false;
        }
    }
    return true;
}

} // namespace officebridge
