#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSysInfo>
#include <QThread>

#include <atomic>
#include <cstdio>
#include <mutex>

namespace officebridge::logging {

namespace {

const char *const kFallbackProcessName = "office-bridge";

// File output is serialized; the trace flag is read on hot paths without it.
std::mutex g_writeMutex;
std::atomic<bool> g_trace{false};

std::mutex g_nameMutex;
QString g_processName;

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

// Native thread id, prefixed with the QThread name when one is set.
std::string threadLabel()
{
    const QString id = QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
    const QThread *thread = QThread::currentThread();
    if (thread && !thread->objectName().isEmpty()) {
        return (thread->objectName() + QLatin1Char('@') + id).toStdString();
    }
    return id.toStdString();
}

// Appends one line, first moving a full file aside to <path>.1. Falls back
// to stderr when the file cannot be written.
void appendLine(const QString &path, const QByteArray &line)
{
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        std::fprintf(stderr, "%s", line.constData());
        return;
    }
    if (info.exists() && info.size() + line.size() >= kMaxLogFileBytes) {
        const QString previous = path + QStringLiteral(".1");
        QFile::remove(previous);
        QFile::rename(path, previous);
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        std::fprintf(stderr, "%s", line.constData());
        return;
    }
    file.write(line);
}

} // namespace

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString relative = QStringLiteral(".office-local-bridge/logs");
    return home.isEmpty() ? relative : QDir(home).filePath(relative);
}

void initLogging(const QString &processName, bool traceEnabled)
{
    {
        std::lock_guard<std::mutex> lock(g_nameMutex);
        g_processName = processName;
    }
    g_trace.store(traceEnabled);
}

bool isTraceEnabled()
{
    return g_trace.load();
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_nameMutex);
        if (!g_processName.isEmpty()) {
            return g_processName;
        }
    }
    const QString appName = QCoreApplication::instance()
        ? QCoreApplication::applicationName()
        : QString();
    return appName.isEmpty() ? QString::fromLatin1(kFallbackProcessName) : appName;
}

QString defaultWho()
{
    static const QString who = QStringLiteral("host:%1,user:%2")
        .arg(QSysInfo::machineHostName(),
             qEnvironmentVariable("USER", qEnvironmentVariable("USERNAME")));
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const bool trace = g_trace.load();
    if (level == LogLevel::Debug && !trace) {
        return;
    }

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const nlohmann::json record = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"thread", threadLabel()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_corrId : correlationId).toStdString()},
        {"context", context}
    };

    // Child output and HTTP bodies may carry invalid UTF-8.
    QByteArray line = QByteArray::fromStdString(
        record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    line.append('\n');

    const QDir dir(logsDirPath());
    std::lock_guard<std::mutex> lock(g_writeMutex);
    appendLine(dir.filePath(process + QStringLiteral(".log")), line);
    if (trace) {
        appendLine(dir.filePath(process + QStringLiteral("-trace.log")), line);
    }
}

} // namespace officebridge::logging
