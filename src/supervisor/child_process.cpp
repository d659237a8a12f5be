#include "supervisor/child_process.hpp"

#include <memory>
#include <string>
#include <utility>

#include <QDeadlineTimer>
#include <QDir>
#include <QProcess>
#include <QStandardPaths>
#include <QThread>

#include "common/logging.hpp"

#ifdef Q_OS_WIN
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <cerrno>
    #include <cstring>
    #include <signal.h>
    #include <unistd.h>
#endif

namespace officebridge {

namespace {

constexpr int kMaxLineBytes = 4096;
constexpr int kStartTimeoutMs = 10 * 1000;
constexpr int kExitPollIntervalMs = 20;

// Runs fn on the thread that owns context and returns once it has finished.
template <typename Fn>
void runOn(QObject *context, Fn fn)
{
    if (QThread::currentThread() == context->thread()) {
        fn();
        return;
    }
    QMetaObject::invokeMethod(context, std::move(fn), Qt::BlockingQueuedConnection);
}

// Splits raw pipe output into lines and forwards each one as a DEBUG event.
class LineForwarder {
public:
    LineForwarder(const QProcess *process, const char *stream)
        : m_process(process)
        , m_stream(stream)
    {
    }

    void append(const QByteArray &data)
    {
        for (const char c : data) {
            if (c == '\n') {
                flush();
                continue;
            }
            if (c != '\r') {
                m_pending.append(c);
            }
            if (m_pending.size() >= kMaxLineBytes) {
                flush();
            }
        }
    }

    void flush()
    {
        if (m_pending.isEmpty()) {
            return;
        }
        if (logging::isTraceEnabled()) {
            OBLOG_DEBUG(QStringLiteral("BridgeService"),
                        QStringLiteral("childOutput"),
                        QStringLiteral("child_output"),
                        QString::fromLatin1(m_stream),
                        QStringLiteral("pipe"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"pid", m_process->processId()},
                                        {"stream", m_stream},
                                        {"line", m_pending.toStdString()}}));
        }
        m_pending.clear();
    }

private:
    const QProcess *m_process;
    const char *m_stream;
    QByteArray m_pending;
};

Error spawnError(const std::string &detail)
{
    return makeError(ErrorKind::SpawnFailure, "failed to start bridge service: " + detail);
}

// Resolves bare names (node, npm) through PATH; paths are used as given.
QString resolveProgram(const QString &program)
{
    if (program.contains(QLatin1Char('/')) || program.contains(QLatin1Char('\\'))) {
        return QDir::cleanPath(QDir::current().absoluteFilePath(program));
    }
    return QStandardPaths::findExecutable(program);
}

void forwardOutput(QProcess *process)
{
    auto out = std::make_shared<LineForwarder>(process, "stdout");
    auto err = std::make_shared<LineForwarder>(process, "stderr");

    QObject::connect(process, &QProcess::readyReadStandardOutput, process, [process, out]() {
        out->append(process->readAllStandardOutput());
    });
    QObject::connect(process, &QProcess::readyReadStandardError, process, [process, err]() {
        err->append(process->readAllStandardError());
    });
    QObject::connect(process, &QProcess::finished, process,
                     [process, out, err](int exitCode, QProcess::ExitStatus exitStatus) {
        out->append(process->readAllStandardOutput());
        err->append(process->readAllStandardError());
        out->flush();
        err->flush();
        OBLOG_INFO(QStringLiteral("ChildProcess"),
                   QStringLiteral("finished"),
                   QStringLiteral("child_exited"),
                   QStringLiteral("process_exit"),
                   QStringLiteral("qprocess"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"exitCode", exitCode},
                                   {"crashed", exitStatus == QProcess::CrashExit}}));
    });
}

class QtChildProcess : public ChildProcess {
public:
    QtChildProcess(QObject *context, QProcess *process, qint64 pid)
        : m_context(context)
        , m_process(process)
        , m_pid(pid)
    {
    }

    ~QtChildProcess() override
    {
        runOn(m_context, [this]() {
            if (m_process->state() != QProcess::NotRunning) {
                OBLOG_WARN(QStringLiteral("ChildProcess"),
                           QStringLiteral("~QtChildProcess"),
                           QStringLiteral("child_killed_on_release"),
                           QStringLiteral("handle_dropped_while_running"),
                           QStringLiteral("kill"),
                           logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"pid", m_pid}}));
                m_process->kill();
                m_process->waitForFinished(kStartTimeoutMs);
            }
            delete m_process;
        });
    }

    qint64 pid() const override
    {
        return m_pid;
    }

    Result<ChildState> tryWait() override
    {
        ChildState state = ChildState::Running;
        runOn(m_context, [this, &state]() {
            if (m_process->state() != QProcess::NotRunning) {
                m_process->waitForFinished(0);
            }
            if (m_process->state() == QProcess::NotRunning) {
                state = ChildState::Exited;
            }
        });
        return state;
    }

    Status terminate() override
    {
#ifdef Q_OS_WIN
        // Console children ignore WM_CLOSE.
        return kill();
#else
        return signalProcessGroup(SIGTERM);
#endif
    }

    Status kill() override
    {
#ifdef Q_OS_WIN
        runOn(m_context, [this]() { m_process->kill(); });
        return std::nullopt;
#else
        return signalProcessGroup(SIGKILL);
#endif
    }

    // Polls from the calling thread so the process thread stays free for
    // other handles and for concurrent tryWait() calls.
    Result<ChildState> waitForExit(int timeoutMs) override
    {
        // A negative interval never expires.
        const QDeadlineTimer deadline(static_cast<qint64>(timeoutMs));
        for (;;) {
            Result<ChildState> state = tryWait();
            if (!state || state.value() == ChildState::Exited) {
                return state;
            }
            if (deadline.hasExpired()) {
                return ChildState::Running;
            }
            QThread::msleep(kExitPollIntervalMs);
        }
    }

private:
#ifndef Q_OS_WIN
    // The child leads its own process group; signalling the group also
    // reaches the node process started by npm.
    Status signalProcessGroup(int signal)
    {
        Status status;
        runOn(m_context, [this, signal, &status]() {
            if (m_process->state() == QProcess::NotRunning) {
                return;
            }
            if (::kill(static_cast<pid_t>(-m_pid), signal) == 0) {
                return;
            }
            if (errno == ESRCH) {
                if (signal == SIGKILL) {
                    m_process->kill();
                } else {
                    m_process->terminate();
                }
                return;
            }
            status = makeError(ErrorKind::IoFailure,
                               std::string("failed to signal bridge service process: ")
                                   + std::strerror(errno));
        });
        return status;
    }
#endif

    QObject *m_context;
    QProcess *m_process;
    qint64 m_pid;
};

} // namespace

NativeProcessLauncher::NativeProcessLauncher()
    : m_thread(std::make_unique<QThread>())
    , m_context(new QObject)
{
    m_thread->setObjectName(QStringLiteral("office-bridge-processes"));
    m_context->moveToThread(m_thread.get());
    QObject::connect(m_thread.get(), &QThread::finished, m_context, &QObject::deleteLater);
    m_thread->start();
}

NativeProcessLauncher::~NativeProcessLauncher()
{
    m_thread->quit();
    m_thread->wait();
}

Result<std::unique_ptr<ChildProcess>> NativeProcessLauncher::spawn(const LaunchCommand &command)
{
    QString program = resolveProgram(command.program);
    if (program.isEmpty()) {
        return spawnError("executable not found: " + command.program.toStdString());
    }

    QStringList args = command.args;
#ifdef Q_OS_WIN
    // Batch wrappers such as npm.cmd only run through the command interpreter.
    if (program.endsWith(QLatin1String(".cmd"), Qt::CaseInsensitive)
        || program.endsWith(QLatin1String(".bat"), Qt::CaseInsensitive)) {
        args.prepend(QDir::toNativeSeparators(program));
        args.prepend(QStringLiteral("/c"));
        program = QStringLiteral("cmd.exe");
    }
#endif

    QProcess *started = nullptr;
    qint64 pid = 0;
    QString failure;
    runOn(m_context, [&]() {
        auto process = std::make_unique<QProcess>();
        process->setProgram(program);
        process->setArguments(args);
        if (!command.workingDirectory.isEmpty()) {
            process->setWorkingDirectory(command.workingDirectory);
        }
        process->setStandardInputFile(QProcess::nullDevice());
#ifdef Q_OS_WIN
        process->setCreateProcessArgumentsModifier([](QProcess::CreateProcessArguments *arguments) {
            arguments->flags |= CREATE_NO_WINDOW;
        });
#else
        process->setChildProcessModifier([]() { ::setpgid(0, 0); });
#endif
        forwardOutput(process.get());

        process->start();
        if (!process->waitForStarted(kStartTimeoutMs)) {
            failure = process->errorString();
            return;
        }
        pid = process->processId();
        started = process.release();
    });

    if (!started) {
        return spawnError(command.program.toStdString() + ": " + failure.toStdString());
    }

    nlohmann::json argList = nlohmann::json::array();
    for (const QString &arg : args) {
        argList.push_back(arg.toStdString());
    }
    OBLOG_INFO(QStringLiteral("ChildProcess"),
               QStringLiteral("spawn"),
               QStringLiteral("child_spawned"),
               QStringLiteral("start_requested"),
               QStringLiteral("qprocess"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"pid", pid},
                               {"program", program.toStdString()},
                               {"args", argList},
                               {"cwd", command.workingDirectory.toStdString()}}));

    return std::unique_ptr<ChildProcess>(new QtChildProcess(m_context, started, pid));
}

} // namespace officebridge
