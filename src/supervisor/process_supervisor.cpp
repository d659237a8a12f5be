#include "supervisor/process_supervisor.hpp"

#include "common/logging.hpp"
#include "supervisor/launch_resolver.hpp"

namespace officebridge {

namespace {

nlohmann::json describeCommand(const LaunchCommand &command)
{
    nlohmann::json args = nlohmann::json::array();
    for (const QString &arg : command.args) {
        args.push_back(arg.toStdString());
    }
    return {
        {"program", command.program.toStdString()},
        {"args", args},
        {"cwd", command.workingDirectory.toStdString()}
    };
}

} // namespace

ProcessSupervisor::ProcessSupervisor()
    : ProcessSupervisor(std::make_unique<NativeProcessLauncher>(),
                        []() { return resolveLaunchCommand(resolveServiceLocation()); })
{
}

ProcessSupervisor::ProcessSupervisor(std::unique_ptr<ProcessLauncher> launcher,
                                     CommandResolver resolver)
    : m_launcher(std::move(launcher))
    , m_resolver(std::move(resolver))
{
}

ProcessSupervisor::~ProcessSupervisor()
{
    if (!pid()) {
        return;
    }
    const Status status = stop();
    if (status) {
        OBLOG_ERROR(QStringLiteral("ProcessSupervisor"),
                    QStringLiteral("~ProcessSupervisor"),
                    QStringLiteral("bridge_stop_on_exit_failed"),
                    QString::fromStdString(toErrorKindString(status->kind)),
                    QStringLiteral("terminate"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", status->message}}));
    }
}

Status ProcessSupervisor::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_stopping) {
        return makeError(ErrorKind::AlreadyRunning, "bridge service is still stopping");
    }
    if (m_child) {
        const Result<ChildState> state = m_child->tryWait();
        if (!state) {
            return state.error();
        }
        if (state.value() == ChildState::Running) {
            return makeError(ErrorKind::AlreadyRunning, "bridge service is already running");
        }
        OBLOG_INFO(QStringLiteral("ProcessSupervisor"),
                   QStringLiteral("start"),
                   QStringLiteral("stale_handle_cleared"),
                   QStringLiteral("child_exited"),
                   QStringLiteral("try_wait"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"pid", m_child->pid()}}));
        m_child.reset();
    }

    const LaunchCommand command = m_resolver();
    OBLOG_INFO(QStringLiteral("ProcessSupervisor"),
               QStringLiteral("start"),
               QStringLiteral("bridge_start_requested"),
               QStringLiteral("user_action"),
               QStringLiteral("spawn"),
               logging::defaultWho(),
               QString(),
               describeCommand(command));

    Result<std::unique_ptr<ChildProcess>> spawned = m_launcher->spawn(command);
    if (!spawned) {
        OBLOG_ERROR(QStringLiteral("ProcessSupervisor"),
                    QStringLiteral("start"),
                    QStringLiteral("bridge_spawn_failed"),
                    QString::fromStdString(toErrorKindString(spawned.error().kind)),
                    QStringLiteral("spawn"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", spawned.error().message}}));
        return spawned.error();
    }

    m_child = std::move(spawned).value();
    return std::nullopt;
}

Status ProcessSupervisor::stop()
{
    ChildProcess *child = nullptr;
    int graceMs = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_child || m_stopping) {
            return makeError(ErrorKind::NotRunning, "bridge service is not running");
        }
        m_stopping = true;
        child = m_child.get();
        graceMs = m_stopGracePeriodMs;
    }

    // m_child is not replaced or reset while m_stopping is set.
    const qint64 childPid = child->pid();
    const Status status = terminateAndWait(*child, graceMs);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopping = false;
    if (status) {
        return status;
    }
    m_child.reset();
    OBLOG_INFO(QStringLiteral("ProcessSupervisor"),
               QStringLiteral("stop"),
               QStringLiteral("bridge_stopped"),
               QStringLiteral("user_action"),
               QStringLiteral("terminate"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"pid", childPid}}));
    return std::nullopt;
}

Status ProcessSupervisor::terminateAndWait(ChildProcess &child, int graceMs)
{
    if (const Status terminated = child.terminate()) {
        return terminated;
    }

    Result<ChildState> state = child.waitForExit(graceMs);
    if (!state) {
        return state.error();
    }
    if (state.value() == ChildState::Exited) {
        return std::nullopt;
    }

    OBLOG_WARN(QStringLiteral("ProcessSupervisor"),
               QStringLiteral("stop"),
               QStringLiteral("bridge_kill_escalated"),
               QStringLiteral("grace_period_elapsed"),
               QStringLiteral("kill"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"pid", child.pid()}, {"graceMs", graceMs}}));
    if (const Status killed = child.kill()) {
        return killed;
    }
    state = child.waitForExit(-1);
    if (!state) {
        return state.error();
    }
    return std::nullopt;
}

bool ProcessSupervisor::isRunning()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_child) {
        return false;
    }
    if (m_stopping) {
        return true;
    }
    const Result<ChildState> state = m_child->tryWait();
    if (!state) {
        // Unknown state: keep the handle and report it as alive.
        return true;
    }
    if (state.value() == ChildState::Exited) {
        m_child.reset();
        return false;
    }
    return true;
}

std::optional<qint64> ProcessSupervisor::pid() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_child) {
        return std::nullopt;
    }
    return m_child->pid();
}

void ProcessSupervisor::setStopGracePeriodMs(int graceMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopGracePeriodMs = graceMs;
}

int ProcessSupervisor::stopGracePeriodMs() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stopGracePeriodMs;
}

} // namespace officebridge
