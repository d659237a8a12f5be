#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "common/errors.hpp"
#include "supervisor/child_process.hpp"

namespace officebridge {

// Owns at most one bridge service child process.
//
// State is {Idle, Running(handle), Stopping(handle)} behind a mutex. The
// mutex is released while stop() waits for the child to exit; in that window
// the child still counts as running. Staleness is detected lazily: a handle
// whose process already exited is discarded the next time start() or
// isRunning() probes it.
class ProcessSupervisor {
public:
    using CommandResolver = std::function<LaunchCommand()>;

    static constexpr int kDefaultStopGracePeriodMs = 5000;

    // Native launcher; the command comes from resolveLaunchCommand() applied
    // to resolveServiceLocation() at each start.
    ProcessSupervisor();
    ProcessSupervisor(std::unique_ptr<ProcessLauncher> launcher, CommandResolver resolver);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    // AlreadyRunning when the tracked process is alive, ProbeFailure when its
    // state cannot be determined, SpawnFailure when the OS refuses the launch.
    Status start();

    // NotRunning without touching the OS when nothing is tracked or another
    // stop() is already in progress. Otherwise asks the child to terminate,
    // escalates to a forced kill after the grace period, waits for exit and
    // clears the handle.
    Status stop();

    bool isRunning();
    std::optional<qint64> pid() const;

    void setStopGracePeriodMs(int graceMs);
    int stopGracePeriodMs() const;

private:
    Status terminateAndWait(ChildProcess &child, int graceMs);

    std::unique_ptr<ProcessLauncher> m_launcher;
    CommandResolver m_resolver;
    int m_stopGracePeriodMs = kDefaultStopGracePeriodMs;

    mutable std::mutex m_mutex;
    std::unique_ptr<ChildProcess> m_child;
    bool m_stopping = false;
};

} // namespace officebridge
