#pragma once

#include <memory>

#include <QString>
#include <QStringList>
#include <QtGlobal>

#include "common/errors.hpp"

class QObject;
class QThread;

namespace officebridge {

struct LaunchCommand {
    QString program;
    QStringList args;
    QString workingDirectory;
};

enum class ChildState {
    Exited,
    Running
};

// Handle to one spawned OS process.
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    virtual qint64 pid() const = 0;

    // Non-blocking exit check. An Error (ProbeFailure) means the OS could not
    // answer; the process may still be alive.
    virtual Result<ChildState> tryWait() = 0;

    // Polite termination request: SIGTERM on POSIX. Windows has no such
    // signal and terminates forcefully.
    virtual Status terminate() = 0;

    // Forced termination: SIGKILL / TerminateProcess.
    virtual Status kill() = 0;

    // Waits until the process exits or timeoutMs elapses. A negative timeout
    // waits without bound.
    virtual Result<ChildState> waitForExit(int timeoutMs) = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    virtual Result<std::unique_ptr<ChildProcess>> spawn(const LaunchCommand &command) = 0;
};

// Launches real OS processes through QProcess, with stdin on the null device.
// Every QProcess lives on a thread owned by the launcher, so handles may be
// used from any thread; stdout/stderr lines are forwarded to DEBUG log events.
// Handles must not outlive the launcher that spawned them.
class NativeProcessLauncher : public ProcessLauncher {
public:
    NativeProcessLauncher();
    ~NativeProcessLauncher() override;

    NativeProcessLauncher(const NativeProcessLauncher &) = delete;
    NativeProcessLauncher &operator=(const NativeProcessLauncher &) = delete;

    Result<std::unique_ptr<ChildProcess>> spawn(const LaunchCommand &command) override;

private:
    std::unique_ptr<QThread> m_thread;
    QObject *m_context = nullptr;
};

} // namespace officebridge
