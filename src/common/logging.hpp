#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace officebridge::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Names the process whose <name>.log receives events and switches trace mode.
// In trace mode DEBUG events are kept as well and every line is also copied
// to <name>-trace.log. Safe to call again, e.g. from tests.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// $HOME/.office-local-bridge/logs, re-read on every write. Each file rolls
// over to <file>.1 once it reaches kMaxLogFileBytes.
QString logsDirPath();

constexpr qint64 kMaxLogFileBytes = 5 * 1024 * 1024;

// Thread-local correlation id linking the events of one command invocation.
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

// One JSON line per event. All fields are required; use empty strings where
// unknown. An empty correlationId falls back to the thread's current scope.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

// initLogging() name, else the application name.
QString defaultProcessName();
// "host:<hostname>,user:<login>", computed once.
QString defaultWho();

} // namespace officebridge::logging

#define OBLOG_EVENT(level, component, where, what, why, how, who, corr, ctxJson) \
    ::officebridge::logging::logEvent((level), \
                                      ::officebridge::logging::defaultProcessName(), \
                                      (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define OBLOG_DEBUG(...) OBLOG_EVENT(::officebridge::logging::LogLevel::Debug, __VA_ARGS__)
#define OBLOG_INFO(...) OBLOG_EVENT(::officebridge::logging::LogLevel::Info, __VA_ARGS__)
#define OBLOG_WARN(...) OBLOG_EVENT(::officebridge::logging::LogLevel::Warn, __VA_ARGS__)
#define OBLOG_ERROR(...) OBLOG_EVENT(::officebridge::logging::LogLevel::Error, __VA_ARGS__)
