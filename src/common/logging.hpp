#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace camwatch::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// With trace enabled, Debug events are written and every line is echoed to stderr.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory holding <process>.log. CAMWATCH_LOG_DIR wins over $HOME.
QString logsDirPath();

// Thread-local correlation support. The scheduler tags every cycle.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event, written as one JSON object per line.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();

} // namespace camwatch::logging

#define CWLOG_DEBUG(component, where, what, ctxJson) \
    ::camwatch::logging::logEvent(::camwatch::logging::LogLevel::Debug, \
                                  ::camwatch::logging::defaultProcessName(), \
                                  (component), (where), (what), QString(), (ctxJson))

#define CWLOG_INFO(component, where, what, ctxJson) \
    ::camwatch::logging::logEvent(::camwatch::logging::LogLevel::Info, \
                                  ::camwatch::logging::defaultProcessName(), \
                                  (component), (where), (what), QString(), (ctxJson))

#define CWLOG_WARN(component, where, what, ctxJson) \
    ::camwatch::logging::logEvent(::camwatch::logging::LogLevel::Warn, \
                                  ::camwatch::logging::defaultProcessName(), \
                                  (component), (where), (what), QString(), (ctxJson))

#define CWLOG_ERROR(component, where, what, ctxJson) \
    ::camwatch::logging::logEvent(::camwatch::logging::LogLevel::Error, \
                                  ::camwatch::logging::defaultProcessName(), \
                                  (component), (where), (what), QString(), (ctxJson))
