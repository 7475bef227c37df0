#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace buildprof::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory that receives <process>.log and <process>-trace.log.
QString logsDirPath();

// Thread-local correlation support; one profiling run shares one id.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
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

QString defaultProcessName();
QString defaultWho();

} // namespace buildprof::logging

#define BPLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::buildprof::logging::logEvent(::buildprof::logging::LogLevel::Debug, \
                                   ::buildprof::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BPLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::buildprof::logging::logEvent(::buildprof::logging::LogLevel::Info, \
                                   ::buildprof::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BPLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::buildprof::logging::logEvent(::buildprof::logging::LogLevel::Warn, \
                                   ::buildprof::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BPLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::buildprof::logging::logEvent(::buildprof::logging::LogLevel::Error, \
                                   ::buildprof::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
