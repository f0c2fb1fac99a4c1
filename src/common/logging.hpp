#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace basmgr::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Names the log files after processName and, with traceEnabled, mirrors every
// event into <process>-trace.log. Debug events are dropped unless tracing is on.
void initLogging(const QString &processName, bool traceEnabled);

// Events logged while a scope is alive carry its id. Scopes nest.
class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

QString currentCorrelationId();

// One JSON object per line under $HOME/.local/share/basmgr/logs.
// An empty correlationId falls back to the innermost CorrelationScope.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

// "host:<hostname>,uid:<uid>,euid:<euid>"
QString defaultWho();

} // namespace basmgr::logging

#define BLOG_EVENT(level, component, where, what, why, how, who, corr, ctxJson) \
    ::basmgr::logging::logEvent(::basmgr::logging::LogLevel::level, \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BLOG_DEBUG(...) BLOG_EVENT(Debug, __VA_ARGS__)
#define BLOG_INFO(...) BLOG_EVENT(Info, __VA_ARGS__)
#define BLOG_WARN(...) BLOG_EVENT(Warn, __VA_ARGS__)
#define BLOG_ERROR(...) BLOG_EVENT(Error, __VA_ARGS__)
