#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <unistd.h>

namespace basmgr::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

bool g_traceEnabled = false;
QString g_processName;
QString g_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString processName()
{
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("basmgr");
}

QString logsDir()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/basmgr/logs");
    }
    return home + QStringLiteral("/.local/share/basmgr/logs");
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void appendLine(const QString &path, const QByteArray &line)
{
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        return;
    }
    file.write(line);
    file.write("\n");
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    g_processName = processName;
    g_traceEnabled = traceEnabled;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(g_corrId)
{
    g_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    g_corrId = m_prev;
}

QString currentCorrelationId()
{
    return g_corrId;
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2,euid:%3")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()))
        .arg(static_cast<int>(geteuid()));
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !g_traceEnabled) {
        return;
    }

    const QString process = processName();
    const QString corr = correlationId.isEmpty() ? g_corrId : correlationId;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", process.toStdString()},
        {"pid", static_cast<long>(getpid())},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    // Failures to log are ignored; they never fail the edit being logged.
    const QString dir = logsDir();
    if (!QDir().mkpath(dir)) {
        return;
    }
    const QByteArray line = QByteArray::fromStdString(payload.dump());
    const QString base = dir + QDir::separator() + process;
    appendLine(base + QStringLiteral(".log"), line);
    if (g_traceEnabled) {
        appendLine(base + QStringLiteral("-trace.log"), line);
    }
}

} // namespace basmgr::logging
