#include "common/process_utils.hpp"

#include <QProcess>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace basmgr {

ProcessResult runCommand(const QString &program, const QStringList &arguments,
                         int timeoutMs)
{
    ProcessResult result;

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        BLOG_WARN(QStringLiteral("ProcessUtils"),
                  QStringLiteral("runCommand"),
                  QStringLiteral("process_start_failed"),
                  process.errorString(),
                  QStringLiteral("qprocess"),
                  basmgr::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"program", program.toStdString()}}));
        return result;
    }
    result.started = true;

    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished();
        result.output = QString::fromUtf8(process.readAll());
        return result;
    }

    result.normalExit = process.exitStatus() == QProcess::NormalExit;
    result.exitCode = process.exitCode();
    result.output = QString::fromUtf8(process.readAll());

    BLOG_DEBUG(QStringLiteral("ProcessUtils"),
               QStringLiteral("runCommand"),
               QStringLiteral("process_finished"),
               QStringLiteral("helper_invocation"),
               QStringLiteral("qprocess"),
               basmgr::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"program", program.toStdString()},
                               {"args", arguments.size()},
                               {"exitCode", result.exitCode},
                               {"normalExit", result.normalExit}}));
    return result;
}

} // namespace basmgr
