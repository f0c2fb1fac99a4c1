#include "common/config.hpp"

#include <QDir>
#include <QFileInfo>
#include <QProcess>

namespace basmgr {

namespace {

QString homeDir()
{
    const QString home = qEnvironmentVariable("HOME");
    if (!home.isEmpty()) {
        return home;
    }
    return QDir::homePath();
}

QString envOr(const char *name, const QString &fallback)
{
    const QString value = qEnvironmentVariable(name);
    return value.isEmpty() ? fallback : value;
}

} // namespace

QString defaultRcFile(const QString &shell, const QString &home)
{
    const QString shellName = QFileInfo(shell).fileName();
    if (shellName == QStringLiteral("zsh")) {
        return home + QStringLiteral("/.zshrc");
    }
    return home + QStringLiteral("/.bashrc");
}

ToolConfig ToolConfig::fromEnvironment()
{
    ToolConfig config;
    const QString home = homeDir();

    config.shell = envOr("SHELL", QStringLiteral("/bin/bash"));
    config.rcFile = envOr("BASM_RC_FILE", defaultRcFile(config.shell, home));
    config.sudoersPath = envOr("BASM_SUDOERS_PATH", QStringLiteral("/etc/sudoers"));
    config.backupDir = envOr("BASM_BACKUP_DIR",
                             home + QStringLiteral("/.local/share/basmgr/backups"));

    QStringList validator = QProcess::splitCommand(qEnvironmentVariable("BASM_VALIDATOR"));
    if (validator.isEmpty()) {
        validator = {QStringLiteral("visudo"), QStringLiteral("-c"),
                     QStringLiteral("-q"), QStringLiteral("-f")};
    }
    config.validatorProgram = validator.takeFirst();
    config.validatorArguments = validator;

    config.backupRcOnWrite = qEnvironmentVariable("BASM_RC_BACKUP") != QStringLiteral("0");
    config.traceEnabled = qEnvironmentVariableIntValue("BASM_TRACE") == 1;
    return config;
}

} // namespace basmgr
