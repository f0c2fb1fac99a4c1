#pragma once

#include <QString>
#include <QStringList>

namespace basmgr {

// Paths and helpers resolved once per invocation. Adapters receive a copy
// and never consult the environment themselves.
struct ToolConfig {
    QString rcFile;
    QString sudoersPath;
    QString backupDir;
    QString shell;

    // The staging file path is appended as the last argument.
    QString validatorProgram;
    QStringList validatorArguments;

    bool backupRcOnWrite = true;
    bool traceEnabled = false;

    static ToolConfig fromEnvironment();
};

QString defaultRcFile(const QString &shell, const QString &home);

} // namespace basmgr
