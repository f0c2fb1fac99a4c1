#pragma once

#include <QString>
#include <QStringList>

namespace basmgr {

struct ProcessResult {
    bool started = false;
    bool normalExit = false;
    int exitCode = -1;
    // stdout and stderr, merged in arrival order.
    QString output;

    bool succeeded() const
    {
        return started && normalExit && exitCode == 0;
    }
};

ProcessResult runCommand(const QString &program, const QStringList &arguments,
                         int timeoutMs = 30000);

} // namespace basmgr
