#pragma once

#include <QString>
#include <QStringList>

#include "common/config.hpp"
#include "common/enums.hpp"

namespace basmgr {

class BasmCli
{
public:
    explicit BasmCli(ToolConfig config);

    // CLI dispatcher for alias, export, sudoers, backup and restore commands.
    // returns exit code
    int run(int argc, char *argv[]);

    static constexpr int kExitOk = 0;
    static constexpr int kExitUsage = 1;
    static constexpr int kExitIo = 2;
    static constexpr int kExitSudoersRejected = 3;

private:
    int dispatch(const QStringList &args);

    // alias and export share one handler; sudoers has its own.
    int runRcEntryCommand(EntryKind kind, const QStringList &args);
    int runSudoersCommand(const QStringList &args);
    int runBackup(const QStringList &args);
    int runRestore(const QStringList &args);
    int runListBackups(const QStringList &args);
    int runApply(const QStringList &args);

    ToolConfig m_config;
};

} // namespace basmgr
