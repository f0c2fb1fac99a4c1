#include "cli/BasmCli.hpp"

#include <iostream>

#include <QUuid>

#include <nlohmann/json.hpp>

#include "adapters/rc_file_adapter.hpp"
#include "adapters/sudoers_adapter.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "store/backup_manager.hpp"

namespace basmgr {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  basmgr alias add NAME COMMAND\n"
        "  basmgr alias remove NAME\n"
        "  basmgr alias list [--format text|json]\n"
        "  basmgr export add VAR VALUE\n"
        "  basmgr export remove VAR\n"
        "  basmgr export list [--format text|json]\n"
        "  basmgr sudoers add RULE\n"
        "  basmgr sudoers remove RULE\n"
        "  basmgr sudoers list [--format text|json]\n"
        "  basmgr backup [--no-rc] [--no-sudoers]\n"
        "  basmgr restore [--no-rc] [--no-sudoers]\n"
        "  basmgr backups [--format text|json]\n"
        "  basmgr apply\n"
        "\n"
        "Environment:\n"
        "  BASM_RC_FILE       rc file (default ~/.bashrc, ~/.zshrc for zsh)\n"
        "  BASM_SUDOERS_PATH  sudoers file (default /etc/sudoers)\n"
        "  BASM_BACKUP_DIR    snapshot directory (default ~/.local/share/basmgr/backups)\n"
        "  BASM_VALIDATOR     sudoers checker, file appended (default \"visudo -c -q -f\")\n"
        "  BASM_RC_BACKUP=0   do not snapshot the rc file before writing\n"
        "  BASM_TRACE=1       write debug trace logs\n");
}

int usageError()
{
    std::cerr << usageText().toStdString();
    return BasmCli::kExitUsage;
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

// Returns an empty string for an unknown format.
QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("text");
    }
    const QString format = value.toLower();
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        return {};
    }
    return format;
}

QString kindLabel(EntryKind kind)
{
    switch (kind) {
    case EntryKind::Alias:
        return QStringLiteral("Alias");
    case EntryKind::Export:
        return QStringLiteral("Export");
    case EntryKind::SudoersRule:
        return QStringLiteral("Sudoers rule");
    }
    return QStringLiteral("Entry");
}

void printEntries(const std::vector<Entry> &entries, const QString &format)
{
    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(entries).dump(2) << std::endl;
        return;
    }
    for (const auto &entry : entries) {
        std::cout << entry.rawLine << "\n";
    }
}

} // namespace

BasmCli::BasmCli(ToolConfig config)
    : m_config(std::move(config))
{
}

int BasmCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        return usageError();
    }

    const QString command = args.at(1);
    if (command == QStringLiteral("help") || command == QStringLiteral("--help")
        || command == QStringLiteral("-h")) {
        std::cout << usageText().toStdString();
        return kExitOk;
    }

    const logging::CorrelationScope scope(QUuid::createUuid().toString(QUuid::WithoutBraces));
    BLOG_INFO(QStringLiteral("BasmCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              basmgr::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()},
                              {"args", args.size()}}));

    // Errors surface here exactly once: message on stderr, category as exit code.
    try {
        return dispatch(args);
    } catch (const SudoersValidationError &ex) {
        std::cerr << "error: " << ex.what() << std::endl;
        if (!ex.diagnostics().empty()) {
            std::cerr << ex.diagnostics() << std::endl;
        }
        return kExitSudoersRejected;
    } catch (const ValidationError &ex) {
        BLOG_WARN(QStringLiteral("BasmCli"),
                  QStringLiteral("run"),
                  QStringLiteral("validation_error"),
                  QString::fromStdString(ex.what()),
                  QStringLiteral("cli"),
                  basmgr::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"command", command.toStdString()}}));
        std::cerr << "error: " << ex.what() << std::endl;
        return kExitUsage;
    } catch (const IoError &ex) {
        BLOG_ERROR(QStringLiteral("BasmCli"),
                   QStringLiteral("run"),
                   QStringLiteral("io_error"),
                   QString::fromStdString(ex.what()),
                   QStringLiteral("cli"),
                   basmgr::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"command", command.toStdString()}}));
        std::cerr << "error: " << ex.what() << std::endl;
        return kExitIo;
    } catch (const BasmError &ex) {
        BLOG_ERROR(QStringLiteral("BasmCli"),
                   QStringLiteral("run"),
                   QStringLiteral("command_failed"),
                   QString::fromStdString(ex.what()),
                   QStringLiteral("cli"),
                   basmgr::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"command", command.toStdString()}}));
        std::cerr << "error: " << ex.what() << std::endl;
        return kExitUsage;
    }
}

int BasmCli::dispatch(const QStringList &args)
{
    const QString command = args.at(1);
    if (command == QStringLiteral("alias")) {
        return runRcEntryCommand(EntryKind::Alias, args);
    }
    if (command == QStringLiteral("export")) {
        return runRcEntryCommand(EntryKind::Export, args);
    }
    if (command == QStringLiteral("sudoers")) {
        return runSudoersCommand(args);
    }
    if (command == QStringLiteral("backup")) {
        return runBackup(args);
    }
    if (command == QStringLiteral("restore")) {
        return runRestore(args);
    }
    if (command == QStringLiteral("backups")) {
        return runListBackups(args);
    }
    if (command == QStringLiteral("apply")) {
        return runApply(args);
    }

    return usageError();
}

int BasmCli::runRcEntryCommand(EntryKind kind, const QStringList &args)
{
    if (args.size() < 3) {
        return usageError();
    }

    BackupManager backups(m_config.backupDir);
    RcFileAdapter rc(m_config, backups);
    const QString action = args.at(2);
    const std::string label = kindLabel(kind).toStdString();
    const std::string rcPath = rc.path().toStdString();

    if (action == QStringLiteral("add")) {
        if (args.size() != 5) {
            return usageError();
        }
        const std::string key = args.at(3).toStdString();
        switch (rc.add(kind, key, args.at(4).toStdString())) {
        case EditOutcome::Added:
            std::cout << label << " '" << key << "' added to " << rcPath << std::endl;
            break;
        case EditOutcome::Updated:
            std::cout << label << " '" << key << "' updated in " << rcPath << std::endl;
            break;
        case EditOutcome::Unchanged:
            std::cout << label << " '" << key << "' already set in " << rcPath << std::endl;
            break;
        }
        return kExitOk;
    }

    if (action == QStringLiteral("remove")) {
        if (args.size() != 4) {
            return usageError();
        }
        const std::string key = args.at(3).toStdString();
        if (rc.remove(kind, key) > 0) {
            std::cout << label << " '" << key << "' removed from " << rcPath << std::endl;
        } else {
            std::cout << "No " << toKindString(kind) << " named '" << key << "' in "
                      << rcPath << std::endl;
        }
        return kExitOk;
    }

    if (action == QStringLiteral("list")) {
        const QString format = getFormat(args);
        if (format.isEmpty()) {
            std::cerr << "Invalid format. Use text or json." << std::endl;
            return kExitUsage;
        }
        printEntries(rc.list(kind), format);
        return kExitOk;
    }

    return usageError();
}

int BasmCli::runSudoersCommand(const QStringList &args)
{
    if (args.size() < 3) {
        return usageError();
    }

    BackupManager backups(m_config.backupDir);
    SudoersAdapter sudoers(m_config, backups);
    const QString action = args.at(2);
    const std::string sudoersPath = sudoers.path().toStdString();

    if (action == QStringLiteral("add")) {
        if (args.size() != 4) {
            return usageError();
        }
        if (sudoers.add(args.at(3).toStdString()) == EditOutcome::Added) {
            std::cout << "Validation OK. Sudoers rule added to " << sudoersPath << std::endl;
        } else {
            std::cout << "Sudoers rule already present in " << sudoersPath << std::endl;
        }
        return kExitOk;
    }

    if (action == QStringLiteral("remove")) {
        if (args.size() != 4) {
            return usageError();
        }
        if (sudoers.remove(args.at(3).toStdString()) > 0) {
            std::cout << "Validation OK. Sudoers rule removed from " << sudoersPath << std::endl;
        } else {
            std::cout << "No matching sudoers rule in " << sudoersPath << std::endl;
        }
        return kExitOk;
    }

    if (action == QStringLiteral("list")) {
        const QString format = getFormat(args);
        if (format.isEmpty()) {
            std::cerr << "Invalid format. Use text or json." << std::endl;
            return kExitUsage;
        }
        printEntries(sudoers.list(), format);
        return kExitOk;
    }

    return usageError();
}

int BasmCli::runBackup(const QStringList &args)
{
    BackupManager backups(m_config.backupDir);
    if (!args.contains(QStringLiteral("--no-rc"))) {
        const std::string id = backups.backup(m_config.rcFile);
        std::cout << "Backed up " << m_config.rcFile.toStdString() << " -> " << id << std::endl;
    }
    if (!args.contains(QStringLiteral("--no-sudoers"))) {
        const std::string id = backups.backup(m_config.sudoersPath);
        std::cout << "Backed up " << m_config.sudoersPath.toStdString() << " -> " << id
                  << std::endl;
    }
    return kExitOk;
}

int BasmCli::runRestore(const QStringList &args)
{
    BackupManager backups(m_config.backupDir);
    const std::string backupDir = m_config.backupDir.toStdString();

    if (!args.contains(QStringLiteral("--no-rc"))) {
        const std::string rcPath = m_config.rcFile.toStdString();
        if (backups.restore(m_config.rcFile)) {
            std::cout << "Restored " << rcPath << " from backup" << std::endl;
        } else {
            std::cout << "No rc backup found in " << backupDir << std::endl;
        }
    }

    if (!args.contains(QStringLiteral("--no-sudoers"))) {
        SudoersAdapter sudoers(m_config, backups);
        if (sudoers.restoreLatest()) {
            std::cout << "Restored " << sudoers.path().toStdString() << " from backup"
                      << std::endl;
        } else {
            std::cout << "No sudoers backup found in " << backupDir << std::endl;
        }
    }
    return kExitOk;
}

int BasmCli::runListBackups(const QStringList &args)
{
    const QString format = getFormat(args);
    if (format.isEmpty()) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return kExitUsage;
    }

    BackupManager backups(m_config.backupDir);
    const auto rcSnapshots = backups.listSnapshots(m_config.rcFile);
    const auto sudoersSnapshots = backups.listSnapshots(m_config.sudoersPath);

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["backupDir"] = m_config.backupDir.toStdString();
        payload["rc"] = rcSnapshots;
        payload["sudoers"] = sudoersSnapshots;
        std::cout << payload.dump(2) << std::endl;
        return kExitOk;
    }

    const auto render = [](const char *label, const std::vector<FileSnapshot> &snapshots) {
        for (const auto &snapshot : snapshots) {
            std::cout << label << "  " << snapshot.id << "  "
                      << toIso8601Utc(snapshot.createdAt) << "  ";
            if (snapshot.existed) {
                std::cout << snapshot.size << " bytes\n";
            } else {
                std::cout << "(file did not exist)\n";
            }
        }
    };
    render("rc     ", rcSnapshots);
    render("sudoers", sudoersSnapshots);
    if (rcSnapshots.empty() && sudoersSnapshots.empty()) {
        std::cout << "No backups in " << m_config.backupDir.toStdString() << std::endl;
    }
    return kExitOk;
}

int BasmCli::runApply(const QStringList &args)
{
    if (args.size() != 2) {
        return usageError();
    }

    BackupManager backups(m_config.backupDir);
    RcFileAdapter rc(m_config, backups);
    const ProcessResult result = rc.apply();
    if (!result.output.isEmpty()) {
        std::cout << result.output.toStdString();
    }
    if (!result.succeeded()) {
        std::cerr << "Sourcing " << rc.path().toStdString() << " with "
                  << m_config.shell.toStdString() << " failed (exit code "
                  << result.exitCode << ")" << std::endl;
        return kExitUsage;
    }
    std::cout << "Sourced " << rc.path().toStdString() << " with "
              << m_config.shell.toStdString()
              << "; open a new shell to pick up the changes." << std::endl;
    return kExitOk;
}

} // namespace basmgr
