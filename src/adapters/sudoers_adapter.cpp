#include "adapters/sudoers_adapter.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <unistd.h>

#include <QFileInfo>
#include <QTemporaryFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "store/backup_manager.hpp"
#include "store/line_entry_store.hpp"

namespace basmgr {

SudoersAdapter::SudoersAdapter(ToolConfig config, BackupManager &backups)
    : m_config(std::move(config))
    , m_backups(backups)
{
}

const QString &SudoersAdapter::path() const
{
    return m_config.sudoersPath;
}

std::string SudoersAdapter::readLive() const
{
    bool existed = false;
    std::string content = readTextFile(m_config.sudoersPath, &existed);
    if (!existed) {
        throw IoError("sudoers file not found: " + m_config.sudoersPath.toStdString());
    }
    return content;
}

EditOutcome SudoersAdapter::add(const std::string &rule)
{
    validateEntryInput(EntryKind::SudoersRule, rule, rule);

    const std::string before = readLive();
    const EntryDocument document = parseEntries(EntryKind::SudoersRule, before);
    if (findEntry(document, EntryKind::SudoersRule, rule).has_value()) {
        return EditOutcome::Unchanged;
    }

    const std::string after =
        serializeEntries(upsertEntry(document, EntryKind::SudoersRule, rule, rule));
    stageValidateAndSwap(after, QStringLiteral("add"), true);
    return EditOutcome::Added;
}

std::size_t SudoersAdapter::remove(const std::string &rule)
{
    validateEntryInput(EntryKind::SudoersRule, rule, rule);

    const std::string before = readLive();
    const RemoveResult result =
        removeEntries(parseEntries(EntryKind::SudoersRule, before), EntryKind::SudoersRule, rule);
    if (result.removedCount == 0) {
        return 0;
    }

    stageValidateAndSwap(serializeEntries(result.document), QStringLiteral("remove"), true);
    return result.removedCount;
}

std::vector<Entry> SudoersAdapter::list() const
{
    return listEntries(parseEntries(EntryKind::SudoersRule, readLive()),
                       EntryKind::SudoersRule);
}

bool SudoersAdapter::restoreLatest()
{
    const auto snapshot = m_backups.latestSnapshot(m_config.sudoersPath);
    if (!snapshot.has_value()) {
        return false;
    }
    if (!snapshot->existed) {
        throw ValidationError("latest sudoers snapshot " + snapshot->id
                              + " records no file; refusing to delete "
                              + m_config.sudoersPath.toStdString());
    }

    // Restoring takes no snapshot of its own, so the latest snapshot stays the
    // restore target and repeated restores land on the same content.
    const std::string content = m_backups.readSnapshot(*snapshot);
    bool liveExists = false;
    if (readTextFile(m_config.sudoersPath, &liveExists) == content && liveExists) {
        return true;
    }
    stageValidateAndSwap(content, QStringLiteral("restore"), false);
    return true;
}

void SudoersAdapter::stageValidateAndSwap(const std::string &content,
                                          const QString &operation,
                                          bool snapshotLive)
{
    const QFileInfo live(m_config.sudoersPath);
    const QString livePath = live.absoluteFilePath();

    // Staged in the live file's directory so the final rename never crosses
    // a filesystem boundary.
    QTemporaryFile staging(live.absolutePath() + QStringLiteral("/.")
                           + live.fileName() + QStringLiteral(".basmgr-XXXXXX"));
    if (!staging.open()) {
        throw IoError("cannot create staging file in " + live.absolutePath().toStdString()
                      + ": " + staging.errorString().toStdString());
    }
    const QByteArray bytes = QByteArray::fromStdString(content);
    if (staging.write(bytes) != bytes.size() || !staging.flush()) {
        throw IoError("cannot write staging file: " + staging.errorString().toStdString());
    }
    if (live.exists() && !staging.setPermissions(live.permissions())) {
        throw IoError("cannot set permissions on staging file: "
                      + staging.errorString().toStdString());
    }
    if (::fsync(staging.handle()) != 0) {
        const int error = errno;
        throw IoError("cannot sync staging file: " + std::string(std::strerror(error)));
    }
    staging.close();
    const QString stagingPath = staging.fileName();

    QStringList arguments = m_config.validatorArguments;
    arguments << stagingPath;
    const ProcessResult check = runCommand(m_config.validatorProgram, arguments);
    if (!check.started) {
        throw IoError("cannot run sudoers validator " + m_config.validatorProgram.toStdString());
    }
    if (!check.succeeded()) {
        BLOG_WARN(QStringLiteral("SudoersAdapter"),
                  QStringLiteral("stageValidateAndSwap"),
                  QStringLiteral("sudoers_rejected"),
                  QStringLiteral("validator_failed"),
                  m_config.validatorProgram,
                  basmgr::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"operation", operation.toStdString()},
                                  {"exitCode", check.exitCode},
                                  {"normalExit", check.normalExit},
                                  {"diagnostics", check.output.toStdString()}}));
        throw SudoersValidationError(
            "sudoers validation failed; " + livePath.toStdString() + " left unchanged",
            check.output.trimmed().toStdString());
    }

    std::string snapshotId;
    if (snapshotLive) {
        snapshotId = m_backups.backup(livePath);
    }

    if (std::rename(QFile::encodeName(stagingPath).constData(),
                    QFile::encodeName(livePath).constData()) != 0) {
        const int error = errno;
        throw IoError("cannot replace " + livePath.toStdString() + ": "
                      + std::strerror(error));
    }
    staging.setAutoRemove(false);

    BLOG_INFO(QStringLiteral("SudoersAdapter"),
              QStringLiteral("stageValidateAndSwap"),
              QStringLiteral("sudoers_replaced"),
              QStringLiteral("validator_passed"),
              QStringLiteral("stage_validate_rename"),
              basmgr::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"operation", operation.toStdString()},
                              {"snapshot", snapshotId},
                              {"path", livePath.toStdString()},
                              {"bytes", content.size()}}));
}

} // namespace basmgr
