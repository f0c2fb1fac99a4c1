#include "adapters/rc_file_adapter.hpp"

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "store/backup_manager.hpp"
#include "store/line_entry_store.hpp"

namespace basmgr {

namespace {

void requireRcKind(EntryKind kind)
{
    if (kind != EntryKind::Alias && kind != EntryKind::Export) {
        throw ValidationError(toKindString(kind) + " entries do not live in the rc file");
    }
}

} // namespace

RcFileAdapter::RcFileAdapter(ToolConfig config, BackupManager &backups)
    : m_config(std::move(config))
    , m_backups(backups)
{
}

const QString &RcFileAdapter::path() const
{
    return m_config.rcFile;
}

EditOutcome RcFileAdapter::add(EntryKind kind, const std::string &key,
                               const std::string &value)
{
    requireRcKind(kind);
    validateEntryInput(kind, key, value);

    const std::string before = readTextFile(m_config.rcFile);
    const EntryDocument document = parseEntries(kind, before);
    const bool existed = findEntry(document, kind, key).has_value();
    const std::string after = serializeEntries(upsertEntry(document, kind, key, value));

    EditOutcome outcome = EditOutcome::Unchanged;
    if (after != before) {
        commit(before, after);
        outcome = existed ? EditOutcome::Updated : EditOutcome::Added;
    }

    BLOG_INFO(QStringLiteral("RcFileAdapter"),
              QStringLiteral("add"),
              QStringLiteral("rc_entry_upsert"),
              QStringLiteral("user_invocation"),
              QStringLiteral("line_entry_store"),
              basmgr::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"kind", kind},
                              {"key", key},
                              {"outcome", toOutcomeString(outcome)},
                              {"path", m_config.rcFile.toStdString()}}));
    return outcome;
}

std::size_t RcFileAdapter::remove(EntryKind kind, const std::string &key)
{
    requireRcKind(kind);
    validateEntryInput(kind, key, std::string());

    const std::string before = readTextFile(m_config.rcFile);
    const RemoveResult result = removeEntries(parseEntries(kind, before), kind, key);
    if (result.removedCount > 0) {
        commit(before, serializeEntries(result.document));
    }

    BLOG_INFO(QStringLiteral("RcFileAdapter"),
              QStringLiteral("remove"),
              QStringLiteral("rc_entry_remove"),
              QStringLiteral("user_invocation"),
              QStringLiteral("line_entry_store"),
              basmgr::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"kind", kind},
                              {"key", key},
                              {"removed", result.removedCount},
                              {"path", m_config.rcFile.toStdString()}}));
    return result.removedCount;
}

std::vector<Entry> RcFileAdapter::list(EntryKind kind) const
{
    requireRcKind(kind);
    return listEntries(parseEntries(kind, readTextFile(m_config.rcFile)), kind);
}

void RcFileAdapter::commit(const std::string &before, const std::string &after)
{
    if (m_config.backupRcOnWrite) {
        m_backups.backup(m_config.rcFile);
    }
    writeFileAtomically(m_config.rcFile, after);

    BLOG_DEBUG(QStringLiteral("RcFileAdapter"),
               QStringLiteral("commit"),
               QStringLiteral("rc_written"),
               QStringLiteral("content_changed"),
               QStringLiteral("qsavefile"),
               basmgr::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"bytesBefore", before.size()},
                               {"bytesAfter", after.size()},
                               {"backup", m_config.backupRcOnWrite}}));
}

ProcessResult RcFileAdapter::apply() const
{
    const ProcessResult result = runCommand(
        m_config.shell,
        {QStringLiteral("-c"), QStringLiteral(". \"$1\""), QStringLiteral("basmgr"),
         m_config.rcFile});
    if (!result.started) {
        throw IoError("cannot start shell " + m_config.shell.toStdString());
    }

    BLOG_INFO(QStringLiteral("RcFileAdapter"),
              QStringLiteral("apply"),
              QStringLiteral("rc_sourced"),
              QStringLiteral("user_invocation"),
              QStringLiteral("child_shell"),
              basmgr::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"shell", m_config.shell.toStdString()},
                              {"exitCode", result.exitCode}}));
    return result;
}

} // namespace basmgr
