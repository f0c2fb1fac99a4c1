#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "common/process_utils.hpp"

namespace basmgr {

class BackupManager;

// Alias and export editing on the resolved shell rc file. Every mutating
// call is a full read-modify-write of the file; a missing rc file reads as
// empty and is created on the first write.
class RcFileAdapter {
public:
    RcFileAdapter(ToolConfig config, BackupManager &backups);

    EditOutcome add(EntryKind kind, const std::string &key, const std::string &value);

    // Returns the number of lines removed; zero means no such entry.
    std::size_t remove(EntryKind kind, const std::string &key);

    std::vector<Entry> list(EntryKind kind) const;

    // Sources the rc file in a child shell and reports how it went.
    ProcessResult apply() const;

    const QString &path() const;

private:
    void commit(const std::string &before, const std::string &after);

    ToolConfig m_config;
    BackupManager &m_backups;
};

} // namespace basmgr
