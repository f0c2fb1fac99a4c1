#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"

namespace basmgr {

class BackupManager;

/**
 * Sudoers editing with a validation gate.
 *
 * add() and remove() compute the new content, write it to a staging file
 * beside the live file, run the configured validator on the staging file,
 * snapshot the live file, and rename the staging file over it. The live
 * file is never replaced with content the validator has not accepted; a
 * rejection throws SudoersValidationError and leaves it byte-for-byte as
 * it was.
 *
 * Rules are matched by their trimmed text, not by a key.
 */
class SudoersAdapter {
public:
    SudoersAdapter(ToolConfig config, BackupManager &backups);

    EditOutcome add(const std::string &rule);

    // Returns the number of lines removed; zero means no such rule.
    std::size_t remove(const std::string &rule);

    std::vector<Entry> list() const;

    // Puts the latest sudoers snapshot back through the same validation
    // gate. The replaced file is not snapshotted, so restoring twice is a
    // no-op. False when there is no snapshot.
    bool restoreLatest();

    const QString &path() const;

private:
    std::string readLive() const;
    void stageValidateAndSwap(const std::string &content, const QString &operation,
                              bool snapshotLive);

    ToolConfig m_config;
    BackupManager &m_backups;
};

} // namespace basmgr
