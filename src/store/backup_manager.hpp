#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace basmgr {

// BackupManager keeps append-only snapshots of target files in one
// directory. Each snapshot is a content file <id>.bak plus a JSON manifest
// <id>.json; a snapshot of a missing file has a manifest only. Snapshots
// are never overwritten or pruned.
class BackupManager {
public:
    explicit BackupManager(QString backupDir);

    // Snapshots the current content of path and returns the snapshot id.
    std::string backup(const QString &path);

    // Writes the most recent snapshot of path back, or removes path if the
    // snapshot recorded that it did not exist. False when there is none.
    bool restore(const QString &path);

    // Most recent first.
    std::vector<FileSnapshot> listSnapshots(const QString &path) const;
    std::optional<FileSnapshot> latestSnapshot(const QString &path) const;

    std::string readSnapshot(const FileSnapshot &snapshot) const;

    const QString &backupDir() const;

private:
    QString snapshotPrefix(const QString &path) const;

    QString m_backupDir;
};

} // namespace basmgr
