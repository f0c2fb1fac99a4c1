#include "store/backup_manager.hpp"

#include <algorithm>
#include <chrono>

#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace basmgr {

namespace {

QString absolutePath(const QString &path)
{
    return QFileInfo(path).absoluteFilePath();
}

QString manifestPath(const QString &dir, const QString &id)
{
    return dir + QDir::separator() + id + QStringLiteral(".json");
}

QString contentPath(const QString &dir, const QString &id)
{
    return dir + QDir::separator() + id + QStringLiteral(".bak");
}

void restrictToOwner(const QString &path, QFileDevice::Permissions extra = {})
{
    if (QFile::setPermissions(path, QFileDevice::ReadOwner | QFileDevice::WriteOwner | extra)) {
        return;
    }
    BLOG_WARN(QStringLiteral("BackupManager"),
              QStringLiteral("restrictToOwner"),
              QStringLiteral("chmod_failed"),
              QStringLiteral("snapshot_privacy"),
              QStringLiteral("qfile_permissions"),
              basmgr::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"path", path.toStdString()}}));
}

} // namespace

BackupManager::BackupManager(QString backupDir)
    : m_backupDir(std::move(backupDir))
{
}

const QString &BackupManager::backupDir() const
{
    return m_backupDir;
}

QString BackupManager::snapshotPrefix(const QString &path) const
{
    // Hidden names (".bashrc") would be skipped by directory listings.
    QString name = QFileInfo(path).fileName();
    while (name.startsWith(QLatin1Char('.'))) {
        name.remove(0, 1);
    }
    if (name.isEmpty()) {
        name = QStringLiteral("file");
    }
    const QByteArray hash = QCryptographicHash::hash(
        absolutePath(path).toUtf8(), QCryptographicHash::Sha1).toHex();
    return name + QLatin1Char('-') + QString::fromLatin1(hash.left(8)) + QLatin1Char('-');
}

std::string BackupManager::backup(const QString &path)
{
    const bool dirExisted = QDir(m_backupDir).exists();
    ensureDirectory(m_backupDir);
    if (!dirExisted) {
        restrictToOwner(m_backupDir, QFileDevice::ExeOwner);
    }

    bool existed = false;
    const std::string content = readTextFile(path, &existed);

    const auto now = std::chrono::system_clock::now();
    const QString base = snapshotPrefix(path)
        + QDateTime::fromMSecsSinceEpoch(toEpochMillis(now), Qt::UTC)
              .toString(QStringLiteral("yyyyMMdd'T'HHmmsszzz'Z'"));

    QString id = base;
    int sequence = 0;
    while (QFile::exists(manifestPath(m_backupDir, id))) {
        ++sequence;
        id = base + QLatin1Char('-') + QString::number(sequence);
    }

    FileSnapshot snapshot;
    snapshot.id = id.toStdString();
    snapshot.sourcePath = absolutePath(path).toStdString();
    snapshot.createdAt = now;
    snapshot.sequence = sequence;
    snapshot.existed = existed;
    snapshot.size = content.size();

    if (existed) {
        const QString dataPath = contentPath(m_backupDir, id);
        writeFileAtomically(dataPath, content);
        restrictToOwner(dataPath);
    }
    // The manifest goes last: a manifest on disk means the snapshot is complete.
    const QString metaPath = manifestPath(m_backupDir, id);
    writeFileAtomically(metaPath, nlohmann::json(snapshot).dump(2) + "\n");
    restrictToOwner(metaPath);

    BLOG_INFO(QStringLiteral("BackupManager"),
              QStringLiteral("backup"),
              QStringLiteral("snapshot_created"),
              QStringLiteral("pre_mutation"),
              QStringLiteral("file_copy"),
              basmgr::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"id", snapshot.id},
                              {"source", snapshot.sourcePath},
                              {"existed", existed},
                              {"size", snapshot.size}}));
    return snapshot.id;
}

std::vector<FileSnapshot> BackupManager::listSnapshots(const QString &path) const
{
    std::vector<FileSnapshot> snapshots;
    QDir dir(m_backupDir);
    if (!dir.exists()) {
        return snapshots;
    }

    const std::string source = absolutePath(path).toStdString();
    // Matched on the recorded source, not the id prefix: file names may hold
    // wildcard characters that a name filter would interpret.
    const QStringList manifests = dir.entryList({QStringLiteral("*.json")}, QDir::Files);

    for (const QString &name : manifests) {
        const QString metaPath = dir.absoluteFilePath(name);
        QFile file(metaPath);
        if (!file.open(QIODevice::ReadOnly)) {
            continue;
        }
        FileSnapshot snapshot;
        try {
            snapshot = nlohmann::json::parse(file.readAll().toStdString()).get<FileSnapshot>();
        } catch (const nlohmann::json::exception &ex) {
            BLOG_WARN(QStringLiteral("BackupManager"),
                      QStringLiteral("listSnapshots"),
                      QStringLiteral("manifest_unreadable"),
                      QString::fromUtf8(ex.what()),
                      QStringLiteral("json_parse"),
                      basmgr::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"manifest", metaPath.toStdString()}}));
            continue;
        }
        if (snapshot.sourcePath != source || snapshot.id.empty()) {
            continue;
        }
        snapshot.contentPath =
            contentPath(m_backupDir, QString::fromStdString(snapshot.id)).toStdString();
        snapshots.push_back(std::move(snapshot));
    }

    std::sort(snapshots.begin(), snapshots.end(),
              [](const FileSnapshot &a, const FileSnapshot &b) {
                  if (a.createdAt != b.createdAt) {
                      return a.createdAt > b.createdAt;
                  }
                  if (a.sequence != b.sequence) {
                      return a.sequence > b.sequence;
                  }
                  return a.id > b.id;
              });
    return snapshots;
}

std::optional<FileSnapshot> BackupManager::latestSnapshot(const QString &path) const
{
    const auto snapshots = listSnapshots(path);
    if (snapshots.empty()) {
        return std::nullopt;
    }
    return snapshots.front();
}

std::string BackupManager::readSnapshot(const FileSnapshot &snapshot) const
{
    if (!snapshot.existed) {
        return {};
    }
    bool existed = false;
    std::string content = readTextFile(QString::fromStdString(snapshot.contentPath), &existed);
    if (!existed) {
        throw IoError("snapshot content missing: " + snapshot.contentPath);
    }
    return content;
}

bool BackupManager::restore(const QString &path)
{
    const auto snapshot = latestSnapshot(path);
    if (!snapshot.has_value()) {
        BLOG_INFO(QStringLiteral("BackupManager"),
                  QStringLiteral("restore"),
                  QStringLiteral("snapshot_missing"),
                  QStringLiteral("user_restore"),
                  QStringLiteral("manifest_scan"),
                  basmgr::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", path.toStdString()}}));
        return false;
    }

    if (snapshot->existed) {
        writeFileAtomically(path, readSnapshot(*snapshot));
    } else if (QFile::exists(path) && !QFile::remove(path)) {
        throw IoError("cannot remove " + path.toStdString());
    }

    BLOG_INFO(QStringLiteral("BackupManager"),
              QStringLiteral("restore"),
              QStringLiteral("snapshot_restored"),
              QStringLiteral("user_restore"),
              snapshot->existed ? QStringLiteral("atomic_write") : QStringLiteral("remove"),
              basmgr::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"id", snapshot->id},
                              {"path", path.toStdString()}}));
    return true;
}

} // namespace basmgr
