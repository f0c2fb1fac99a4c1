#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "adapters/rc_file_adapter.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "store/backup_manager.hpp"

class RcFileAdapterTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testMissingFileIsEmpty();
    void testAddListRemove();
    void testReplaceReportsUpdated();
    void testUnchangedWritesNothing();
    void testRemoveMissingKeepsFile();
    void testBackupBeforeWrite();
    void testBackupDisabled();
    void testInvalidInputTouchesNothing();
    void testRejectsSudoersKind();
    void testApplySourcesFile();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    basmgr::ToolConfig m_config;
};

static void writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "Failed to open file:" << path << file.errorString();
        return;
    }
    file.write(content);
}

static QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

void RcFileAdapterTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void RcFileAdapterTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void RcFileAdapterTests::init()
{
    static int counter = 0;
    const QString dir = m_tempDir.path() + QStringLiteral("/case-%1").arg(++counter);
    QVERIFY(QDir().mkpath(dir));

    m_config = basmgr::ToolConfig();
    m_config.rcFile = dir + QStringLiteral("/shell/rc_test");
    m_config.sudoersPath = dir + QStringLiteral("/sudoers");
    m_config.backupDir = dir + QStringLiteral("/backups");
    m_config.shell = QStringLiteral("sh");
    m_config.backupRcOnWrite = true;
}

void RcFileAdapterTests::testMissingFileIsEmpty()
{
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::RcFileAdapter rc(m_config, backups);

    QVERIFY(rc.list(basmgr::EntryKind::Alias).empty());
    QCOMPARE(rc.remove(basmgr::EntryKind::Export, "NOPE"), static_cast<size_t>(0));
    QVERIFY(!QFile::exists(m_config.rcFile));

    QCOMPARE(rc.add(basmgr::EntryKind::Alias, "ll", "ls -l"), basmgr::EditOutcome::Added);
    QCOMPARE(readFile(m_config.rcFile), QByteArray("alias ll='ls -l'\n"));
}

void RcFileAdapterTests::testAddListRemove()
{
    QVERIFY(QDir().mkpath(QFileInfo(m_config.rcFile).absolutePath()));
    writeFile(m_config.rcFile, "# test rc\nexport PATH=/usr/bin\n");

    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::RcFileAdapter rc(m_config, backups);

    rc.add(basmgr::EntryKind::Alias, "greet", "echo hello");
    rc.add(basmgr::EntryKind::Export, "FOO", "bar baz");
    QCOMPARE(readFile(m_config.rcFile),
             QByteArray("# test rc\nexport PATH=/usr/bin\nalias greet='echo hello'\n"
                        "export FOO=\"bar baz\"\n"));

    const auto aliases = rc.list(basmgr::EntryKind::Alias);
    QCOMPARE(aliases.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(aliases.front().rawLine),
             QStringLiteral("alias greet='echo hello'"));

    const auto exports = rc.list(basmgr::EntryKind::Export);
    QCOMPARE(exports.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(exports[1].value), QStringLiteral("bar baz"));

    QCOMPARE(rc.remove(basmgr::EntryKind::Alias, "greet"), static_cast<size_t>(1));
    QCOMPARE(rc.remove(basmgr::EntryKind::Export, "FOO"), static_cast<size_t>(1));
    QCOMPARE(readFile(m_config.rcFile), QByteArray("# test rc\nexport PATH=/usr/bin\n"));
}

void RcFileAdapterTests::testReplaceReportsUpdated()
{
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::RcFileAdapter rc(m_config, backups);

    QCOMPARE(rc.add(basmgr::EntryKind::Export, "EDITOR", "vi"), basmgr::EditOutcome::Added);
    QCOMPARE(rc.add(basmgr::EntryKind::Export, "EDITOR", "nvim"), basmgr::EditOutcome::Updated);
    QCOMPARE(readFile(m_config.rcFile), QByteArray("export EDITOR=nvim\n"));
}

void RcFileAdapterTests::testUnchangedWritesNothing()
{
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::RcFileAdapter rc(m_config, backups);

    rc.add(basmgr::EntryKind::Alias, "ll", "ls -l");
    const auto snapshotsAfterFirst = backups.listSnapshots(m_config.rcFile).size();

    QCOMPARE(rc.add(basmgr::EntryKind::Alias, "ll", "ls -l"), basmgr::EditOutcome::Unchanged);
    QCOMPARE(backups.listSnapshots(m_config.rcFile).size(), snapshotsAfterFirst);
    QCOMPARE(readFile(m_config.rcFile), QByteArray("alias ll='ls -l'\n"));
}

void RcFileAdapterTests::testRemoveMissingKeepsFile()
{
    QVERIFY(QDir().mkpath(QFileInfo(m_config.rcFile).absolutePath()));
    writeFile(m_config.rcFile, "alias a='1'");

    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::RcFileAdapter rc(m_config, backups);

    QCOMPARE(rc.remove(basmgr::EntryKind::Alias, "b"), static_cast<size_t>(0));
    QCOMPARE(readFile(m_config.rcFile), QByteArray("alias a='1'"));
    QVERIFY(backups.listSnapshots(m_config.rcFile).empty());
}

void RcFileAdapterTests::testBackupBeforeWrite()
{
    QVERIFY(QDir().mkpath(QFileInfo(m_config.rcFile).absolutePath()));
    writeFile(m_config.rcFile, "alias a='1'\n");

    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::RcFileAdapter rc(m_config, backups);
    rc.add(basmgr::EntryKind::Alias, "a", "2");

    const auto latest = backups.latestSnapshot(m_config.rcFile);
    QVERIFY(latest.has_value());
    QCOMPARE(QByteArray::fromStdString(backups.readSnapshot(*latest)), QByteArray("alias a='1'\n"));

    QVERIFY(backups.restore(m_config.rcFile));
    QCOMPARE(readFile(m_config.rcFile), QByteArray("alias a='1'\n"));
}

void RcFileAdapterTests::testBackupDisabled()
{
    m_config.backupRcOnWrite = false;
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::RcFileAdapter rc(m_config, backups);

    rc.add(basmgr::EntryKind::Alias, "a", "1");
    QVERIFY(backups.listSnapshots(m_config.rcFile).empty());
}

void RcFileAdapterTests::testInvalidInputTouchesNothing()
{
    QVERIFY(QDir().mkpath(QFileInfo(m_config.rcFile).absolutePath()));
    writeFile(m_config.rcFile, "export A=1\n");

    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::RcFileAdapter rc(m_config, backups);

    QVERIFY_EXCEPTION_THROWN(rc.add(basmgr::EntryKind::Alias, "bad\nname", "x"),
                             basmgr::ValidationError);
    QVERIFY_EXCEPTION_THROWN(rc.add(basmgr::EntryKind::Export, "OK", "line1\nline2"),
                             basmgr::ValidationError);
    QCOMPARE(readFile(m_config.rcFile), QByteArray("export A=1\n"));
    QVERIFY(!QDir(m_config.backupDir).exists());
}

void RcFileAdapterTests::testRejectsSudoersKind()
{
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::RcFileAdapter rc(m_config, backups);

    QVERIFY_EXCEPTION_THROWN(
        rc.add(basmgr::EntryKind::SudoersRule, "alice ALL=(ALL) ALL", "alice ALL=(ALL) ALL"),
        basmgr::ValidationError);
    QVERIFY(!QFile::exists(m_config.rcFile));
}

void RcFileAdapterTests::testApplySourcesFile()
{
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::RcFileAdapter rc(m_config, backups);
    rc.add(basmgr::EntryKind::Export, "BASM_APPLY_CHECK", "ok");

    const auto good = rc.apply();
    QVERIFY(good.started);
    QCOMPARE(good.exitCode, 0);

    writeFile(m_config.rcFile, "exit 7\n");
    const auto bad = rc.apply();
    QVERIFY(!bad.succeeded());
    QCOMPARE(bad.exitCode, 7);
}

QTEST_MAIN(RcFileAdapterTests)
#include "test_rc_file_adapter.moc"
