#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "adapters/sudoers_adapter.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "store/backup_manager.hpp"

namespace {

const QByteArray kInitialSudoers =
    "# test sudoers\n"
    "Defaults env_reset\n"
    "root ALL=(ALL:ALL) ALL\n";

const char *kRule = "alice ALL=(ALL) NOPASSWD: /usr/bin/systemctl";

} // namespace

class SudoersAdapterTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testRejectedAddLeavesLiveFileUntouched();
    void testRejectedRemoveLeavesLiveFileUntouched();
    void testValidatorSeesStagedContent();
    void testAcceptedAddSwapsAndBacksUp();
    void testAddExistingRuleIsNoOp();
    void testRemove();
    void testRemoveMissingRuleSkipsValidator();
    void testPermissionsKept();
    void testMissingValidatorIsIoError();
    void testMissingSudoersIsIoError();
    void testList();
    void testRestoreLatestIsValidated();
    void testRepeatedRestoreIsStable();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QString m_caseDir;
    basmgr::ToolConfig m_config;

    void useValidator(const QString &script);
    QStringList stagingLeftovers() const;
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

void SudoersAdapterTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SudoersAdapterTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SudoersAdapterTests::init()
{
    static int counter = 0;
    m_caseDir = m_tempDir.path() + QStringLiteral("/case-%1").arg(++counter);
    QVERIFY(QDir().mkpath(m_caseDir + QStringLiteral("/etc")));

    m_config = basmgr::ToolConfig();
    m_config.rcFile = m_caseDir + QStringLiteral("/rc");
    m_config.sudoersPath = m_caseDir + QStringLiteral("/etc/sudoers");
    m_config.backupDir = m_caseDir + QStringLiteral("/backups");
    m_config.shell = QStringLiteral("sh");
    useValidator(QStringLiteral("exit 0"));

    writeFile(m_config.sudoersPath, kInitialSudoers);
}

// The staging file path arrives as $1.
void SudoersAdapterTests::useValidator(const QString &script)
{
    m_config.validatorProgram = QStringLiteral("sh");
    m_config.validatorArguments = {QStringLiteral("-c"), script, QStringLiteral("validator")};
}

QStringList SudoersAdapterTests::stagingLeftovers() const
{
    return QDir(m_caseDir + QStringLiteral("/etc"))
        .entryList({QStringLiteral("*basmgr*")}, QDir::Files | QDir::Hidden);
}

void SudoersAdapterTests::testRejectedAddLeavesLiveFileUntouched()
{
    useValidator(QStringLiteral("echo '>>> staged:2 syntax error near line 4 <<<' >&2; exit 1"));
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::SudoersAdapter sudoers(m_config, backups);

    bool thrown = false;
    try {
        sudoers.add(kRule);
    } catch (const basmgr::SudoersValidationError &ex) {
        thrown = true;
        QVERIFY(QString::fromStdString(ex.diagnostics()).contains(QStringLiteral("syntax error")));
    }
    QVERIFY(thrown);

    QCOMPARE(readFile(m_config.sudoersPath), kInitialSudoers);
    QVERIFY(stagingLeftovers().isEmpty());
    QVERIFY(backups.listSnapshots(m_config.sudoersPath).empty());
}

void SudoersAdapterTests::testRejectedRemoveLeavesLiveFileUntouched()
{
    useValidator(QStringLiteral("exit 1"));
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::SudoersAdapter sudoers(m_config, backups);

    QVERIFY_EXCEPTION_THROWN(sudoers.remove("root ALL=(ALL:ALL) ALL"),
                             basmgr::SudoersValidationError);
    QCOMPARE(readFile(m_config.sudoersPath), kInitialSudoers);
    QVERIFY(stagingLeftovers().isEmpty());
}

void SudoersAdapterTests::testValidatorSeesStagedContent()
{
    // Rejects any staged file that mentions "BROKEN", accepts everything else.
    useValidator(QStringLiteral("if grep -q BROKEN \"$1\"; then echo bad rule >&2; exit 1; fi"));
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::SudoersAdapter sudoers(m_config, backups);

    QVERIFY_EXCEPTION_THROWN(sudoers.add("BROKEN ALL="), basmgr::SudoersValidationError);
    QCOMPARE(readFile(m_config.sudoersPath), kInitialSudoers);

    QCOMPARE(sudoers.add(kRule), basmgr::EditOutcome::Added);
    QCOMPARE(readFile(m_config.sudoersPath), kInitialSudoers + kRule + "\n");
}

void SudoersAdapterTests::testAcceptedAddSwapsAndBacksUp()
{
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::SudoersAdapter sudoers(m_config, backups);

    QCOMPARE(sudoers.add(kRule), basmgr::EditOutcome::Added);
    QCOMPARE(readFile(m_config.sudoersPath), kInitialSudoers + kRule + "\n");
    QVERIFY(stagingLeftovers().isEmpty());

    const auto latest = backups.latestSnapshot(m_config.sudoersPath);
    QVERIFY(latest.has_value());
    QCOMPARE(QByteArray::fromStdString(backups.readSnapshot(*latest)), kInitialSudoers);
}

void SudoersAdapterTests::testAddExistingRuleIsNoOp()
{
    // A validator that always fails proves nothing was staged.
    useValidator(QStringLiteral("exit 1"));
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::SudoersAdapter sudoers(m_config, backups);

    QCOMPARE(sudoers.add("  root ALL=(ALL:ALL) ALL"), basmgr::EditOutcome::Unchanged);
    QCOMPARE(readFile(m_config.sudoersPath), kInitialSudoers);
    QVERIFY(backups.listSnapshots(m_config.sudoersPath).empty());
}

void SudoersAdapterTests::testRemove()
{
    writeFile(m_config.sudoersPath, kInitialSudoers + kRule + "\n");
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::SudoersAdapter sudoers(m_config, backups);

    QCOMPARE(sudoers.remove(kRule), static_cast<size_t>(1));
    QCOMPARE(readFile(m_config.sudoersPath), kInitialSudoers);
    QCOMPARE(backups.listSnapshots(m_config.sudoersPath).size(), static_cast<size_t>(1));
}

void SudoersAdapterTests::testRemoveMissingRuleSkipsValidator()
{
    useValidator(QStringLiteral("exit 1"));
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::SudoersAdapter sudoers(m_config, backups);

    QCOMPARE(sudoers.remove("bob ALL=(ALL) ALL"), static_cast<size_t>(0));
    QCOMPARE(readFile(m_config.sudoersPath), kInitialSudoers);
}

void SudoersAdapterTests::testPermissionsKept()
{
    const QFileDevice::Permissions readOnly =
        QFileDevice::ReadOwner | QFileDevice::ReadGroup;
    QVERIFY(QFile::setPermissions(m_config.sudoersPath, readOnly));

    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::SudoersAdapter sudoers(m_config, backups);
    sudoers.add(kRule);

    const QFileDevice::Permissions after = QFileInfo(m_config.sudoersPath).permissions();
    QVERIFY(after.testFlag(QFileDevice::ReadOwner));
    QVERIFY(after.testFlag(QFileDevice::ReadGroup));
    QVERIFY(!after.testFlag(QFileDevice::WriteOwner));
    QVERIFY(!after.testFlag(QFileDevice::ReadOther));
}

void SudoersAdapterTests::testMissingValidatorIsIoError()
{
    m_config.validatorProgram = QStringLiteral("/nonexistent/basmgr-visudo");
    m_config.validatorArguments.clear();
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::SudoersAdapter sudoers(m_config, backups);

    QVERIFY_EXCEPTION_THROWN(sudoers.add(kRule), basmgr::IoError);
    QCOMPARE(readFile(m_config.sudoersPath), kInitialSudoers);
    QVERIFY(stagingLeftovers().isEmpty());
}

void SudoersAdapterTests::testMissingSudoersIsIoError()
{
    QVERIFY(QFile::remove(m_config.sudoersPath));
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::SudoersAdapter sudoers(m_config, backups);

    QVERIFY_EXCEPTION_THROWN(sudoers.add(kRule), basmgr::IoError);
    QVERIFY_EXCEPTION_THROWN(sudoers.list(), basmgr::IoError);
    QVERIFY(!QFile::exists(m_config.sudoersPath));
}

void SudoersAdapterTests::testList()
{
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::SudoersAdapter sudoers(m_config, backups);

    const auto rules = sudoers.list();
    QCOMPARE(rules.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(rules[0].rawLine), QStringLiteral("Defaults env_reset"));
    QCOMPARE(QString::fromStdString(rules[1].rawLine), QStringLiteral("root ALL=(ALL:ALL) ALL"));
}

void SudoersAdapterTests::testRestoreLatestIsValidated()
{
    basmgr::BackupManager backups(m_config.backupDir);
    {
        basmgr::SudoersAdapter sudoers(m_config, backups);
        QVERIFY(!sudoers.restoreLatest());
        sudoers.add(kRule);
    }
    const QByteArray edited = readFile(m_config.sudoersPath);

    useValidator(QStringLiteral("exit 1"));
    {
        basmgr::SudoersAdapter sudoers(m_config, backups);
        QVERIFY_EXCEPTION_THROWN(sudoers.restoreLatest(), basmgr::SudoersValidationError);
        QCOMPARE(readFile(m_config.sudoersPath), edited);
    }

    useValidator(QStringLiteral("exit 0"));
    {
        basmgr::SudoersAdapter sudoers(m_config, backups);
        QVERIFY(sudoers.restoreLatest());
        QCOMPARE(readFile(m_config.sudoersPath), kInitialSudoers);
    }
}

void SudoersAdapterTests::testRepeatedRestoreIsStable()
{
    basmgr::BackupManager backups(m_config.backupDir);
    basmgr::SudoersAdapter sudoers(m_config, backups);
    sudoers.add(kRule);
    QCOMPARE(backups.listSnapshots(m_config.sudoersPath).size(), static_cast<size_t>(1));

    QVERIFY(sudoers.restoreLatest());
    QCOMPARE(readFile(m_config.sudoersPath), kInitialSudoers);
    QVERIFY(sudoers.restoreLatest());
    QCOMPARE(readFile(m_config.sudoersPath), kInitialSudoers);

    QCOMPARE(backups.listSnapshots(m_config.sudoersPath).size(), static_cast<size_t>(1));
    QVERIFY(stagingLeftovers().isEmpty());
}

QTEST_MAIN(SudoersAdapterTests)
#include "test_sudoers_adapter.moc"
