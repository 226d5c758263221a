#include <gtest/gtest.h>

#include "BackupManager.h"
#include "Errors.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

namespace {

class BackupManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.isValid());
        m_databaseFile = m_dir.filePath("repair_shop.db");
        QFile f(m_databaseFile);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("SQLite format 3");
    }

    QString backupDir() const { return m_dir.filePath("backups"); }

    // creates a file in the backup directory last modified at `when`
    void createOldFile(const QString &name, const QDateTime &when) {
        QDir().mkpath(backupDir());
        QFile f(QDir(backupDir()).filePath(name));
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("x");
        f.flush();
        ASSERT_TRUE(f.setFileTime(when, QFileDevice::FileModificationTime));
    }

    QTemporaryDir m_dir;
    QString m_databaseFile;
};

}  // namespace

TEST_F(BackupManagerTest, Backup_CopiesIntoTimestampedFile) {
    BackupManager backups(backupDir(), 15);
    const QString path = backups.backup(m_databaseFile);

    const QFileInfo info(path);
    EXPECT_TRUE(info.exists());
    EXPECT_EQ(info.dir().absolutePath(), QDir(backupDir()).absolutePath());
    EXPECT_TRUE(info.fileName().startsWith("repair_shop_"));
    EXPECT_TRUE(info.fileName().endsWith(".db"));

    QFile copy(path);
    ASSERT_TRUE(copy.open(QIODevice::ReadOnly));
    EXPECT_EQ(copy.readAll(), QByteArray("SQLite format 3"));
}

TEST_F(BackupManagerTest, Backup_TwiceInOneSecondKeepsBoth) {
    BackupManager backups(backupDir(), 15);
    const QString first = backups.backup(m_databaseFile);
    const QString second = backups.backup(m_databaseFile);
    EXPECT_NE(first, second);
    EXPECT_TRUE(QFileInfo::exists(first));
    EXPECT_TRUE(QFileInfo::exists(second));
}

TEST_F(BackupManagerTest, Backup_MissingDatabaseThrows) {
    BackupManager backups(backupDir(), 15);
    EXPECT_THROW(backups.backup(m_dir.filePath("missing.db")), PersistenceError);
}

TEST(BackupFileNameTest, UsesDateAndTime) {
    const QDateTime when(QDate(2024, 3, 9), QTime(14, 5, 7));
    EXPECT_EQ(BackupManager::backupFileName("repair_shop", when),
              QString("repair_shop_20240309_140507.db"));
}

TEST(BackupFileNameTest, RecognisesOnlyTimestampedNames) {
    EXPECT_TRUE(BackupManager::isBackupFileName("repair_shop_20240309_140507.db", "repair_shop"));
    EXPECT_TRUE(BackupManager::isBackupFileName("repair_shop_20240309_140507_2.db", "repair_shop"));
    EXPECT_FALSE(BackupManager::isBackupFileName("repair_shop.db", "repair_shop"));
    EXPECT_FALSE(BackupManager::isBackupFileName("repair_shop_old.db", "repair_shop"));
    EXPECT_FALSE(BackupManager::isBackupFileName("other_20240309_140507.db", "repair_shop"));
    EXPECT_FALSE(BackupManager::isBackupFileName("repair_shop_20240309_140507.db.tmp", "repair_shop"));
}

TEST_F(BackupManagerTest, Backup_PrefixWithPlaceholderKeepsCollisionSuffix) {
    // occupy the next few seconds so the backup has to take a suffix
    const QDateTime start = QDateTime::currentDateTime();
    for (int s = 0; s < 5; ++s) {
        createOldFile(BackupManager::backupFileName("shop%1", start.addSecs(s)), start);
    }

    BackupManager backups(backupDir(), 15);
    const QString name = QFileInfo(backups.backup(m_databaseFile, "shop%1")).fileName();
    EXPECT_TRUE(name.startsWith("shop%1_")) << name.toStdString();
    EXPECT_TRUE(name.endsWith("_1.db")) << name.toStdString();
}

TEST_F(BackupManagerTest, RemoveExpired_DeletesOnlyOldBackups) {
    const QDateTime now(QDate(2024, 6, 30), QTime(12, 0));
    createOldFile("repair_shop_20240610_120000.db", now.addDays(-20));
    createOldFile("repair_shop_20240610_120000_1.db", now.addDays(-20));
    createOldFile("repair_shop_20240627_120000.db", now.addDays(-3));
    createOldFile("notes_old.txt", now.addDays(-40));

    BackupManager backups(backupDir(), 15);
    EXPECT_EQ(backups.removeExpiredBackups(m_databaseFile, now), 2);

    const QDir dir(backupDir());
    EXPECT_FALSE(dir.exists("repair_shop_20240610_120000.db"));
    EXPECT_FALSE(dir.exists("repair_shop_20240610_120000_1.db"));
    EXPECT_TRUE(dir.exists("repair_shop_20240627_120000.db"));
    EXPECT_TRUE(dir.exists("notes_old.txt"));
}

TEST_F(BackupManagerTest, RemoveExpired_KeepsDatabaseAndUnrelatedFiles) {
    const QDateTime now(QDate(2024, 6, 30), QTime(12, 0));
    createOldFile("repair_shop.db", now.addDays(-20));
    createOldFile("other.db", now.addDays(-20));
    createOldFile("repair_shop_20240601_080000.db", now.addDays(-29));

    // backups kept beside the live database
    BackupManager backups(backupDir(), 15);
    const QString liveDatabase = QDir(backupDir()).filePath("repair_shop.db");
    EXPECT_EQ(backups.removeExpiredBackups(liveDatabase, now), 1);

    const QDir dir(backupDir());
    EXPECT_TRUE(dir.exists("repair_shop.db"));
    EXPECT_TRUE(dir.exists("other.db"));
    EXPECT_FALSE(dir.exists("repair_shop_20240601_080000.db"));
}

TEST_F(BackupManagerTest, RemoveExpired_NeverDeletesTheLiveDatabase) {
    const QDateTime now(QDate(2024, 6, 30), QTime(12, 0));
    // a database restored from a backup keeps the backup's name
    createOldFile("repair_shop_20240501_090000.db", now.addDays(-60));

    BackupManager backups(backupDir(), 15);
    const QString liveDatabase = QDir(backupDir()).filePath("repair_shop_20240501_090000.db");
    EXPECT_EQ(backups.removeExpiredBackups(liveDatabase, now), 0);
    EXPECT_TRUE(QFileInfo::exists(liveDatabase));
}

TEST_F(BackupManagerTest, RemoveExpired_MissingDirectoryIsNoop) {
    BackupManager backups(m_dir.filePath("nowhere"), 15);
    EXPECT_EQ(backups.removeExpiredBackups(m_databaseFile), 0);
}
