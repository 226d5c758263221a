#include "BackupManager.h"
#include "Errors.h"
#include "Logging.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>

BackupManager::BackupManager(const QString &directory, int retentionDays)
    : m_directory(directory)
    , m_retentionDays(retentionDays)
{
}

QString BackupManager::directory() const {
    return m_directory;
}

int BackupManager::retentionDays() const {
    return m_retentionDays;
}

QString BackupManager::backupFileName(const QString &prefix, const QDateTime &when) {
    return QStringLiteral("%1_%2.db").arg(prefix, when.toString(QStringLiteral("yyyyMMdd_HHmmss")));
}

bool BackupManager::isBackupFileName(const QString &fileName, const QString &prefix) {
    const QRegularExpression pattern(
        QStringLiteral("^%1_\\d{8}_\\d{6}(_\\d+)?\\.db$").arg(QRegularExpression::escape(prefix)));
    return pattern.match(fileName).hasMatch();
}

QString BackupManager::backup(const QString &databaseFile, const QString &prefix) const {
    if (!QFileInfo::exists(databaseFile)) {
        qCWarning(lcBackup) << "Nothing to back up," << databaseFile << "does not exist";
        throw PersistenceError(QStringLiteral("Database file %1 does not exist").arg(databaseFile));
    }

    QDir dir(m_directory);
    if (!dir.mkpath(QStringLiteral("."))) {
        throw PersistenceError(QStringLiteral("Cannot create backup directory %1").arg(m_directory));
    }

    const QString baseName = backupFileName(prefix, QDateTime::currentDateTime());
    QString target = dir.filePath(baseName);
    // two backups within the same second
    for (int n = 1; QFileInfo::exists(target); ++n) {
        target = dir.filePath(QStringLiteral("%1_%2.db")
                                  .arg(QFileInfo(baseName).completeBaseName(), QString::number(n)));
    }

    QFile source(databaseFile);
    if (!source.copy(target)) {
        qCWarning(lcBackup) << "Backup of" << databaseFile << "failed:" << source.errorString();
        throw PersistenceError(QStringLiteral("Backup to %1 failed: %2").arg(target, source.errorString()));
    }
    qCInfo(lcBackup) << "Backup created:" << target;
    return target;
}

int BackupManager::removeExpiredBackups(const QString &databaseFile, const QDateTime &now,
                                        const QString &prefix) const {
    QDir dir(m_directory);
    if (!dir.exists()) return 0;

    const QString liveDatabase = QFileInfo(databaseFile).canonicalFilePath();
    const QDateTime cutoff = now.addDays(-m_retentionDays);
    int removed = 0;
    const QFileInfoList files = dir.entryInfoList(QStringList() << QStringLiteral("*.db"), QDir::Files);
    for (const QFileInfo &info : files) {
        if (!isBackupFileName(info.fileName(), prefix)) continue;
        if (!liveDatabase.isEmpty() && info.canonicalFilePath() == liveDatabase) continue;
        if (info.lastModified() >= cutoff) continue;
        if (QFile::remove(info.absoluteFilePath())) {
            ++removed;
            qCInfo(lcBackup) << "Removed old backup:" << info.fileName();
        } else {
            qCWarning(lcBackup) << "Could not remove old backup:" << info.absoluteFilePath();
        }
    }
    return removed;
}
