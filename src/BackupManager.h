#ifndef BACKUPMANAGER_H
#define BACKUPMANAGER_H

#include <QString>
#include <QDateTime>

// Timestamped copies of the database file plus retention cleanup
class BackupManager {
public:
    BackupManager(const QString &directory, int retentionDays);

    QString directory() const;
    int retentionDays() const;

    // copies the file to <directory>/<prefix>_<yyyyMMdd_HHmmss>.db and
    // returns the new path; throws PersistenceError
    QString backup(const QString &databaseFile,
                   const QString &prefix = QStringLiteral("repair_shop")) const;

    // deletes <prefix>_<yyyyMMdd_HHmmss>[_N].db files last modified before
    // now - retentionDays; databaseFile itself is never removed.
    // Returns how many were removed.
    int removeExpiredBackups(const QString &databaseFile,
                             const QDateTime &now = QDateTime::currentDateTime(),
                             const QString &prefix = QStringLiteral("repair_shop")) const;

    static QString backupFileName(const QString &prefix, const QDateTime &when);
    static bool isBackupFileName(const QString &fileName, const QString &prefix);

private:
    QString m_directory;
    int m_retentionDays;
};

#endif // BACKUPMANAGER_H
