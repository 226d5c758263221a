#ifndef DATABASEMANAGER_H
#define DATABASEMANAGER_H

#include <QSqlDatabase>
#include <QString>

// Owns one named QSQLITE connection. Created once by the composition root and
// handed to the record store; there is no process-wide instance.
class DatabaseManager {
public:
    DatabaseManager();
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager &) = delete;
    DatabaseManager &operator=(const DatabaseManager &) = delete;

    /// opens (or creates) the file, enables foreign keys and applies migrations
    bool open(const QString &fileName);
    void close();
    bool isOpen() const;

    QSqlDatabase database() const;
    QString fileName() const;
    QString lastError() const;

    int schemaVersion() const;
    static int latestSchemaVersion();

    /// create required tables if they do not exist
    bool createSchema();

private:
    bool execOrFail(const QString &sql);

    QString m_connectionName;
    QSqlDatabase m_db;
    QString m_lastError;
};

#endif // DATABASEMANAGER_H
