#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QString>

// Settings read from an INI file; missing keys keep their defaults
struct AppConfig {
    QString databasePath = QStringLiteral("repair_shop.db");
    bool allowNegativeStock = true;
    QString backupDirectory = QStringLiteral("backups");
    int backupRetentionDays = 15;
    bool backupOnStartup = true;

    static AppConfig load(const QString &fileName);
    // throws PersistenceError when the file cannot be written
    void save(const QString &fileName) const;

    static QString defaultFileName();
};

#endif // APPCONFIG_H
