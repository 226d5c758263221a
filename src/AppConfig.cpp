#include "AppConfig.h"
#include "Errors.h"
#include "Logging.h"
#include <QCoreApplication>
#include <QDir>
#include <QSettings>

QString AppConfig::defaultFileName() {
    return QDir(QCoreApplication::applicationDirPath()).filePath(QStringLiteral("repairshop.ini"));
}

AppConfig AppConfig::load(const QString &fileName) {
    AppConfig config;
    QSettings settings(fileName, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qCWarning(lcApp) << "Could not parse" << fileName << ", using defaults";
        return config;
    }

    config.databasePath = settings.value(QStringLiteral("database/path"), config.databasePath).toString();
    config.allowNegativeStock = settings.value(QStringLiteral("inventory/allowNegativeStock"),
                                               config.allowNegativeStock).toBool();
    config.backupDirectory = settings.value(QStringLiteral("backup/directory"),
                                            config.backupDirectory).toString();

    bool ok = false;
    const int days = settings.value(QStringLiteral("backup/retentionDays"),
                                    config.backupRetentionDays).toInt(&ok);
    if (ok && days >= 0) {
        config.backupRetentionDays = days;
    } else {
        qCWarning(lcApp) << "Ignoring invalid backup/retentionDays in" << fileName;
    }
    config.backupOnStartup = settings.value(QStringLiteral("backup/onStartup"),
                                            config.backupOnStartup).toBool();
    return config;
}

void AppConfig::save(const QString &fileName) const {
    QSettings settings(fileName, QSettings::IniFormat);
    settings.setValue(QStringLiteral("database/path"), databasePath);
    settings.setValue(QStringLiteral("inventory/allowNegativeStock"), allowNegativeStock);
    settings.setValue(QStringLiteral("backup/directory"), backupDirectory);
    settings.setValue(QStringLiteral("backup/retentionDays"), backupRetentionDays);
    settings.setValue(QStringLiteral("backup/onStartup"), backupOnStartup);
    settings.sync();
    if (settings.status() != QSettings::NoError) {
        throw PersistenceError(QStringLiteral("Cannot write settings to %1").arg(fileName));
    }
}
