#include <gtest/gtest.h>

#include "AppConfig.h"

#include <QFile>
#include <QTemporaryDir>

TEST(AppConfigTest, MissingFileGivesDefaults) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const AppConfig config = AppConfig::load(dir.filePath("absent.ini"));
    EXPECT_EQ(config.databasePath, QString("repair_shop.db"));
    EXPECT_TRUE(config.allowNegativeStock);
    EXPECT_EQ(config.backupDirectory, QString("backups"));
    EXPECT_EQ(config.backupRetentionDays, 15);
    EXPECT_TRUE(config.backupOnStartup);
}

TEST(AppConfigTest, ReadsIniKeys) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString file = dir.filePath("shop.ini");
    {
        QFile f(file);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Text));
        f.write("[database]\n"
                "path=/srv/shop.db\n"
                "[inventory]\n"
                "allowNegativeStock=false\n"
                "[backup]\n"
                "directory=/srv/backups\n"
                "retentionDays=30\n"
                "onStartup=false\n");
    }

    const AppConfig config = AppConfig::load(file);
    EXPECT_EQ(config.databasePath, QString("/srv/shop.db"));
    EXPECT_FALSE(config.allowNegativeStock);
    EXPECT_EQ(config.backupDirectory, QString("/srv/backups"));
    EXPECT_EQ(config.backupRetentionDays, 30);
    EXPECT_FALSE(config.backupOnStartup);
}

TEST(AppConfigTest, InvalidRetentionKeepsDefault) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString file = dir.filePath("shop.ini");
    {
        QFile f(file);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Text));
        f.write("[backup]\nretentionDays=forever\n");
    }
    EXPECT_EQ(AppConfig::load(file).backupRetentionDays, 15);
}

TEST(AppConfigTest, SaveThenLoad) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString file = dir.filePath("saved.ini");

    AppConfig config;
    config.databasePath = "custom.db";
    config.allowNegativeStock = false;
    config.backupRetentionDays = 7;
    config.save(file);

    const AppConfig loaded = AppConfig::load(file);
    EXPECT_EQ(loaded.databasePath, QString("custom.db"));
    EXPECT_FALSE(loaded.allowNegativeStock);
    EXPECT_EQ(loaded.backupRetentionDays, 7);
    EXPECT_TRUE(loaded.backupOnStartup);
}
