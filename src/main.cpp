#include <QApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QMessageBox>
#include <QStyleFactory>
#include "AppConfig.h"
#include "BackupManager.h"
#include "DatabaseManager.h"
#include "Errors.h"
#include "InventoryLedger.h"
#include "InvoiceManager.h"
#include "Logging.h"
#include "MainWindow.h"
#include "ReportService.h"
#include "ShopDocuments.h"
#include "SqlRecordStore.h"
#include "WorkOrderLifecycle.h"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("RepairShop");
    app.setApplicationVersion("1.0");
    app.setOrganizationName("RepairShop");

    QCommandLineParser parser;
    parser.setApplicationDescription("Customers, equipment, work orders, parts and invoices of a repair shop");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "Settings file (INI).", "file");
    QCommandLineOption databaseOption({"d", "database"}, "SQLite database file.", "file");
    parser.addOption(configOption);
    parser.addOption(databaseOption);
    parser.process(app);

    const QString configFile = parser.isSet(configOption) ? parser.value(configOption)
                                                          : AppConfig::defaultFileName();
    AppConfig config = AppConfig::load(configFile);
    if (parser.isSet(databaseOption)) {
        config.databasePath = parser.value(databaseOption);
    }
    qCInfo(lcApp) << "Settings:" << configFile << "database:" << config.databasePath;

    // Fusion with a dark palette
    app.setStyle(QStyleFactory::create("Fusion"));
    QPalette p;
    p.setColor(QPalette::Window,          QColor(45,45,48));
    p.setColor(QPalette::WindowText,      Qt::white);
    p.setColor(QPalette::Base,            QColor(28,28,30));
    p.setColor(QPalette::AlternateBase,   QColor(45,45,48));
    p.setColor(QPalette::ToolTipBase,     QColor(28,28,30));
    p.setColor(QPalette::ToolTipText,     Qt::white);
    p.setColor(QPalette::Text,            Qt::white);
    p.setColor(QPalette::Button,          QColor(53,53,53));
    p.setColor(QPalette::ButtonText,      Qt::white);
    p.setColor(QPalette::BrightText,      Qt::red);
    p.setColor(QPalette::Highlight,       QColor(42,130,218));
    p.setColor(QPalette::HighlightedText, Qt::black);
    p.setColor(QPalette::Disabled, QPalette::Text,       QColor(100,100,100));
    p.setColor(QPalette::Disabled, QPalette::ButtonText, QColor(100,100,100));
    app.setPalette(p);

    BackupManager backups(config.backupDirectory, config.backupRetentionDays);
    if (config.backupOnStartup && QFileInfo::exists(config.databasePath)) {
        try {
            backups.backup(config.databasePath);
            backups.removeExpiredBackups(config.databasePath);
        } catch (const PersistenceError &e) {
            // start anyway
            qCWarning(lcBackup) << "Startup backup failed:" << e.message();
        }
    }

    DatabaseManager db;
    if (!db.open(config.databasePath)) {
        QMessageBox::critical(nullptr, "Database error",
                              QString("Could not open %1\n\n%2").arg(config.databasePath, db.lastError()));
        return 1;
    }

    StockPolicy policy;
    policy.allowNegativeStock = config.allowNegativeStock;

    SqlRecordStore store(db);
    InventoryLedger ledger(store, policy);
    WorkOrderLifecycle lifecycle(store, ledger);
    ReportService reports(store);
    InvoiceManager invoices(store);
    ShopDocuments documents(store);

    MainWindow w(ShopServices{store, ledger, lifecycle, reports, invoices, documents,
                              backups, config.databasePath});
    w.show();
    return app.exec();
}
