#ifndef SHOPSERVICES_H
#define SHOPSERVICES_H

#include <QString>

class BackupManager;
class RecordStore;
class InventoryLedger;
class WorkOrderLifecycle;
class ReportService;
class InvoiceManager;
class ShopDocuments;

// Everything the forms work through; owned by main()
struct ShopServices {
    RecordStore &store;
    InventoryLedger &ledger;
    WorkOrderLifecycle &lifecycle;
    ReportService &reports;
    InvoiceManager &invoices;
    ShopDocuments &documents;
    const BackupManager &backups;
    QString databaseFile;
};

#endif // SHOPSERVICES_H
