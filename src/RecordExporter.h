#ifndef RECORDEXPORTER_H
#define RECORDEXPORTER_H

#include "CsvFile.h"
#include "Customer.h"
#include "Invoice.h"
#include "Part.h"
#include "WorkOrder.h"

#include <QVector>

class RecordStore;

struct ImportResult {
    int inserted = 0;
    int updated = 0;
    int skipped = 0;
};

// Maps typed records to CSV tables and back
class RecordExporter {
public:
    static CsvTable workOrderTable(const QVector<WorkOrder> &orders);
    static QVector<WorkOrder> workOrdersFromTable(const CsvTable &table);

    static CsvTable customerTable(const QVector<Customer> &customers);
    static QVector<Customer> customersFromTable(const CsvTable &table);

    static CsvTable partTable(const QVector<Part> &parts);
    static CsvTable invoiceTable(const QVector<Invoice> &invoices);

    static void exportWorkOrders(const RecordStore &store, const QString &fileName);
    static void exportCustomers(const RecordStore &store, const QString &fileName);
    static void exportParts(const RecordStore &store, const QString &fileName);
    static void exportInvoices(const RecordStore &store, const QString &fileName);

    // All rows in one transaction. A row whose id names an existing customer
    // updates it, any other row with both names is added, the rest are
    // skipped. Nothing is kept when a row fails.
    static ImportResult importCustomers(RecordStore &store, const QString &fileName);
};

#endif // RECORDEXPORTER_H
