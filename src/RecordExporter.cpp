#include "RecordExporter.h"
#include "Errors.h"
#include "Logging.h"
#include "RecordStore.h"

namespace {

const QStringList kWorkOrderColumns = {
    QStringLiteral("id"), QStringLiteral("equipment_id"), QStringLiteral("technician_id"),
    QStringLiteral("description"), QStringLiteral("status"), QStringLiteral("date_opened"),
    QStringLiteral("date_closed"), QStringLiteral("due_date")
};

const QStringList kCustomerColumns = {
    QStringLiteral("id"), QStringLiteral("first_name"), QStringLiteral("last_name"),
    QStringLiteral("phone"), QStringLiteral("email"), QStringLiteral("address"),
    QStringLiteral("notes")
};

const QStringList kPartColumns = {
    QStringLiteral("id"), QStringLiteral("sku"), QStringLiteral("description"),
    QStringLiteral("quantity"), QStringLiteral("unit_cost")
};

const QStringList kInvoiceColumns = {
    QStringLiteral("id"), QStringLiteral("work_order_id"), QStringLiteral("amount"),
    QStringLiteral("status"), QStringLiteral("issued_on"), QStringLiteral("due_date"),
    QStringLiteral("notes")
};

QString dateText(const QDate &date) {
    return date.isValid() ? date.toString(Qt::ISODate) : QString();
}

QDate parseDate(const QString &text) {
    return QDate::fromString(text.trimmed(), Qt::ISODate);
}

} // namespace

CsvTable RecordExporter::workOrderTable(const QVector<WorkOrder> &orders) {
    CsvTable table;
    table.header = kWorkOrderColumns;
    for (const WorkOrder &wo : orders) {
        table.rows.append(QStringList{
            QString::number(wo.id()),
            QString::number(wo.equipmentId()),
            wo.technicianId() ? QString::number(*wo.technicianId()) : QString(),
            wo.description(),
            WorkOrder::statusToString(wo.status()),
            dateText(wo.dateOpened()),
            dateText(wo.dateClosed()),
            dateText(wo.dueDate())
        });
    }
    return table;
}

QVector<WorkOrder> RecordExporter::workOrdersFromTable(const CsvTable &table) {
    QVector<WorkOrder> orders;
    for (int row = 0; row < table.rows.size(); ++row) {
        WorkOrder wo;
        wo.setId(table.value(row, QStringLiteral("id")).toInt());
        wo.setEquipmentId(table.value(row, QStringLiteral("equipment_id")).toInt());

        bool ok = false;
        const int technicianId = table.value(row, QStringLiteral("technician_id")).toInt(&ok);
        wo.setTechnicianId(ok ? std::optional<int>(technicianId) : std::nullopt);

        wo.setDescription(table.value(row, QStringLiteral("description")));
        wo.setStatus(WorkOrder::statusFromString(table.value(row, QStringLiteral("status"))));
        wo.setDateOpened(parseDate(table.value(row, QStringLiteral("date_opened"))));
        wo.setDateClosed(parseDate(table.value(row, QStringLiteral("date_closed"))));
        wo.setDueDate(parseDate(table.value(row, QStringLiteral("due_date"))));
        orders.append(wo);
    }
    return orders;
}

CsvTable RecordExporter::customerTable(const QVector<Customer> &customers) {
    CsvTable table;
    table.header = kCustomerColumns;
    for (const Customer &c : customers) {
        table.rows.append(QStringList{
            QString::number(c.id()), c.firstName(), c.lastName(),
            c.phone(), c.email(), c.address(), c.notes()
        });
    }
    return table;
}

QVector<Customer> RecordExporter::customersFromTable(const CsvTable &table) {
    QVector<Customer> customers;
    for (int row = 0; row < table.rows.size(); ++row) {
        Customer c(table.value(row, QStringLiteral("first_name")).trimmed(),
                   table.value(row, QStringLiteral("last_name")).trimmed(),
                   table.value(row, QStringLiteral("phone")).trimmed(),
                   table.value(row, QStringLiteral("email")).trimmed(),
                   table.value(row, QStringLiteral("address")).trimmed());
        c.setNotes(table.value(row, QStringLiteral("notes")));
        c.setId(table.value(row, QStringLiteral("id")).toInt());
        customers.append(c);
    }
    return customers;
}

CsvTable RecordExporter::partTable(const QVector<Part> &parts) {
    CsvTable table;
    table.header = kPartColumns;
    for (const Part &p : parts) {
        table.rows.append(QStringList{
            QString::number(p.id()), p.sku(), p.description(),
            QString::number(p.quantity()), QString::number(p.unitCost(), 'f', 2)
        });
    }
    return table;
}

CsvTable RecordExporter::invoiceTable(const QVector<Invoice> &invoices) {
    CsvTable table;
    table.header = kInvoiceColumns;
    for (const Invoice &inv : invoices) {
        table.rows.append(QStringList{
            QString::number(inv.id()), QString::number(inv.workOrderId()),
            QString::number(inv.amount(), 'f', 2), Invoice::statusToString(inv.status()),
            dateText(inv.issuedOn()), dateText(inv.dueDate()), inv.notes()
        });
    }
    return table;
}

void RecordExporter::exportWorkOrders(const RecordStore &store, const QString &fileName) {
    CsvFile::write(workOrderTable(store.workOrders()), fileName);
}

void RecordExporter::exportCustomers(const RecordStore &store, const QString &fileName) {
    CsvFile::write(customerTable(store.customers()), fileName);
}

void RecordExporter::exportParts(const RecordStore &store, const QString &fileName) {
    CsvFile::write(partTable(store.parts()), fileName);
}

void RecordExporter::exportInvoices(const RecordStore &store, const QString &fileName) {
    CsvFile::write(invoiceTable(store.invoices()), fileName);
}

ImportResult RecordExporter::importCustomers(RecordStore &store, const QString &fileName) {
    const CsvTable table = CsvFile::read(fileName);
    if (table.columnIndex(QStringLiteral("first_name")) < 0
            || table.columnIndex(QStringLiteral("last_name")) < 0) {
        throw ValidationError(QStringLiteral("%1 has no first_name/last_name columns").arg(fileName));
    }

    ImportResult result;
    TransactionGuard tx(store);
    for (Customer c : customersFromTable(table)) {
        if (c.firstName().isEmpty() || c.lastName().isEmpty()) {
            ++result.skipped;
            continue;
        }
        if (c.id() > 0 && store.updateCustomer(c)) {
            ++result.updated;
            continue;
        }
        c.setId(0);
        store.addCustomer(c);
        ++result.inserted;
    }
    tx.commit();

    qCInfo(lcExport) << "Imported customers from" << fileName << "inserted" << result.inserted
                     << "updated" << result.updated << "skipped" << result.skipped;
    return result;
}
