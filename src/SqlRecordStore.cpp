#include "SqlRecordStore.h"
#include "DatabaseManager.h"
#include "Errors.h"
#include "Logging.h"
#include <QSqlError>
#include <QVariant>

namespace {

const char kCustomerColumns[] = "id, first_name, last_name, phone, email, address, notes";
const char kEquipmentColumns[] =
    "id, customer_id, make, model, cpu, ram, storage, os, serial_number, notes";
const char kPartColumns[] = "id, sku, description, quantity, unit_cost";
const char kWorkOrderColumns[] =
    "w.id, w.equipment_id, w.technician_id, w.description, w.status, "
    "w.date_opened, w.date_closed, w.due_date";
const char kInvoiceColumns[] =
    "id, work_order_id, amount, status, issued_on, due_date, notes";

QVariant dateValue(const QDate &date) {
    return date.isValid() ? QVariant(date.toString(Qt::ISODate)) : QVariant();
}

QDate dateFrom(const QVariant &value) {
    return QDate::fromString(value.toString(), Qt::ISODate);
}

QString direction(Qt::SortOrder order) {
    return order == Qt::AscendingOrder ? QStringLiteral("ASC") : QStringLiteral("DESC");
}

Customer customerFromRow(const QSqlQuery &q) {
    Customer c(q.value(1).toString(), q.value(2).toString(), q.value(3).toString(),
               q.value(4).toString(), q.value(5).toString());
    c.setId(q.value(0).toInt());
    c.setNotes(q.value(6).toString());
    return c;
}

Equipment equipmentFromRow(const QSqlQuery &q) {
    Equipment e(q.value(1).toInt(), q.value(2).toString(), q.value(3).toString(),
                q.value(8).toString());
    e.setId(q.value(0).toInt());
    e.setCpu(q.value(4).toString());
    e.setRam(q.value(5).toString());
    e.setStorage(q.value(6).toString());
    e.setOs(q.value(7).toString());
    e.setNotes(q.value(9).toString());
    return e;
}

Part partFromRow(const QSqlQuery &q) {
    Part p(q.value(1).toString(), q.value(2).toString(), q.value(3).toInt(),
           q.value(4).toDouble());
    p.setId(q.value(0).toInt());
    return p;
}

WorkOrder workOrderFromRow(const QSqlQuery &q) {
    std::optional<int> technicianId;
    if (!q.value(2).isNull()) {
        technicianId = q.value(2).toInt();
    }
    WorkOrder w(q.value(1).toInt(), technicianId, q.value(3).toString(),
                dateFrom(q.value(5)));
    w.setId(q.value(0).toInt());
    w.setStatus(WorkOrder::statusFromString(q.value(4).toString()));
    w.setDateClosed(dateFrom(q.value(6)));
    w.setDueDate(dateFrom(q.value(7)));
    return w;
}

void requireNames(const Customer &customer) {
    if (customer.firstName().trimmed().isEmpty() || customer.lastName().trimmed().isEmpty()) {
        throw ValidationError("Customer first and last name are required");
    }
}

Invoice invoiceFromRow(const QSqlQuery &q) {
    Invoice inv(q.value(1).toInt(), q.value(2).toDouble(), dateFrom(q.value(4)));
    inv.setId(q.value(0).toInt());
    inv.setStatus(Invoice::statusFromString(q.value(3).toString()));
    inv.setDueDate(dateFrom(q.value(5)));
    inv.setNotes(q.value(6).toString());
    return inv;
}

} // namespace

SqlRecordStore::SqlRecordStore(DatabaseManager &db)
    : m_db(db) {
}

// ─── plumbing ───────────────────────────────────────────────────────────────

QSqlQuery SqlRecordStore::prepare(const QString &sql) const {
    QSqlQuery query(m_db.database());
    if (!query.prepare(sql)) {
        qCWarning(lcStore) << "Prepare failed:" << query.lastError().text() << sql;
        throw PersistenceError(QStringLiteral("Cannot prepare statement: %1")
                                   .arg(query.lastError().text()));
    }
    return query;
}

void SqlRecordStore::exec(QSqlQuery &query, const char *what) const {
    if (!query.exec()) {
        qCWarning(lcStore) << "Failed to" << what << ":" << query.lastError().text();
        throw PersistenceError(QStringLiteral("Failed to %1: %2")
                                   .arg(QLatin1String(what), query.lastError().text()));
    }
}

int SqlRecordStore::insert(QSqlQuery &query, const char *what) {
    exec(query, what);
    const int id = query.lastInsertId().toInt();
    qCDebug(lcStore) << what << "-> id" << id;
    return id;
}

bool SqlRecordStore::rowExists(const char *table, int id) const {
    QSqlQuery query = prepare(QStringLiteral("SELECT 1 FROM %1 WHERE id = :id")
                                  .arg(QLatin1String(table)));
    query.bindValue(":id", id);
    exec(query, "look up row");
    return query.next();
}

void SqlRecordStore::requireParent(const char *table, int id, const char *what) const {
    if (!rowExists(table, id)) {
        throw ReferenceError(QStringLiteral("%1 #%2 does not exist")
                                 .arg(QLatin1String(what), QString::number(id)));
    }
}

void SqlRecordStore::beginTransaction() {
    QSqlDatabase db = m_db.database();
    if (!db.transaction()) {
        throw PersistenceError(QStringLiteral("Cannot begin transaction: %1")
                                   .arg(db.lastError().text()));
    }
}

void SqlRecordStore::commitTransaction() {
    QSqlDatabase db = m_db.database();
    if (!db.commit()) {
        throw PersistenceError(QStringLiteral("Cannot commit transaction: %1")
                                   .arg(db.lastError().text()));
    }
}

void SqlRecordStore::rollbackTransaction() {
    QSqlDatabase db = m_db.database();
    if (!db.rollback()) {
        throw PersistenceError(QStringLiteral("Cannot roll back transaction: %1")
                                   .arg(db.lastError().text()));
    }
}

// ─── customers ──────────────────────────────────────────────────────────────

int SqlRecordStore::addCustomer(const Customer &customer) {
    requireNames(customer);
    QSqlQuery query = prepare("INSERT INTO customers(first_name, last_name, phone, email, address, notes) "
                              "VALUES(:first, :last, :phone, :email, :address, :notes)");
    query.bindValue(":first", customer.firstName().trimmed());
    query.bindValue(":last", customer.lastName().trimmed());
    query.bindValue(":phone", customer.phone());
    query.bindValue(":email", customer.email());
    query.bindValue(":address", customer.address());
    query.bindValue(":notes", customer.notes());
    return insert(query, "insert customer");
}

bool SqlRecordStore::updateCustomer(const Customer &customer) {
    requireNames(customer);
    QSqlQuery query = prepare("UPDATE customers SET first_name = :first, last_name = :last, phone = :phone, "
                              "email = :email, address = :address, notes = :notes WHERE id = :id");
    query.bindValue(":first", customer.firstName().trimmed());
    query.bindValue(":last", customer.lastName().trimmed());
    query.bindValue(":phone", customer.phone());
    query.bindValue(":email", customer.email());
    query.bindValue(":address", customer.address());
    query.bindValue(":notes", customer.notes());
    query.bindValue(":id", customer.id());
    exec(query, "update customer");
    if (query.numRowsAffected() == 0) {
        return false;
    }
    qCDebug(lcStore) << "update customer -> id" << customer.id();
    return true;
}

Customer SqlRecordStore::customer(int id) const {
    QSqlQuery query = prepare(QStringLiteral("SELECT %1 FROM customers WHERE id = :id")
                                  .arg(QLatin1String(kCustomerColumns)));
    query.bindValue(":id", id);
    exec(query, "load customer");
    if (!query.next()) {
        throw NotFoundError(QStringLiteral("Customer #%1 not found").arg(id));
    }
    return customerFromRow(query);
}

QVector<Customer> SqlRecordStore::customers() const {
    QSqlQuery query = prepare(QStringLiteral("SELECT %1 FROM customers "
                                             "ORDER BY last_name COLLATE NOCASE, first_name COLLATE NOCASE, id")
                                  .arg(QLatin1String(kCustomerColumns)));
    exec(query, "list customers");
    QVector<Customer> result;
    while (query.next()) {
        result.append(customerFromRow(query));
    }
    return result;
}

// ─── equipment ──────────────────────────────────────────────────────────────

int SqlRecordStore::addEquipment(const Equipment &equipment) {
    requireParent("customers", equipment.customerId(), "Customer");
    QSqlQuery query = prepare("INSERT INTO equipment(customer_id, make, model, cpu, ram, storage, os, "
                              "serial_number, notes) "
                              "VALUES(:customer, :make, :model, :cpu, :ram, :storage, :os, :serial, :notes)");
    query.bindValue(":customer", equipment.customerId());
    query.bindValue(":make", equipment.make());
    query.bindValue(":model", equipment.model());
    query.bindValue(":cpu", equipment.cpu());
    query.bindValue(":ram", equipment.ram());
    query.bindValue(":storage", equipment.storage());
    query.bindValue(":os", equipment.os());
    query.bindValue(":serial", equipment.serialNumber());
    query.bindValue(":notes", equipment.notes());
    return insert(query, "insert equipment");
}

Equipment SqlRecordStore::equipment(int id) const {
    QSqlQuery query = prepare(QStringLiteral("SELECT %1 FROM equipment WHERE id = :id")
                                  .arg(QLatin1String(kEquipmentColumns)));
    query.bindValue(":id", id);
    exec(query, "load equipment");
    if (!query.next()) {
        throw NotFoundError(QStringLiteral("Equipment #%1 not found").arg(id));
    }
    return equipmentFromRow(query);
}

QVector<Equipment> SqlRecordStore::equipmentForCustomer(int customerId) const {
    QSqlQuery query = prepare(QStringLiteral("SELECT %1 FROM equipment WHERE customer_id = :customer ORDER BY id")
                                  .arg(QLatin1String(kEquipmentColumns)));
    query.bindValue(":customer", customerId);
    exec(query, "list equipment");
    QVector<Equipment> result;
    while (query.next()) {
        result.append(equipmentFromRow(query));
    }
    return result;
}

QVector<Equipment> SqlRecordStore::allEquipment() const {
    QSqlQuery query = prepare(QStringLiteral("SELECT %1 FROM equipment ORDER BY id")
                                  .arg(QLatin1String(kEquipmentColumns)));
    exec(query, "list equipment");
    QVector<Equipment> result;
    while (query.next()) {
        result.append(equipmentFromRow(query));
    }
    return result;
}

// ─── technicians ────────────────────────────────────────────────────────────

int SqlRecordStore::addTechnician(const Technician &technician) {
    if (technician.name().trimmed().isEmpty()) {
        throw ValidationError("Technician name is required");
    }
    QSqlQuery query = prepare("INSERT INTO technicians(name) VALUES(:name)");
    query.bindValue(":name", technician.name().trimmed());
    return insert(query, "insert technician");
}

Technician SqlRecordStore::technician(int id) const {
    QSqlQuery query = prepare("SELECT id, name FROM technicians WHERE id = :id");
    query.bindValue(":id", id);
    exec(query, "load technician");
    if (!query.next()) {
        throw NotFoundError(QStringLiteral("Technician #%1 not found").arg(id));
    }
    Technician t(query.value(1).toString());
    t.setId(query.value(0).toInt());
    return t;
}

QVector<Technician> SqlRecordStore::technicians() const {
    QSqlQuery query = prepare("SELECT id, name FROM technicians ORDER BY name COLLATE NOCASE, id");
    exec(query, "list technicians");
    QVector<Technician> result;
    while (query.next()) {
        Technician t(query.value(1).toString());
        t.setId(query.value(0).toInt());
        result.append(t);
    }
    return result;
}

// ─── parts ──────────────────────────────────────────────────────────────────

int SqlRecordStore::addPart(const Part &part) {
    const QString sku = part.sku().trimmed();
    if (sku.isEmpty()) {
        throw ValidationError("Part SKU is required");
    }
    if (part.quantity() < 0) {
        throw ValidationError(QStringLiteral("Part %1: quantity cannot be negative").arg(sku));
    }
    if (part.unitCost() < 0) {
        throw ValidationError(QStringLiteral("Part %1: unit cost cannot be negative").arg(sku));
    }
    QSqlQuery dup = prepare("SELECT 1 FROM parts WHERE sku = :sku");
    dup.bindValue(":sku", sku);
    exec(dup, "check sku");
    if (dup.next()) {
        throw ValidationError(QStringLiteral("Part %1 already exists").arg(sku));
    }

    QSqlQuery query = prepare("INSERT INTO parts(sku, description, quantity, unit_cost) "
                              "VALUES(:sku, :desc, :qty, :cost)");
    query.bindValue(":sku", sku);
    query.bindValue(":desc", part.description());
    query.bindValue(":qty", part.quantity());
    query.bindValue(":cost", part.unitCost());
    return insert(query, "insert part");
}

Part SqlRecordStore::part(int id) const {
    QSqlQuery query = prepare(QStringLiteral("SELECT %1 FROM parts WHERE id = :id")
                                  .arg(QLatin1String(kPartColumns)));
    query.bindValue(":id", id);
    exec(query, "load part");
    if (!query.next()) {
        throw NotFoundError(QStringLiteral("Part #%1 not found").arg(id));
    }
    return partFromRow(query);
}

QVector<Part> SqlRecordStore::parts() const {
    QSqlQuery query = prepare(QStringLiteral("SELECT %1 FROM parts ORDER BY sku")
                                  .arg(QLatin1String(kPartColumns)));
    exec(query, "list parts");
    QVector<Part> result;
    while (query.next()) {
        result.append(partFromRow(query));
    }
    return result;
}

void SqlRecordStore::adjustPartQuantity(int partId, int delta) {
    QSqlQuery query = prepare("UPDATE parts SET quantity = quantity + :delta WHERE id = :id");
    query.bindValue(":delta", delta);
    query.bindValue(":id", partId);
    exec(query, "update stock");
    if (query.numRowsAffected() == 0) {
        throw NotFoundError(QStringLiteral("Part #%1 not found").arg(partId));
    }
}

// ─── work orders ────────────────────────────────────────────────────────────

int SqlRecordStore::addWorkOrder(const WorkOrder &order) {
    if (!order.dateOpened().isValid()) {
        throw ValidationError("Work order needs an opening date");
    }
    requireParent("equipment", order.equipmentId(), "Equipment");
    if (order.technicianId()) {
        requireParent("technicians", *order.technicianId(), "Technician");
    }
    QSqlQuery query = prepare("INSERT INTO work_orders(equipment_id, technician_id, description, status, "
                              "date_opened, date_closed, due_date) "
                              "VALUES(:equipment, :tech, :desc, :status, :opened, :closed, :due)");
    query.bindValue(":equipment", order.equipmentId());
    query.bindValue(":tech", order.technicianId() ? QVariant(*order.technicianId()) : QVariant());
    query.bindValue(":desc", order.description());
    query.bindValue(":status", WorkOrder::statusToString(order.status()));
    query.bindValue(":opened", dateValue(order.dateOpened()));
    query.bindValue(":closed", dateValue(order.dateClosed()));
    query.bindValue(":due", dateValue(order.dueDate()));
    return insert(query, "insert work order");
}

WorkOrder SqlRecordStore::workOrder(int id) const {
    QSqlQuery query = prepare(QStringLiteral("SELECT %1 FROM work_orders w WHERE w.id = :id")
                                  .arg(QLatin1String(kWorkOrderColumns)));
    query.bindValue(":id", id);
    exec(query, "load work order");
    if (!query.next()) {
        throw NotFoundError(QStringLiteral("Work order #%1 not found").arg(id));
    }
    return workOrderFromRow(query);
}

QVector<WorkOrder> SqlRecordStore::workOrders(Qt::SortOrder order) const {
    QSqlQuery query = prepare(QStringLiteral("SELECT %1 FROM work_orders w ORDER BY w.date_opened %2, w.id %2")
                                  .arg(QLatin1String(kWorkOrderColumns), direction(order)));
    exec(query, "list work orders");
    QVector<WorkOrder> result;
    while (query.next()) {
        result.append(workOrderFromRow(query));
    }
    return result;
}

QVector<WorkOrder> SqlRecordStore::workOrdersWithStatus(WorkOrder::Status status,
                                                        Qt::SortOrder order) const {
    QSqlQuery query = prepare(QStringLiteral("SELECT %1 FROM work_orders w WHERE w.status = :status "
                                             "ORDER BY w.date_opened %2, w.id %2")
                                  .arg(QLatin1String(kWorkOrderColumns), direction(order)));
    query.bindValue(":status", WorkOrder::statusToString(status));
    exec(query, "list work orders");
    QVector<WorkOrder> result;
    while (query.next()) {
        result.append(workOrderFromRow(query));
    }
    return result;
}

QVector<WorkOrder> SqlRecordStore::workOrdersForCustomer(int customerId, Qt::SortOrder order) const {
    QSqlQuery query = prepare(QStringLiteral("SELECT %1 FROM work_orders w "
                                             "JOIN equipment e ON e.id = w.equipment_id "
                                             "WHERE e.customer_id = :customer "
                                             "ORDER BY w.date_opened %2, w.id %2")
                                  .arg(QLatin1String(kWorkOrderColumns), direction(order)));
    query.bindValue(":customer", customerId);
    exec(query, "list customer work orders");
    QVector<WorkOrder> result;
    while (query.next()) {
        result.append(workOrderFromRow(query));
    }
    return result;
}

void SqlRecordStore::closeWorkOrder(int id, const QDate &dateClosed) {
    if (!rowExists("work_orders", id)) {
        throw NotFoundError(QStringLiteral("Work order #%1 not found").arg(id));
    }
    // the status filter keeps the first closing date of an already closed order
    QSqlQuery query = prepare("UPDATE work_orders SET status = :closed, date_closed = :date "
                              "WHERE id = :id AND status = :open");
    query.bindValue(":closed", WorkOrder::statusToString(WorkOrder::Closed));
    query.bindValue(":date", dateValue(dateClosed));
    query.bindValue(":id", id);
    query.bindValue(":open", WorkOrder::statusToString(WorkOrder::Open));
    exec(query, "close work order");
}

// ─── work log ───────────────────────────────────────────────────────────────

int SqlRecordStore::addWorkDetail(const WorkDetail &detail) {
    if (detail.description().trimmed().isEmpty()) {
        throw ValidationError("Work detail description is required");
    }
    requireParent("work_orders", detail.workOrderId(), "Work order");
    QSqlQuery query = prepare("INSERT INTO work_details(work_order_id, date, description) "
                              "VALUES(:wo, :date, :desc)");
    query.bindValue(":wo", detail.workOrderId());
    query.bindValue(":date", dateValue(detail.date()));
    query.bindValue(":desc", detail.description().trimmed());
    return insert(query, "insert work detail");
}

QVector<WorkDetail> SqlRecordStore::workDetails(int workOrderId) const {
    QSqlQuery query = prepare("SELECT id, work_order_id, date, description FROM work_details "
                              "WHERE work_order_id = :wo ORDER BY date ASC, id ASC");
    query.bindValue(":wo", workOrderId);
    exec(query, "list work details");
    QVector<WorkDetail> result;
    while (query.next()) {
        WorkDetail d(query.value(1).toInt(), dateFrom(query.value(2)), query.value(3).toString());
        d.setId(query.value(0).toInt());
        result.append(d);
    }
    return result;
}

// ─── stock movements ────────────────────────────────────────────────────────

int SqlRecordStore::addPartUsage(const PartUsage &usage) {
    if (usage.quantity() <= 0) {
        throw ValidationError("Usage quantity must be positive");
    }
    requireParent("work_orders", usage.workOrderId(), "Work order");
    requireParent("parts", usage.partId(), "Part");
    QSqlQuery query = prepare("INSERT INTO part_usage(work_order_id, part_id, quantity) "
                              "VALUES(:wo, :part, :qty)");
    query.bindValue(":wo", usage.workOrderId());
    query.bindValue(":part", usage.partId());
    query.bindValue(":qty", usage.quantity());
    return insert(query, "insert part usage");
}

QVector<PartUsage> SqlRecordStore::partUsages(int workOrderId) const {
    QSqlQuery query = prepare("SELECT id, work_order_id, part_id, quantity FROM part_usage "
                              "WHERE work_order_id = :wo ORDER BY id");
    query.bindValue(":wo", workOrderId);
    exec(query, "list part usage");
    QVector<PartUsage> result;
    while (query.next()) {
        PartUsage u(query.value(1).toInt(), query.value(2).toInt(), query.value(3).toInt());
        u.setId(query.value(0).toInt());
        result.append(u);
    }
    return result;
}

int SqlRecordStore::consumedQuantity(int partId) const {
    QSqlQuery query = prepare("SELECT COALESCE(SUM(quantity), 0) FROM part_usage WHERE part_id = :part");
    query.bindValue(":part", partId);
    exec(query, "sum part usage");
    return query.next() ? query.value(0).toInt() : 0;
}

int SqlRecordStore::addStockReceipt(const StockReceipt &receipt) {
    if (receipt.quantity() <= 0) {
        throw ValidationError("Received quantity must be positive");
    }
    if (receipt.unitCost() < 0) {
        throw ValidationError("Unit cost cannot be negative");
    }
    requireParent("parts", receipt.partId(), "Part");
    QSqlQuery query = prepare("INSERT INTO stock_receipts(part_id, date, quantity, unit_cost, supplier) "
                              "VALUES(:part, :date, :qty, :cost, :supplier)");
    query.bindValue(":part", receipt.partId());
    query.bindValue(":date", dateValue(receipt.date()));
    query.bindValue(":qty", receipt.quantity());
    query.bindValue(":cost", receipt.unitCost());
    query.bindValue(":supplier", receipt.supplier());
    return insert(query, "insert stock receipt");
}

QVector<StockReceipt> SqlRecordStore::stockReceipts(int partId) const {
    QSqlQuery query = prepare("SELECT id, part_id, date, quantity, unit_cost, supplier FROM stock_receipts "
                              "WHERE part_id = :part ORDER BY date, id");
    query.bindValue(":part", partId);
    exec(query, "list stock receipts");
    QVector<StockReceipt> result;
    while (query.next()) {
        StockReceipt r(query.value(1).toInt(), dateFrom(query.value(2)), query.value(3).toInt(),
                       query.value(4).toDouble(), query.value(5).toString());
        r.setId(query.value(0).toInt());
        result.append(r);
    }
    return result;
}

// ─── invoices ───────────────────────────────────────────────────────────────

int SqlRecordStore::addInvoice(const Invoice &invoice) {
    if (invoice.amount() < 0) {
        throw ValidationError("Invoice amount cannot be negative");
    }
    requireParent("work_orders", invoice.workOrderId(), "Work order");
    QSqlQuery query = prepare("INSERT INTO invoices(work_order_id, amount, status, issued_on, due_date, notes) "
                              "VALUES(:wo, :amount, :status, :issued, :due, :notes)");
    query.bindValue(":wo", invoice.workOrderId());
    query.bindValue(":amount", invoice.amount());
    query.bindValue(":status", Invoice::statusToString(invoice.status()));
    query.bindValue(":issued", dateValue(invoice.issuedOn()));
    query.bindValue(":due", dateValue(invoice.dueDate()));
    query.bindValue(":notes", invoice.notes());
    return insert(query, "insert invoice");
}

Invoice SqlRecordStore::invoice(int id) const {
    QSqlQuery query = prepare(QStringLiteral("SELECT %1 FROM invoices WHERE id = :id")
                                  .arg(QLatin1String(kInvoiceColumns)));
    query.bindValue(":id", id);
    exec(query, "load invoice");
    if (!query.next()) {
        throw NotFoundError(QStringLiteral("Invoice #%1 not found").arg(id));
    }
    return invoiceFromRow(query);
}

QVector<Invoice> SqlRecordStore::invoices(std::optional<Invoice::Status> status) const {
    QString sql = QStringLiteral("SELECT %1 FROM invoices").arg(QLatin1String(kInvoiceColumns));
    if (status) {
        sql += QStringLiteral(" WHERE status = :status");
    }
    sql += QStringLiteral(" ORDER BY issued_on DESC, id DESC");
    QSqlQuery query = prepare(sql);
    if (status) {
        query.bindValue(":status", Invoice::statusToString(*status));
    }
    exec(query, "list invoices");
    QVector<Invoice> result;
    while (query.next()) {
        result.append(invoiceFromRow(query));
    }
    return result;
}

void SqlRecordStore::setInvoiceStatus(int id, Invoice::Status status) {
    QSqlQuery query = prepare("UPDATE invoices SET status = :status WHERE id = :id");
    query.bindValue(":status", Invoice::statusToString(status));
    query.bindValue(":id", id);
    exec(query, "update invoice status");
    if (query.numRowsAffected() == 0) {
        throw NotFoundError(QStringLiteral("Invoice #%1 not found").arg(id));
    }
}

// ─── letterhead ─────────────────────────────────────────────────────────────

BusinessInfo SqlRecordStore::businessInfo() const {
    QSqlQuery query = prepare("SELECT name, address, phone, email, website FROM business_info WHERE id = 1");
    exec(query, "load business info");
    BusinessInfo info;
    if (query.next()) {
        info.name = query.value(0).toString();
        info.address = query.value(1).toString();
        info.phone = query.value(2).toString();
        info.email = query.value(3).toString();
        info.website = query.value(4).toString();
    }
    return info;
}

void SqlRecordStore::saveBusinessInfo(const BusinessInfo &info) {
    QSqlQuery query = prepare("INSERT OR REPLACE INTO business_info(id, name, address, phone, email, website) "
                              "VALUES(1, :name, :address, :phone, :email, :website)");
    query.bindValue(":name", info.name);
    query.bindValue(":address", info.address);
    query.bindValue(":phone", info.phone);
    query.bindValue(":email", info.email);
    query.bindValue(":website", info.website);
    exec(query, "save business info");
    qCInfo(lcStore) << "Business info saved";
}
