#include "ReportService.h"
#include "RecordStore.h"

#include <QHash>

ReportService::ReportService(const RecordStore &store)
    : m_store(store) {
}

WorkOrderSummary ReportService::summarize(const WorkOrder &order) const {
    WorkOrderSummary row;
    row.order = order;
    row.equipment = m_store.equipment(order.equipmentId());
    row.customer = m_store.customer(row.equipment.customerId());
    if (order.technicianId()) {
        row.technician = m_store.technician(*order.technicianId());
    }
    return row;
}

QVector<WorkOrderSummary> ReportService::openWorkOrders() const {
    QVector<WorkOrderSummary> result;
    for (const WorkOrder &order : m_store.workOrdersWithStatus(WorkOrder::Open, Qt::AscendingOrder)) {
        result.append(summarize(order));
    }
    return result;
}

QVector<WorkOrderSummary> ReportService::workOrderHistory(int customerId) const {
    // NotFoundError for an unknown customer rather than an empty history
    m_store.customer(customerId);
    QVector<WorkOrderSummary> result;
    for (const WorkOrder &order : m_store.workOrdersForCustomer(customerId, Qt::DescendingOrder)) {
        result.append(summarize(order));
    }
    return result;
}

WorkOrderSummary ReportService::summary(int workOrderId) const {
    return summarize(m_store.workOrder(workOrderId));
}

QVector<WorkDetail> ReportService::workDetails(int workOrderId) const {
    return m_store.workDetails(workOrderId);
}

QVector<PartUsageLine> ReportService::partUsages(int workOrderId) const {
    QVector<PartUsageLine> result;
    for (const PartUsage &usage : m_store.partUsages(workOrderId)) {
        result.append(PartUsageLine{usage, m_store.part(usage.partId())});
    }
    return result;
}

SearchResults ReportService::search(const QString &term) const {
    SearchResults results;
    const QString needle = term.trimmed();
    if (needle.isEmpty()) return results;

    auto matches = [&needle](const QString &text) {
        return text.contains(needle, Qt::CaseInsensitive);
    };

    for (const Customer &c : m_store.customers()) {
        if (matches(c.firstName()) || matches(c.lastName()) || matches(c.fullName())
                || matches(c.phone()) || matches(c.email())) {
            results.customers.append(c);
        }
    }

    // ids match whole, with or without a leading '#'
    const QString idText = needle.startsWith(QLatin1Char('#')) ? needle.mid(1) : needle;

    QHash<int, QString> serials;
    for (const Equipment &e : m_store.allEquipment()) {
        serials.insert(e.id(), e.serialNumber());
    }
    for (const WorkOrder &w : m_store.workOrders(Qt::AscendingOrder)) {
        if (matches(w.description()) || matches(serials.value(w.equipmentId()))
                || QString::number(w.id()) == idText) {
            results.workOrders.append(w);
        }
    }
    return results;
}

DashboardStats ReportService::dashboard() const {
    DashboardStats stats;
    stats.customers = m_store.customers().size();
    stats.equipment = m_store.allEquipment().size();
    stats.technicians = m_store.technicians().size();
    stats.openWorkOrders = m_store.workOrdersWithStatus(WorkOrder::Open).size();
    stats.closedWorkOrders = m_store.workOrdersWithStatus(WorkOrder::Closed).size();
    for (const Part &p : m_store.parts()) {
        if (p.isOutOfStock()) ++stats.partsOutOfStock;
    }
    for (const Invoice &inv : m_store.invoices()) {
        if (inv.status() == Invoice::Paid) {
            ++stats.paidInvoices;
            stats.paidTotal += inv.amount();
        } else {
            ++stats.outstandingInvoices;
            stats.outstandingTotal += inv.amount();
        }
    }
    return stats;
}
