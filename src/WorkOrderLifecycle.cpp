#include "WorkOrderLifecycle.h"
#include "InventoryLedger.h"
#include "RecordStore.h"
#include "Errors.h"
#include "Logging.h"

WorkOrderLifecycle::WorkOrderLifecycle(RecordStore &store, InventoryLedger &ledger, Clock clock)
    : m_store(store), m_ledger(ledger), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] { return QDate::currentDate(); };
    }
}

QDate WorkOrderLifecycle::today() const {
    return m_clock();
}

int WorkOrderLifecycle::open(int equipmentId, std::optional<int> technicianId,
                             const QString &description, const QDate &dueDate) {
    WorkOrder order(equipmentId, technicianId, description.trimmed(), today());
    order.setDueDate(dueDate);
    const int id = m_store.addWorkOrder(order);
    qCInfo(lcWorkOrders) << "Opened work order" << id << "for equipment" << equipmentId;
    return id;
}

int WorkOrderLifecycle::logDetail(int workOrderId, const QString &description) {
    const WorkOrder order = m_store.workOrder(workOrderId);
    if (!order.isOpen()) {
        qCDebug(lcWorkOrders) << "Logging on closed work order" << workOrderId;
    }
    return m_store.addWorkDetail(WorkDetail(workOrderId, today(), description));
}

void WorkOrderLifecycle::close(int workOrderId) {
    const WorkOrder order = m_store.workOrder(workOrderId);
    if (!order.isOpen()) {
        qCDebug(lcWorkOrders) << "Work order" << workOrderId << "already closed on"
                              << order.dateClosed();
        return;
    }
    m_store.closeWorkOrder(workOrderId, today());
    qCInfo(lcWorkOrders) << "Closed work order" << workOrderId;
}

int WorkOrderLifecycle::recordPartUsage(int workOrderId, int partId, int quantity) {
    return m_ledger.consumePart(workOrderId, partId, quantity);
}
