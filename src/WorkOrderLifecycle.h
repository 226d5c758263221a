#ifndef WORKORDERLIFECYCLE_H
#define WORKORDERLIFECYCLE_H

#include <QString>
#include <QDate>
#include <functional>
#include <optional>

class RecordStore;
class InventoryLedger;

// Open -> Closed state machine of a work order and its work log.
class WorkOrderLifecycle {
public:
    using Clock = std::function<QDate()>;

    WorkOrderLifecycle(RecordStore &store, InventoryLedger &ledger, Clock clock = Clock());

    // ReferenceError if the equipment or the given technician does not exist
    int open(int equipmentId, std::optional<int> technicianId, const QString &description,
             const QDate &dueDate = QDate());

    // allowed in any state
    int logDetail(int workOrderId, const QString &description);

    // NotFoundError for an unknown id; closing twice keeps the first date
    void close(int workOrderId);

    // allowed in any state; see InventoryLedger::consumePart
    int recordPartUsage(int workOrderId, int partId, int quantity);

    QDate today() const;

private:
    RecordStore &m_store;
    InventoryLedger &m_ledger;
    Clock m_clock;
};

#endif // WORKORDERLIFECYCLE_H
