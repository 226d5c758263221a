#include "InventoryLedger.h"
#include "RecordStore.h"
#include "Errors.h"
#include "Logging.h"

InventoryLedger::InventoryLedger(RecordStore &store, StockPolicy policy, Clock clock)
    : m_store(store), m_policy(policy), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] { return QDate::currentDate(); };
    }
}

int InventoryLedger::consumePart(int workOrderId, int partId, int quantity) {
    if (quantity <= 0) {
        throw ValidationError(QStringLiteral("Quantity must be positive, got %1").arg(quantity));
    }
    // both throw NotFoundError for unknown ids
    m_store.workOrder(workOrderId);
    const Part before = m_store.part(partId);

    TransactionGuard tx(m_store);
    if (!m_policy.allowNegativeStock && before.quantity() < quantity) {
        qCWarning(lcLedger) << "Refused usage of" << quantity << "x" << before.sku()
                            << "with" << before.quantity() << "on hand";
        throw InsufficientStockError(QStringLiteral("Only %1 of %2 on hand, %3 requested")
                                         .arg(QString::number(before.quantity()), before.sku(),
                                              QString::number(quantity)));
    }

    const int usageId = m_store.addPartUsage(PartUsage(workOrderId, partId, quantity));
    m_store.adjustPartQuantity(partId, -quantity);
    tx.commit();

    qCInfo(lcLedger) << "Work order" << workOrderId << "used" << quantity << "x" << before.sku()
                     << "(" << before.quantity() << "->" << before.quantity() - quantity << ")";
    return usageId;
}

int InventoryLedger::receiveStock(int partId, int quantity, double unitCost,
                                  const QString &supplier) {
    if (quantity <= 0) {
        throw ValidationError(QStringLiteral("Quantity must be positive, got %1").arg(quantity));
    }
    const Part before = m_store.part(partId);

    TransactionGuard tx(m_store);
    const int receiptId = m_store.addStockReceipt(
        StockReceipt(partId, m_clock(), quantity, unitCost, supplier));
    m_store.adjustPartQuantity(partId, quantity);
    tx.commit();

    qCInfo(lcLedger) << "Received" << quantity << "x" << before.sku() << "from"
                     << (supplier.isEmpty() ? QStringLiteral("(unknown)") : supplier);
    return receiptId;
}

int InventoryLedger::onHand(int partId) const {
    return m_store.part(partId).quantity();
}

int InventoryLedger::consumed(int partId) const {
    m_store.part(partId);
    return m_store.consumedQuantity(partId);
}

StockPolicy InventoryLedger::policy() const {
    return m_policy;
}

void InventoryLedger::setPolicy(StockPolicy policy) {
    m_policy = policy;
}
