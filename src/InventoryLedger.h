#ifndef INVENTORYLEDGER_H
#define INVENTORYLEDGER_H

#include <QString>
#include <QDate>
#include <functional>

class RecordStore;

struct StockPolicy {
    // false: reject usage that would take a part below zero
    bool allowNegativeStock = true;
};

// Keeps Part.quantity equal to the stock on hand: every usage decrements it and
// every receipt increments it, each inside one transaction with its ledger row.
class InventoryLedger {
public:
    using Clock = std::function<QDate()>;

    explicit InventoryLedger(RecordStore &store, StockPolicy policy = StockPolicy(),
                             Clock clock = Clock());

    // insert a PartUsage and decrement the part; returns the usage id
    int consumePart(int workOrderId, int partId, int quantity);

    // insert a StockReceipt and increment the part; returns the receipt id
    int receiveStock(int partId, int quantity, double unitCost,
                     const QString &supplier = QString());

    int onHand(int partId) const;
    int consumed(int partId) const;

    StockPolicy policy() const;
    void setPolicy(StockPolicy policy);

private:
    RecordStore &m_store;
    StockPolicy m_policy;
    Clock m_clock;
};

#endif // INVENTORYLEDGER_H
