#ifndef PARTUSAGE_H
#define PARTUSAGE_H

// Ledger event: `quantity` units of a part consumed by a work order
class PartUsage {
public:
    PartUsage();
    PartUsage(int workOrderId, int partId, int quantity);

    int id() const;
    void setId(int id);

    int workOrderId() const;
    void setWorkOrderId(int workOrderId);

    int partId() const;
    void setPartId(int partId);

    int quantity() const;
    void setQuantity(int quantity);

private:
    int m_id;
    int m_workOrderId;
    int m_partId;
    int m_quantity;
};

#endif // PARTUSAGE_H
