#ifndef PART_H
#define PART_H

#include <QString>

// Represents a single stock item in the parts inventory
class Part {
public:
    Part();
    Part(const QString &sku, const QString &description, int quantity,
         double unitCost);

    int id() const;
    void setId(int id);

    QString sku() const;
    void setSku(const QString &sku);

    QString description() const;
    void setDescription(const QString &description);

    // units on hand; may go negative when the ledger allows oversell
    int quantity() const;
    void setQuantity(int quantity);

    double unitCost() const;
    void setUnitCost(double unitCost);

    bool isOutOfStock() const;
    double stockValue() const; // quantity * unitCost

private:
    int m_id;
    QString m_sku;
    QString m_description;
    int m_quantity;
    double m_unitCost;
};

#endif // PART_H
