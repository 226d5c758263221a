#ifndef STOCKRECEIPT_H
#define STOCKRECEIPT_H

#include <QString>
#include <QDate>

// Record of parts received into stock
class StockReceipt {
public:
    StockReceipt();
    StockReceipt(int partId, const QDate &date, int quantity, double unitCost,
                 const QString &supplier = QString());

    int id() const;
    void setId(int id);

    int partId() const;
    void setPartId(int partId);

    QDate date() const;
    void setDate(const QDate &date);

    int quantity() const;
    void setQuantity(int quantity);

    double unitCost() const;
    void setUnitCost(double unitCost);

    double total() const; // quantity * unitCost

    QString supplier() const;
    void setSupplier(const QString &supplier);

private:
    int m_id;
    int m_partId;
    QDate m_date;
    int m_quantity;
    double m_unitCost;
    QString m_supplier;
};

#endif // STOCKRECEIPT_H
