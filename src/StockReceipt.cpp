#include "StockReceipt.h"

StockReceipt::StockReceipt()
    : m_id(0), m_partId(0), m_quantity(0), m_unitCost(0) {}

StockReceipt::StockReceipt(int partId, const QDate &date, int quantity,
                           double unitCost, const QString &supplier)
    : m_id(0), m_partId(partId), m_date(date), m_quantity(quantity),
      m_unitCost(unitCost), m_supplier(supplier) {}

int StockReceipt::id() const { return m_id; }
void StockReceipt::setId(int id) { m_id = id; }

int StockReceipt::partId() const { return m_partId; }
void StockReceipt::setPartId(int partId) { m_partId = partId; }

QDate StockReceipt::date() const { return m_date; }
void StockReceipt::setDate(const QDate &date) { m_date = date; }

int StockReceipt::quantity() const { return m_quantity; }
void StockReceipt::setQuantity(int quantity) { m_quantity = quantity; }

double StockReceipt::unitCost() const { return m_unitCost; }
void StockReceipt::setUnitCost(double unitCost) { m_unitCost = unitCost; }

double StockReceipt::total() const { return m_quantity * m_unitCost; }

QString StockReceipt::supplier() const { return m_supplier; }
void StockReceipt::setSupplier(const QString &supplier) { m_supplier = supplier; }
