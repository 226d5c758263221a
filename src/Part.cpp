#include "Part.h"

Part::Part()
    : m_id(0), m_quantity(0), m_unitCost(0) {}

Part::Part(const QString &sku, const QString &description, int quantity,
           double unitCost)
    : m_id(0), m_sku(sku), m_description(description), m_quantity(quantity),
      m_unitCost(unitCost) {}

int Part::id() const { return m_id; }
void Part::setId(int id) { m_id = id; }

QString Part::sku() const { return m_sku; }
void Part::setSku(const QString &sku) { m_sku = sku; }

QString Part::description() const { return m_description; }
void Part::setDescription(const QString &description) { m_description = description; }

int Part::quantity() const { return m_quantity; }
void Part::setQuantity(int quantity) { m_quantity = quantity; }

double Part::unitCost() const { return m_unitCost; }
void Part::setUnitCost(double unitCost) { m_unitCost = unitCost; }

bool Part::isOutOfStock() const {
    return m_quantity <= 0;
}

double Part::stockValue() const {
    return m_quantity * m_unitCost;
}
