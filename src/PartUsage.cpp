#include "PartUsage.h"

PartUsage::PartUsage()
    : m_id(0), m_workOrderId(0), m_partId(0), m_quantity(0) {}

PartUsage::PartUsage(int workOrderId, int partId, int quantity)
    : m_id(0), m_workOrderId(workOrderId), m_partId(partId), m_quantity(quantity) {}

int PartUsage::id() const { return m_id; }
void PartUsage::setId(int id) { m_id = id; }

int PartUsage::workOrderId() const { return m_workOrderId; }
void PartUsage::setWorkOrderId(int workOrderId) { m_workOrderId = workOrderId; }

int PartUsage::partId() const { return m_partId; }
void PartUsage::setPartId(int partId) { m_partId = partId; }

int PartUsage::quantity() const { return m_quantity; }
void PartUsage::setQuantity(int quantity) { m_quantity = quantity; }
