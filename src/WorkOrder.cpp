#include "WorkOrder.h"

WorkOrder::WorkOrder()
    : m_id(0), m_equipmentId(0), m_status(Open) {}

WorkOrder::WorkOrder(int equipmentId, std::optional<int> technicianId,
                     const QString &description, const QDate &dateOpened)
    : m_id(0), m_equipmentId(equipmentId), m_technicianId(technicianId),
      m_description(description), m_status(Open), m_dateOpened(dateOpened) {}

int WorkOrder::id() const { return m_id; }
void WorkOrder::setId(int id) { m_id = id; }

int WorkOrder::equipmentId() const { return m_equipmentId; }
void WorkOrder::setEquipmentId(int equipmentId) { m_equipmentId = equipmentId; }

std::optional<int> WorkOrder::technicianId() const { return m_technicianId; }
void WorkOrder::setTechnicianId(std::optional<int> technicianId) { m_technicianId = technicianId; }

QString WorkOrder::description() const { return m_description; }
void WorkOrder::setDescription(const QString &description) { m_description = description; }

WorkOrder::Status WorkOrder::status() const { return m_status; }
void WorkOrder::setStatus(Status status) { m_status = status; }
bool WorkOrder::isOpen() const { return m_status == Open; }

QDate WorkOrder::dateOpened() const { return m_dateOpened; }
void WorkOrder::setDateOpened(const QDate &date) { m_dateOpened = date; }

QDate WorkOrder::dateClosed() const { return m_dateClosed; }
void WorkOrder::setDateClosed(const QDate &date) { m_dateClosed = date; }

QDate WorkOrder::dueDate() const { return m_dueDate; }
void WorkOrder::setDueDate(const QDate &date) { m_dueDate = date; }

QString WorkOrder::statusToString(Status status) {
    return status == Closed ? QStringLiteral("Closed") : QStringLiteral("Open");
}

WorkOrder::Status WorkOrder::statusFromString(const QString &text) {
    return text.trimmed().compare(QLatin1String("Closed"), Qt::CaseInsensitive) == 0
            ? Closed : Open;
}
