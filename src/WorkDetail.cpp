#include "WorkDetail.h"

WorkDetail::WorkDetail()
    : m_id(0), m_workOrderId(0) {}

WorkDetail::WorkDetail(int workOrderId, const QDate &date, const QString &description)
    : m_id(0), m_workOrderId(workOrderId), m_date(date), m_description(description) {}

int WorkDetail::id() const { return m_id; }
void WorkDetail::setId(int id) { m_id = id; }

int WorkDetail::workOrderId() const { return m_workOrderId; }
void WorkDetail::setWorkOrderId(int workOrderId) { m_workOrderId = workOrderId; }

QDate WorkDetail::date() const { return m_date; }
void WorkDetail::setDate(const QDate &date) { m_date = date; }

QString WorkDetail::description() const { return m_description; }
void WorkDetail::setDescription(const QString &description) { m_description = description; }
