#include "Invoice.h"

Invoice::Invoice()
    : m_id(0), m_workOrderId(0), m_amount(0), m_status(Outstanding) {}

Invoice::Invoice(int workOrderId, double amount, const QDate &issuedOn)
    : m_id(0), m_workOrderId(workOrderId), m_amount(amount),
      m_status(Outstanding), m_issuedOn(issuedOn) {}

int Invoice::id() const { return m_id; }
void Invoice::setId(int id) { m_id = id; }

int Invoice::workOrderId() const { return m_workOrderId; }
void Invoice::setWorkOrderId(int workOrderId) { m_workOrderId = workOrderId; }

double Invoice::amount() const { return m_amount; }
void Invoice::setAmount(double amount) { m_amount = amount; }

Invoice::Status Invoice::status() const { return m_status; }
void Invoice::setStatus(Status status) { m_status = status; }

QDate Invoice::issuedOn() const { return m_issuedOn; }
void Invoice::setIssuedOn(const QDate &date) { m_issuedOn = date; }

QDate Invoice::dueDate() const { return m_dueDate; }
void Invoice::setDueDate(const QDate &date) { m_dueDate = date; }

QString Invoice::notes() const { return m_notes; }
void Invoice::setNotes(const QString &notes) { m_notes = notes; }

QString Invoice::statusToString(Status status) {
    return status == Paid ? QStringLiteral("Paid") : QStringLiteral("Outstanding");
}

Invoice::Status Invoice::statusFromString(const QString &text) {
    return text.trimmed().compare(QLatin1String("Paid"), Qt::CaseInsensitive) == 0
            ? Paid : Outstanding;
}
