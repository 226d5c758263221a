#ifndef INVOICEMANAGER_H
#define INVOICEMANAGER_H

#include "Invoice.h"

#include <QString>
#include <QDate>
#include <QVector>
#include <functional>
#include <optional>

class RecordStore;

// Issues invoices against work orders and tracks whether they were paid.
class InvoiceManager {
public:
    using Clock = std::function<QDate()>;

    explicit InvoiceManager(RecordStore &store, Clock clock = Clock());

    int issue(int workOrderId, double amount, const QDate &dueDate = QDate(),
              const QString &notes = QString());

    void markPaid(int invoiceId);
    void markOutstanding(int invoiceId);

    QVector<Invoice> invoices(std::optional<Invoice::Status> status = std::nullopt) const;

private:
    RecordStore &m_store;
    Clock m_clock;
};

#endif // INVOICEMANAGER_H
