#include "InvoiceManager.h"
#include "RecordStore.h"
#include "Errors.h"
#include "Logging.h"

InvoiceManager::InvoiceManager(RecordStore &store, Clock clock)
    : m_store(store), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] { return QDate::currentDate(); };
    }
}

int InvoiceManager::issue(int workOrderId, double amount, const QDate &dueDate,
                          const QString &notes) {
    if (amount < 0) {
        throw ValidationError("Invoice amount cannot be negative");
    }
    m_store.workOrder(workOrderId);

    Invoice invoice(workOrderId, amount, m_clock());
    invoice.setDueDate(dueDate);
    invoice.setNotes(notes);
    const int id = m_store.addInvoice(invoice);
    qCInfo(lcWorkOrders) << "Issued invoice" << id << "for work order" << workOrderId
                         << "amount" << amount;
    return id;
}

void InvoiceManager::markPaid(int invoiceId) {
    m_store.setInvoiceStatus(invoiceId, Invoice::Paid);
}

void InvoiceManager::markOutstanding(int invoiceId) {
    m_store.setInvoiceStatus(invoiceId, Invoice::Outstanding);
}

QVector<Invoice> InvoiceManager::invoices(std::optional<Invoice::Status> status) const {
    return m_store.invoices(status);
}
