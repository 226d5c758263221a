#ifndef SHOPDOCUMENTS_H
#define SHOPDOCUMENTS_H

#include "DocumentRenderer.h"
#include "ReportService.h"

class RecordStore;

// Builds the printable documents of the shop from stored records
class ShopDocuments {
public:
    explicit ShopDocuments(const RecordStore &store);

    // customer, equipment, work log and parts used
    DocumentContent workOrderSlip(int workOrderId) const;
    DocumentContent invoice(int invoiceId) const;
    DocumentContent customerHistory(int customerId) const;

    // renders under the stored business letterhead
    void print(const DocumentContent &content, const QString &fileName) const;

private:
    const RecordStore &m_store;
    ReportService m_reports;
};

#endif // SHOPDOCUMENTS_H
