#ifndef REPORTSERVICE_H
#define REPORTSERVICE_H

#include "Customer.h"
#include "Equipment.h"
#include "Part.h"
#include "PartUsage.h"
#include "Technician.h"
#include "WorkDetail.h"
#include "WorkOrder.h"

#include <QString>
#include <QVector>
#include <optional>

class RecordStore;

// Work order joined with what it is attached to
struct WorkOrderSummary {
    WorkOrder order;
    Equipment equipment;
    Customer customer;
    std::optional<Technician> technician;
};

struct PartUsageLine {
    PartUsage usage;
    Part part;
};

struct SearchResults {
    QVector<Customer> customers;
    QVector<WorkOrder> workOrders;

    bool isEmpty() const { return customers.isEmpty() && workOrders.isEmpty(); }
};

struct DashboardStats {
    int customers = 0;
    int equipment = 0;
    int technicians = 0;
    int openWorkOrders = 0;
    int closedWorkOrders = 0;
    int partsOutOfStock = 0;
    int outstandingInvoices = 0;
    double outstandingTotal = 0;
    int paidInvoices = 0;
    double paidTotal = 0;
};

// Read-only views over the record store. No method writes.
class ReportService {
public:
    explicit ReportService(const RecordStore &store);

    // status Open only, oldest first
    QVector<WorkOrderSummary> openWorkOrders() const;

    // every work order on the customer's equipment, newest first
    QVector<WorkOrderSummary> workOrderHistory(int customerId) const;

    WorkOrderSummary summary(int workOrderId) const;

    QVector<WorkDetail> workDetails(int workOrderId) const;
    QVector<PartUsageLine> partUsages(int workOrderId) const;

    // case-insensitive substring match; customers by name, phone, email and
    // work orders by description, equipment serial or id
    SearchResults search(const QString &term) const;

    DashboardStats dashboard() const;

private:
    WorkOrderSummary summarize(const WorkOrder &order) const;

    const RecordStore &m_store;
};

#endif // REPORTSERVICE_H
