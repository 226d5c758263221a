#ifndef RECORDSTORE_H
#define RECORDSTORE_H

#include "BusinessInfo.h"
#include "Customer.h"
#include "Equipment.h"
#include "Invoice.h"
#include "Part.h"
#include "PartUsage.h"
#include "StockReceipt.h"
#include "Technician.h"
#include "WorkDetail.h"
#include "WorkOrder.h"

#include <QVector>
#include <optional>

// Persistence port for every entity of the shop.
//
// addX() validates required fields (ValidationError) and parent rows
// (ReferenceError) and returns the new id. Getters throw NotFoundError for an
// unknown id. Any driver failure is reported as PersistenceError.
// There is no generic update: only the narrow mutations below, which the
// ledger, the lifecycle, the invoice book and the customer import rely on.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual void beginTransaction() = 0;
    virtual void commitTransaction() = 0;
    virtual void rollbackTransaction() = 0;

    // customers, ordered by last name then first name
    virtual int addCustomer(const Customer &customer) = 0;
    // rewrites the customer with customer.id(); false when there is none
    virtual bool updateCustomer(const Customer &customer) = 0;
    virtual Customer customer(int id) const = 0;
    virtual QVector<Customer> customers() const = 0;

    virtual int addEquipment(const Equipment &equipment) = 0;
    virtual Equipment equipment(int id) const = 0;
    virtual QVector<Equipment> equipmentForCustomer(int customerId) const = 0;
    virtual QVector<Equipment> allEquipment() const = 0;

    virtual int addTechnician(const Technician &technician) = 0;
    virtual Technician technician(int id) const = 0;
    virtual QVector<Technician> technicians() const = 0;

    // parts, ordered by sku
    virtual int addPart(const Part &part) = 0;
    virtual Part part(int id) const = 0;
    virtual QVector<Part> parts() const = 0;
    virtual void adjustPartQuantity(int partId, int delta) = 0;

    // work orders, ordered by date opened then id
    virtual int addWorkOrder(const WorkOrder &order) = 0;
    virtual WorkOrder workOrder(int id) const = 0;
    virtual QVector<WorkOrder> workOrders(Qt::SortOrder order = Qt::AscendingOrder) const = 0;
    virtual QVector<WorkOrder> workOrdersWithStatus(WorkOrder::Status status,
                                                    Qt::SortOrder order = Qt::AscendingOrder) const = 0;
    virtual QVector<WorkOrder> workOrdersForCustomer(int customerId,
                                                     Qt::SortOrder order = Qt::DescendingOrder) const = 0;
    virtual void closeWorkOrder(int id, const QDate &dateClosed) = 0;

    virtual int addWorkDetail(const WorkDetail &detail) = 0;
    virtual QVector<WorkDetail> workDetails(int workOrderId) const = 0;

    virtual int addPartUsage(const PartUsage &usage) = 0;
    virtual QVector<PartUsage> partUsages(int workOrderId) const = 0;
    virtual int consumedQuantity(int partId) const = 0;

    virtual int addStockReceipt(const StockReceipt &receipt) = 0;
    virtual QVector<StockReceipt> stockReceipts(int partId) const = 0;

    // invoices, newest first
    virtual int addInvoice(const Invoice &invoice) = 0;
    virtual Invoice invoice(int id) const = 0;
    virtual QVector<Invoice> invoices(std::optional<Invoice::Status> status = std::nullopt) const = 0;
    virtual void setInvoiceStatus(int id, Invoice::Status status) = 0;

    virtual BusinessInfo businessInfo() const = 0;
    virtual void saveBusinessInfo(const BusinessInfo &info) = 0;
};

// Scoped transaction: begins on construction, rolls back on destruction
// unless commit() was reached.
class TransactionGuard {
public:
    explicit TransactionGuard(RecordStore &store);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard &) = delete;
    TransactionGuard &operator=(const TransactionGuard &) = delete;

    void commit();

private:
    RecordStore &m_store;
    bool m_finished;
};

#endif // RECORDSTORE_H
