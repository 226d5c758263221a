#ifndef SQLRECORDSTORE_H
#define SQLRECORDSTORE_H

#include "RecordStore.h"

#include <QSqlQuery>

class DatabaseManager;

// RecordStore over the QSQLITE connection owned by a DatabaseManager.
// Rows are mapped to typed records here and nowhere else.
class SqlRecordStore : public RecordStore {
public:
    explicit SqlRecordStore(DatabaseManager &db);

    void beginTransaction() override;
    void commitTransaction() override;
    void rollbackTransaction() override;

    int addCustomer(const Customer &customer) override;
    bool updateCustomer(const Customer &customer) override;
    Customer customer(int id) const override;
    QVector<Customer> customers() const override;

    int addEquipment(const Equipment &equipment) override;
    Equipment equipment(int id) const override;
    QVector<Equipment> equipmentForCustomer(int customerId) const override;
    QVector<Equipment> allEquipment() const override;

    int addTechnician(const Technician &technician) override;
    Technician technician(int id) const override;
    QVector<Technician> technicians() const override;

    int addPart(const Part &part) override;
    Part part(int id) const override;
    QVector<Part> parts() const override;
    void adjustPartQuantity(int partId, int delta) override;

    int addWorkOrder(const WorkOrder &order) override;
    WorkOrder workOrder(int id) const override;
    QVector<WorkOrder> workOrders(Qt::SortOrder order = Qt::AscendingOrder) const override;
    QVector<WorkOrder> workOrdersWithStatus(WorkOrder::Status status,
                                            Qt::SortOrder order = Qt::AscendingOrder) const override;
    QVector<WorkOrder> workOrdersForCustomer(int customerId,
                                             Qt::SortOrder order = Qt::DescendingOrder) const override;
    void closeWorkOrder(int id, const QDate &dateClosed) override;

    int addWorkDetail(const WorkDetail &detail) override;
    QVector<WorkDetail> workDetails(int workOrderId) const override;

    int addPartUsage(const PartUsage &usage) override;
    QVector<PartUsage> partUsages(int workOrderId) const override;
    int consumedQuantity(int partId) const override;

    int addStockReceipt(const StockReceipt &receipt) override;
    QVector<StockReceipt> stockReceipts(int partId) const override;

    int addInvoice(const Invoice &invoice) override;
    Invoice invoice(int id) const override;
    QVector<Invoice> invoices(std::optional<Invoice::Status> status = std::nullopt) const override;
    void setInvoiceStatus(int id, Invoice::Status status) override;

    BusinessInfo businessInfo() const override;
    void saveBusinessInfo(const BusinessInfo &info) override;

private:
    QSqlQuery prepare(const QString &sql) const;
    void exec(QSqlQuery &query, const char *what) const;
    int insert(QSqlQuery &query, const char *what);
    bool rowExists(const char *table, int id) const;
    void requireParent(const char *table, int id, const char *what) const;

    DatabaseManager &m_db;
};

#endif // SQLRECORDSTORE_H
