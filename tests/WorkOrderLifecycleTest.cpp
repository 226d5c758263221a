#include "ShopTestFixture.h"
#include "Errors.h"
#include "InventoryLedger.h"
#include "WorkOrderLifecycle.h"

namespace {

class WorkOrderLifecycleTest : public ShopTest {
protected:
    void SetUp() override {
        ShopTest::SetUp();
        m_ledger = std::make_unique<InventoryLedger>(*m_store);
        m_lifecycle = std::make_unique<WorkOrderLifecycle>(*m_store, *m_ledger,
                                                           [this] { return m_today; });
        m_equipment = createEquipment(createCustomer());
    }

    QDate m_today = QDate(2024, 5, 10);
    int m_equipment = 0;
    std::unique_ptr<InventoryLedger> m_ledger;
    std::unique_ptr<WorkOrderLifecycle> m_lifecycle;
};

}  // namespace

TEST_F(WorkOrderLifecycleTest, Open_StartsOpenDatedToday) {
    const int id = m_lifecycle->open(m_equipment, std::nullopt, "No power", QDate(2024, 5, 17));
    const WorkOrder wo = m_store->workOrder(id);
    EXPECT_EQ(wo.status(), WorkOrder::Open);
    EXPECT_EQ(wo.dateOpened(), m_today);
    EXPECT_EQ(wo.dueDate(), QDate(2024, 5, 17));
    EXPECT_FALSE(wo.dateClosed().isValid());
    EXPECT_EQ(wo.description(), QString("No power"));
}

TEST_F(WorkOrderLifecycleTest, Open_AssignsTechnician) {
    const int tech = m_store->addTechnician(Technician("Sam"));
    const int id = m_lifecycle->open(m_equipment, tech, "Slow boot");
    EXPECT_EQ(m_store->workOrder(id).technicianId(), std::optional<int>(tech));
}

TEST_F(WorkOrderLifecycleTest, Open_UnknownReferencesRejected) {
    EXPECT_THROW(m_lifecycle->open(m_equipment + 1, std::nullopt, "x"), ReferenceError);
    EXPECT_THROW(m_lifecycle->open(m_equipment, 123, "x"), ReferenceError);
    EXPECT_TRUE(m_store->workOrders().isEmpty());
}

TEST_F(WorkOrderLifecycleTest, Close_MovesToClosedAndNeverBack) {
    const int id = m_lifecycle->open(m_equipment, std::nullopt, "Broken hinge");
    EXPECT_TRUE(m_store->workOrder(id).isOpen());

    m_today = QDate(2024, 5, 12);
    m_lifecycle->close(id);
    WorkOrder wo = m_store->workOrder(id);
    EXPECT_EQ(wo.status(), WorkOrder::Closed);
    EXPECT_EQ(wo.dateClosed(), QDate(2024, 5, 12));

    // a second close is a no-op
    m_today = QDate(2024, 6, 1);
    m_lifecycle->close(id);
    wo = m_store->workOrder(id);
    EXPECT_EQ(wo.status(), WorkOrder::Closed);
    EXPECT_EQ(wo.dateClosed(), QDate(2024, 5, 12));
}

TEST_F(WorkOrderLifecycleTest, Close_UnknownIdThrowsNotFound) {
    EXPECT_THROW(m_lifecycle->close(999), NotFoundError);
}

TEST_F(WorkOrderLifecycleTest, LogDetail_DatedTodayAndAllowedAfterClose) {
    const int id = m_lifecycle->open(m_equipment, std::nullopt, "Fan noise");
    m_lifecycle->logDetail(id, "Cleaned fan");
    m_lifecycle->close(id);
    m_today = QDate(2024, 5, 11);
    m_lifecycle->logDetail(id, "Customer picked up");

    const QVector<WorkDetail> details = m_store->workDetails(id);
    ASSERT_EQ(details.size(), 2);
    EXPECT_EQ(details[0].date(), QDate(2024, 5, 10));
    EXPECT_EQ(details[1].description(), QString("Customer picked up"));
}

TEST_F(WorkOrderLifecycleTest, LogDetail_UnknownWorkOrderThrowsNotFound) {
    EXPECT_THROW(m_lifecycle->logDetail(5, "x"), NotFoundError);
}

TEST_F(WorkOrderLifecycleTest, RecordPartUsage_GoesThroughLedger) {
    const int id = m_lifecycle->open(m_equipment, std::nullopt, "Battery");
    const int part = createPart("BAT-001", 5);
    m_lifecycle->recordPartUsage(id, part, 1);
    EXPECT_EQ(m_store->part(part).quantity(), 4);
    EXPECT_EQ(m_store->partUsages(id).size(), 1);
}
