#include "ShopTestFixture.h"
#include "Errors.h"
#include "InventoryLedger.h"

namespace {

class InventoryLedgerTest : public ShopTest {
protected:
    void SetUp() override {
        ShopTest::SetUp();
        m_workOrder = createWorkOrder(createEquipment(createCustomer()));
        m_part = createPart("BAT-001", 5, 40.0);
    }

    int m_workOrder = 0;
    int m_part = 0;
};

// Store whose stock update fails after the usage row was written
class FailingStockStore : public SqlRecordStore {
public:
    using SqlRecordStore::SqlRecordStore;

    void adjustPartQuantity(int, int) override {
        throw PersistenceError("disk I/O error");
    }
};

}  // namespace

// --- consumePart ---

TEST_F(InventoryLedgerTest, ConsumePart_DecrementsAndRecordsOneUsage) {
    InventoryLedger ledger(*m_store);
    const int usageId = ledger.consumePart(m_workOrder, m_part, 3);
    EXPECT_GT(usageId, 0);

    EXPECT_EQ(m_store->part(m_part).quantity(), 2);
    const QVector<PartUsage> usages = m_store->partUsages(m_workOrder);
    ASSERT_EQ(usages.size(), 1);
    EXPECT_EQ(usages[0].id(), usageId);
    EXPECT_EQ(usages[0].partId(), m_part);
    EXPECT_EQ(usages[0].quantity(), 3);
}

TEST_F(InventoryLedgerTest, ConsumePart_NonPositiveQuantityChangesNothing) {
    InventoryLedger ledger(*m_store);
    EXPECT_THROW(ledger.consumePart(m_workOrder, m_part, 0), ValidationError);
    EXPECT_THROW(ledger.consumePart(m_workOrder, m_part, -2), ValidationError);

    EXPECT_EQ(m_store->part(m_part).quantity(), 5);
    EXPECT_TRUE(m_store->partUsages(m_workOrder).isEmpty());
}

TEST_F(InventoryLedgerTest, ConsumePart_UnknownIdsThrowNotFound) {
    InventoryLedger ledger(*m_store);
    EXPECT_THROW(ledger.consumePart(m_workOrder + 1, m_part, 1), NotFoundError);
    EXPECT_THROW(ledger.consumePart(m_workOrder, m_part + 1, 1), NotFoundError);
    EXPECT_EQ(m_store->part(m_part).quantity(), 5);
}

TEST_F(InventoryLedgerTest, ConsumePart_AllowsNegativeStockByDefault) {
    InventoryLedger ledger(*m_store);
    ledger.consumePart(m_workOrder, m_part, 8);
    EXPECT_EQ(ledger.onHand(m_part), -3);
    EXPECT_EQ(ledger.consumed(m_part), 8);
}

TEST_F(InventoryLedgerTest, ConsumePart_OversellRejectedWhenDisallowed) {
    StockPolicy strict;
    strict.allowNegativeStock = false;
    InventoryLedger ledger(*m_store, strict);

    EXPECT_THROW(ledger.consumePart(m_workOrder, m_part, 6), InsufficientStockError);
    EXPECT_EQ(m_store->part(m_part).quantity(), 5);
    EXPECT_TRUE(m_store->partUsages(m_workOrder).isEmpty());

    // the whole stock may still be used
    ledger.consumePart(m_workOrder, m_part, 5);
    EXPECT_EQ(m_store->part(m_part).quantity(), 0);
}

TEST_F(InventoryLedgerTest, InsufficientStockIsAValidationError) {
    StockPolicy strict;
    strict.allowNegativeStock = false;
    InventoryLedger ledger(*m_store, strict);
    EXPECT_THROW(ledger.consumePart(m_workOrder, m_part, 99), ValidationError);
}

TEST_F(InventoryLedgerTest, InsufficientStock_MessageKeepsSkuVerbatim) {
    const int cap = createPart("CAP-%1", 2);
    StockPolicy strict;
    strict.allowNegativeStock = false;
    InventoryLedger ledger(*m_store, strict);

    try {
        ledger.consumePart(m_workOrder, cap, 7);
        FAIL() << "expected InsufficientStockError";
    } catch (const InsufficientStockError &e) {
        EXPECT_EQ(e.message(), QString("Only 2 of CAP-%1 on hand, 7 requested"));
    }
}

TEST_F(InventoryLedgerTest, ConsumePart_FailedStockUpdateRollsBackUsage) {
    FailingStockStore failing(m_db);
    InventoryLedger ledger(failing);

    EXPECT_THROW(ledger.consumePart(m_workOrder, m_part, 2), PersistenceError);

    EXPECT_EQ(m_store->part(m_part).quantity(), 5);
    EXPECT_TRUE(m_store->partUsages(m_workOrder).isEmpty());
    EXPECT_EQ(m_store->consumedQuantity(m_part), 0);
}

// --- receiveStock ---

TEST_F(InventoryLedgerTest, ReceiveStock_IncrementsAndRecordsReceipt) {
    InventoryLedger ledger(*m_store, StockPolicy(), [] { return QDate(2024, 3, 1); });
    ledger.receiveStock(m_part, 10, 38.5, "Acme Supply");

    EXPECT_EQ(ledger.onHand(m_part), 15);
    const QVector<StockReceipt> receipts = m_store->stockReceipts(m_part);
    ASSERT_EQ(receipts.size(), 1);
    EXPECT_EQ(receipts[0].quantity(), 10);
    EXPECT_EQ(receipts[0].date(), QDate(2024, 3, 1));
    EXPECT_EQ(receipts[0].supplier(), QString("Acme Supply"));
    EXPECT_DOUBLE_EQ(receipts[0].total(), 385.0);
}

TEST_F(InventoryLedgerTest, ReceiveStock_Validates) {
    InventoryLedger ledger(*m_store);
    EXPECT_THROW(ledger.receiveStock(m_part, 0, 1.0), ValidationError);
    EXPECT_THROW(ledger.receiveStock(m_part, 1, -1.0), ValidationError);
    EXPECT_THROW(ledger.receiveStock(m_part + 1, 1, 1.0), NotFoundError);
    EXPECT_EQ(ledger.onHand(m_part), 5);
    EXPECT_TRUE(m_store->stockReceipts(m_part).isEmpty());
}

TEST_F(InventoryLedgerTest, ReceiveStock_FailedStockUpdateRollsBackReceipt) {
    FailingStockStore failing(m_db);
    InventoryLedger ledger(failing);

    EXPECT_THROW(ledger.receiveStock(m_part, 4, 1.0), PersistenceError);
    EXPECT_EQ(m_store->part(m_part).quantity(), 5);
    EXPECT_TRUE(m_store->stockReceipts(m_part).isEmpty());
}

TEST_F(InventoryLedgerTest, SetPolicy_TakesEffect) {
    InventoryLedger ledger(*m_store);
    StockPolicy strict;
    strict.allowNegativeStock = false;
    ledger.setPolicy(strict);
    EXPECT_FALSE(ledger.policy().allowNegativeStock);
    EXPECT_THROW(ledger.consumePart(m_workOrder, m_part, 6), InsufficientStockError);
}
