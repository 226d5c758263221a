#include "ShopTestFixture.h"
#include "Errors.h"
#include "InvoiceManager.h"

namespace {

class InvoiceManagerTest : public ShopTest {
protected:
    void SetUp() override {
        ShopTest::SetUp();
        m_invoices = std::make_unique<InvoiceManager>(*m_store, [] { return QDate(2024, 4, 1); });
        m_workOrder = createWorkOrder(createEquipment(createCustomer()));
    }

    int m_workOrder = 0;
    std::unique_ptr<InvoiceManager> m_invoices;
};

}  // namespace

TEST_F(InvoiceManagerTest, Issue_CreatesOutstandingInvoice) {
    const int id = m_invoices->issue(m_workOrder, 129.99, QDate(2024, 4, 15), "Net 14");
    const Invoice inv = m_store->invoice(id);
    EXPECT_EQ(inv.workOrderId(), m_workOrder);
    EXPECT_DOUBLE_EQ(inv.amount(), 129.99);
    EXPECT_EQ(inv.status(), Invoice::Outstanding);
    EXPECT_EQ(inv.issuedOn(), QDate(2024, 4, 1));
    EXPECT_EQ(inv.dueDate(), QDate(2024, 4, 15));
    EXPECT_EQ(inv.notes(), QString("Net 14"));
}

TEST_F(InvoiceManagerTest, Issue_Validates) {
    EXPECT_THROW(m_invoices->issue(m_workOrder, -1.0), ValidationError);
    EXPECT_THROW(m_invoices->issue(m_workOrder + 1, 10.0), NotFoundError);
    EXPECT_TRUE(m_invoices->invoices().isEmpty());
}

TEST_F(InvoiceManagerTest, MarkPaidAndBack) {
    const int id = m_invoices->issue(m_workOrder, 50.0);
    m_invoices->markPaid(id);
    EXPECT_EQ(m_store->invoice(id).status(), Invoice::Paid);
    EXPECT_EQ(m_invoices->invoices(Invoice::Paid).size(), 1);
    EXPECT_TRUE(m_invoices->invoices(Invoice::Outstanding).isEmpty());

    m_invoices->markOutstanding(id);
    EXPECT_EQ(m_store->invoice(id).status(), Invoice::Outstanding);
}

TEST_F(InvoiceManagerTest, MarkPaid_UnknownInvoiceThrowsNotFound) {
    EXPECT_THROW(m_invoices->markPaid(77), NotFoundError);
}

TEST(InvoiceStatusTest, TextRoundTrip) {
    EXPECT_EQ(Invoice::statusToString(Invoice::Paid), QString("Paid"));
    EXPECT_EQ(Invoice::statusFromString("Paid"), Invoice::Paid);
    EXPECT_EQ(Invoice::statusFromString("Outstanding"), Invoice::Outstanding);
}
