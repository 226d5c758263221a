#include "ShopTestFixture.h"
#include "DocumentRenderer.h"
#include "Errors.h"
#include "InventoryLedger.h"
#include "InvoiceManager.h"
#include "ShopDocuments.h"

#include <QFile>
#include <QTemporaryDir>

namespace {

class DocumentsTest : public ShopTest {
protected:
    void SetUp() override {
        ShopTest::SetUp();
        ASSERT_TRUE(m_dir.isValid());

        m_customer = m_store->addCustomer(Customer("Jane", "Doe", "555-0100", "jane@example.com",
                                                   "1 Main St"));
        Equipment xps(m_customer, "Dell", "XPS", "SN-42");
        xps.setCpu("i7");
        m_equipment = m_store->addEquipment(xps);
        m_workOrder = createWorkOrder(m_equipment, QDate(2024, 6, 1), "Battery <swollen>");
        m_store->addWorkDetail(WorkDetail(m_workOrder, QDate(2024, 6, 2), "Replaced battery"));

        const int battery = createPart("BAT-001", 5, 45.0);
        InventoryLedger(*m_store).consumePart(m_workOrder, battery, 2);
    }

    bool isPdf(const QString &file) const {
        QFile f(file);
        return f.open(QIODevice::ReadOnly) && f.read(5) == QByteArray("%PDF-");
    }

    QTemporaryDir m_dir;
    int m_customer = 0;
    int m_equipment = 0;
    int m_workOrder = 0;
};

QString fieldValue(const DocumentContent &doc, const QString &label) {
    for (const auto &field : doc.fields) {
        if (field.first == label) return field.second;
    }
    return QString();
}

}  // namespace

// --- Content ---

TEST_F(DocumentsTest, WorkOrderSlip_ListsCustomerEquipmentLogAndParts) {
    ShopDocuments documents(*m_store);
    const DocumentContent slip = documents.workOrderSlip(m_workOrder);

    EXPECT_EQ(slip.title, QString("Work Order #%1").arg(m_workOrder));
    EXPECT_EQ(fieldValue(slip, "Status"), QString("Open"));
    EXPECT_EQ(fieldValue(slip, "Date opened"), QString("2024-06-01"));
    EXPECT_EQ(fieldValue(slip, "Technician"), QString("Unassigned"));

    QStringList headings;
    for (const DocumentSection &s : slip.sections) headings << s.heading;
    EXPECT_TRUE(headings.contains("Customer"));
    EXPECT_TRUE(headings.contains("Equipment"));
    EXPECT_TRUE(headings.contains("Work Log"));

    ASSERT_FALSE(slip.table.isEmpty());
    ASSERT_EQ(slip.table.rows.size(), 2);
    EXPECT_EQ(slip.table.rows[0][0], QString("BAT-001"));
    EXPECT_EQ(slip.table.rows[0][2], QString("2"));
    EXPECT_EQ(slip.table.rows[1][4], QString("$90.00"));
}

TEST_F(DocumentsTest, Invoice_CarriesAmountAndWorkOrder) {
    InvoiceManager invoices(*m_store, [] { return QDate(2024, 6, 5); });
    const int id = invoices.issue(m_workOrder, 149.5, QDate(2024, 6, 20), "Thank you");

    const DocumentContent doc = ShopDocuments(*m_store).invoice(id);
    EXPECT_EQ(doc.title, QString("Invoice #%1").arg(id));
    EXPECT_EQ(fieldValue(doc, "Amount"), QString("$149.50"));
    EXPECT_EQ(fieldValue(doc, "Issued on"), QString("2024-06-05"));
    EXPECT_EQ(fieldValue(doc, "Due date"), QString("2024-06-20"));
    EXPECT_EQ(doc.sections.last().heading, QString("Notes"));
}

TEST_F(DocumentsTest, CustomerHistory_OneRowPerWorkOrder) {
    createWorkOrder(m_equipment, QDate(2024, 7, 1), "Keyboard");
    const DocumentContent doc = ShopDocuments(*m_store).customerHistory(m_customer);
    ASSERT_EQ(doc.table.rows.size(), 2);
    EXPECT_EQ(doc.table.rows[0][1], QString("2024-07-01"));
    EXPECT_EQ(fieldValue(doc, "Work orders"), QString("2"));
}

TEST_F(DocumentsTest, UnknownRecordsThrowNotFound) {
    ShopDocuments documents(*m_store);
    EXPECT_THROW(documents.workOrderSlip(999), NotFoundError);
    EXPECT_THROW(documents.invoice(999), NotFoundError);
    EXPECT_THROW(documents.customerHistory(999), NotFoundError);
}

// --- Rendering ---

TEST_F(DocumentsTest, Html_EscapesTextAndShowsLetterhead) {
    BusinessInfo info;
    info.name = "Fix & Go";
    info.website = "https://fix.example";
    const QString html = DocumentRenderer(info).toHtml(ShopDocuments(*m_store).workOrderSlip(m_workOrder));
    EXPECT_TRUE(html.contains("Fix &amp; Go"));
    EXPECT_TRUE(html.contains("https://fix.example"));
    EXPECT_TRUE(html.contains("Battery &lt;swollen&gt;"));
    EXPECT_FALSE(html.contains("<swollen>"));
}

TEST_F(DocumentsTest, Print_WritesPdfFiles) {
    ShopDocuments documents(*m_store);
    const int invoice = InvoiceManager(*m_store).issue(m_workOrder, 10.0);

    const QString slip = m_dir.filePath("slip.pdf");
    const QString inv = m_dir.filePath("invoice.pdf");
    const QString history = m_dir.filePath("history.pdf");
    documents.print(documents.workOrderSlip(m_workOrder), slip);
    documents.print(documents.invoice(invoice), inv);
    documents.print(documents.customerHistory(m_customer), history);

    EXPECT_TRUE(isPdf(slip));
    EXPECT_TRUE(isPdf(inv));
    EXPECT_TRUE(isPdf(history));
}

TEST_F(DocumentsTest, Print_UnwritablePathThrowsPersistence) {
    ShopDocuments documents(*m_store);
    EXPECT_THROW(documents.print(documents.workOrderSlip(m_workOrder),
                                 m_dir.filePath("no/such/dir/slip.pdf")),
                 PersistenceError);
}
