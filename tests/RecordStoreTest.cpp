#include "ShopTestFixture.h"
#include "Errors.h"

namespace {

class RecordStoreTest : public ShopTest {};

}  // namespace

// --- Schema ---

TEST_F(RecordStoreTest, Open_AppliesAllMigrations) {
    EXPECT_EQ(m_db.schemaVersion(), DatabaseManager::latestSchemaVersion());
}

TEST_F(RecordStoreTest, BusinessInfo_SeededOnce) {
    const BusinessInfo seeded = m_store->businessInfo();
    EXPECT_EQ(seeded.name, QString("Business Name Here"));

    BusinessInfo info;
    info.name = "Fix-It Computers";
    info.phone = "555-0199";
    m_store->saveBusinessInfo(info);

    EXPECT_EQ(m_store->businessInfo().name, QString("Fix-It Computers"));
    EXPECT_EQ(m_store->businessInfo().phone, QString("555-0199"));
}

// --- Customers ---

TEST_F(RecordStoreTest, AddCustomer_ReturnsIdAndRoundTrips) {
    Customer c("Jane", "Doe", "555-0100", "jane@example.com", "1 Main St");
    c.setNotes("prefers email");
    const int id = m_store->addCustomer(c);
    EXPECT_GT(id, 0);

    const Customer found = m_store->customer(id);
    EXPECT_EQ(found.id(), id);
    EXPECT_EQ(found.fullName(), QString("Jane Doe"));
    EXPECT_EQ(found.address(), QString("1 Main St"));
    EXPECT_EQ(found.notes(), QString("prefers email"));
}

TEST_F(RecordStoreTest, AddCustomer_RequiresBothNames) {
    EXPECT_THROW(m_store->addCustomer(Customer("Jane", "")), ValidationError);
    EXPECT_THROW(m_store->addCustomer(Customer("  ", "Doe")), ValidationError);
    EXPECT_TRUE(m_store->customers().isEmpty());
}

TEST_F(RecordStoreTest, Customers_OrderedByLastThenFirstName) {
    createCustomer("Zoe", "Adams");
    createCustomer("Amy", "Baker");
    createCustomer("Bob", "Adams");

    const QVector<Customer> all = m_store->customers();
    ASSERT_EQ(all.size(), 3);
    EXPECT_EQ(all[0].fullName(), QString("Bob Adams"));
    EXPECT_EQ(all[1].fullName(), QString("Zoe Adams"));
    EXPECT_EQ(all[2].fullName(), QString("Amy Baker"));
}

TEST_F(RecordStoreTest, Customer_UnknownIdThrowsNotFound) {
    EXPECT_THROW(m_store->customer(42), NotFoundError);
}

TEST_F(RecordStoreTest, UpdateCustomer_RewritesExistingRowOnly) {
    const int id = createCustomer("Jane", "Doe");
    Customer changed("Jane", "Smith", "555-0199", "jane@smith.test", "2 Oak Ave");
    changed.setId(id);
    EXPECT_TRUE(m_store->updateCustomer(changed));
    EXPECT_EQ(m_store->customer(id).lastName(), QString("Smith"));
    EXPECT_EQ(m_store->customer(id).address(), QString("2 Oak Ave"));

    changed.setId(id + 1);
    EXPECT_FALSE(m_store->updateCustomer(changed));
    EXPECT_EQ(m_store->customers().size(), 1);

    changed.setId(id);
    changed.setFirstName("");
    EXPECT_THROW(m_store->updateCustomer(changed), ValidationError);
}

// --- Equipment ---

TEST_F(RecordStoreTest, AddEquipment_UnknownCustomerThrowsReference) {
    EXPECT_THROW(m_store->addEquipment(Equipment(99, "Dell", "XPS")), ReferenceError);
    EXPECT_TRUE(m_store->allEquipment().isEmpty());
}

TEST_F(RecordStoreTest, EquipmentForCustomer_OnlyThatCustomer) {
    const int jane = createCustomer("Jane", "Doe");
    const int john = createCustomer("John", "Roe");
    Equipment laptop(jane, "Dell", "XPS", "SN-1");
    laptop.setCpu("i7");
    laptop.setRam("16GB");
    createEquipment(john, "HP", "Envy", "SN-2");
    const int laptopId = m_store->addEquipment(laptop);

    const QVector<Equipment> janes = m_store->equipmentForCustomer(jane);
    ASSERT_EQ(janes.size(), 1);
    EXPECT_EQ(janes[0].id(), laptopId);
    EXPECT_EQ(janes[0].cpu(), QString("i7"));
    EXPECT_EQ(janes[0].displayName(), QString("Dell XPS"));
    EXPECT_EQ(m_store->allEquipment().size(), 2);
}

// --- Technicians ---

TEST_F(RecordStoreTest, AddTechnician_RequiresName) {
    EXPECT_THROW(m_store->addTechnician(Technician("")), ValidationError);
    const int id = m_store->addTechnician(Technician("Sam"));
    EXPECT_EQ(m_store->technician(id).name(), QString("Sam"));
}

// --- Parts ---

TEST_F(RecordStoreTest, AddPart_RejectsInvalidFields) {
    EXPECT_THROW(m_store->addPart(Part("", "no sku", 1, 1.0)), ValidationError);
    EXPECT_THROW(m_store->addPart(Part("BAT-001", "battery", -1, 1.0)), ValidationError);
    EXPECT_THROW(m_store->addPart(Part("BAT-001", "battery", 1, -1.0)), ValidationError);
    EXPECT_TRUE(m_store->parts().isEmpty());
}

TEST_F(RecordStoreTest, AddPart_DuplicateSkuRejected) {
    createPart("BAT-001", 5);
    EXPECT_THROW(createPart("BAT-001", 3), ValidationError);
    EXPECT_EQ(m_store->parts().size(), 1);
}

TEST_F(RecordStoreTest, AdjustPartQuantity_AppliesDelta) {
    const int id = createPart("BAT-001", 5);
    m_store->adjustPartQuantity(id, -7);
    EXPECT_EQ(m_store->part(id).quantity(), -2);
    EXPECT_TRUE(m_store->part(id).isOutOfStock());
    EXPECT_THROW(m_store->adjustPartQuantity(id + 100, 1), NotFoundError);
}

// --- Work orders ---

TEST_F(RecordStoreTest, AddWorkOrder_ChecksReferences) {
    const int equipment = createEquipment(createCustomer());
    EXPECT_THROW(createWorkOrder(equipment + 10), ReferenceError);
    EXPECT_THROW(m_store->addWorkOrder(WorkOrder(equipment, 77, "Repair", QDate(2024, 1, 1))),
                 ReferenceError);
    EXPECT_THROW(m_store->addWorkOrder(WorkOrder(equipment, std::nullopt, "Repair", QDate())),
                 ValidationError);
    EXPECT_TRUE(m_store->workOrders().isEmpty());
}

TEST_F(RecordStoreTest, WorkOrder_RoundTripsNullableFields) {
    const int equipment = createEquipment(createCustomer());
    const int tech = m_store->addTechnician(Technician("Sam"));

    WorkOrder assigned(equipment, tech, "Replace screen", QDate(2024, 2, 3));
    assigned.setDueDate(QDate(2024, 2, 10));
    const int assignedId = m_store->addWorkOrder(assigned);
    const int unassignedId = createWorkOrder(equipment, QDate(2024, 2, 4));

    const WorkOrder a = m_store->workOrder(assignedId);
    EXPECT_EQ(a.technicianId(), std::optional<int>(tech));
    EXPECT_EQ(a.dueDate(), QDate(2024, 2, 10));
    EXPECT_EQ(a.status(), WorkOrder::Open);
    EXPECT_FALSE(a.dateClosed().isValid());

    const WorkOrder u = m_store->workOrder(unassignedId);
    EXPECT_FALSE(u.technicianId().has_value());
    EXPECT_FALSE(u.dueDate().isValid());
}

TEST_F(RecordStoreTest, CloseWorkOrder_KeepsFirstCloseDate) {
    const int wo = createWorkOrder(createEquipment(createCustomer()));
    m_store->closeWorkOrder(wo, QDate(2024, 1, 5));
    m_store->closeWorkOrder(wo, QDate(2024, 1, 9));

    const WorkOrder closed = m_store->workOrder(wo);
    EXPECT_EQ(closed.status(), WorkOrder::Closed);
    EXPECT_EQ(closed.dateClosed(), QDate(2024, 1, 5));
    EXPECT_THROW(m_store->closeWorkOrder(wo + 1, QDate(2024, 1, 5)), NotFoundError);
}

TEST_F(RecordStoreTest, WorkOrdersWithStatus_Filters) {
    const int equipment = createEquipment(createCustomer());
    const int first = createWorkOrder(equipment, QDate(2024, 1, 1));
    const int second = createWorkOrder(equipment, QDate(2024, 1, 2));
    m_store->closeWorkOrder(first, QDate(2024, 1, 3));

    const QVector<WorkOrder> open = m_store->workOrdersWithStatus(WorkOrder::Open);
    ASSERT_EQ(open.size(), 1);
    EXPECT_EQ(open[0].id(), second);

    const QVector<WorkOrder> closed = m_store->workOrdersWithStatus(WorkOrder::Closed);
    ASSERT_EQ(closed.size(), 1);
    EXPECT_EQ(closed[0].id(), first);
}

// --- Details and usage ---

TEST_F(RecordStoreTest, WorkDetails_InChronologicalOrder) {
    const int wo = createWorkOrder(createEquipment(createCustomer()));
    m_store->addWorkDetail(WorkDetail(wo, QDate(2024, 1, 3), "Replaced battery"));
    m_store->addWorkDetail(WorkDetail(wo, QDate(2024, 1, 2), "Diagnosed"));

    const QVector<WorkDetail> details = m_store->workDetails(wo);
    ASSERT_EQ(details.size(), 2);
    EXPECT_EQ(details[0].description(), QString("Diagnosed"));
    EXPECT_EQ(details[1].description(), QString("Replaced battery"));
}

TEST_F(RecordStoreTest, AddWorkDetail_Validates) {
    const int wo = createWorkOrder(createEquipment(createCustomer()));
    EXPECT_THROW(m_store->addWorkDetail(WorkDetail(wo, QDate(2024, 1, 2), "")), ValidationError);
    EXPECT_THROW(m_store->addWorkDetail(WorkDetail(wo + 5, QDate(2024, 1, 2), "x")), ReferenceError);
}

TEST_F(RecordStoreTest, AddPartUsage_ChecksReferencesAndQuantity) {
    const int wo = createWorkOrder(createEquipment(createCustomer()));
    const int part = createPart("BAT-001", 5);
    EXPECT_THROW(m_store->addPartUsage(PartUsage(wo, part, 0)), ValidationError);
    EXPECT_THROW(m_store->addPartUsage(PartUsage(wo + 1, part, 1)), ReferenceError);
    EXPECT_THROW(m_store->addPartUsage(PartUsage(wo, part + 1, 1)), ReferenceError);

    m_store->addPartUsage(PartUsage(wo, part, 2));
    m_store->addPartUsage(PartUsage(wo, part, 1));
    EXPECT_EQ(m_store->partUsages(wo).size(), 2);
    EXPECT_EQ(m_store->consumedQuantity(part), 3);
}

// --- Invoices ---

TEST_F(RecordStoreTest, Invoices_FilterByStatusNewestFirst) {
    const int wo = createWorkOrder(createEquipment(createCustomer()));
    const int older = m_store->addInvoice(Invoice(wo, 50.0, QDate(2024, 1, 1)));
    const int newer = m_store->addInvoice(Invoice(wo, 75.0, QDate(2024, 2, 1)));
    m_store->setInvoiceStatus(older, Invoice::Paid);

    const QVector<Invoice> all = m_store->invoices();
    ASSERT_EQ(all.size(), 2);
    EXPECT_EQ(all[0].id(), newer);

    const QVector<Invoice> paid = m_store->invoices(Invoice::Paid);
    ASSERT_EQ(paid.size(), 1);
    EXPECT_EQ(paid[0].id(), older);
    EXPECT_DOUBLE_EQ(paid[0].amount(), 50.0);

    EXPECT_THROW(m_store->setInvoiceStatus(newer + 10, Invoice::Paid), NotFoundError);
}

// --- Transactions ---

TEST_F(RecordStoreTest, TransactionGuard_RollsBackWithoutCommit) {
    {
        TransactionGuard tx(*m_store);
        createCustomer("Temp", "Customer");
    }
    EXPECT_TRUE(m_store->customers().isEmpty());

    {
        TransactionGuard tx(*m_store);
        createCustomer("Kept", "Customer");
        tx.commit();
    }
    EXPECT_EQ(m_store->customers().size(), 1);
}
