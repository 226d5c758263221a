#include "ShopDocuments.h"
#include "RecordStore.h"

namespace {

QString money(double amount) {
    return QStringLiteral("$%1").arg(amount, 0, 'f', 2);
}

QString dateText(const QDate &date) {
    return date.isValid() ? date.toString(Qt::ISODate) : QString();
}

DocumentSection customerSection(const Customer &c) {
    DocumentSection section;
    section.heading = QStringLiteral("Customer");
    section.paragraphs << c.fullName();
    if (!c.address().isEmpty()) section.paragraphs << c.address();
    section.paragraphs << QStringLiteral("Phone: %1").arg(c.phone())
                       << QStringLiteral("Email: %1").arg(c.email());
    return section;
}

DocumentSection equipmentSection(const Equipment &e) {
    DocumentSection section;
    section.heading = QStringLiteral("Equipment");
    section.paragraphs << QStringLiteral("Make: %1").arg(e.make())
                       << QStringLiteral("Model: %1").arg(e.model())
                       << QStringLiteral("Serial: %1").arg(e.serialNumber());
    if (!e.cpu().isEmpty()) section.paragraphs << QStringLiteral("CPU: %1").arg(e.cpu());
    if (!e.ram().isEmpty()) section.paragraphs << QStringLiteral("RAM: %1").arg(e.ram());
    if (!e.storage().isEmpty()) section.paragraphs << QStringLiteral("Storage: %1").arg(e.storage());
    if (!e.os().isEmpty()) section.paragraphs << QStringLiteral("OS: %1").arg(e.os());
    if (!e.notes().isEmpty()) section.paragraphs << QStringLiteral("Notes: %1").arg(e.notes());
    return section;
}

} // namespace

ShopDocuments::ShopDocuments(const RecordStore &store)
    : m_store(store)
    , m_reports(store)
{
}

DocumentContent ShopDocuments::workOrderSlip(int workOrderId) const {
    const WorkOrderSummary s = m_reports.summary(workOrderId);

    DocumentContent doc;
    doc.title = QStringLiteral("Work Order #%1").arg(s.order.id());
    doc.fields.append({QStringLiteral("Status"), WorkOrder::statusToString(s.order.status())});
    doc.fields.append({QStringLiteral("Date opened"), dateText(s.order.dateOpened())});
    if (s.order.dateClosed().isValid()) {
        doc.fields.append({QStringLiteral("Date closed"), dateText(s.order.dateClosed())});
    }
    if (s.order.dueDate().isValid()) {
        doc.fields.append({QStringLiteral("Due date"), dateText(s.order.dueDate())});
    }
    doc.fields.append({QStringLiteral("Technician"),
                       s.technician ? s.technician->name() : QStringLiteral("Unassigned")});

    doc.sections.append(customerSection(s.customer));
    doc.sections.append(equipmentSection(s.equipment));
    doc.sections.append(DocumentSection{QStringLiteral("Work Description"), {s.order.description()}});

    DocumentSection log{QStringLiteral("Work Log"), {}};
    for (const WorkDetail &d : m_reports.workDetails(workOrderId)) {
        log.paragraphs << QStringLiteral("%1  %2").arg(dateText(d.date()), d.description());
    }
    if (!log.paragraphs.isEmpty()) doc.sections.append(log);

    const QVector<PartUsageLine> usages = m_reports.partUsages(workOrderId);
    if (!usages.isEmpty()) {
        doc.table.heading = QStringLiteral("Parts Used");
        doc.table.header << QStringLiteral("SKU") << QStringLiteral("Description")
                         << QStringLiteral("Qty") << QStringLiteral("Unit cost")
                         << QStringLiteral("Line total");
        double total = 0;
        for (const PartUsageLine &line : usages) {
            const double lineTotal = line.usage.quantity() * line.part.unitCost();
            total += lineTotal;
            doc.table.rows.append(QStringList{line.part.sku(), line.part.description(),
                                   QString::number(line.usage.quantity()),
                                   money(line.part.unitCost()), money(lineTotal)});
        }
        doc.table.rows.append(QStringList{QString(), QStringLiteral("Total"), QString(), QString(), money(total)});
    }
    return doc;
}

DocumentContent ShopDocuments::invoice(int invoiceId) const {
    const Invoice inv = m_store.invoice(invoiceId);
    const WorkOrderSummary s = m_reports.summary(inv.workOrderId());

    DocumentContent doc;
    doc.title = QStringLiteral("Invoice #%1").arg(inv.id());
    doc.fields.append({QStringLiteral("Status"), Invoice::statusToString(inv.status())});
    doc.fields.append({QStringLiteral("Issued on"), dateText(inv.issuedOn())});
    if (inv.dueDate().isValid()) {
        doc.fields.append({QStringLiteral("Due date"), dateText(inv.dueDate())});
    }
    doc.fields.append({QStringLiteral("Amount"), money(inv.amount())});

    doc.sections.append(customerSection(s.customer));
    doc.sections.append(DocumentSection{QStringLiteral("Related Work Order"),
                                        {QStringLiteral("WO #%1").arg(s.order.id()),
                                         QStringLiteral("Description: %1").arg(s.order.description())}});
    doc.sections.append(equipmentSection(s.equipment));
    if (!inv.notes().isEmpty()) {
        doc.sections.append(DocumentSection{QStringLiteral("Notes"), {inv.notes()}});
    }
    return doc;
}

DocumentContent ShopDocuments::customerHistory(int customerId) const {
    const QVector<WorkOrderSummary> history = m_reports.workOrderHistory(customerId);
    const Customer c = m_store.customer(customerId);

    DocumentContent doc;
    doc.title = QStringLiteral("Service History: %1").arg(c.fullName());
    doc.fields.append({QStringLiteral("Work orders"), QString::number(history.size())});
    doc.sections.append(customerSection(c));

    doc.table.heading = QStringLiteral("Work Orders");
    doc.table.header << QStringLiteral("WO #") << QStringLiteral("Opened")
                     << QStringLiteral("Closed") << QStringLiteral("Equipment")
                     << QStringLiteral("Status") << QStringLiteral("Description");
    for (const WorkOrderSummary &s : history) {
        doc.table.rows.append(QStringList{QString::number(s.order.id()), dateText(s.order.dateOpened()),
                               dateText(s.order.dateClosed()), s.equipment.displayName(),
                               WorkOrder::statusToString(s.order.status()), s.order.description()});
    }
    return doc;
}

void ShopDocuments::print(const DocumentContent &content, const QString &fileName) const {
    DocumentRenderer(m_store.businessInfo()).render(content, fileName);
}
