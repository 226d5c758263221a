#include "WorkOrdersForm.h"
#include "Errors.h"
#include "RecordDialog.h"
#include "RecordExporter.h"
#include "RecordStore.h"
#include "ShopDocuments.h"
#include "WorkOrderLifecycle.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QMessageBox>
#include <QFileDialog>
#include <QSplitter>

WorkOrdersForm::WorkOrdersForm(const ShopServices &services, QWidget *parent)
    : QWidget(parent), m_services(services) {
    setupUI();
}

void WorkOrdersForm::setupUI() {
    QVBoxLayout *layout = new QVBoxLayout(this);

    QHBoxLayout *filterLayout = new QHBoxLayout();
    m_filterCombo = new QComboBox(this);
    m_filterCombo->addItem("Open work orders");
    m_filterCombo->addItem("All work orders");
    m_searchEdit = new QLineEdit(this);
    m_searchEdit->setPlaceholderText("Description, serial number or #id");
    filterLayout->addWidget(m_filterCombo);
    filterLayout->addWidget(new QLabel("Search:", this));
    filterLayout->addWidget(m_searchEdit, 1);
    layout->addLayout(filterLayout);

    QSplitter *splitter = new QSplitter(Qt::Vertical, this);

    m_tableView = new QTableWidget(0, 7, this);
    m_tableView->setHorizontalHeaderLabels({"WO #", "Opened", "Due", "Customer", "Equipment",
                                            "Technician", "Status"});
    m_tableView->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_tableView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_tableView->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_tableView->horizontalHeader()->setStretchLastSection(true);
    splitter->addWidget(m_tableView);

    m_detailView = new QTextEdit(this);
    m_detailView->setReadOnly(true);
    m_detailView->setFontFamily("Courier New");
    splitter->addWidget(m_detailView);
    layout->addWidget(splitter, 1);

    QHBoxLayout *btnLayout = new QHBoxLayout();
    m_openBtn = new QPushButton("Open work order", this);
    m_logBtn = new QPushButton("Log work", this);
    m_partBtn = new QPushButton("Use part", this);
    m_closeBtn = new QPushButton("Close", this);
    m_slipBtn = new QPushButton("Work order PDF", this);
    m_exportBtn = new QPushButton("Export CSV", this);

    btnLayout->addWidget(m_openBtn);
    btnLayout->addWidget(m_logBtn);
    btnLayout->addWidget(m_partBtn);
    btnLayout->addWidget(m_closeBtn);
    btnLayout->addWidget(m_slipBtn);
    btnLayout->addWidget(m_exportBtn);
    btnLayout->addStretch();
    layout->addLayout(btnLayout);

    connect(m_filterCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &WorkOrdersForm::refresh);
    connect(m_searchEdit, &QLineEdit::returnPressed, this, &WorkOrdersForm::refresh);
    connect(m_tableView, &QTableWidget::itemSelectionChanged, this, &WorkOrdersForm::showSelected);
    connect(m_openBtn, &QPushButton::clicked, this, &WorkOrdersForm::openWorkOrder);
    connect(m_logBtn, &QPushButton::clicked, this, &WorkOrdersForm::logDetail);
    connect(m_partBtn, &QPushButton::clicked, this, &WorkOrdersForm::usePart);
    connect(m_closeBtn, &QPushButton::clicked, this, &WorkOrdersForm::closeWorkOrder);
    connect(m_slipBtn, &QPushButton::clicked, this, &WorkOrdersForm::printSlip);
    connect(m_exportBtn, &QPushButton::clicked, this, &WorkOrdersForm::exportCsv);

    setLayout(layout);
}

void WorkOrdersForm::showEvent(QShowEvent *event) {
    QWidget::showEvent(event);
    refresh();
}

void WorkOrdersForm::refresh() {
    try {
        QVector<WorkOrderSummary> orders;
        const QString term = m_searchEdit->text().trimmed();
        if (!term.isEmpty()) {
            for (const WorkOrder &wo : m_services.reports.search(term).workOrders) {
                orders.append(m_services.reports.summary(wo.id()));
            }
        } else if (m_filterCombo->currentIndex() == 0) {
            orders = m_services.reports.openWorkOrders();
        } else {
            for (const WorkOrder &wo : m_services.store.workOrders(Qt::DescendingOrder)) {
                orders.append(m_services.reports.summary(wo.id()));
            }
        }
        showOrders(orders);
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
    }
}

void WorkOrdersForm::showOrders(const QVector<WorkOrderSummary> &orders) {
    m_tableView->setRowCount(0);
    m_detailView->clear();
    for (const WorkOrderSummary &s : orders) {
        const int row = m_tableView->rowCount();
        m_tableView->insertRow(row);
        m_tableView->setItem(row, 0, new QTableWidgetItem(QString::number(s.order.id())));
        m_tableView->setItem(row, 1, new QTableWidgetItem(s.order.dateOpened().toString(Qt::ISODate)));
        m_tableView->setItem(row, 2, new QTableWidgetItem(s.order.dueDate().toString(Qt::ISODate)));
        m_tableView->setItem(row, 3, new QTableWidgetItem(s.customer.fullName()));
        m_tableView->setItem(row, 4, new QTableWidgetItem(s.equipment.displayName()));
        m_tableView->setItem(row, 5, new QTableWidgetItem(s.technician ? s.technician->name() : QString()));
        m_tableView->setItem(row, 6, new QTableWidgetItem(WorkOrder::statusToString(s.order.status())));
    }
}

int WorkOrdersForm::selectedWorkOrderId() const {
    const int row = m_tableView->currentRow();
    if (row < 0 || !m_tableView->item(row, 0)) return 0;
    return m_tableView->item(row, 0)->text().toInt();
}

void WorkOrdersForm::showSelected() {
    m_detailView->clear();
    const int id = selectedWorkOrderId();
    if (id == 0) return;

    try {
        const WorkOrderSummary s = m_services.reports.summary(id);
        m_detailView->append(QString("Work order #%1  [%2]").arg(id).arg(WorkOrder::statusToString(s.order.status())));
        m_detailView->append(s.order.description());
        m_detailView->append(QString());
        m_detailView->append("Work log:");
        for (const WorkDetail &d : m_services.reports.workDetails(id)) {
            m_detailView->append(QString("  %1  %2").arg(d.date().toString(Qt::ISODate), d.description()));
        }
        m_detailView->append(QString());
        m_detailView->append("Parts used:");
        for (const PartUsageLine &line : m_services.reports.partUsages(id)) {
            m_detailView->append(QString("  %1 x %2  %3")
                                 .arg(line.usage.quantity())
                                 .arg(line.part.sku(), line.part.description()));
        }
    } catch (const RepairShopError &e) {
        m_detailView->append(e.message());
    }
}

void WorkOrdersForm::openWorkOrder() {
    QVector<QPair<QString, QVariant>> equipment;
    QVector<QPair<QString, QVariant>> technicians;
    technicians.append(qMakePair(QString("Unassigned"), QVariant()));
    try {
        for (const Equipment &e : m_services.store.allEquipment()) {
            const Customer owner = m_services.store.customer(e.customerId());
            equipment.append(qMakePair(QString("%1 - %2 (%3)").arg(owner.fullName(), e.displayName(), e.serialNumber()),
                                       QVariant(e.id())));
        }
        for (const Technician &t : m_services.store.technicians()) {
            technicians.append(qMakePair(t.name(), QVariant(t.id())));
        }
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
        return;
    }
    if (equipment.isEmpty()) {
        QMessageBox::warning(this, "Error", "Add a customer and their equipment first");
        return;
    }

    RecordDialog dialog("Open work order", this);
    dialog.addChoice("Equipment", equipment);
    dialog.addChoice("Technician", technicians);
    dialog.addMultiline("Description");
    dialog.addDate("Due date");
    if (dialog.exec() != QDialog::Accepted) return;

    const QVariant technician = dialog.choice("Technician");
    try {
        m_services.lifecycle.open(dialog.choice("Equipment").toInt(),
                                  technician.isValid() ? std::optional<int>(technician.toInt()) : std::nullopt,
                                  dialog.text("Description"), dialog.date("Due date"));
        refresh();
    } catch (const RepairShopError &e) {
        QMessageBox::warning(this, "Error", e.message());
    }
}

void WorkOrdersForm::logDetail() {
    const int id = selectedWorkOrderId();
    if (id == 0) {
        QMessageBox::warning(this, "Error", "Select a work order first");
        return;
    }

    RecordDialog dialog(QString("Log work on #%1").arg(id), this);
    dialog.addMultiline("Work performed");
    if (dialog.exec() != QDialog::Accepted) return;

    try {
        m_services.lifecycle.logDetail(id, dialog.text("Work performed"));
        showSelected();
    } catch (const RepairShopError &e) {
        QMessageBox::warning(this, "Error", e.message());
    }
}

void WorkOrdersForm::usePart() {
    const int id = selectedWorkOrderId();
    if (id == 0) {
        QMessageBox::warning(this, "Error", "Select a work order first");
        return;
    }

    QVector<QPair<QString, QVariant>> parts;
    try {
        for (const Part &p : m_services.store.parts()) {
            parts.append(qMakePair(QString("%1 - %2 (%3 on hand)")
                                       .arg(p.sku(), p.description(), QString::number(p.quantity())),
                                   QVariant(p.id())));
        }
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
        return;
    }
    if (parts.isEmpty()) {
        QMessageBox::warning(this, "Error", "No parts in inventory");
        return;
    }

    RecordDialog dialog(QString("Use part on #%1").arg(id), this);
    dialog.addChoice("Part", parts);
    dialog.addNumber("Quantity", 1, 1, 100000);
    if (dialog.exec() != QDialog::Accepted) return;

    try {
        m_services.lifecycle.recordPartUsage(id, dialog.choice("Part").toInt(),
                                             static_cast<int>(dialog.number("Quantity")));
        showSelected();
    } catch (const InsufficientStockError &e) {
        QMessageBox::warning(this, "Not enough stock", e.message());
    } catch (const RepairShopError &e) {
        QMessageBox::warning(this, "Error", e.message());
    }
}

void WorkOrdersForm::closeWorkOrder() {
    const int id = selectedWorkOrderId();
    if (id == 0) {
        QMessageBox::warning(this, "Error", "Select a work order first");
        return;
    }
    if (QMessageBox::question(this, "Close work order", QString("Close work order #%1?").arg(id))
            != QMessageBox::Yes) {
        return;
    }

    try {
        m_services.lifecycle.close(id);
        refresh();
    } catch (const RepairShopError &e) {
        QMessageBox::warning(this, "Error", e.message());
    }
}

void WorkOrdersForm::printSlip() {
    const int id = selectedWorkOrderId();
    if (id == 0) {
        QMessageBox::warning(this, "Error", "Select a work order first");
        return;
    }
    const QString file = QFileDialog::getSaveFileName(this, "Save work order",
                                                      QString("work_order_%1.pdf").arg(id), "PDF (*.pdf)");
    if (file.isEmpty()) return;

    try {
        m_services.documents.print(m_services.documents.workOrderSlip(id), file);
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
    }
}

void WorkOrdersForm::exportCsv() {
    const QString file = QFileDialog::getSaveFileName(this, "Export work orders", "work_orders.csv", "CSV (*.csv)");
    if (file.isEmpty()) return;

    try {
        RecordExporter::exportWorkOrders(m_services.store, file);
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Export failed", e.message());
    }
}
