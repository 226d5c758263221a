#include "PartsForm.h"
#include "Errors.h"
#include "InventoryLedger.h"
#include "PartDelegate.h"
#include "RecordDialog.h"
#include "RecordExporter.h"
#include "RecordStore.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QMessageBox>
#include <QFileDialog>

namespace {
const int kQuantityColumn = 3;
}

PartsForm::PartsForm(const ShopServices &services, QWidget *parent)
    : QWidget(parent), m_services(services) {
    setupUI();
}

void PartsForm::setupUI() {
    QVBoxLayout *layout = new QVBoxLayout(this);

    m_tableView = new QTableWidget(0, 6, this);
    m_tableView->setHorizontalHeaderLabels({"ID", "SKU", "Description", "On hand", "Unit cost", "Stock value"});
    m_tableView->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_tableView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_tableView->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_tableView->horizontalHeader()->setSectionResizeMode(2, QHeaderView::Stretch);

    // out-of-stock rows in light red
    m_tableView->setItemDelegate(new PartDelegate(kQuantityColumn, this));
    layout->addWidget(m_tableView);

    m_policyLabel = new QLabel(this);
    layout->addWidget(m_policyLabel);

    QHBoxLayout *btnLayout = new QHBoxLayout();
    m_addBtn = new QPushButton("Add part", this);
    m_receiveBtn = new QPushButton("Receive stock", this);
    m_exportBtn = new QPushButton("Export CSV", this);

    btnLayout->addWidget(m_addBtn);
    btnLayout->addWidget(m_receiveBtn);
    btnLayout->addWidget(m_exportBtn);
    btnLayout->addStretch();
    layout->addLayout(btnLayout);

    connect(m_addBtn, &QPushButton::clicked, this, &PartsForm::addPart);
    connect(m_receiveBtn, &QPushButton::clicked, this, &PartsForm::receiveStock);
    connect(m_exportBtn, &QPushButton::clicked, this, &PartsForm::exportCsv);

    setLayout(layout);
}

void PartsForm::showEvent(QShowEvent *event) {
    QWidget::showEvent(event);
    refresh();
}

void PartsForm::refresh() {
    m_policyLabel->setText(m_services.ledger.policy().allowNegativeStock
                           ? "Parts may be used beyond the stock on hand"
                           : "Usage beyond the stock on hand is rejected");
    m_tableView->setRowCount(0);
    try {
        for (const Part &p : m_services.store.parts()) {
            const int row = m_tableView->rowCount();
            m_tableView->insertRow(row);
            m_tableView->setItem(row, 0, new QTableWidgetItem(QString::number(p.id())));
            m_tableView->setItem(row, 1, new QTableWidgetItem(p.sku()));
            m_tableView->setItem(row, 2, new QTableWidgetItem(p.description()));
            m_tableView->setItem(row, kQuantityColumn, new QTableWidgetItem(QString::number(p.quantity())));
            m_tableView->setItem(row, 4, new QTableWidgetItem(QString::number(p.unitCost(), 'f', 2)));
            m_tableView->setItem(row, 5, new QTableWidgetItem(QString::number(p.stockValue(), 'f', 2)));
        }
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
    }
}

int PartsForm::selectedPartId() const {
    const int row = m_tableView->currentRow();
    if (row < 0 || !m_tableView->item(row, 0)) return 0;
    return m_tableView->item(row, 0)->text().toInt();
}

void PartsForm::addPart() {
    RecordDialog dialog("New part", this);
    dialog.addText("SKU");
    dialog.addText("Description");
    dialog.addNumber("Quantity", 0, 0, 1000000);
    dialog.addNumber("Unit cost", 0, 0, 1000000, 2);
    if (dialog.exec() != QDialog::Accepted) return;

    try {
        m_services.store.addPart(Part(dialog.text("SKU"), dialog.text("Description"),
                                      static_cast<int>(dialog.number("Quantity")),
                                      dialog.number("Unit cost")));
        refresh();
    } catch (const RepairShopError &e) {
        QMessageBox::warning(this, "Error", e.message());
    }
}

void PartsForm::receiveStock() {
    const int partId = selectedPartId();
    if (partId == 0) {
        QMessageBox::warning(this, "Error", "Select a part first");
        return;
    }

    RecordDialog dialog("Receive stock", this);
    dialog.addNumber("Quantity", 1, 1, 1000000);
    dialog.addNumber("Unit cost", 0, 0, 1000000, 2);
    dialog.addText("Supplier");
    if (dialog.exec() != QDialog::Accepted) return;

    try {
        m_services.ledger.receiveStock(partId, static_cast<int>(dialog.number("Quantity")),
                                       dialog.number("Unit cost"), dialog.text("Supplier"));
        refresh();
    } catch (const RepairShopError &e) {
        QMessageBox::warning(this, "Error", e.message());
    }
}

void PartsForm::exportCsv() {
    const QString file = QFileDialog::getSaveFileName(this, "Export parts", "parts.csv", "CSV (*.csv)");
    if (file.isEmpty()) return;

    try {
        RecordExporter::exportParts(m_services.store, file);
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Export failed", e.message());
    }
}
