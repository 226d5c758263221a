#include "CustomersForm.h"
#include "BackupManager.h"
#include "Errors.h"
#include "RecordDialog.h"
#include "RecordExporter.h"
#include "RecordStore.h"
#include "ReportService.h"
#include "ShopDocuments.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QMessageBox>
#include <QFileDialog>
#include <QSplitter>

CustomersForm::CustomersForm(const ShopServices &services, QWidget *parent)
    : QWidget(parent), m_services(services) {
    setupUI();
}

void CustomersForm::setupUI() {
    QVBoxLayout *layout = new QVBoxLayout(this);

    QHBoxLayout *searchLayout = new QHBoxLayout();
    m_searchEdit = new QLineEdit(this);
    m_searchEdit->setPlaceholderText("Name, phone or email");
    QPushButton *searchBtn = new QPushButton("Search", this);
    QPushButton *clearBtn = new QPushButton("Show all", this);
    searchLayout->addWidget(new QLabel("Search:", this));
    searchLayout->addWidget(m_searchEdit, 1);
    searchLayout->addWidget(searchBtn);
    searchLayout->addWidget(clearBtn);
    layout->addLayout(searchLayout);

    QSplitter *splitter = new QSplitter(Qt::Vertical, this);

    m_customerTable = new QTableWidget(0, 6, this);
    m_customerTable->setHorizontalHeaderLabels({"ID", "First name", "Last name", "Phone", "Email", "Address"});
    m_customerTable->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_customerTable->setSelectionMode(QAbstractItemView::SingleSelection);
    m_customerTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_customerTable->horizontalHeader()->setStretchLastSection(true);
    splitter->addWidget(m_customerTable);

    m_equipmentTable = new QTableWidget(0, 8, this);
    m_equipmentTable->setHorizontalHeaderLabels({"ID", "Make", "Model", "Serial", "CPU", "RAM", "Storage", "OS"});
    m_equipmentTable->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_equipmentTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_equipmentTable->horizontalHeader()->setStretchLastSection(true);
    splitter->addWidget(m_equipmentTable);
    layout->addWidget(splitter, 1);

    QHBoxLayout *btnLayout = new QHBoxLayout();
    m_addBtn = new QPushButton("Add customer", this);
    m_addEquipmentBtn = new QPushButton("Add equipment", this);
    m_importBtn = new QPushButton("Import CSV", this);
    m_exportBtn = new QPushButton("Export CSV", this);
    m_historyBtn = new QPushButton("History PDF", this);

    btnLayout->addWidget(m_addBtn);
    btnLayout->addWidget(m_addEquipmentBtn);
    btnLayout->addWidget(m_importBtn);
    btnLayout->addWidget(m_exportBtn);
    btnLayout->addWidget(m_historyBtn);
    btnLayout->addStretch();
    layout->addLayout(btnLayout);

    connect(searchBtn, &QPushButton::clicked, this, &CustomersForm::search);
    connect(m_searchEdit, &QLineEdit::returnPressed, this, &CustomersForm::search);
    connect(clearBtn, &QPushButton::clicked, this, &CustomersForm::refresh);
    connect(m_addBtn, &QPushButton::clicked, this, &CustomersForm::addCustomer);
    connect(m_addEquipmentBtn, &QPushButton::clicked, this, &CustomersForm::addEquipment);
    connect(m_importBtn, &QPushButton::clicked, this, &CustomersForm::importCsv);
    connect(m_exportBtn, &QPushButton::clicked, this, &CustomersForm::exportCsv);
    connect(m_historyBtn, &QPushButton::clicked, this, &CustomersForm::printHistory);
    connect(m_customerTable, &QTableWidget::itemSelectionChanged, this, &CustomersForm::loadEquipment);

    setLayout(layout);
}

void CustomersForm::showEvent(QShowEvent *event) {
    QWidget::showEvent(event);
    refresh();
}

void CustomersForm::refresh() {
    m_searchEdit->clear();
    try {
        showCustomers(m_services.store.customers());
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
    }
}

void CustomersForm::showCustomers(const QVector<Customer> &customers) {
    m_customerTable->setRowCount(0);
    for (const Customer &c : customers) {
        const int row = m_customerTable->rowCount();
        m_customerTable->insertRow(row);
        m_customerTable->setItem(row, 0, new QTableWidgetItem(QString::number(c.id())));
        m_customerTable->setItem(row, 1, new QTableWidgetItem(c.firstName()));
        m_customerTable->setItem(row, 2, new QTableWidgetItem(c.lastName()));
        m_customerTable->setItem(row, 3, new QTableWidgetItem(c.phone()));
        m_customerTable->setItem(row, 4, new QTableWidgetItem(c.email()));
        m_customerTable->setItem(row, 5, new QTableWidgetItem(c.address()));
    }
    m_equipmentTable->setRowCount(0);
}

int CustomersForm::selectedCustomerId() const {
    const int row = m_customerTable->currentRow();
    if (row < 0 || !m_customerTable->item(row, 0)) return 0;
    return m_customerTable->item(row, 0)->text().toInt();
}

void CustomersForm::loadEquipment() {
    m_equipmentTable->setRowCount(0);
    const int customerId = selectedCustomerId();
    if (customerId == 0) return;

    try {
        for (const Equipment &e : m_services.store.equipmentForCustomer(customerId)) {
            const int row = m_equipmentTable->rowCount();
            m_equipmentTable->insertRow(row);
            m_equipmentTable->setItem(row, 0, new QTableWidgetItem(QString::number(e.id())));
            m_equipmentTable->setItem(row, 1, new QTableWidgetItem(e.make()));
            m_equipmentTable->setItem(row, 2, new QTableWidgetItem(e.model()));
            m_equipmentTable->setItem(row, 3, new QTableWidgetItem(e.serialNumber()));
            m_equipmentTable->setItem(row, 4, new QTableWidgetItem(e.cpu()));
            m_equipmentTable->setItem(row, 5, new QTableWidgetItem(e.ram()));
            m_equipmentTable->setItem(row, 6, new QTableWidgetItem(e.storage()));
            m_equipmentTable->setItem(row, 7, new QTableWidgetItem(e.os()));
        }
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
    }
}

void CustomersForm::search() {
    try {
        const SearchResults results = m_services.reports.search(m_searchEdit->text());
        showCustomers(results.customers);
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
    }
}

void CustomersForm::addCustomer() {
    RecordDialog dialog("New customer", this);
    dialog.addText("First name");
    dialog.addText("Last name");
    dialog.addText("Phone");
    dialog.addText("Email");
    dialog.addMultiline("Address");
    dialog.addMultiline("Notes");
    if (dialog.exec() != QDialog::Accepted) return;

    Customer customer(dialog.text("First name"), dialog.text("Last name"),
                      dialog.text("Phone"), dialog.text("Email"), dialog.text("Address"));
    customer.setNotes(dialog.text("Notes"));
    try {
        m_services.store.addCustomer(customer);
        refresh();
    } catch (const RepairShopError &e) {
        QMessageBox::warning(this, "Error", e.message());
    }
}

void CustomersForm::addEquipment() {
    const int customerId = selectedCustomerId();
    if (customerId == 0) {
        QMessageBox::warning(this, "Error", "Select a customer first");
        return;
    }

    RecordDialog dialog("New equipment", this);
    dialog.addText("Make");
    dialog.addText("Model");
    dialog.addText("Serial number");
    dialog.addText("CPU");
    dialog.addText("RAM");
    dialog.addText("Storage");
    dialog.addText("OS");
    dialog.addMultiline("Notes");
    if (dialog.exec() != QDialog::Accepted) return;

    Equipment equipment(customerId, dialog.text("Make"), dialog.text("Model"),
                        dialog.text("Serial number"));
    equipment.setCpu(dialog.text("CPU"));
    equipment.setRam(dialog.text("RAM"));
    equipment.setStorage(dialog.text("Storage"));
    equipment.setOs(dialog.text("OS"));
    equipment.setNotes(dialog.text("Notes"));
    try {
        m_services.store.addEquipment(equipment);
        loadEquipment();
    } catch (const RepairShopError &e) {
        QMessageBox::warning(this, "Error", e.message());
    }
}

void CustomersForm::importCsv() {
    const QString file = QFileDialog::getOpenFileName(this, "Import customers", "", "CSV (*.csv);;All (*)");
    if (file.isEmpty()) return;

    try {
        m_services.backups.backup(m_services.databaseFile);
    } catch (const PersistenceError &e) {
        if (QMessageBox::question(this, "Import",
                                  QString("Backup before import failed:\n%1\n\nImport anyway?").arg(e.message()))
                != QMessageBox::Yes) {
            return;
        }
    }

    try {
        const ImportResult result = RecordExporter::importCustomers(m_services.store, file);
        refresh();
        QMessageBox::information(this, "Import",
                                 QString("Inserted %1, updated %2, skipped %3")
                                     .arg(QString::number(result.inserted), QString::number(result.updated),
                                          QString::number(result.skipped)));
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Import failed", e.message());
    }
}

void CustomersForm::exportCsv() {
    const QString file = QFileDialog::getSaveFileName(this, "Export customers", "customers.csv", "CSV (*.csv)");
    if (file.isEmpty()) return;

    try {
        RecordExporter::exportCustomers(m_services.store, file);
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Export failed", e.message());
    }
}

void CustomersForm::printHistory() {
    const int customerId = selectedCustomerId();
    if (customerId == 0) {
        QMessageBox::warning(this, "Error", "Select a customer first");
        return;
    }
    const QString file = QFileDialog::getSaveFileName(this, "Save service history",
                                                      QString("customer_%1_history.pdf").arg(customerId),
                                                      "PDF (*.pdf)");
    if (file.isEmpty()) return;

    try {
        m_services.documents.print(m_services.documents.customerHistory(customerId), file);
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
    }
}
