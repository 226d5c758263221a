#include "InvoicesForm.h"
#include "Errors.h"
#include "InvoiceManager.h"
#include "RecordDialog.h"
#include "RecordExporter.h"
#include "RecordStore.h"
#include "ShopDocuments.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QMessageBox>
#include <QFileDialog>
#include <optional>

InvoicesForm::InvoicesForm(const ShopServices &services, QWidget *parent)
    : QWidget(parent), m_services(services) {
    setupUI();
}

void InvoicesForm::setupUI() {
    QVBoxLayout *layout = new QVBoxLayout(this);

    m_filterCombo = new QComboBox(this);
    m_filterCombo->addItem("All invoices");
    m_filterCombo->addItem("Outstanding", QVariant(static_cast<int>(Invoice::Outstanding)));
    m_filterCombo->addItem("Paid", QVariant(static_cast<int>(Invoice::Paid)));
    layout->addWidget(m_filterCombo);

    m_tableView = new QTableWidget(0, 7, this);
    m_tableView->setHorizontalHeaderLabels({"ID", "WO #", "Amount", "Status", "Issued", "Due", "Notes"});
    m_tableView->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_tableView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_tableView->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_tableView->horizontalHeader()->setStretchLastSection(true);
    layout->addWidget(m_tableView);

    QHBoxLayout *btnLayout = new QHBoxLayout();
    m_issueBtn = new QPushButton("Issue invoice", this);
    m_paidBtn = new QPushButton("Mark paid", this);
    m_outstandingBtn = new QPushButton("Mark outstanding", this);
    m_pdfBtn = new QPushButton("Invoice PDF", this);
    m_exportBtn = new QPushButton("Export CSV", this);

    btnLayout->addWidget(m_issueBtn);
    btnLayout->addWidget(m_paidBtn);
    btnLayout->addWidget(m_outstandingBtn);
    btnLayout->addWidget(m_pdfBtn);
    btnLayout->addWidget(m_exportBtn);
    btnLayout->addStretch();
    layout->addLayout(btnLayout);

    connect(m_filterCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &InvoicesForm::refresh);
    connect(m_issueBtn, &QPushButton::clicked, this, &InvoicesForm::issueInvoice);
    connect(m_paidBtn, &QPushButton::clicked, this, &InvoicesForm::markPaid);
    connect(m_outstandingBtn, &QPushButton::clicked, this, &InvoicesForm::markOutstanding);
    connect(m_pdfBtn, &QPushButton::clicked, this, &InvoicesForm::printInvoice);
    connect(m_exportBtn, &QPushButton::clicked, this, &InvoicesForm::exportCsv);

    setLayout(layout);
}

void InvoicesForm::showEvent(QShowEvent *event) {
    QWidget::showEvent(event);
    refresh();
}

void InvoicesForm::refresh() {
    std::optional<Invoice::Status> status;
    const QVariant filter = m_filterCombo->currentData();
    if (filter.isValid()) {
        status = static_cast<Invoice::Status>(filter.toInt());
    }

    m_tableView->setRowCount(0);
    try {
        for (const Invoice &inv : m_services.invoices.invoices(status)) {
            const int row = m_tableView->rowCount();
            m_tableView->insertRow(row);
            m_tableView->setItem(row, 0, new QTableWidgetItem(QString::number(inv.id())));
            m_tableView->setItem(row, 1, new QTableWidgetItem(QString::number(inv.workOrderId())));
            m_tableView->setItem(row, 2, new QTableWidgetItem(QString::number(inv.amount(), 'f', 2)));
            m_tableView->setItem(row, 3, new QTableWidgetItem(Invoice::statusToString(inv.status())));
            m_tableView->setItem(row, 4, new QTableWidgetItem(inv.issuedOn().toString(Qt::ISODate)));
            m_tableView->setItem(row, 5, new QTableWidgetItem(inv.dueDate().toString(Qt::ISODate)));
            m_tableView->setItem(row, 6, new QTableWidgetItem(inv.notes()));
        }
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
    }
}

int InvoicesForm::selectedInvoiceId() const {
    const int row = m_tableView->currentRow();
    if (row < 0 || !m_tableView->item(row, 0)) return 0;
    return m_tableView->item(row, 0)->text().toInt();
}

void InvoicesForm::issueInvoice() {
    QVector<QPair<QString, QVariant>> orders;
    try {
        for (const WorkOrder &wo : m_services.store.workOrders(Qt::DescendingOrder)) {
            orders.append(qMakePair(QString("#%1 %2").arg(wo.id()).arg(wo.description().left(40)),
                                    QVariant(wo.id())));
        }
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
        return;
    }
    if (orders.isEmpty()) {
        QMessageBox::warning(this, "Error", "There are no work orders to invoice");
        return;
    }

    RecordDialog dialog("Issue invoice", this);
    dialog.addChoice("Work order", orders);
    dialog.addNumber("Amount", 0, 0, 10000000, 2);
    dialog.addDate("Due date");
    dialog.addMultiline("Notes");
    if (dialog.exec() != QDialog::Accepted) return;

    try {
        m_services.invoices.issue(dialog.choice("Work order").toInt(), dialog.number("Amount"),
                                  dialog.date("Due date"), dialog.text("Notes"));
        refresh();
    } catch (const RepairShopError &e) {
        QMessageBox::warning(this, "Error", e.message());
    }
}

void InvoicesForm::markPaid() {
    const int id = selectedInvoiceId();
    if (id == 0) {
        QMessageBox::warning(this, "Error", "Select an invoice first");
        return;
    }
    try {
        m_services.invoices.markPaid(id);
        refresh();
    } catch (const RepairShopError &e) {
        QMessageBox::warning(this, "Error", e.message());
    }
}

void InvoicesForm::markOutstanding() {
    const int id = selectedInvoiceId();
    if (id == 0) {
        QMessageBox::warning(this, "Error", "Select an invoice first");
        return;
    }
    try {
        m_services.invoices.markOutstanding(id);
        refresh();
    } catch (const RepairShopError &e) {
        QMessageBox::warning(this, "Error", e.message());
    }
}

void InvoicesForm::printInvoice() {
    const int id = selectedInvoiceId();
    if (id == 0) {
        QMessageBox::warning(this, "Error", "Select an invoice first");
        return;
    }
    const QString file = QFileDialog::getSaveFileName(this, "Save invoice",
                                                      QString("invoice_%1.pdf").arg(id), "PDF (*.pdf)");
    if (file.isEmpty()) return;

    try {
        m_services.documents.print(m_services.documents.invoice(id), file);
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
    }
}

void InvoicesForm::exportCsv() {
    const QString file = QFileDialog::getSaveFileName(this, "Export invoices", "invoices.csv", "CSV (*.csv)");
    if (file.isEmpty()) return;

    try {
        RecordExporter::exportInvoices(m_services.store, file);
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Export failed", e.message());
    }
}
