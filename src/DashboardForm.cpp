#include "DashboardForm.h"
#include "Errors.h"
#include "ReportService.h"
#include <QVBoxLayout>
#include <QGroupBox>
#include <QPushButton>

DashboardForm::DashboardForm(const ShopServices &services, QWidget *parent)
    : QWidget(parent), m_services(services) {
    setupUI();
}

void DashboardForm::setupUI() {
    QVBoxLayout *layout = new QVBoxLayout(this);

    QGroupBox *countsBox = new QGroupBox("Shop", this);
    QVBoxLayout *countsLayout = new QVBoxLayout(countsBox);
    m_countsLabel = new QLabel(countsBox);
    countsLayout->addWidget(m_countsLabel);
    layout->addWidget(countsBox);

    QGroupBox *invoicesBox = new QGroupBox("Invoices", this);
    QVBoxLayout *invoicesLayout = new QVBoxLayout(invoicesBox);
    m_invoicesLabel = new QLabel(invoicesBox);
    invoicesLayout->addWidget(m_invoicesLabel);
    layout->addWidget(invoicesBox);

    QGroupBox *stockBox = new QGroupBox("Inventory", this);
    QVBoxLayout *stockLayout = new QVBoxLayout(stockBox);
    m_stockLabel = new QLabel(stockBox);
    stockLayout->addWidget(m_stockLabel);
    layout->addWidget(stockBox);

    QPushButton *refreshBtn = new QPushButton("Refresh", this);
    connect(refreshBtn, &QPushButton::clicked, this, &DashboardForm::refresh);
    layout->addWidget(refreshBtn);
    layout->addStretch();

    setLayout(layout);
}

void DashboardForm::showEvent(QShowEvent *event) {
    QWidget::showEvent(event);
    refresh();
}

void DashboardForm::refresh() {
    try {
        const DashboardStats stats = m_services.reports.dashboard();
        m_countsLabel->setText(QString("Customers: %1\nEquipment: %2\nTechnicians: %3\n"
                                       "Open work orders: %4\nClosed work orders: %5")
                               .arg(stats.customers).arg(stats.equipment).arg(stats.technicians)
                               .arg(stats.openWorkOrders).arg(stats.closedWorkOrders));
        m_invoicesLabel->setText(QString("Outstanding: %1 ($%2)\nPaid: %3 ($%4)")
                                 .arg(stats.outstandingInvoices)
                                 .arg(stats.outstandingTotal, 0, 'f', 2)
                                 .arg(stats.paidInvoices)
                                 .arg(stats.paidTotal, 0, 'f', 2));
        m_stockLabel->setText(QString("Parts out of stock: %1").arg(stats.partsOutOfStock));
    } catch (const RepairShopError &e) {
        m_countsLabel->setText(e.message());
    }
}
