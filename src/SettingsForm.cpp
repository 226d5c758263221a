#include "SettingsForm.h"
#include "Errors.h"
#include "RecordStore.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QFormLayout>
#include <QGroupBox>
#include <QHeaderView>
#include <QInputDialog>
#include <QMessageBox>

SettingsForm::SettingsForm(const ShopServices &services, QWidget *parent)
    : QWidget(parent), m_services(services) {
    setupUI();
}

void SettingsForm::setupUI() {
    QHBoxLayout *layout = new QHBoxLayout(this);

    QGroupBox *techBox = new QGroupBox("Technicians", this);
    QVBoxLayout *techLayout = new QVBoxLayout(techBox);
    m_technicianTable = new QTableWidget(0, 2, techBox);
    m_technicianTable->setHorizontalHeaderLabels({"ID", "Name"});
    m_technicianTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_technicianTable->horizontalHeader()->setStretchLastSection(true);
    techLayout->addWidget(m_technicianTable);
    m_addTechnicianBtn = new QPushButton("Add technician", techBox);
    techLayout->addWidget(m_addTechnicianBtn);
    layout->addWidget(techBox, 1);

    QGroupBox *businessBox = new QGroupBox("Business info (printed on documents)", this);
    QVBoxLayout *businessLayout = new QVBoxLayout(businessBox);
    QFormLayout *form = new QFormLayout();
    m_nameEdit = new QLineEdit(businessBox);
    m_addressEdit = new QPlainTextEdit(businessBox);
    m_addressEdit->setFixedHeight(80);
    m_phoneEdit = new QLineEdit(businessBox);
    m_emailEdit = new QLineEdit(businessBox);
    m_websiteEdit = new QLineEdit(businessBox);
    form->addRow("Name:", m_nameEdit);
    form->addRow("Address:", m_addressEdit);
    form->addRow("Phone:", m_phoneEdit);
    form->addRow("Email:", m_emailEdit);
    form->addRow("Website:", m_websiteEdit);
    businessLayout->addLayout(form);
    m_saveBtn = new QPushButton("Save", businessBox);
    businessLayout->addWidget(m_saveBtn);
    businessLayout->addStretch();
    layout->addWidget(businessBox, 1);

    connect(m_addTechnicianBtn, &QPushButton::clicked, this, &SettingsForm::addTechnician);
    connect(m_saveBtn, &QPushButton::clicked, this, &SettingsForm::saveBusinessInfo);

    setLayout(layout);
}

void SettingsForm::showEvent(QShowEvent *event) {
    QWidget::showEvent(event);
    refresh();
}

void SettingsForm::refresh() {
    m_technicianTable->setRowCount(0);
    try {
        for (const Technician &t : m_services.store.technicians()) {
            const int row = m_technicianTable->rowCount();
            m_technicianTable->insertRow(row);
            m_technicianTable->setItem(row, 0, new QTableWidgetItem(QString::number(t.id())));
            m_technicianTable->setItem(row, 1, new QTableWidgetItem(t.name()));
        }

        const BusinessInfo info = m_services.store.businessInfo();
        m_nameEdit->setText(info.name);
        m_addressEdit->setPlainText(info.address);
        m_phoneEdit->setText(info.phone);
        m_emailEdit->setText(info.email);
        m_websiteEdit->setText(info.website);
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
    }
}

void SettingsForm::addTechnician() {
    bool ok = false;
    const QString name = QInputDialog::getText(this, "New technician", "Name:", QLineEdit::Normal,
                                               QString(), &ok);
    if (!ok) return;

    try {
        m_services.store.addTechnician(Technician(name.trimmed()));
        refresh();
    } catch (const RepairShopError &e) {
        QMessageBox::warning(this, "Error", e.message());
    }
}

void SettingsForm::saveBusinessInfo() {
    BusinessInfo info;
    info.name = m_nameEdit->text().trimmed();
    info.address = m_addressEdit->toPlainText().trimmed();
    info.phone = m_phoneEdit->text().trimmed();
    info.email = m_emailEdit->text().trimmed();
    info.website = m_websiteEdit->text().trimmed();

    try {
        m_services.store.saveBusinessInfo(info);
        QMessageBox::information(this, "Saved", "Business info saved");
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Error", e.message());
    }
}
