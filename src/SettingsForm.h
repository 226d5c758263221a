#ifndef SETTINGSFORM_H
#define SETTINGSFORM_H

#include "ShopServices.h"

#include <QWidget>
#include <QTableWidget>
#include <QPushButton>
#include <QLineEdit>
#include <QPlainTextEdit>

// Technicians and the business letterhead
class SettingsForm : public QWidget {
    Q_OBJECT
public:
    SettingsForm(const ShopServices &services, QWidget *parent = nullptr);

public slots:
    void refresh();

private slots:
    void addTechnician();
    void saveBusinessInfo();

protected:
    void showEvent(QShowEvent *event) override;

private:
    void setupUI();

    ShopServices m_services;
    QTableWidget *m_technicianTable;
    QPushButton *m_addTechnicianBtn;
    QLineEdit *m_nameEdit;
    QPlainTextEdit *m_addressEdit;
    QLineEdit *m_phoneEdit;
    QLineEdit *m_emailEdit;
    QLineEdit *m_websiteEdit;
    QPushButton *m_saveBtn;
};

#endif // SETTINGSFORM_H
