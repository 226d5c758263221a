#ifndef CUSTOMERSFORM_H
#define CUSTOMERSFORM_H

#include "ShopServices.h"
#include "Customer.h"

#include <QWidget>
#include <QTableWidget>
#include <QPushButton>
#include <QLineEdit>
#include <QVector>

class CustomersForm : public QWidget {
    Q_OBJECT
public:
    CustomersForm(const ShopServices &services, QWidget *parent = nullptr);

public slots:
    void refresh();

private slots:
    void addCustomer();
    void addEquipment();
    void search();
    void importCsv();
    void exportCsv();
    void printHistory();
    void loadEquipment();

protected:
    void showEvent(QShowEvent *event) override;

private:
    void setupUI();
    void showCustomers(const QVector<Customer> &customers);
    int selectedCustomerId() const;

    ShopServices m_services;
    QLineEdit *m_searchEdit;
    QTableWidget *m_customerTable;
    QTableWidget *m_equipmentTable;
    QPushButton *m_addBtn;
    QPushButton *m_addEquipmentBtn;
    QPushButton *m_importBtn;
    QPushButton *m_exportBtn;
    QPushButton *m_historyBtn;
};

#endif // CUSTOMERSFORM_H
