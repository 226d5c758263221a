#ifndef PARTSFORM_H
#define PARTSFORM_H

#include "ShopServices.h"

#include <QWidget>
#include <QTableWidget>
#include <QPushButton>
#include <QLabel>

class PartsForm : public QWidget {
    Q_OBJECT
public:
    PartsForm(const ShopServices &services, QWidget *parent = nullptr);

public slots:
    void refresh();

private slots:
    void addPart();
    void receiveStock();
    void exportCsv();

protected:
    void showEvent(QShowEvent *event) override;

private:
    void setupUI();
    int selectedPartId() const;

    ShopServices m_services;
    QTableWidget *m_tableView;
    QLabel *m_policyLabel;
    QPushButton *m_addBtn;
    QPushButton *m_receiveBtn;
    QPushButton *m_exportBtn;
};

#endif // PARTSFORM_H
