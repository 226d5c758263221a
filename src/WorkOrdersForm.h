#ifndef WORKORDERSFORM_H
#define WORKORDERSFORM_H

#include "ShopServices.h"
#include "ReportService.h"

#include <QWidget>
#include <QTableWidget>
#include <QPushButton>
#include <QComboBox>
#include <QLineEdit>
#include <QTextEdit>
#include <QVector>

class WorkOrdersForm : public QWidget {
    Q_OBJECT
public:
    WorkOrdersForm(const ShopServices &services, QWidget *parent = nullptr);

public slots:
    void refresh();

private slots:
    void openWorkOrder();
    void logDetail();
    void usePart();
    void closeWorkOrder();
    void printSlip();
    void exportCsv();
    void showSelected();

protected:
    void showEvent(QShowEvent *event) override;

private:
    void setupUI();
    void showOrders(const QVector<WorkOrderSummary> &orders);
    int selectedWorkOrderId() const;

    ShopServices m_services;
    QComboBox *m_filterCombo;
    QLineEdit *m_searchEdit;
    QTableWidget *m_tableView;
    QTextEdit *m_detailView;
    QPushButton *m_openBtn;
    QPushButton *m_logBtn;
    QPushButton *m_partBtn;
    QPushButton *m_closeBtn;
    QPushButton *m_slipBtn;
    QPushButton *m_exportBtn;
};

#endif // WORKORDERSFORM_H
