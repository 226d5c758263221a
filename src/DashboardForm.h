#ifndef DASHBOARDFORM_H
#define DASHBOARDFORM_H

#include "ShopServices.h"

#include <QWidget>
#include <QLabel>

class DashboardForm : public QWidget {
    Q_OBJECT
public:
    DashboardForm(const ShopServices &services, QWidget *parent = nullptr);

public slots:
    void refresh();

protected:
    void showEvent(QShowEvent *event) override;

private:
    void setupUI();

    ShopServices m_services;
    QLabel *m_countsLabel;
    QLabel *m_invoicesLabel;
    QLabel *m_stockLabel;
};

#endif // DASHBOARDFORM_H
