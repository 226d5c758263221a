#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include "ShopServices.h"

#include <QMainWindow>
#include <QTabWidget>

class DashboardForm;
class CustomersForm;
class WorkOrdersForm;
class PartsForm;
class InvoicesForm;
class SettingsForm;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    MainWindow(const ShopServices &services, QWidget *parent = nullptr);

private slots:
    void backupNow();

private:
    void setupUI();
    void setupMenu();

    ShopServices m_services;

    QTabWidget *m_tabWidget;
    DashboardForm *m_dashboardForm;
    CustomersForm *m_customersForm;
    WorkOrdersForm *m_workOrdersForm;
    PartsForm *m_partsForm;
    InvoicesForm *m_invoicesForm;
    SettingsForm *m_settingsForm;
};

#endif // MAINWINDOW_H
