#include "MainWindow.h"
#include "BackupManager.h"
#include "CustomersForm.h"
#include "DashboardForm.h"
#include "Errors.h"
#include "InvoicesForm.h"
#include "PartsForm.h"
#include "SettingsForm.h"
#include "WorkOrdersForm.h"
#include <QAction>
#include <QMenuBar>
#include <QMessageBox>
#include <QStatusBar>

MainWindow::MainWindow(const ShopServices &services, QWidget *parent)
    : QMainWindow(parent)
    , m_services(services) {

    setupUI();
    setupMenu();

    setWindowTitle("Repair Shop");
    statusBar()->showMessage(QString("Database: %1").arg(m_services.databaseFile));
    resize(1200, 700);
}

void MainWindow::setupUI() {
    m_tabWidget = new QTabWidget(this);

    // create forms
    m_dashboardForm = new DashboardForm(m_services);
    m_customersForm = new CustomersForm(m_services);
    m_workOrdersForm = new WorkOrdersForm(m_services);
    m_partsForm = new PartsForm(m_services);
    m_invoicesForm = new InvoicesForm(m_services);
    m_settingsForm = new SettingsForm(m_services);

    m_tabWidget->addTab(m_dashboardForm, "Dashboard");
    m_tabWidget->addTab(m_customersForm, "Customers");
    m_tabWidget->addTab(m_workOrdersForm, "Work Orders");
    m_tabWidget->addTab(m_partsForm, "Parts");
    m_tabWidget->addTab(m_invoicesForm, "Invoices");
    m_tabWidget->addTab(m_settingsForm, "Settings");

    setCentralWidget(m_tabWidget);
}

void MainWindow::setupMenu() {
    QMenu *fileMenu = menuBar()->addMenu("&File");

    QAction *backupAction = fileMenu->addAction("&Backup database");
    connect(backupAction, &QAction::triggered, this, &MainWindow::backupNow);

    fileMenu->addSeparator();
    QAction *quitAction = fileMenu->addAction("&Quit");
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);
}

void MainWindow::backupNow() {
    try {
        const QString path = m_services.backups.backup(m_services.databaseFile);
        m_services.backups.removeExpiredBackups(m_services.databaseFile);
        statusBar()->showMessage(QString("Backup created: %1").arg(path), 5000);
    } catch (const RepairShopError &e) {
        QMessageBox::critical(this, "Backup failed", e.message());
    }
}
