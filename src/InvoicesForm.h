#ifndef INVOICESFORM_H
#define INVOICESFORM_H

#include "ShopServices.h"

#include <QWidget>
#include <QTableWidget>
#include <QPushButton>
#include <QComboBox>

class InvoicesForm : public QWidget {
    Q_OBJECT
public:
    InvoicesForm(const ShopServices &services, QWidget *parent = nullptr);

public slots:
    void refresh();

private slots:
    void issueInvoice();
    void markPaid();
    void markOutstanding();
    void printInvoice();
    void exportCsv();

protected:
    void showEvent(QShowEvent *event) override;

private:
    void setupUI();
    int selectedInvoiceId() const;

    ShopServices m_services;
    QComboBox *m_filterCombo;
    QTableWidget *m_tableView;
    QPushButton *m_issueBtn;
    QPushButton *m_paidBtn;
    QPushButton *m_outstandingBtn;
    QPushButton *m_pdfBtn;
    QPushButton *m_exportBtn;
};

#endif // INVOICESFORM_H
