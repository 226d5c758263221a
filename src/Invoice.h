#ifndef INVOICE_H
#define INVOICE_H

#include <QString>
#include <QDate>

// Bill for a work order; only the total is stored
class Invoice {
public:
    enum Status { Outstanding, Paid };

    Invoice();
    Invoice(int workOrderId, double amount, const QDate &issuedOn);

    int id() const;
    void setId(int id);

    int workOrderId() const;
    void setWorkOrderId(int workOrderId);

    double amount() const;
    void setAmount(double amount);

    Status status() const;
    void setStatus(Status status);

    QDate issuedOn() const;
    void setIssuedOn(const QDate &date);

    QDate dueDate() const;
    void setDueDate(const QDate &date);

    QString notes() const;
    void setNotes(const QString &notes);

    static QString statusToString(Status status);
    static Status statusFromString(const QString &text);

private:
    int m_id;
    int m_workOrderId;
    double m_amount;
    Status m_status;
    QDate m_issuedOn;
    QDate m_dueDate;
    QString m_notes;
};

#endif // INVOICE_H
