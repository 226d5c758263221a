#ifndef WORKDETAIL_H
#define WORKDETAIL_H

#include <QString>
#include <QDate>

// One entry of the append-only work log of a work order
class WorkDetail {
public:
    WorkDetail();
    WorkDetail(int workOrderId, const QDate &date, const QString &description);

    int id() const;
    void setId(int id);

    int workOrderId() const;
    void setWorkOrderId(int workOrderId);

    QDate date() const;
    void setDate(const QDate &date);

    QString description() const;
    void setDescription(const QString &description);

private:
    int m_id;
    int m_workOrderId;
    QDate m_date;
    QString m_description;
};

#endif // WORKDETAIL_H
