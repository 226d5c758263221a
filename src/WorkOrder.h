#ifndef WORKORDER_H
#define WORKORDER_H

#include <QString>
#include <QDate>
#include <optional>

// A unit of repair work on one piece of equipment.
// Status only ever moves from Open to Closed.
class WorkOrder {
public:
    enum Status { Open, Closed };

    WorkOrder();
    WorkOrder(int equipmentId, std::optional<int> technicianId,
              const QString &description, const QDate &dateOpened);

    int id() const;
    void setId(int id);

    int equipmentId() const;
    void setEquipmentId(int equipmentId);

    // empty when the work order is unassigned
    std::optional<int> technicianId() const;
    void setTechnicianId(std::optional<int> technicianId);

    QString description() const;
    void setDescription(const QString &description);

    Status status() const;
    void setStatus(Status status);
    bool isOpen() const;

    QDate dateOpened() const;
    void setDateOpened(const QDate &date);

    // null while the work order is open
    QDate dateClosed() const;
    void setDateClosed(const QDate &date);

    QDate dueDate() const;
    void setDueDate(const QDate &date);

    static QString statusToString(Status status);
    // unknown text maps to Open
    static Status statusFromString(const QString &text);

private:
    int m_id;
    int m_equipmentId;
    std::optional<int> m_technicianId;
    QString m_description;
    Status m_status;
    QDate m_dateOpened;
    QDate m_dateClosed;
    QDate m_dueDate;
};

#endif // WORKORDER_H
