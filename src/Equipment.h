#ifndef EQUIPMENT_H
#define EQUIPMENT_H

#include <QString>

// A machine brought in by a customer
class Equipment {
public:
    Equipment();
    Equipment(int customerId, const QString &make, const QString &model,
              const QString &serialNumber = QString());

    int id() const;
    void setId(int id);

    int customerId() const;
    void setCustomerId(int customerId);

    QString make() const;
    void setMake(const QString &make);

    QString model() const;
    void setModel(const QString &model);

    QString cpu() const;
    void setCpu(const QString &cpu);

    QString ram() const;
    void setRam(const QString &ram);

    QString storage() const;
    void setStorage(const QString &storage);

    QString os() const;
    void setOs(const QString &os);

    QString serialNumber() const;
    void setSerialNumber(const QString &serialNumber);

    QString notes() const;
    void setNotes(const QString &notes);

    QString displayName() const; // "Make Model"

private:
    int m_id;
    int m_customerId;
    QString m_make;
    QString m_model;
    QString m_cpu;
    QString m_ram;
    QString m_storage;
    QString m_os;
    QString m_serialNumber;
    QString m_notes;
};

#endif // EQUIPMENT_H
