#ifndef TECHNICIAN_H
#define TECHNICIAN_H

#include <QString>

class Technician {
public:
    Technician();
    explicit Technician(const QString &name);

    int id() const;
    void setId(int id);

    QString name() const;
    void setName(const QString &name);

private:
    int m_id;
    QString m_name;
};

#endif // TECHNICIAN_H
