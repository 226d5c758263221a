#ifndef CUSTOMER_H
#define CUSTOMER_H

#include <QString>

// A client of the shop; owns zero or more pieces of equipment
class Customer {
public:
    Customer();
    Customer(const QString &firstName, const QString &lastName,
             const QString &phone = QString(), const QString &email = QString(),
             const QString &address = QString());

    int id() const;
    void setId(int id);

    QString firstName() const;
    void setFirstName(const QString &firstName);

    QString lastName() const;
    void setLastName(const QString &lastName);

    QString phone() const;
    void setPhone(const QString &phone);

    QString email() const;
    void setEmail(const QString &email);

    QString address() const;
    void setAddress(const QString &address);

    QString notes() const;
    void setNotes(const QString &notes);

    QString fullName() const; // "First Last"

private:
    int m_id;
    QString m_firstName;
    QString m_lastName;
    QString m_phone;
    QString m_email;
    QString m_address;
    QString m_notes;
};

#endif // CUSTOMER_H
