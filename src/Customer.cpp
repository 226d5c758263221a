#include "Customer.h"

Customer::Customer()
    : m_id(0) {}

Customer::Customer(const QString &firstName, const QString &lastName,
                   const QString &phone, const QString &email,
                   const QString &address)
    : m_id(0), m_firstName(firstName), m_lastName(lastName),
      m_phone(phone), m_email(email), m_address(address) {}

int Customer::id() const { return m_id; }
void Customer::setId(int id) { m_id = id; }

QString Customer::firstName() const { return m_firstName; }
void Customer::setFirstName(const QString &firstName) { m_firstName = firstName; }

QString Customer::lastName() const { return m_lastName; }
void Customer::setLastName(const QString &lastName) { m_lastName = lastName; }

QString Customer::phone() const { return m_phone; }
void Customer::setPhone(const QString &phone) { m_phone = phone; }

QString Customer::email() const { return m_email; }
void Customer::setEmail(const QString &email) { m_email = email; }

QString Customer::address() const { return m_address; }
void Customer::setAddress(const QString &address) { m_address = address; }

QString Customer::notes() const { return m_notes; }
void Customer::setNotes(const QString &notes) { m_notes = notes; }

QString Customer::fullName() const {
    return (m_firstName + QLatin1Char(' ') + m_lastName).trimmed();
}
