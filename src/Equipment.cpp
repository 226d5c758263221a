#include "Equipment.h"

Equipment::Equipment()
    : m_id(0), m_customerId(0) {}

Equipment::Equipment(int customerId, const QString &make, const QString &model,
                     const QString &serialNumber)
    : m_id(0), m_customerId(customerId), m_make(make), m_model(model),
      m_serialNumber(serialNumber) {}

int Equipment::id() const { return m_id; }
void Equipment::setId(int id) { m_id = id; }

int Equipment::customerId() const { return m_customerId; }
void Equipment::setCustomerId(int customerId) { m_customerId = customerId; }

QString Equipment::make() const { return m_make; }
void Equipment::setMake(const QString &make) { m_make = make; }

QString Equipment::model() const { return m_model; }
void Equipment::setModel(const QString &model) { m_model = model; }

QString Equipment::cpu() const { return m_cpu; }
void Equipment::setCpu(const QString &cpu) { m_cpu = cpu; }

QString Equipment::ram() const { return m_ram; }
void Equipment::setRam(const QString &ram) { m_ram = ram; }

QString Equipment::storage() const { return m_storage; }
void Equipment::setStorage(const QString &storage) { m_storage = storage; }

QString Equipment::os() const { return m_os; }
void Equipment::setOs(const QString &os) { m_os = os; }

QString Equipment::serialNumber() const { return m_serialNumber; }
void Equipment::setSerialNumber(const QString &serialNumber) { m_serialNumber = serialNumber; }

QString Equipment::notes() const { return m_notes; }
void Equipment::setNotes(const QString &notes) { m_notes = notes; }

QString Equipment::displayName() const {
    return (m_make + QLatin1Char(' ') + m_model).trimmed();
}
