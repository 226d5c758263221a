#include "Technician.h"

Technician::Technician()
    : m_id(0) {}

Technician::Technician(const QString &name)
    : m_id(0), m_name(name) {}

int Technician::id() const { return m_id; }
void Technician::setId(int id) { m_id = id; }

QString Technician::name() const { return m_name; }
void Technician::setName(const QString &name) { m_name = name; }
