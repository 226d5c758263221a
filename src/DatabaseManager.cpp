#include "DatabaseManager.h"
#include "Logging.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QAtomicInt>
#include <vector>

namespace {

QAtomicInt connectionCounter;

// One entry per schema version; entry N upgrades version N to N + 1.
const std::vector<std::vector<const char *>> &migrations() {
    static const std::vector<std::vector<const char *>> steps = {
        {
            "CREATE TABLE IF NOT EXISTS customers("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "first_name TEXT NOT NULL,"
            "last_name TEXT NOT NULL,"
            "phone TEXT,"
            "email TEXT,"
            "address TEXT,"
            "notes TEXT)",

            "CREATE TABLE IF NOT EXISTS equipment("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "customer_id INTEGER NOT NULL REFERENCES customers(id),"
            "make TEXT,"
            "model TEXT,"
            "cpu TEXT,"
            "ram TEXT,"
            "storage TEXT,"
            "os TEXT,"
            "serial_number TEXT,"
            "notes TEXT)",

            "CREATE TABLE IF NOT EXISTS technicians("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "name TEXT NOT NULL)",

            "CREATE TABLE IF NOT EXISTS parts("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "sku TEXT NOT NULL UNIQUE,"
            "description TEXT,"
            "quantity INTEGER NOT NULL DEFAULT 0,"
            "unit_cost REAL NOT NULL DEFAULT 0)",

            "CREATE TABLE IF NOT EXISTS work_orders("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "equipment_id INTEGER NOT NULL REFERENCES equipment(id),"
            "technician_id INTEGER REFERENCES technicians(id),"
            "description TEXT,"
            "status TEXT NOT NULL DEFAULT 'Open',"
            "date_opened TEXT NOT NULL,"
            "date_closed TEXT,"
            "due_date TEXT)",

            "CREATE TABLE IF NOT EXISTS work_details("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "work_order_id INTEGER NOT NULL REFERENCES work_orders(id),"
            "date TEXT NOT NULL,"
            "description TEXT)",

            "CREATE TABLE IF NOT EXISTS part_usage("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "work_order_id INTEGER NOT NULL REFERENCES work_orders(id),"
            "part_id INTEGER NOT NULL REFERENCES parts(id),"
            "quantity INTEGER NOT NULL CHECK(quantity > 0))",

            "CREATE INDEX IF NOT EXISTS idx_equipment_customer ON equipment(customer_id)",
            "CREATE INDEX IF NOT EXISTS idx_work_orders_equipment ON work_orders(equipment_id)",
        },
        {
            // Stock receipts, invoices and letterhead
            "CREATE TABLE IF NOT EXISTS stock_receipts("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "part_id INTEGER NOT NULL REFERENCES parts(id),"
            "date TEXT NOT NULL,"
            "quantity INTEGER NOT NULL CHECK(quantity > 0),"
            "unit_cost REAL NOT NULL DEFAULT 0,"
            "supplier TEXT)",

            "CREATE TABLE IF NOT EXISTS invoices("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "work_order_id INTEGER NOT NULL REFERENCES work_orders(id),"
            "amount REAL NOT NULL DEFAULT 0,"
            "status TEXT NOT NULL DEFAULT 'Outstanding',"
            "issued_on TEXT,"
            "due_date TEXT,"
            "notes TEXT)",

            "CREATE TABLE IF NOT EXISTS business_info("
            "id INTEGER PRIMARY KEY CHECK (id = 1),"
            "name TEXT,"
            "address TEXT,"
            "phone TEXT,"
            "email TEXT,"
            "website TEXT)",

            "INSERT OR IGNORE INTO business_info(id, name, address, phone, email, website) "
            "VALUES(1, 'Business Name Here', 'Address line 1\nAddress line 2', "
            "'Phone', 'email@example.com', 'https://example.com')",
        },
    };
    return steps;
}

} // namespace

DatabaseManager::DatabaseManager()
    : m_connectionName(QStringLiteral("repairshop-%1").arg(connectionCounter.fetchAndAddRelaxed(1))) {
}

DatabaseManager::~DatabaseManager() {
    close();
}

bool DatabaseManager::open(const QString &fileName) {
    if (m_db.isOpen()) return true;
    m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    m_db.setDatabaseName(fileName);
    if (!m_db.open()) {
        m_lastError = m_db.lastError().text();
        qCWarning(lcStore) << "Failed to open database:" << m_lastError;
        return false;
    }
    if (!execOrFail("PRAGMA foreign_keys = ON")) {
        return false;
    }
    qCInfo(lcStore) << "Opened database" << fileName;
    // ensure tables exist
    return createSchema();
}

bool DatabaseManager::execOrFail(const QString &sql) {
    QSqlQuery query(m_db);
    if (!query.exec(sql)) {
        m_lastError = query.lastError().text();
        qCWarning(lcStore) << "Statement failed:" << m_lastError << sql;
        return false;
    }
    return true;
}

int DatabaseManager::schemaVersion() const {
    if (!m_db.isOpen()) return 0;
    QSqlQuery query(m_db);
    if (!query.exec("SELECT version FROM schema_version LIMIT 1") || !query.next()) {
        return 0;
    }
    return query.value(0).toInt();
}

int DatabaseManager::latestSchemaVersion() {
    return static_cast<int>(migrations().size());
}

bool DatabaseManager::createSchema() {
    if (!m_db.isOpen()) return false;

    if (!execOrFail("CREATE TABLE IF NOT EXISTS schema_version(version INTEGER NOT NULL)")) {
        return false;
    }
    QSqlQuery count(m_db);
    if (!count.exec("SELECT COUNT(*) FROM schema_version") || !count.next()) {
        m_lastError = count.lastError().text();
        qCWarning(lcStore) << "Cannot read schema version:" << m_lastError;
        return false;
    }
    if (count.value(0).toInt() == 0 && !execOrFail("INSERT INTO schema_version(version) VALUES(0)")) {
        return false;
    }

    const int current = schemaVersion();
    const auto &steps = migrations();
    for (int version = current; version < static_cast<int>(steps.size()); ++version) {
        qCInfo(lcStore) << "Applying migration" << version << "->" << version + 1;
        if (!m_db.transaction()) {
            m_lastError = m_db.lastError().text();
            qCWarning(lcStore) << "Cannot start migration:" << m_lastError;
            return false;
        }
        bool ok = true;
        for (const char *stmt : steps[static_cast<size_t>(version)]) {
            if (!execOrFail(QString::fromUtf8(stmt))) {
                ok = false;
                break;
            }
        }
        if (ok) {
            ok = execOrFail(QStringLiteral("UPDATE schema_version SET version = %1").arg(version + 1));
        }
        if (!ok || !m_db.commit()) {
            m_db.rollback();
            qCWarning(lcStore) << "Schema creation failed at version" << version;
            return false;
        }
    }
    return true;
}

void DatabaseManager::close() {
    if (!m_db.isValid()) return;
    if (m_db.isOpen()) {
        m_db.close();
    }
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
}

bool DatabaseManager::isOpen() const {
    return m_db.isOpen();
}

QSqlDatabase DatabaseManager::database() const {
    return m_db;
}

QString DatabaseManager::fileName() const {
    return m_db.databaseName();
}

QString DatabaseManager::lastError() const {
    return m_lastError;
}
