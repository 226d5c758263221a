#include "RecordStore.h"
#include "Errors.h"
#include "Logging.h"

TransactionGuard::TransactionGuard(RecordStore &store)
    : m_store(store), m_finished(false) {
    m_store.beginTransaction();
}

TransactionGuard::~TransactionGuard() {
    if (m_finished) return;
    try {
        m_store.rollbackTransaction();
        qCWarning(lcStore) << "Transaction rolled back";
    } catch (const PersistenceError &e) {
        qCWarning(lcStore) << "Rollback failed:" << e.message();
    }
}

void TransactionGuard::commit() {
    m_store.commitTransaction();
    m_finished = true;
}
