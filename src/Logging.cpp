#include "Logging.h"

Q_LOGGING_CATEGORY(lcApp, "repairshop.app")
Q_LOGGING_CATEGORY(lcStore, "repairshop.store")
Q_LOGGING_CATEGORY(lcLedger, "repairshop.ledger")
Q_LOGGING_CATEGORY(lcWorkOrders, "repairshop.workorders")
Q_LOGGING_CATEGORY(lcExport, "repairshop.export")
Q_LOGGING_CATEGORY(lcBackup, "repairshop.backup")
