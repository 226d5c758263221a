#ifndef ERRORS_H
#define ERRORS_H

#include <QString>
#include <stdexcept>

// Base of every error raised by the store, the ledger and the lifecycle.
// The presentation layer catches this type and shows what() to the user.
class RepairShopError : public std::runtime_error {
public:
    explicit RepairShopError(const QString &message)
        : std::runtime_error(message.toStdString()) {}

    QString message() const { return QString::fromStdString(what()); }
};

// required field missing or numeric field out of range
class ValidationError : public RepairShopError {
public:
    using RepairShopError::RepairShopError;
};

// usage would drive a part below zero while negative stock is disallowed
class InsufficientStockError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

class NotFoundError : public RepairShopError {
public:
    using RepairShopError::RepairShopError;
};

// insert references a parent row that does not exist
class ReferenceError : public RepairShopError {
public:
    using RepairShopError::RepairShopError;
};

class PersistenceError : public RepairShopError {
public:
    using RepairShopError::RepairShopError;
};

#endif // ERRORS_H
