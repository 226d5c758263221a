#include "DateText.h"
#include "Errors.h"

QDate parseOptionalDate(const QString &text, const QString &field) {
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) return QDate();

    const QDate date = QDate::fromString(trimmed, QStringLiteral("yyyy-MM-dd"));
    if (!date.isValid()) {
        throw ValidationError(QStringLiteral("%1 \"%2\" is not a date, use yyyy-MM-dd")
                                  .arg(field, trimmed));
    }
    return date;
}
