#ifndef DATETEXT_H
#define DATETEXT_H

#include <QDate>
#include <QString>

// Optional yyyy-MM-dd input: blank text gives a null date, anything else
// must be a real date or ValidationError names the field.
QDate parseOptionalDate(const QString &text, const QString &field);

#endif // DATETEXT_H
