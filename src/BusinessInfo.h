#ifndef BUSINESSINFO_H
#define BUSINESSINFO_H

#include <QString>

// Letterhead printed on every document
struct BusinessInfo {
    QString name;
    QString address;
    QString phone;
    QString email;
    QString website;
};

#endif // BUSINESSINFO_H
