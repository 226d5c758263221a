#ifndef DOCUMENTRENDERER_H
#define DOCUMENTRENDERER_H

#include "BusinessInfo.h"

#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>

struct DocumentSection {
    QString heading;
    QStringList paragraphs;
};

struct DocumentTable {
    QString heading;
    QStringList header;
    QVector<QStringList> rows;

    bool isEmpty() const { return header.isEmpty(); }
};

// What goes on one printed page set, independent of the output format
struct DocumentContent {
    QString title;
    QVector<QPair<QString, QString>> fields;
    QVector<DocumentSection> sections;
    DocumentTable table;
};

// Lays out DocumentContent under the business letterhead and prints it to PDF
class DocumentRenderer {
public:
    explicit DocumentRenderer(const BusinessInfo &letterhead);

    QString toHtml(const DocumentContent &content) const;

    // US Letter; throws PersistenceError if the file cannot be written
    void render(const DocumentContent &content, const QString &fileName) const;

private:
    BusinessInfo m_letterhead;
};

#endif // DOCUMENTRENDERER_H
