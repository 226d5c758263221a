#ifndef CSVFILE_H
#define CSVFILE_H

#include <QString>
#include <QStringList>
#include <QVector>

// Named-field rows; the header doubles as the first line of the file
struct CsvTable {
    QStringList header;
    QVector<QStringList> rows;

    int columnIndex(const QString &name) const;
    // empty when the column or the row does not exist
    QString value(int row, const QString &column) const;
};

// RFC 4180 reader/writer (quoted fields, doubled quotes, embedded newlines)
class CsvFile {
public:
    // throws PersistenceError when the file cannot be written
    static void write(const CsvTable &table, const QString &fileName);
    // throws PersistenceError when the file cannot be read
    static CsvTable read(const QString &fileName);

    static QString escape(const QString &field);
    static QString format(const CsvTable &table);
    static QVector<QStringList> parse(const QString &text);
};

#endif // CSVFILE_H
