#include "CsvFile.h"
#include "Errors.h"
#include "Logging.h"
#include <QFile>
#include <QTextStream>

int CsvTable::columnIndex(const QString &name) const {
    return header.indexOf(name);
}

QString CsvTable::value(int row, const QString &column) const {
    const int col = columnIndex(column);
    if (col < 0 || row < 0 || row >= rows.size()) return QString();
    const QStringList &fields = rows.at(row);
    return col < fields.size() ? fields.at(col) : QString();
}

QString CsvFile::escape(const QString &field) {
    const bool needsQuotes = field.contains(QLatin1Char(','))
            || field.contains(QLatin1Char('"'))
            || field.contains(QLatin1Char('\n'))
            || field.contains(QLatin1Char('\r'));
    if (!needsQuotes) return field;
    QString quoted = field;
    quoted.replace(QLatin1String("\""), QLatin1String("\"\""));
    return QLatin1Char('"') + quoted + QLatin1Char('"');
}

QString CsvFile::format(const CsvTable &table) {
    QString out;
    auto appendRow = [&out](const QStringList &fields) {
        QStringList escaped;
        for (const QString &f : fields) escaped << escape(f);
        out += escaped.join(QLatin1Char(','));
        out += QLatin1String("\r\n");
    };
    appendRow(table.header);
    for (const QStringList &row : table.rows) appendRow(row);
    return out;
}

QVector<QStringList> CsvFile::parse(const QString &text) {
    QVector<QStringList> rows;
    QStringList row;
    QString field;
    bool inQuotes = false;
    bool quotedField = false;

    auto endRow = [&]() {
        row << field;
        // a blank line is not a record
        if (!(row.size() == 1 && row.first().isEmpty() && !quotedField)) {
            rows.append(row);
        }
        row.clear();
        field.clear();
        quotedField = false;
    };

    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (inQuotes) {
            if (c == QLatin1Char('"')) {
                if (i + 1 < text.size() && text.at(i + 1) == QLatin1Char('"')) {
                    field += c;
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == QLatin1Char('"')) {
            inQuotes = true;
            quotedField = true;
        } else if (c == QLatin1Char(',')) {
            row << field;
            field.clear();
        } else if (c == QLatin1Char('\r') || c == QLatin1Char('\n')) {
            if (c == QLatin1Char('\r') && i + 1 < text.size() && text.at(i + 1) == QLatin1Char('\n')) {
                ++i;
            }
            endRow();
        } else {
            field += c;
        }
    }
    if (!field.isEmpty() || !row.isEmpty() || quotedField) {
        endRow();
    }
    return rows;
}

void CsvFile::write(const CsvTable &table, const QString &fileName) {
    QFile f(fileName);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCWarning(lcExport) << "Cannot write" << fileName << f.errorString();
        throw PersistenceError(QStringLiteral("Cannot write %1: %2").arg(fileName, f.errorString()));
    }
    QTextStream out(&f);
#if QT_VERSION < QT_VERSION_CHECK(6, 0, 0)
    out.setCodec("UTF-8");
#endif
    out << format(table);
    out.flush();
    if (out.status() != QTextStream::Ok) {
        throw PersistenceError(QStringLiteral("Failed writing %1").arg(fileName));
    }
    qCInfo(lcExport) << "Wrote" << table.rows.size() << "rows to" << fileName;
}

CsvTable CsvFile::read(const QString &fileName) {
    QFile f(fileName);
    if (!f.open(QIODevice::ReadOnly)) {
        qCWarning(lcExport) << "Cannot read" << fileName << f.errorString();
        throw PersistenceError(QStringLiteral("Cannot read %1: %2").arg(fileName, f.errorString()));
    }
    QTextStream in(&f);
#if QT_VERSION < QT_VERSION_CHECK(6, 0, 0)
    in.setCodec("UTF-8");
#endif
    const QVector<QStringList> lines = parse(in.readAll());

    CsvTable table;
    if (lines.isEmpty()) return table;
    for (const QString &name : lines.first()) {
        table.header << name.trimmed();
    }
    for (int i = 1; i < lines.size(); ++i) {
        QStringList row = lines.at(i);
        while (row.size() < table.header.size()) row << QString();
        table.rows.append(row);
    }
    qCInfo(lcExport) << "Read" << table.rows.size() << "rows from" << fileName;
    return table;
}
