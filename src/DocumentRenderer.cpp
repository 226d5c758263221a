#include "DocumentRenderer.h"
#include "Errors.h"
#include "Logging.h"
#include <QFile>
#include <QPageLayout>
#include <QPageSize>
#include <QPdfWriter>
#include <QTextDocument>

namespace {

QString escaped(const QString &text) {
    return text.toHtmlEscaped().replace(QLatin1String("\n"), QLatin1String("<br/>"));
}

} // namespace

DocumentRenderer::DocumentRenderer(const BusinessInfo &letterhead)
    : m_letterhead(letterhead)
{
}

QString DocumentRenderer::toHtml(const DocumentContent &content) const {
    QString html;
    html += QStringLiteral("<html><body style=\"font-family: sans-serif;\">");

    html += QStringLiteral("<h1>%1</h1>").arg(escaped(m_letterhead.name.isEmpty()
                                                     ? QStringLiteral("Business Name")
                                                     : m_letterhead.name));
    if (!m_letterhead.address.isEmpty()) {
        html += QStringLiteral("<p>%1</p>").arg(escaped(m_letterhead.address));
    }
    html += QStringLiteral("<p>Phone: %1&nbsp;&nbsp;&nbsp;Email: %2</p>")
            .arg(escaped(m_letterhead.phone), escaped(m_letterhead.email));
    if (!m_letterhead.website.isEmpty()) {
        html += QStringLiteral("<p>Website: %1</p>").arg(escaped(m_letterhead.website));
    }
    html += QStringLiteral("<hr/>");

    html += QStringLiteral("<h2>%1</h2>").arg(escaped(content.title));
    for (const auto &field : content.fields) {
        html += QStringLiteral("<p><b>%1:</b> %2</p>").arg(escaped(field.first), escaped(field.second));
    }

    for (const DocumentSection &section : content.sections) {
        html += QStringLiteral("<h3>%1</h3>").arg(escaped(section.heading));
        for (const QString &paragraph : section.paragraphs) {
            html += QStringLiteral("<p>%1</p>").arg(escaped(paragraph));
        }
    }

    if (!content.table.isEmpty()) {
        if (!content.table.heading.isEmpty()) {
            html += QStringLiteral("<h3>%1</h3>").arg(escaped(content.table.heading));
        }
        html += QStringLiteral("<table border=\"1\" cellspacing=\"0\" cellpadding=\"4\" width=\"100%\"><tr>");
        for (const QString &column : content.table.header) {
            html += QStringLiteral("<th>%1</th>").arg(escaped(column));
        }
        html += QStringLiteral("</tr>");
        for (const QStringList &row : content.table.rows) {
            html += QStringLiteral("<tr>");
            for (const QString &cell : row) {
                html += QStringLiteral("<td>%1</td>").arg(escaped(cell));
            }
            html += QStringLiteral("</tr>");
        }
        html += QStringLiteral("</table>");
    }

    html += QStringLiteral("</body></html>");
    return html;
}

void DocumentRenderer::render(const DocumentContent &content, const QString &fileName) const {
    QFile file(fileName);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCWarning(lcExport) << "Cannot write PDF" << fileName << file.errorString();
        throw PersistenceError(QStringLiteral("Cannot write %1: %2").arg(fileName, file.errorString()));
    }

    {
        QPdfWriter writer(&file);
        writer.setPageSize(QPageSize(QPageSize::Letter));
        writer.setPageMargins(QMarginsF(18, 18, 18, 18), QPageLayout::Millimeter);
        writer.setTitle(content.title);
        writer.setCreator(m_letterhead.name);

        QTextDocument doc;
        doc.setHtml(toHtml(content));
        doc.print(&writer);
    }

    file.close();
    if (file.size() == 0) {
        throw PersistenceError(QStringLiteral("Nothing was written to %1").arg(fileName));
    }
    qCInfo(lcExport) << "Rendered" << content.title << "to" << fileName;
}
