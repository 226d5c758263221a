#ifndef RECORDDIALOG_H
#define RECORDDIALOG_H

#include <QDialog>
#include <QDate>
#include <QHash>
#include <QPair>
#include <QStringList>
#include <QVariant>
#include <QVector>

class QFormLayout;

// Label/field form used by every "Add ..." button
class RecordDialog : public QDialog {
    Q_OBJECT
public:
    RecordDialog(const QString &title, QWidget *parent = nullptr);

    void addText(const QString &label, const QString &value = QString(),
                 const QString &placeholder = QString());
    void addMultiline(const QString &label, const QString &value = QString());
    void addNumber(const QString &label, double value, double minimum, double maximum,
                   int decimals = 0);
    void addChoice(const QString &label, const QVector<QPair<QString, QVariant>> &items);
    // yyyy-MM-dd line edit, checked when OK is pressed
    void addDate(const QString &label, const QDate &value = QDate());

    QString text(const QString &label) const;
    double number(const QString &label) const;
    QVariant choice(const QString &label) const;
    // null for a blank field; throws ValidationError for anything but yyyy-MM-dd
    QDate date(const QString &label) const;

public slots:
    void accept() override;

private:
    QFormLayout *m_form;
    QHash<QString, QWidget *> m_fields;
    QStringList m_dateFields;
};

#endif // RECORDDIALOG_H
