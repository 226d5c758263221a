#include "RecordDialog.h"
#include "DateText.h"
#include "Errors.h"
#include <QComboBox>
#include <QDate>
#include <QDialogButtonBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QLineEdit>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QVBoxLayout>

RecordDialog::RecordDialog(const QString &title, QWidget *parent)
    : QDialog(parent) {
    setWindowTitle(title);

    QVBoxLayout *layout = new QVBoxLayout(this);
    m_form = new QFormLayout();
    layout->addLayout(m_form);

    QDialogButtonBox *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    layout->addWidget(buttons);

    setMinimumWidth(360);
}

void RecordDialog::addText(const QString &label, const QString &value, const QString &placeholder) {
    QLineEdit *edit = new QLineEdit(value, this);
    edit->setPlaceholderText(placeholder);
    m_form->addRow(label + ":", edit);
    m_fields.insert(label, edit);
}

void RecordDialog::addMultiline(const QString &label, const QString &value) {
    QPlainTextEdit *edit = new QPlainTextEdit(value, this);
    edit->setFixedHeight(80);
    m_form->addRow(label + ":", edit);
    m_fields.insert(label, edit);
}

void RecordDialog::addNumber(const QString &label, double value, double minimum, double maximum,
                             int decimals) {
    QDoubleSpinBox *spin = new QDoubleSpinBox(this);
    spin->setDecimals(decimals);
    spin->setRange(minimum, maximum);
    spin->setValue(value);
    m_form->addRow(label + ":", spin);
    m_fields.insert(label, spin);
}

void RecordDialog::addChoice(const QString &label, const QVector<QPair<QString, QVariant>> &items) {
    QComboBox *combo = new QComboBox(this);
    for (const auto &item : items) {
        combo->addItem(item.first, item.second);
    }
    m_form->addRow(label + ":", combo);
    m_fields.insert(label, combo);
}

void RecordDialog::addDate(const QString &label, const QDate &value) {
    addText(label, value.isValid() ? value.toString(Qt::ISODate) : QString(), "yyyy-MM-dd");
    m_dateFields.append(label);
}

void RecordDialog::accept() {
    for (const QString &label : m_dateFields) {
        try {
            parseOptionalDate(text(label), label);
        } catch (const ValidationError &e) {
            QMessageBox::warning(this, "Invalid date", e.message());
            m_fields.value(label)->setFocus();
            return;
        }
    }
    QDialog::accept();
}

QString RecordDialog::text(const QString &label) const {
    QWidget *w = m_fields.value(label);
    if (QLineEdit *edit = qobject_cast<QLineEdit *>(w)) return edit->text().trimmed();
    if (QPlainTextEdit *edit = qobject_cast<QPlainTextEdit *>(w)) return edit->toPlainText().trimmed();
    return QString();
}

double RecordDialog::number(const QString &label) const {
    QDoubleSpinBox *spin = qobject_cast<QDoubleSpinBox *>(m_fields.value(label));
    return spin ? spin->value() : 0.0;
}

QVariant RecordDialog::choice(const QString &label) const {
    QComboBox *combo = qobject_cast<QComboBox *>(m_fields.value(label));
    return combo ? combo->currentData() : QVariant();
}

QDate RecordDialog::date(const QString &label) const {
    return parseOptionalDate(text(label), label);
}
