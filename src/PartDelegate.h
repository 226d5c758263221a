#ifndef PARTDELEGATE_H
#define PARTDELEGATE_H

#include <QStyledItemDelegate>
#include <QModelIndex>
#include <QPainter>

// Highlights rows whose on-hand quantity is zero or below
class PartDelegate : public QStyledItemDelegate {
    Q_OBJECT
public:
    PartDelegate(int quantityColumn, QObject *parent = nullptr);

    void paint(QPainter *painter, const QStyleOptionViewItem &option,
               const QModelIndex &index) const override;

private:
    bool isOutOfStock(const QModelIndex &index) const;

    int m_quantityColumn;
};

#endif // PARTDELEGATE_H
