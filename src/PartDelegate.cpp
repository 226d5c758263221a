#include "PartDelegate.h"
#include <QAbstractItemModel>
#include <QStyleOptionViewItem>
#include <QColor>
#include <QBrush>

PartDelegate::PartDelegate(int quantityColumn, QObject *parent)
    : QStyledItemDelegate(parent), m_quantityColumn(quantityColumn) {
}

bool PartDelegate::isOutOfStock(const QModelIndex &index) const {
    const QAbstractItemModel *model = index.model();
    return model->data(model->index(index.row(), m_quantityColumn)).toInt() <= 0;
}

void PartDelegate::paint(QPainter *painter, const QStyleOptionViewItem &option,
                         const QModelIndex &index) const {
    QStyleOptionViewItem opt = option;

    if (isOutOfStock(index)) {
        opt.backgroundBrush = QBrush(QColor(255, 200, 200)); // light red
    }

    QStyledItemDelegate::paint(painter, opt, index);
}
