#include "LogModel.hpp"

namespace pyro {

LogModel::LogModel(int maxLines, QObject* parent)
    : QAbstractListModel(parent), maxLines_(qMax(1, maxLines))
{
}

int LogModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid()) return 0;
    return lines_.size();
}

QVariant LogModel::data(const QModelIndex& index, int role) const
{
    if (index.row() < 0 || index.row() >= lines_.size()) return {};
    switch (role) {
    case Qt::DisplayRole:
    case TextRole:  return lines_[index.row()];
    default:        return {};
    }
}

QHash<int, QByteArray> LogModel::roleNames() const
{
    return {
        {TextRole, "text"}
    };
}

void LogModel::append(const QString& line)
{
    if (lines_.size() >= maxLines_) {
        const int excess = lines_.size() - maxLines_ + 1;
        beginRemoveRows(QModelIndex(), 0, excess - 1);
        lines_.erase(lines_.begin(), lines_.begin() + excess);
        endRemoveRows();
    }

    const int row = lines_.size();
    beginInsertRows(QModelIndex(), row, row);
    lines_.append(line);
    endInsertRows();
    emit countChanged();
}

void LogModel::clear()
{
    if (lines_.isEmpty()) return;
    beginResetModel();
    lines_.clear();
    endResetModel();
    emit countChanged();
}

} // namespace pyro
