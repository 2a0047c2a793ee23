#pragma once

#include <QAbstractListModel>
#include <QStringList>

namespace pyro {

/// Session log shown in the window. Holds at most maxLines() entries;
/// appending past the bound drops the oldest line.
class LogModel : public QAbstractListModel {
    Q_OBJECT
    Q_PROPERTY(int count READ rowCount NOTIFY countChanged)
public:
    enum Roles {
        TextRole = Qt::UserRole + 1
    };

    explicit LogModel(int maxLines = 1000, QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    QHash<int, QByteArray> roleNames() const override;

    int maxLines() const { return maxLines_; }
    QStringList lines() const { return lines_; }

public slots:
    void append(const QString& line);
    void clear();

signals:
    void countChanged();

private:
    QStringList lines_;
    int maxLines_;
};

} // namespace pyro
