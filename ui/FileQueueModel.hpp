// List model over the pending file queue. Lives on the GUI thread; every
// queue mutation in the application goes through this object.
#pragma once
#include <QAbstractListModel>
#include <QStringList>
#include "ncmdump/FileQueue.hpp"

class FileQueueModel : public QAbstractListModel {
  Q_OBJECT
public:
  explicit FileQueueModel(QObject* parent = nullptr);

  int rowCount(const QModelIndex& parent = QModelIndex()) const override;
  QVariant data(const QModelIndex& index, int role) const override;
  Qt::ItemFlags flags(const QModelIndex& index) const override;

  // Return true when the queue changed. add() also ignores an empty path,
  // which names no file.
  bool add(const QString& path);
  bool remove(const QString& path);
  void clear();

  bool contains(const QString& path) const;
  int size() const { return static_cast<int>(queue_.size()); }
  bool isEmpty() const { return queue_.empty(); }
  QString pathAt(const QModelIndex& idx) const;

  QStringList paths() const;
  // Copy of the contents at this instant; later mutations do not affect it.
  QStringList snapshot() const { return paths(); }

signals:
  void cleared();
  void sizeChanged(int size);

private:
  ncmdump::FileQueue queue_;
};
