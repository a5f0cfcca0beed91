#include "FileQueueModel.hpp"
#include "ncmdump/RuntimeLogging.hpp"
#include <QFileInfo>
#include <QLoggingCategory>
#include <QVariant>
Q_LOGGING_CATEGORY(ncmQueue, "ncmdump.queue")

static QString loggable(const QString& path) {
  return QString::fromStdString(ncmdump::loggablePath(path.toStdString()));
}

FileQueueModel::FileQueueModel(QObject* parent)
  : QAbstractListModel(parent) {}

int FileQueueModel::rowCount(const QModelIndex& parent) const {
  if (parent.isValid()) return 0;
  return static_cast<int>(queue_.size());
}

QVariant FileQueueModel::data(const QModelIndex& index, int role) const {
  if (!index.isValid() || index.row() < 0 || index.row() >= size())
    return {};
  const QString path = QString::fromStdString(queue_.items()[index.row()]);
  if (role == Qt::DisplayRole) return path;
  if (role == Qt::ToolTipRole) return QFileInfo(path).fileName();
  return {};
}

Qt::ItemFlags FileQueueModel::flags(const QModelIndex& index) const {
  if (!index.isValid()) return Qt::NoItemFlags;
  return Qt::ItemIsEnabled | Qt::ItemIsSelectable;
}

bool FileQueueModel::add(const QString& path) {
  const std::string p = path.toStdString();
  if (p.empty() || queue_.contains(p)) {
    qCDebug(ncmQueue) << "add ignored (duplicate or empty)" << loggable(path);
    return false;
  }
  const int row = size();
  beginInsertRows(QModelIndex(), row, row);
  queue_.add(p);
  endInsertRows();
  qCDebug(ncmQueue) << "added" << loggable(path) << "size=" << size();
  emit sizeChanged(size());
  return true;
}

bool FileQueueModel::remove(const QString& path) {
  const auto idx = queue_.indexOf(path.toStdString());
  if (!idx) return false;
  const int row = static_cast<int>(*idx);
  beginRemoveRows(QModelIndex(), row, row);
  queue_.remove(path.toStdString());
  endRemoveRows();
  qCDebug(ncmQueue) << "removed" << loggable(path) << "size=" << size();
  emit sizeChanged(size());
  return true;
}

void FileQueueModel::clear() {
  const bool hadItems = !queue_.empty();
  beginResetModel();
  queue_.clear();
  endResetModel();
  qCDebug(ncmQueue) << "cleared";
  emit cleared();
  if (hadItems) emit sizeChanged(0);
}

bool FileQueueModel::contains(const QString& path) const {
  return queue_.contains(path.toStdString());
}

QString FileQueueModel::pathAt(const QModelIndex& idx) const {
  if (!idx.isValid() || idx.row() < 0 || idx.row() >= size()) return {};
  return QString::fromStdString(queue_.items()[idx.row()]);
}

QStringList FileQueueModel::paths() const {
  QStringList out;
  out.reserve(size());
  for (const auto& p : queue_.items())
    out << QString::fromStdString(p);
  return out;
}
