#include "DropArea.hpp"
#include <QDragEnterEvent>
#include <QDragLeaveEvent>
#include <QDropEvent>
#include <QLabel>
#include <QLoggingCategory>
#include <QMimeData>
#include <QMouseEvent>
#include <QUrl>
#include <QVBoxLayout>
Q_LOGGING_CATEGORY(ncmDrop, "ncmdump.drop")

DropArea::DropArea(QWidget* parent) : QFrame(parent) {
    setAcceptDrops(true);
    setCursor(Qt::PointingHandCursor);
    setMinimumHeight(72);

    auto* lay = new QVBoxLayout(this);
    label_ = new QLabel(tr("Drop files here or click to select"), this);
    label_->setAlignment(Qt::AlignCenter);
    lay->addWidget(label_);
    applyStyle();
}

void DropArea::setCompact(bool compact) {
    if (compact_ == compact) return;
    compact_ = compact;
    setMaximumHeight(compact_ ? 96 : QWIDGETSIZE_MAX);
}

void DropArea::setHighlighted(bool on) {
    if (highlighted_ == on) return;
    highlighted_ = on;
    applyStyle();
}

void DropArea::applyStyle() {
    setStyleSheet(QStringLiteral(
        "DropArea { border: 2px dashed %1; border-radius: 8px; }")
        .arg(highlighted_ ? QStringLiteral("#2563EB") : QStringLiteral("#D1D5DB")));
}

void DropArea::dragEnterEvent(QDragEnterEvent* e) {
    if (!e->mimeData() || !e->mimeData()->hasUrls()) {
        e->ignore();
        return;
    }
    e->acceptProposedAction();
    emit hoverStarted();
}

void DropArea::dragLeaveEvent(QDragLeaveEvent* e) {
    QFrame::dragLeaveEvent(e);
    emit dragCancelled();
}

void DropArea::dropEvent(QDropEvent* e) {
    const auto urls = e->mimeData() ? e->mimeData()->urls() : QList<QUrl>{};
    QStringList paths;
    for (const QUrl& u : urls) {
        const QString p = u.toLocalFile();
        if (!p.isEmpty()) paths << p;
    }
    if (paths.size() != urls.size())
        qCDebug(ncmDrop) << "ignored non-local urls" << (urls.size() - paths.size());
    e->acceptProposedAction();
    emit filesDropped(paths);
}

void DropArea::mouseReleaseEvent(QMouseEvent* e) {
    if (e->button() == Qt::LeftButton) {
        emit clicked();
        e->accept();
        return;
    }
    QFrame::mouseReleaseEvent(e);
}
