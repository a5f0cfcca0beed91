// Drop/picker ingestion: capped background enumeration, GUI-thread queue
// updates.
#include "IngestionController.hpp"
#include "DialogProvider.hpp"
#include "FileQueueModel.hpp"
#include "ncmdump/NcmTypes.hpp"
#include "ncmdump/PathEnumerator.hpp"
#include "ncmdump/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <QMetaObject>
#include <string>
#include <system_error>
#include <vector>
Q_LOGGING_CATEGORY(ncmIngest, "ncmdump.ingest")

static QString loggable(const QString& path) {
    return QString::fromStdString(ncmdump::loggablePath(path.toStdString()));
}

IngestionController::IngestionController(FileQueueModel* queue,
                                         ncmdump::PathEnumerator* enumerator,
                                         DialogProvider* dialogs,
                                         QObject* parent)
    : QObject(parent), queue_(queue), enumerator_(enumerator), dialogs_(dialogs) {}

IngestionController::~IngestionController() {
    // Paths still waiting are dropped; results posted by running threads go
    // away together with this object's pending events.
    waiting_.clear();
    for (auto& job : jobs_) {
        if (job.thread.joinable())
            job.thread.join();
    }
}

void IngestionController::handleDrop(const QStringList& paths) {
    applyDragEvent(ncmdump::DragEvent::Drop);
    qCInfo(ncmIngest) << "drop received" << "paths=" << paths.size();
    if (!enumerator_) {
        qCWarning(ncmIngest) << "drop ignored: no enumerator";
        return;
    }

    for (const QString& path : paths) {
        if (path.isEmpty())
            continue;
        waiting_.push_back(path);
        ++pending_;
    }
    schedule();
}

void IngestionController::handleHoverStart() {
    applyDragEvent(ncmdump::DragEvent::HoverStart);
}

void IngestionController::handleDragCancelled() {
    applyDragEvent(ncmdump::DragEvent::Cancelled);
}

void IngestionController::selectFiles() {
    if (!dialogs_)
        return;
    const auto files = dialogs_->pickFiles(
        tr("NCM Files"), {QString::fromLatin1(ncmdump::kNcmExtension)});
    if (!files) {
        qCDebug(ncmIngest) << "file selection dismissed";
        return;
    }
    int added = 0;
    for (const QString& f : *files) {
        if (queue_->add(f))
            ++added;
    }
    qCInfo(ncmIngest) << "manual selection" << "picked=" << files->size()
                      << "added=" << added;
}

void IngestionController::applyDragEvent(ncmdump::DragEvent ev) {
    const bool next = ncmdump::reduceDragState(hovering_, ev);
    qCDebug(ncmIngest) << "drag event" << ncmdump::dragEventName(ev)
                       << "hovering=" << next;
    if (next == hovering_)
        return;
    hovering_ = next;
    emit hoverChanged(hovering_);
}

void IngestionController::schedule() {
    while (running_ < maxConcurrent_ && !waiting_.empty()) {
        const QString path = waiting_.front();
        waiting_.pop_front();

        const quint64 id = nextJobId_++;
        jobs_.push_back(EnumerationJob{id, std::thread()});
        ncmdump::PathEnumerator* enumerator = enumerator_;
        try {
            jobs_.back().thread = std::thread([this, enumerator, id, path]() {
                std::vector<std::string> out;
                std::string err;
                const bool ok = enumerator->enumerate(path.toStdString(), out, err);
                QStringList files;
                files.reserve(static_cast<int>(out.size()));
                for (const auto& f : out)
                    files << QString::fromStdString(f);
                const QString error = QString::fromStdString(err);
                QMetaObject::invokeMethod(
                    this,
                    [this, id, path, files, ok, error]() {
                        onJobFinished(id, path, files, ok, error);
                    },
                    Qt::QueuedConnection);
            });
        } catch (const std::system_error& e) {
            // No thread for this path: report it as a failed enumeration so
            // the drop still completes.
            jobs_.pop_back();
            qCWarning(ncmIngest) << "cannot start enumeration thread"
                                 << loggable(path) << e.what();
            applyEnumeration(path, {}, false, QString::fromLocal8Bit(e.what()));
            continue;
        }
        ++running_;
        qCDebug(ncmIngest) << "enumeration started" << loggable(path)
                           << "running=" << running_ << "waiting=" << waiting_.size();
    }
}

void IngestionController::onJobFinished(quint64 id, const QString& path,
                                        const QStringList& files, bool ok,
                                        const QString& error) {
    joinJob(id);
    if (running_ > 0)
        --running_;
    applyEnumeration(path, files, ok, error);
    schedule();
}

void IngestionController::applyEnumeration(const QString& path,
                                           const QStringList& files, bool ok,
                                           const QString& error) {
    if (pending_ > 0)
        --pending_;
    if (!ok) {
        qCWarning(ncmIngest) << "enumeration failed" << loggable(path) << error;
        emit pathEnumerated(path, 0, false);
    } else {
        int added = 0;
        for (const QString& f : files) {
            if (queue_->add(f))
                ++added;
        }
        qCInfo(ncmIngest) << "enumerated" << loggable(path)
                          << "found=" << files.size() << "added=" << added;
        emit pathEnumerated(path, added, true);
    }
    if (pending_ == 0)
        applyDragEvent(ncmdump::DragEvent::DropCompleted);
}

void IngestionController::joinJob(quint64 id) {
    for (auto it = jobs_.begin(); it != jobs_.end(); ++it) {
        if (it->id != id)
            continue;
        // The thread has already posted its result, so this only waits for
        // it to return.
        if (it->thread.joinable())
            it->thread.join();
        jobs_.erase(it);
        return;
    }
}
