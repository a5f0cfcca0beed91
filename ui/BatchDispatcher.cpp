// Sequential batch dispatch: snapshot, one dump at a time, progress, reset.
#include "BatchDispatcher.hpp"
#include "DialogProvider.hpp"
#include "FileQueueModel.hpp"
#include "ncmdump/Dumper.hpp"
#include "ncmdump/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <QMetaObject>
#include <string>
Q_LOGGING_CATEGORY(ncmDispatch, "ncmdump.dispatch")

static const char *stateName(BatchDispatcher::State st) {
    switch (st) {
    case BatchDispatcher::State::Idle:
        return "Idle";
    case BatchDispatcher::State::AwaitingOutputDir:
        return "AwaitingOutputDir";
    case BatchDispatcher::State::Running:
        return "Running";
    }
    return "Unknown";
}

static QString loggable(const QString &path) {
    return QString::fromStdString(ncmdump::loggablePath(path.toStdString()));
}

BatchDispatcher::BatchDispatcher(FileQueueModel *queue, ncmdump::Dumper *dumper,
                                 DialogProvider *dialogs, QObject *parent)
    : QObject(parent), queue_(queue), dumper_(dumper), dialogs_(dialogs) {}

BatchDispatcher::~BatchDispatcher() {
    if (worker_.joinable()) {
        qCInfo(ncmDispatch) << "shutdown with batch in flight; stopping after current item";
        shuttingDown_ = true;
    }
    joinWorker();
}

bool BatchDispatcher::start() {
    if (state_ != State::Idle) {
        qCWarning(ncmDispatch) << "start rejected" << "state=" << stateName(state_);
        return false;
    }
    if (!queue_ || !dumper_ || !dialogs_) {
        qCWarning(ncmDispatch) << "start rejected: dispatcher not wired";
        return false;
    }
    if (queue_->isEmpty()) {
        qCInfo(ncmDispatch) << "start ignored: queue is empty";
        return false;
    }

    setState(State::AwaitingOutputDir);
    const auto dir = dialogs_->pickDirectory();
    if (!dir || dir->isEmpty()) {
        qCInfo(ncmDispatch) << "output directory selection dismissed";
        setState(State::Idle);
        return false;
    }

    // The work list is fixed here; later queue edits do not touch it.
    joinWorker();
    batch_ = queue_->snapshot();
    if (batch_.isEmpty()) {
        setState(State::Idle);
        return false;
    }
    report_ = BatchReport{};
    report_.outputDir = *dir;
    report_.total = static_cast<int>(batch_.size());
    setState(State::Running);
    qCInfo(ncmDispatch) << "batch started" << "items=" << report_.total
                        << "outputDir=" << loggable(*dir);

    const QStringList work = batch_;
    const std::string outDir = dir->toStdString();
    ncmdump::Dumper *dumper = dumper_;
    worker_ = std::thread([this, work, outDir, dumper]() {
        for (int i = 0; i < work.size(); ++i) {
            if (shuttingDown_.load())
                return;
            std::string err;
            const bool ok = dumper->dump(work.at(i).toStdString(), outDir, err);
            const QString error = QString::fromStdString(err);
            QMetaObject::invokeMethod(
                this, [this, i, ok, error]() { onItemFinished(i, ok, error); },
                Qt::QueuedConnection);
        }
        QMetaObject::invokeMethod(this, [this]() { finishBatch(); },
                                  Qt::QueuedConnection);
    });
    return true;
}

void BatchDispatcher::resetProgress() {
    if (state_ == State::Running)
        return;
    setProgress(0);
}

void BatchDispatcher::setState(State s) {
    if (state_ == s)
        return;
    qCDebug(ncmDispatch) << "state" << stateName(state_) << "->" << stateName(s);
    state_ = s;
    emit stateChanged(state_);
}

void BatchDispatcher::setProgress(int percent) {
    if (progress_ == percent)
        return;
    progress_ = percent;
    emit progressChanged(progress_);
}

void BatchDispatcher::onItemFinished(int index, bool ok, const QString &error) {
    if (state_ != State::Running || index < 0 || index >= batch_.size())
        return;
    const QString path = batch_.at(index);
    if (ok) {
        ++report_.succeeded;
        qCDebug(ncmDispatch) << "dumped" << loggable(path);
    } else {
        report_.failures.push_back({path, error});
        qCWarning(ncmDispatch) << "dump failed" << loggable(path) << error;
    }
    // Single-item batches keep the bar hidden.
    const int total = static_cast<int>(batch_.size());
    if (total > 1)
        setProgress(((index + 1) * 100) / total);
    emit itemFinished(index, path, ok, error);
}

void BatchDispatcher::finishBatch() {
    joinWorker();
    const BatchReport report = report_;
    setProgress(0);
    batch_.clear();
    // Failed items are not retried or re-queued.
    queue_->clear();
    setState(State::Idle);
    qCInfo(ncmDispatch) << "batch finished" << "total=" << report.total
                        << "ok=" << report.succeeded
                        << "failed=" << report.failed();
    dialogs_->notifyMessage(tr("All files have been dumped!"), tr("Success"));
    emit batchFinished(report);
}

void BatchDispatcher::joinWorker() {
    if (worker_.joinable())
        worker_.join();
}
