// Runs the queued files through the dumper, one at a time, on a single
// worker thread. Progress and queue state are only touched on the GUI thread.
#pragma once
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <atomic>
#include <thread>

class DialogProvider;
class FileQueueModel;
namespace ncmdump { class Dumper; }

// Outcome of one batch. The user only sees a blanket completion message;
// the per-file detail is for logging and programmatic callers.
struct BatchReport {
    struct Failure {
        QString path;
        QString error;
    };
    QString outputDir;
    int total = 0;
    int succeeded = 0;
    QVector<Failure> failures;

    int failed() const { return static_cast<int>(failures.size()); }
};

class BatchDispatcher : public QObject {
    Q_OBJECT
public:
    enum class State { Idle, AwaitingOutputDir, Running };
    Q_ENUM(State)

    // None of the collaborators are owned; they must outlive the dispatcher.
    BatchDispatcher(FileQueueModel* queue,
                    ncmdump::Dumper* dumper,
                    DialogProvider* dialogs,
                    QObject* parent = nullptr);
    ~BatchDispatcher() override;

    State state() const { return state_; }
    bool isRunning() const { return state_ == State::Running; }
    // Percent of the running batch, 0 when idle or for single-item batches.
    int progress() const { return progress_; }
    // Work list of the running batch (empty when idle).
    const QStringList& currentBatch() const { return batch_; }

    // Asks for an output directory and starts the batch. Returns false when
    // nothing was started: not idle, empty queue, or the dialog was dismissed.
    bool start();

public slots:
    // Queue cleared from outside a batch: drop any stale progress.
    void resetProgress();

signals:
    void stateChanged(BatchDispatcher::State state);
    void progressChanged(int percent);
    void itemFinished(int index, const QString& path, bool ok, const QString& error);
    void batchFinished(const BatchReport& report);

private:
    void setState(State s);
    void setProgress(int percent);
    void onItemFinished(int index, bool ok, const QString& error);
    void finishBatch();
    void joinWorker();

    FileQueueModel* queue_ = nullptr;      // not owned
    ncmdump::Dumper* dumper_ = nullptr;    // not owned
    DialogProvider* dialogs_ = nullptr;    // not owned
    State state_ = State::Idle;
    int progress_ = 0;
    QStringList batch_;
    BatchReport report_;
    std::thread worker_;
    // Set only on destruction so an in-flight batch stops between items.
    std::atomic_bool shuttingDown_{false};
};
