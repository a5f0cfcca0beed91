// Turns drop notifications and picker results into queue additions, and owns
// the drop-target hover flag.
#pragma once
#include <QObject>
#include <QString>
#include <QStringList>
#include <deque>
#include <list>
#include <thread>
#include "ncmdump/DragState.hpp"

class DialogProvider;
class FileQueueModel;
namespace ncmdump { class PathEnumerator; }

class IngestionController : public QObject {
    Q_OBJECT
public:
    // None of the collaborators are owned; they must outlive the controller.
    IngestionController(FileQueueModel* queue,
                        ncmdump::PathEnumerator* enumerator,
                        DialogProvider* dialogs,
                        QObject* parent = nullptr);
    ~IngestionController() override;

    bool isHovering() const { return hovering_; }
    // Dropped paths whose enumeration has not been applied yet (waiting or
    // running).
    int pendingEnumerations() const { return pending_; }
    int runningEnumerations() const { return running_; }

    // Concurrency: maximum number of enumeration threads at once
    void setMaxConcurrent(int n) { if (n < 1) n = 1; maxConcurrent_ = n; }
    int maxConcurrent() const { return maxConcurrent_; }

public slots:
    // Dropped paths wait in a FIFO and are expanded on at most
    // maxConcurrent() background threads; results are added on the GUI
    // thread in the order the enumerator returned them.
    void handleDrop(const QStringList& paths);
    void handleHoverStart();
    void handleDragCancelled();
    // Opens the picker and queues the chosen files as-is.
    void selectFiles();

signals:
    void hoverChanged(bool hovering);
    // One per dropped path once its results are applied. ok=false means the
    // enumerator failed and nothing was added.
    void pathEnumerated(const QString& path, int added, bool ok);

private:
    struct EnumerationJob {
        quint64 id = 0;
        std::thread thread;
    };

    void applyDragEvent(ncmdump::DragEvent ev);
    void schedule();
    void onJobFinished(quint64 id, const QString& path, const QStringList& files,
                       bool ok, const QString& error);
    void applyEnumeration(const QString& path, const QStringList& files,
                          bool ok, const QString& error);
    void joinJob(quint64 id);

    FileQueueModel* queue_ = nullptr;              // not owned
    ncmdump::PathEnumerator* enumerator_ = nullptr; // not owned
    DialogProvider* dialogs_ = nullptr;            // not owned
    bool hovering_ = false;
    int pending_ = 0;
    int running_ = 0;
    int maxConcurrent_ = 4;
    quint64 nextJobId_ = 1;
    std::deque<QString> waiting_;
    std::list<EnumerationJob> jobs_;
};
