// Controller tests without external framework (run via CTest).
// Drives the queue model, ingestion and dispatch controllers on a
// QCoreApplication event loop with scripted collaborators.
#include "AppSettings.hpp"
#include "BatchDispatcher.hpp"
#include "DialogProvider.hpp"
#include "FileQueueModel.hpp"
#include "IngestionController.hpp"
#include "ncmdump/MockDumper.hpp"
#include "ncmdump/MockPathEnumerator.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QSettings>
#include <QThread>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

// Scripted dialogs: each picker call pops the next answer (nullopt when the
// script is exhausted, i.e. the user dismissed it).
class FakeDialogs : public DialogProvider {
public:
    std::deque<std::optional<QStringList>> fileAnswers;
    std::deque<std::optional<QString>> dirAnswers;
    std::vector<std::pair<QString, QString>> messages;
    int fileCalls = 0;
    int dirCalls = 0;
    QStringList lastExtensions;

    std::optional<QStringList> pickFiles(const QString &,
                                         const QStringList &extensions) override {
        ++fileCalls;
        lastExtensions = extensions;
        if (fileAnswers.empty())
            return std::nullopt;
        auto a = fileAnswers.front();
        fileAnswers.pop_front();
        return a;
    }

    std::optional<QString> pickDirectory() override {
        ++dirCalls;
        if (dirAnswers.empty())
            return std::nullopt;
        auto a = dirAnswers.front();
        dirAnswers.pop_front();
        return a;
    }

    void notifyMessage(const QString &text, const QString &title) override {
        messages.emplace_back(text, title);
    }
};

template <typename Pred>
bool waitFor(Pred pred, int timeoutMs = 5000) {
    QElapsedTimer timer;
    timer.start();
    while (!pred()) {
        if (timer.elapsed() > timeoutMs)
            return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
    return true;
}

// Pumps the event loop for a short while so late events can show up.
void settle(int ms = 50) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
}

// ---- queue model ----

void test_model_signals(TestContext &t) {
    FileQueueModel m;
    int cleared = 0;
    std::vector<int> sizes;
    QObject::connect(&m, &FileQueueModel::cleared, [&] { ++cleared; });
    QObject::connect(&m, &FileQueueModel::sizeChanged, [&](int n) { sizes.push_back(n); });

    t.check(m.add("a") && m.add("b"), "model add should append new paths");
    t.check(!m.add("a"), "model add of duplicate should be a no-op");
    t.check(!m.add(QString()) && !m.contains(QString()), "model add of empty path should be ignored");
    t.check(m.rowCount() == 2, "rowCount should follow the queue");
    t.check(m.paths() == QStringList{"a", "b"}, "paths should keep insertion order");
    t.check(m.remove("a") && !m.remove("a"), "remove should report whether it changed the queue");
    m.clear();
    t.check(m.isEmpty() && cleared == 1, "clear should empty the model and emit cleared");
    m.clear();
    t.check(cleared == 2, "clear on empty queue still emits cleared");
    t.check(sizes == std::vector<int>({1, 2, 1, 0}), "sizeChanged should only fire on real changes");
}

// ---- ingestion ----

void test_drop_adds_without_duplicates(TestContext &t) {
    FileQueueModel queue;
    ncmdump::MockPathEnumerator en;
    FakeDialogs dialogs;
    IngestionController ing(&queue, &en, &dialogs);
    en.setResult("/drop/x", {"/drop/x/1.ncm", "/drop/x/2.ncm"});

    ing.handleDrop({"/drop/x"});
    t.check(waitFor([&] { return ing.pendingEnumerations() == 0; }), "first drop should complete");
    t.check(queue.paths() == QStringList{"/drop/x/1.ncm", "/drop/x/2.ncm"},
            "drop should add enumerated files in order");

    ing.handleDrop({"/drop/x"});
    t.check(waitFor([&] { return ing.pendingEnumerations() == 0; }), "second drop should complete");
    t.check(queue.size() == 2, "dropping the same folder twice must not duplicate entries");
}

void test_drop_failure_isolated(TestContext &t) {
    FileQueueModel queue;
    ncmdump::MockPathEnumerator en;
    FakeDialogs dialogs;
    IngestionController ing(&queue, &en, &dialogs);
    en.setFailure("/drop/locked", "permission denied");
    en.setResult("/drop/ok", {"/drop/ok/a.ncm"});
    en.setDelay("/drop/ok", std::chrono::milliseconds(30));

    std::vector<std::pair<QString, bool>> results;
    QObject::connect(&ing, &IngestionController::pathEnumerated,
                     [&](const QString &p, int, bool ok) { results.emplace_back(p, ok); });

    ing.handleDrop({"/drop/locked", "/drop/ok", "/drop/file.ncm"});
    t.check(ing.pendingEnumerations() == 3, "each dropped path should be enumerated");
    t.check(waitFor([&] { return ing.pendingEnumerations() == 0; }), "drop should complete");
    t.check(results.size() == 3, "every dropped path should report a result");
    t.check(!queue.contains("/drop/locked"), "failed enumeration must add nothing");
    t.check(queue.contains("/drop/ok/a.ncm") && queue.contains("/drop/file.ncm"),
            "other dropped paths are still added");
    t.check(queue.size() == 2, "queue should hold exactly the successful results");
}

void test_hover_state(TestContext &t) {
    FileQueueModel queue;
    ncmdump::MockPathEnumerator en;
    FakeDialogs dialogs;
    IngestionController ing(&queue, &en, &dialogs);
    std::vector<bool> changes;
    QObject::connect(&ing, &IngestionController::hoverChanged,
                     [&](bool h) { changes.push_back(h); });

    t.check(!ing.isHovering(), "hover should start off");
    ing.handleHoverStart();
    t.check(ing.isHovering(), "hover start should set hover");
    ing.handleHoverStart();
    ing.handleDragCancelled();
    t.check(!ing.isHovering(), "cancel should clear hover");

    ing.handleHoverStart();
    ing.handleDrop({});
    t.check(!ing.isHovering(), "drop with no paths should clear hover");
    t.check(queue.isEmpty(), "drop with no paths should not change the queue");

    ing.handleHoverStart();
    en.setDelay("/slow", std::chrono::milliseconds(20));
    ing.handleDrop({"/slow"});
    t.check(!ing.isHovering(), "drop should clear hover immediately");
    t.check(waitFor([&] { return ing.pendingEnumerations() == 0; }), "slow drop should complete");
    t.check(!ing.isHovering(), "hover should stay off after the drop completes");
    t.check(changes == std::vector<bool>({true, false, true, false, true, false}),
            "hoverChanged should only fire on transitions");
}

void test_drop_enumeration_is_capped(TestContext &t) {
    FileQueueModel queue;
    ncmdump::MockPathEnumerator en;
    FakeDialogs dialogs;
    IngestionController ing(&queue, &en, &dialogs);
    ing.setMaxConcurrent(3);

    QStringList dropped;
    for (int i = 0; i < 60; ++i) {
        const QString p = QString("/drop/many/%1.ncm").arg(i, 3, 10, QChar('0'));
        en.setDelay(p.toStdString(), std::chrono::milliseconds(3));
        dropped << p;
    }

    int maxRunning = 0;
    QObject::connect(&ing, &IngestionController::pathEnumerated, [&](const QString &, int, bool) {
        maxRunning = std::max(maxRunning, ing.runningEnumerations());
    });

    ing.handleDrop(dropped);
    t.check(ing.runningEnumerations() == 3, "a large drop should start only up to the cap");
    t.check(ing.pendingEnumerations() == 60, "every dropped path should be pending");
    t.check(waitFor([&] { return ing.pendingEnumerations() == 0; }, 20000),
            "large drop should complete");
    t.check(en.maxConcurrentCalls() <= 3, "enumerations in flight must stay within the cap");
    t.check(maxRunning <= 3, "running enumerations must stay within the cap");
    t.check(ing.runningEnumerations() == 0, "no enumeration should be left running");
    t.check(en.calls().size() == 60, "every dropped path should be enumerated once");
    t.check(queue.size() == 60, "every dropped file should be queued");
    t.check(!ing.isHovering(), "hover stays off after a large drop");
}

void test_single_worker_keeps_drop_order(TestContext &t) {
    FileQueueModel queue;
    ncmdump::MockPathEnumerator en;
    FakeDialogs dialogs;
    IngestionController ing(&queue, &en, &dialogs);
    ing.setMaxConcurrent(0);
    t.check(ing.maxConcurrent() == 1, "concurrency is at least one");

    en.setDelay("/d/first", std::chrono::milliseconds(20));
    en.setResult("/d/first", {"/d/first/1.ncm", "/d/first/2.ncm"});
    ing.handleDrop({"/d/first", "/d/second.ncm", "/d/third.ncm"});
    t.check(waitFor([&] { return ing.pendingEnumerations() == 0; }), "drop should complete");
    t.check(en.maxConcurrentCalls() == 1, "a single worker never overlaps enumerations");
    t.check(queue.paths() ==
                QStringList{"/d/first/1.ncm", "/d/first/2.ncm", "/d/second.ncm", "/d/third.ncm"},
            "a single worker applies results in drop order");

    // A drop arriving while the first is still waiting is queued behind it.
    en.setDelay("/d/slow", std::chrono::milliseconds(20));
    ing.handleDrop({"/d/slow"});
    ing.handleDrop({"/d/after.ncm"});
    t.check(ing.runningEnumerations() == 1 && ing.pendingEnumerations() == 2,
            "second drop waits for the busy worker");
    t.check(waitFor([&] { return ing.pendingEnumerations() == 0; }), "queued drops should complete");
    t.check(queue.paths().endsWith("/d/after.ncm") && queue.contains("/d/slow"),
            "queued drops are applied after the running one");
}

void test_manual_selection(TestContext &t) {
    FileQueueModel queue;
    ncmdump::MockPathEnumerator en;
    FakeDialogs dialogs;
    IngestionController ing(&queue, &en, &dialogs);
    queue.add("/music/a.ncm");

    dialogs.fileAnswers.push_back(QStringList{"/music/a.ncm", "/music/b.ncm"});
    ing.selectFiles();
    t.check(dialogs.lastExtensions == QStringList{"ncm"}, "picker should filter on ncm");
    t.check(queue.paths() == QStringList{"/music/a.ncm", "/music/b.ncm"},
            "picked files should be added without duplicates");

    ing.selectFiles(); // script exhausted: dismissed
    t.check(dialogs.fileCalls == 2, "picker should be opened each time");
    t.check(queue.size() == 2, "dismissed picker must leave the queue unchanged");
    t.check(en.calls().empty(), "picked files are not enumerated");
}

// ---- dispatch ----

void test_batch_runs_to_completion(TestContext &t) {
    FileQueueModel queue;
    ncmdump::MockDumper dumper;
    FakeDialogs dialogs;
    BatchDispatcher disp(&queue, &dumper, &dialogs);
    dumper.setFailure("b", "corrupt");
    dumper.setDelay(std::chrono::milliseconds(5));
    queue.add("a");
    queue.add("b");
    queue.add("c");
    dialogs.dirAnswers.push_back(QString("/out"));

    std::vector<int> progress;
    std::optional<BatchReport> report;
    QObject::connect(&disp, &BatchDispatcher::progressChanged,
                     [&](int p) { progress.push_back(p); });
    QObject::connect(&disp, &BatchDispatcher::batchFinished,
                     [&](const BatchReport &r) { report = r; });

    t.check(disp.start(), "start should begin the batch");
    t.check(disp.isRunning(), "dispatcher should be running after start");
    t.check(disp.currentBatch() == QStringList{"a", "b", "c"}, "batch should snapshot the queue");
    t.check(!disp.start(), "start while running should be rejected");
    t.check(dialogs.dirCalls == 1, "rejected start must not open the dialog");

    t.check(waitFor([&] { return report.has_value(); }), "batch should finish");
    t.check(disp.state() == BatchDispatcher::State::Idle, "dispatcher should return to idle");
    t.check(queue.isEmpty(), "queue should be empty after the batch");
    t.check(disp.progress() == 0, "progress should reset after the batch");
    t.check(progress == std::vector<int>({33, 66, 100, 0}),
            "progress should step per item and reset at the end");
    t.check(dialogs.messages.size() == 1, "exactly one completion message should be shown");
    if (!dialogs.messages.empty()) {
        t.check(dialogs.messages[0].first == "All files have been dumped!" &&
                    dialogs.messages[0].second == "Success",
                "completion message should be the blanket success notice");
    }
    const auto calls = dumper.calls();
    t.check(calls.size() == 3 && calls[0].file == "a" && calls[1].file == "b" &&
                calls[2].file == "c",
            "items should be dumped in queue order");
    t.check(calls.size() == 3 && calls[2].outputDir == "/out",
            "items should be dumped into the chosen directory");
    t.check(dumper.maxConcurrentCalls() == 1, "dumps must never overlap");
    if (report) {
        t.check(report->total == 3 && report->succeeded == 2 && report->failed() == 1,
                "report should count successes and failures");
        t.check(report->failed() == 1 && report->failures[0].path == "b" &&
                    report->failures[0].error == "corrupt",
                "report should carry the failed path and error");
    }
}

void test_single_item_batch_has_no_progress(TestContext &t) {
    FileQueueModel queue;
    ncmdump::MockDumper dumper;
    FakeDialogs dialogs;
    BatchDispatcher disp(&queue, &dumper, &dialogs);
    queue.add("only");
    dialogs.dirAnswers.push_back(QString("/out"));

    int progressSignals = 0;
    bool finished = false;
    QObject::connect(&disp, &BatchDispatcher::progressChanged, [&](int) { ++progressSignals; });
    QObject::connect(&disp, &BatchDispatcher::batchFinished,
                     [&](const BatchReport &) { finished = true; });

    t.check(disp.start(), "single-item batch should start");
    t.check(waitFor([&] { return finished; }), "single-item batch should finish");
    t.check(progressSignals == 0, "single-item batch should not report progress");
    t.check(queue.isEmpty() && dialogs.messages.size() == 1,
            "single-item batch should clear the queue and notify once");
}

void test_dismissed_directory_dialog(TestContext &t) {
    FileQueueModel queue;
    ncmdump::MockDumper dumper;
    FakeDialogs dialogs;
    BatchDispatcher disp(&queue, &dumper, &dialogs);
    queue.add("a");
    queue.add("b");

    std::vector<BatchDispatcher::State> states;
    QObject::connect(&disp, &BatchDispatcher::stateChanged,
                     [&](BatchDispatcher::State s) { states.push_back(s); });

    t.check(!disp.start(), "start should report nothing started when dismissed");
    settle();
    t.check(disp.state() == BatchDispatcher::State::Idle, "dismissed dialog should return to idle");
    t.check(states.size() == 2 && states[0] == BatchDispatcher::State::AwaitingOutputDir &&
                states[1] == BatchDispatcher::State::Idle,
            "state should pass through AwaitingOutputDir and back");
    t.check(queue.size() == 2, "dismissed dialog must not touch the queue");
    t.check(dumper.calls().empty(), "dismissed dialog must not dump anything");
    t.check(dialogs.messages.empty(), "dismissed dialog must not notify");
}

void test_empty_queue_start_rejected(TestContext &t) {
    FileQueueModel queue;
    ncmdump::MockDumper dumper;
    FakeDialogs dialogs;
    BatchDispatcher disp(&queue, &dumper, &dialogs);
    dialogs.dirAnswers.push_back(QString("/out"));

    t.check(!disp.start(), "start on empty queue should be rejected");
    t.check(dialogs.dirCalls == 0, "empty queue should not open the directory dialog");
    t.check(disp.state() == BatchDispatcher::State::Idle, "empty queue start stays idle");
}

void test_snapshot_isolation(TestContext &t) {
    FileQueueModel queue;
    ncmdump::MockDumper dumper;
    FakeDialogs dialogs;
    BatchDispatcher disp(&queue, &dumper, &dialogs);
    dumper.setDelay(std::chrono::milliseconds(20));
    queue.add("a");
    queue.add("b");
    queue.add("c");
    dialogs.dirAnswers.push_back(QString("/out"));

    bool finished = false;
    std::vector<int> progress;
    QObject::connect(&disp, &BatchDispatcher::batchFinished,
                     [&](const BatchReport &) { finished = true; });
    QObject::connect(&disp, &BatchDispatcher::progressChanged,
                     [&](int p) { progress.push_back(p); });

    t.check(disp.start(), "batch should start");
    // Edits while running do not change the work list.
    queue.remove("b");
    queue.add("d");
    t.check(disp.currentBatch() == QStringList{"a", "b", "c"},
            "running batch should keep its snapshot");

    t.check(waitFor([&] { return finished; }), "batch should finish");
    const auto calls = dumper.calls();
    t.check(calls.size() == 3, "every snapshot item should be dumped");
    bool sawB = false;
    bool sawD = false;
    for (const auto &c : calls) {
        sawB = sawB || c.file == "b";
        sawD = sawD || c.file == "d";
    }
    t.check(sawB, "item removed mid-batch is still dumped");
    t.check(!sawD, "item added mid-batch is not dumped");
    t.check(progress == std::vector<int>({33, 66, 100, 0}),
            "queue edits mid-batch must not change the progress denominator");
    t.check(queue.isEmpty(), "queue is cleared at the end of the batch");
}

void test_external_clear_resets_progress(TestContext &t) {
    FileQueueModel queue;
    ncmdump::MockDumper dumper;
    FakeDialogs dialogs;
    BatchDispatcher disp(&queue, &dumper, &dialogs);
    QObject::connect(&queue, &FileQueueModel::cleared, &disp, &BatchDispatcher::resetProgress);
    dumper.setDelay(std::chrono::milliseconds(30));
    queue.add("a");
    queue.add("b");
    dialogs.dirAnswers.push_back(QString("/out"));

    bool finished = false;
    QObject::connect(&disp, &BatchDispatcher::batchFinished,
                     [&](const BatchReport &) { finished = true; });
    t.check(disp.start(), "batch should start");
    t.check(waitFor([&] { return disp.progress() == 50; }), "first item should report 50%");
    queue.clear();
    t.check(disp.progress() == 50, "clear during a batch must not reset progress");
    t.check(waitFor([&] { return finished; }), "batch should finish");
    t.check(disp.progress() == 0, "progress resets when the batch ends");

    queue.add("x");
    queue.clear();
    t.check(disp.progress() == 0, "clear while idle keeps progress at 0");
}

// ---- settings ----

void test_settings_roundtrip(TestContext &t) {
    const QString file = QDir::temp().filePath(
        QString("ncmdump-settings-%1.ini").arg(QCoreApplication::applicationPid()));
    QFile::remove(file);
    {
        QSettings s(file, QSettings::IniFormat);
        const AppSettings d = AppSettings::load(s);
        t.check(d.recursiveScan && d.maxScanDepth == 32 && !d.followSymlinks,
                "scan defaults should apply");
        t.check(d.writeCover && d.overwriteExisting && d.rememberDirs,
                "dump and path defaults should apply");

        AppSettings a = d;
        a.recursiveScan = false;
        a.maxScanDepth = 1000;
        a.writeCover = false;
        a.lastOutputDir = "/tmp/out";
        a.save(s);
    }
    {
        QSettings s(file, QSettings::IniFormat);
        const AppSettings b = AppSettings::load(s);
        t.check(!b.recursiveScan && !b.writeCover, "saved flags should load back");
        t.check(b.maxScanDepth == 256, "depth should be clamped to the supported range");
        t.check(b.lastOutputDir == "/tmp/out", "last output dir should load back");
        const auto eo = b.enumerateOptions();
        t.check(!eo.recursive && eo.maxDepth == 256, "enumerate options should mirror settings");
        t.check(!b.dumpOptions().writeCover, "dump options should mirror settings");
    }
    QFile::remove(file);
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_model_signals(t);
    test_drop_adds_without_duplicates(t);
    test_drop_failure_isolated(t);
    test_hover_state(t);
    test_drop_enumeration_is_capped(t);
    test_single_worker_keeps_drop_order(t);
    test_manual_selection(t);
    test_batch_runs_to_completion(t);
    test_single_item_batch_has_no_progress(t);
    test_dismissed_directory_dialog(t);
    test_empty_queue_start_rejected(t);
    test_snapshot_isolation(t);
    test_external_clear_resets_progress(t);
    test_settings_roundtrip(t);

    if (t.failures == 0) {
        std::cout << "[OK] controller tests passed\n";
        return EXIT_SUCCESS;
    }
    std::cerr << "[FAIL] controller tests failures: " << t.failures << "\n";
    return EXIT_FAILURE;
}
