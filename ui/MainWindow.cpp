// Main window: drop area, pending queue, dispatch button and progress.
#include "MainWindow.hpp"
#include "AppSettings.hpp"
#include "BatchDispatcher.hpp"
#include "DropArea.hpp"
#include "FileQueueModel.hpp"
#include "IngestionController.hpp"
#include "QtDialogProvider.hpp"
#include "SettingsDialog.hpp"
#include "ncmdump/FilesystemPathEnumerator.hpp"
#include "ncmdump/NcmDumper.hpp"
#include <QAction>
#include <QFileInfo>
#include <QFont>
#include <QHBoxLayout>
#include <QKeySequence>
#include <QLabel>
#include <QListView>
#include <QProgressBar>
#include <QPushButton>
#include <QStatusBar>
#include <QToolBar>
#include <QVBoxLayout>

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
    const AppSettings settings = AppSettings::load();
    enumerator_ = std::make_unique<ncmdump::FilesystemPathEnumerator>(settings.enumerateOptions());
    dumper_ = std::make_unique<ncmdump::NcmDumper>(settings.dumpOptions());
    dialogs_ = std::make_unique<QtDialogProvider>(this);

    queueModel_ = new FileQueueModel(this);
    ingestion_ = new IngestionController(queueModel_, enumerator_.get(), dialogs_.get(), this);
    dispatcher_ = new BatchDispatcher(queueModel_, dumper_.get(), dialogs_.get(), this);

    // Layout
    auto* central = new QWidget(this);
    auto* root = new QVBoxLayout(central);
    root->setContentsMargins(16, 12, 16, 12);
    root->setSpacing(10);

    auto* title = new QLabel(tr("NCM Dump"), central);
    QFont f = title->font();
    f.setPointSize(f.pointSize() + 6);
    f.setBold(true);
    title->setFont(f);
    title->setAlignment(Qt::AlignCenter);
    root->addWidget(title);

    dropArea_ = new DropArea(central);
    root->addWidget(dropArea_, 1);

    listView_ = new QListView(central);
    listView_->setModel(queueModel_);
    listView_->setSelectionMode(QAbstractItemView::ExtendedSelection);
    listView_->setTextElideMode(Qt::ElideMiddle);
    root->addWidget(listView_, 2);

    auto* buttons = new QHBoxLayout();
    removeBtn_ = new QPushButton(tr("Remove"), central);
    clearBtn_ = new QPushButton(tr("Clear"), central);
    goBtn_ = new QPushButton(tr("Go!"), central);
    goBtn_->setDefault(true);
    buttons->addWidget(removeBtn_);
    buttons->addWidget(clearBtn_);
    buttons->addStretch(1);
    buttons->addWidget(goBtn_);
    root->addLayout(buttons);

    progressBar_ = new QProgressBar(central);
    progressBar_->setRange(0, 100);
    progressBar_->setFormat(QStringLiteral("%p%"));
    progressBar_->setVisible(false);
    root->addWidget(progressBar_);

    setCentralWidget(central);

    // Toolbar
    auto* tb = addToolBar("Main");
    actAddFiles_ = tb->addAction(tr("Add files…"), ingestion_, &IngestionController::selectFiles);
    actAddFiles_->setShortcut(QKeySequence::Open);
    actSettings_ = tb->addAction(tr("Settings"), this, &MainWindow::openSettings);

    auto* actRemove = new QAction(tr("Remove selected"), this);
    actRemove->setShortcut(QKeySequence(Qt::Key_Delete));
    listView_->addAction(actRemove);
    connect(actRemove, &QAction::triggered, this, &MainWindow::removeSelected);

    // Drop notifications and controller wiring; connected once for the
    // lifetime of the window.
    connect(dropArea_, &DropArea::hoverStarted, ingestion_, &IngestionController::handleHoverStart);
    connect(dropArea_, &DropArea::dragCancelled, ingestion_, &IngestionController::handleDragCancelled);
    connect(dropArea_, &DropArea::filesDropped, ingestion_, &IngestionController::handleDrop);
    connect(dropArea_, &DropArea::clicked, ingestion_, &IngestionController::selectFiles);
    connect(ingestion_, &IngestionController::hoverChanged, dropArea_, &DropArea::setHighlighted);
    connect(ingestion_, &IngestionController::pathEnumerated, this,
            [this](const QString& path, int added, bool ok) {
                const QString name = QFileInfo(path).fileName();
                if (ok)
                    statusBar()->showMessage(tr("%1: %2 file(s) added").arg(name).arg(added), 3000);
                else
                    statusBar()->showMessage(tr("%1: could not be read").arg(name), 4000);
            });

    connect(queueModel_, &FileQueueModel::sizeChanged, this, &MainWindow::updateControls);
    connect(queueModel_, &FileQueueModel::cleared, dispatcher_, &BatchDispatcher::resetProgress);
    connect(dispatcher_, &BatchDispatcher::stateChanged, this, &MainWindow::updateControls);
    connect(dispatcher_, &BatchDispatcher::progressChanged, this, &MainWindow::onProgressChanged);
    connect(dispatcher_, &BatchDispatcher::batchFinished, this, [this](const BatchReport& r) {
        statusBar()->showMessage(
            tr("Dumped %1 of %2 file(s)").arg(r.succeeded).arg(r.total), 6000);
    });

    connect(goBtn_, &QPushButton::clicked, dispatcher_, [this] { dispatcher_->start(); });
    connect(removeBtn_, &QPushButton::clicked, this, &MainWindow::removeSelected);
    connect(clearBtn_, &QPushButton::clicked, queueModel_, &FileQueueModel::clear);

    updateControls();
    statusBar()->showMessage(tr("Ready"));
    setWindowTitle(tr("NcmDump"));
    resize(720, 560);
}

MainWindow::~MainWindow() {
    // Controllers join their worker threads, which still use the
    // enumerator and dumper owned by this window.
    delete dispatcher_;
    dispatcher_ = nullptr;
    delete ingestion_;
    ingestion_ = nullptr;
}

void MainWindow::removeSelected() {
    auto* sel = listView_->selectionModel();
    if (!sel) return;
    QStringList paths;
    for (const QModelIndex& idx : sel->selectedRows())
        paths << queueModel_->pathAt(idx);
    for (const QString& p : paths)
        queueModel_->remove(p);
}

void MainWindow::openSettings() {
    if (dispatcher_->state() != BatchDispatcher::State::Idle) return;
    SettingsDialog dlg(this);
    if (dlg.exec() != QDialog::Accepted) return;
    applySettings();
    statusBar()->showMessage(tr("Settings saved"), 3000);
}

void MainWindow::applySettings() {
    const AppSettings s = AppSettings::load();
    enumerator_->setOptions(s.enumerateOptions());
    dumper_->setOptions(s.dumpOptions());
}

void MainWindow::updateControls() {
    if (!dispatcher_) return;
    const bool hasItems = !queueModel_->isEmpty();
    const bool idle = dispatcher_->state() == BatchDispatcher::State::Idle;

    dropArea_->setCompact(hasItems);
    listView_->setVisible(hasItems);
    goBtn_->setVisible(hasItems);
    removeBtn_->setVisible(hasItems);
    clearBtn_->setVisible(hasItems);

    goBtn_->setEnabled(idle && hasItems);
    clearBtn_->setEnabled(idle);
    actSettings_->setEnabled(idle);
}

void MainWindow::onProgressChanged(int percent) {
    progressBar_->setValue(percent);
    progressBar_->setVisible(percent > 0);
}
