#pragma once
#include <QMainWindow>
#include <memory>

class BatchDispatcher;
class DropArea;
class FileQueueModel;
class IngestionController;
class QtDialogProvider;
class QAction;
class QListView;
class QProgressBar;
class QPushButton;
namespace ncmdump { class FilesystemPathEnumerator; class NcmDumper; }

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

private slots:
    void removeSelected();
    void openSettings();
    void updateControls();
    void onProgressChanged(int percent);

private:
    void applySettings();

    // Collaborators used by the controllers (owned here)
    std::unique_ptr<ncmdump::FilesystemPathEnumerator> enumerator_;
    std::unique_ptr<ncmdump::NcmDumper> dumper_;
    std::unique_ptr<QtDialogProvider> dialogs_;

    // Controllers (children of this)
    FileQueueModel* queueModel_ = nullptr;
    IngestionController* ingestion_ = nullptr;
    BatchDispatcher* dispatcher_ = nullptr;

    // Widgets
    DropArea* dropArea_ = nullptr;
    QListView* listView_ = nullptr;
    QPushButton* goBtn_ = nullptr;
    QPushButton* removeBtn_ = nullptr;
    QPushButton* clearBtn_ = nullptr;
    QProgressBar* progressBar_ = nullptr;

    // Actions
    QAction* actAddFiles_ = nullptr;
    QAction* actSettings_ = nullptr;
};
