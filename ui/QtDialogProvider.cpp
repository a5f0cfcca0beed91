#include "QtDialogProvider.hpp"
#include "AppSettings.hpp"
#include <QCoreApplication>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>

std::optional<QStringList>
QtDialogProvider::pickFiles(const QString &filterName,
                            const QStringList &extensions) {
    AppSettings settings = AppSettings::load();
    QStringList patterns;
    for (const QString &ext : extensions)
        patterns << QStringLiteral("*.") + ext;
    const QString filter =
        QStringLiteral("%1 (%2)").arg(filterName, patterns.join(' '));
    const QString startDir =
        settings.rememberDirs ? settings.lastInputDir : defaultInputDirPath();

    const QStringList files = QFileDialog::getOpenFileNames(
        parent_, QCoreApplication::translate("QtDialogProvider", "Select files"),
        startDir, filter);
    if (files.isEmpty())
        return std::nullopt;

    if (settings.rememberDirs) {
        settings.lastInputDir = QFileInfo(files.first()).absolutePath();
        settings.save();
    }
    return files;
}

std::optional<QString> QtDialogProvider::pickDirectory() {
    AppSettings settings = AppSettings::load();
    const QString startDir =
        settings.rememberDirs ? settings.lastOutputDir : defaultOutputDirPath();
    const QString dir = QFileDialog::getExistingDirectory(
        parent_,
        QCoreApplication::translate("QtDialogProvider", "Select output folder"),
        startDir);
    if (dir.isEmpty())
        return std::nullopt;

    if (settings.rememberDirs) {
        settings.lastOutputDir = dir;
        settings.save();
    }
    return dir;
}

void QtDialogProvider::notifyMessage(const QString &text, const QString &title) {
    QMessageBox box(parent_);
    box.setTextFormat(Qt::PlainText);
    box.setWindowModality(Qt::WindowModal);
    box.setIcon(QMessageBox::Information);
    box.setWindowTitle(title);
    box.setText(text);
    box.setStandardButtons(QMessageBox::Ok);
    box.setDefaultButton(QMessageBox::Ok);
    box.exec();
}
