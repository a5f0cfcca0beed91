// QFileDialog/QMessageBox backed dialogs. Starts pickers in the last used
// directories when Paths/rememberDirs is enabled.
#pragma once
#include "DialogProvider.hpp"

class QWidget;

class QtDialogProvider : public DialogProvider {
public:
    explicit QtDialogProvider(QWidget* parent) : parent_(parent) {}

    std::optional<QStringList> pickFiles(const QString& filterName,
                                         const QStringList& extensions) override;
    std::optional<QString> pickDirectory() override;
    void notifyMessage(const QString& text, const QString& title) override;

private:
    QWidget* parent_ = nullptr; // not owned
};
