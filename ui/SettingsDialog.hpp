// Preferences dialog: folder scanning, output and remembered folders.
#pragma once
#include <QDialog>
#include "AppSettings.hpp"

class QCheckBox;
class QSpinBox;

class SettingsDialog : public QDialog {
    Q_OBJECT
public:
    explicit SettingsDialog(QWidget* parent = nullptr);

    // Values as saved by the last accept().
    const AppSettings& settings() const { return settings_; }

private slots:
    void accept() override; // saves to QSettings

private:
    void updateDepthEnabled();

    AppSettings settings_;
    QCheckBox* recursive_ = nullptr;
    QSpinBox* maxDepthSpin_ = nullptr;
    QCheckBox* followSymlinks_ = nullptr;
    QCheckBox* writeCover_ = nullptr;
    QCheckBox* overwrite_ = nullptr;
    QCheckBox* rememberDirs_ = nullptr;
};
