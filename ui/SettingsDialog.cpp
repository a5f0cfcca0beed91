// Implementation of the preferences dialog.
#include "SettingsDialog.hpp"
#include <QCheckBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QSpinBox>
#include <QVBoxLayout>

SettingsDialog::SettingsDialog(QWidget* parent) : QDialog(parent) {
    setWindowTitle(tr("Settings"));
    setMinimumWidth(420);
    settings_ = AppSettings::load();

    auto* root = new QVBoxLayout(this);
    root->setContentsMargins(12, 12, 12, 12);
    root->setSpacing(10);

    auto makeGroup = [this, root](const QString& title) {
        auto* group = new QGroupBox(title, this);
        auto* form = new QFormLayout(group);
        form->setContentsMargins(12, 10, 12, 10);
        form->setFieldGrowthPolicy(QFormLayout::AllNonFixedFieldsGrow);
        root->addWidget(group);
        return form;
    };

    // Dropped folders
    QFormLayout* scanForm = makeGroup(tr("Dropped folders"));
    recursive_ = new QCheckBox(tr("Include sub-folders"), this);
    scanForm->addRow(QString(), recursive_);
    maxDepthSpin_ = new QSpinBox(this);
    maxDepthSpin_->setRange(0, 256);
    scanForm->addRow(tr("Maximum depth:"), maxDepthSpin_);
    followSymlinks_ = new QCheckBox(tr("Follow symbolic links"), this);
    scanForm->addRow(QString(), followSymlinks_);

    // Output
    QFormLayout* outForm = makeGroup(tr("Output"));
    writeCover_ = new QCheckBox(tr("Save cover image next to the audio"), this);
    outForm->addRow(QString(), writeCover_);
    overwrite_ = new QCheckBox(tr("Overwrite existing files"), this);
    outForm->addRow(QString(), overwrite_);
    rememberDirs_ = new QCheckBox(tr("Remember last used folders"), this);
    outForm->addRow(QString(), rememberDirs_);

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    root->addStretch(1);
    root->addWidget(buttons);
    connect(buttons, &QDialogButtonBox::accepted, this, &SettingsDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &SettingsDialog::reject);
    connect(recursive_, &QCheckBox::toggled, this, [this] { updateDepthEnabled(); });

    recursive_->setChecked(settings_.recursiveScan);
    maxDepthSpin_->setValue(settings_.maxScanDepth);
    followSymlinks_->setChecked(settings_.followSymlinks);
    writeCover_->setChecked(settings_.writeCover);
    overwrite_->setChecked(settings_.overwriteExisting);
    rememberDirs_->setChecked(settings_.rememberDirs);
    updateDepthEnabled();
}

void SettingsDialog::updateDepthEnabled() {
    const bool on = recursive_->isChecked();
    maxDepthSpin_->setEnabled(on);
    followSymlinks_->setEnabled(on);
}

void SettingsDialog::accept() {
    // Reload so folders remembered by pickers in the meantime are kept.
    AppSettings s = AppSettings::load();
    s.recursiveScan = recursive_->isChecked();
    s.maxScanDepth = maxDepthSpin_->value();
    s.followSymlinks = followSymlinks_->isChecked();
    s.writeCover = writeCover_->isChecked();
    s.overwriteExisting = overwrite_->isChecked();
    s.rememberDirs = rememberDirs_->isChecked();
    s.save();
    settings_ = s;
    QDialog::accept();
}
