#include "AppSettings.hpp"
#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <algorithm>

static constexpr int kMaxDepthLimit = 256;

QString defaultInputDirPath() {
    return QDir::homePath();
}

QString defaultOutputDirPath() {
    QString p = QStandardPaths::writableLocation(QStandardPaths::MusicLocation);
    if (p.isEmpty()) p = QDir::homePath() + "/Music";
    return p;
}

AppSettings AppSettings::load(QSettings& s) {
    AppSettings a;
    a.recursiveScan = s.value("Scan/recursive", true).toBool();
    a.maxScanDepth = std::clamp(s.value("Scan/maxDepth", 32).toInt(), 0, kMaxDepthLimit);
    a.followSymlinks = s.value("Scan/followSymlinks", false).toBool();
    a.writeCover = s.value("Dump/writeCover", true).toBool();
    a.overwriteExisting = s.value("Dump/overwriteExisting", true).toBool();
    a.rememberDirs = s.value("Paths/rememberDirs", true).toBool();
    a.lastInputDir = s.value("Paths/lastInputDir", defaultInputDirPath()).toString();
    a.lastOutputDir = s.value("Paths/lastOutputDir", defaultOutputDirPath()).toString();
    return a;
}

void AppSettings::save(QSettings& s) const {
    s.setValue("Scan/recursive", recursiveScan);
    s.setValue("Scan/maxDepth", std::clamp(maxScanDepth, 0, kMaxDepthLimit));
    s.setValue("Scan/followSymlinks", followSymlinks);
    s.setValue("Dump/writeCover", writeCover);
    s.setValue("Dump/overwriteExisting", overwriteExisting);
    s.setValue("Paths/rememberDirs", rememberDirs);
    s.setValue("Paths/lastInputDir", lastInputDir);
    s.setValue("Paths/lastOutputDir", lastOutputDir);
    s.sync();
}

AppSettings AppSettings::load() {
    QSettings s("NcmDump", "NcmDump");
    return load(s);
}

void AppSettings::save() const {
    QSettings s("NcmDump", "NcmDump");
    save(s);
}

ncmdump::EnumerateOptions AppSettings::enumerateOptions() const {
    ncmdump::EnumerateOptions o;
    o.recursive = recursiveScan;
    o.maxDepth = maxScanDepth;
    o.followSymlinks = followSymlinks;
    return o;
}

ncmdump::DumpOptions AppSettings::dumpOptions() const {
    ncmdump::DumpOptions o;
    o.writeCover = writeCover;
    o.overwriteExisting = overwriteExisting;
    return o;
}
