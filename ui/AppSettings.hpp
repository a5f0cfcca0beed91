// Persistent user preferences (QSettings "NcmDump"/"NcmDump").
#pragma once
#include <QString>
#include "ncmdump/NcmTypes.hpp"

class QSettings;

struct AppSettings {
    // Scan/*
    bool recursiveScan = true;
    int maxScanDepth = 32;
    bool followSymlinks = false;
    // Dump/*
    bool writeCover = true;
    bool overwriteExisting = true;
    // Paths/*
    bool rememberDirs = true;
    QString lastInputDir;
    QString lastOutputDir;

    static AppSettings load(QSettings& s);
    void save(QSettings& s) const;
    // Convenience wrappers over QSettings("NcmDump", "NcmDump").
    static AppSettings load();
    void save() const;

    ncmdump::EnumerateOptions enumerateOptions() const;
    ncmdump::DumpOptions dumpOptions() const;
};

QString defaultInputDirPath();
QString defaultOutputDirPath();
