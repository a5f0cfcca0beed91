#include "MainWindow.hpp"
#include "ncmdump/RuntimeLogging.hpp"
#include <QApplication>
#include <QLoggingCategory>
Q_LOGGING_CATEGORY(ncmApp, "ncmdump.app")

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName("NcmDump");
    QCoreApplication::setApplicationName("NcmDump");

    const ncmdump::LogPolicy& logs = ncmdump::logPolicy();
    if (logs.debugCategories)
        QLoggingCategory::setFilterRules(QStringLiteral("ncmdump.*.debug=true"));
    qCInfo(ncmApp) << "starting" << "debug=" << logs.debugCategories
                   << "fullPaths=" << logs.fullPaths;

    MainWindow w;
    w.show();
    return app.exec();
}
