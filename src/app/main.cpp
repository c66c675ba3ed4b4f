#include <QApplication>
#include <QGuiApplication>
#include <QMessageBox>
#include <QFileInfo>
#include <QDebug>
#include "app/mainwindow.h"
#include "applog.h"

int main(int argc, char *argv[])
{
    // Desktop theme plugins have crashed the app on some Linux desktops
    QGuiApplication::setDesktopSettingsAware(false);
    qputenv("QT_QPA_PLATFORMTHEME", "");

    QApplication app(argc, argv);
    app.setApplicationName("PlanTakeoff");
    app.setOrganizationName("PlanTakeoff");

    if (!AppLog::install("plantakeoff.log")) {
        qWarning() << "[Main] Logging to stderr only";
    }
    qInfo() << "[Main] Starting, log file:" << AppLog::currentLogPath();

    try {
        MainWindow window;
        window.show();

        const QStringList args = app.arguments();
        if (args.size() > 1) {
            const QString path = QFileInfo(args.at(1)).absoluteFilePath();
            window.openDocument(path);
        }

        const int rc = app.exec();
        AppLog::uninstall();
        return rc;
    } catch (const std::exception& e) {
        qCritical() << "[Main] Unhandled exception:" << e.what();
        QMessageBox::critical(nullptr, "Fatal Error",
            QString("Application crashed: %1").arg(e.what()));
        AppLog::uninstall();
        return 1;
    }
}
