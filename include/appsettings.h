#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QString>
#include <QStringList>

class AppSettings {
public:
    // Directory shown by file dialogs; written on each successful load
    static QString lastDirectory();
    static void setLastDirectory(const QString& dir);

    // Recent drawings (File menu)
    static QStringList recentFiles();
    static void addRecentFile(const QString& path, int maxCount = 10);
    static void clearRecentFiles();

    // Rendering
    static double pageRenderScale();
    static void setPageRenderScale(double scale);
    static double thumbnailScale();
    static void setThumbnailScale(double scale);

    // Annotated PDF save
    static int annotatorTimeoutSeconds();
    static void setAnnotatorTimeoutSeconds(int seconds);
    static QString annotatorPath();         // defaults to the worker beside the executable
    static void setAnnotatorPath(const QString& path);
};

#endif // APPSETTINGS_H
