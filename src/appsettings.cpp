#include "appsettings.h"
#include <QSettings>
#include <QCoreApplication>
#include <QDir>
#include <QSet>

static QString recentKey() { return QStringLiteral("ui/recentFiles"); }

QString AppSettings::lastDirectory()
{
    QSettings s;
    return s.value("ui/lastDir", QDir::homePath()).toString();
}

void AppSettings::setLastDirectory(const QString& dir)
{
    if (dir.trimmed().isEmpty()) return;
    QSettings s;
    s.setValue("ui/lastDir", dir);
}

QStringList AppSettings::recentFiles()
{
    QSettings s;
    QStringList list = s.value(recentKey()).toStringList();
    // De-duplicate and drop empties
    QStringList out;
    QSet<QString> seen;
    for (const QString& p : list) {
        const QString t = p.trimmed();
        if (t.isEmpty()) continue;
        if (seen.contains(t)) continue;
        seen.insert(t);
        out.append(t);
    }
    return out;
}

void AppSettings::addRecentFile(const QString& path, int maxCount)
{
    if (path.trimmed().isEmpty()) return;
    QSettings s;
    QStringList list = s.value(recentKey()).toStringList();
    list.removeAll(path);
    list.prepend(path);
    while (list.size() > maxCount) list.removeLast();
    s.setValue(recentKey(), list);
}

void AppSettings::clearRecentFiles()
{
    QSettings s;
    s.remove(recentKey());
}

double AppSettings::pageRenderScale()
{
    QSettings s;
    return s.value("render/pageScale", 2.0).toDouble();
}

void AppSettings::setPageRenderScale(double scale)
{
    QSettings s;
    if (scale < 0.5) scale = 0.5;
    if (scale > 6.0) scale = 6.0;
    s.setValue("render/pageScale", scale);
}

double AppSettings::thumbnailScale()
{
    QSettings s;
    return s.value("render/thumbnailScale", 0.2).toDouble();
}

void AppSettings::setThumbnailScale(double scale)
{
    QSettings s;
    if (scale < 0.05) scale = 0.05;
    if (scale > 1.0) scale = 1.0;
    s.setValue("render/thumbnailScale", scale);
}

int AppSettings::annotatorTimeoutSeconds()
{
    QSettings s;
    return s.value("save/annotatorTimeoutSeconds", 120).toInt();
}

void AppSettings::setAnnotatorTimeoutSeconds(int seconds)
{
    QSettings s;
    if (seconds < 5) seconds = 5;
    s.setValue("save/annotatorTimeoutSeconds", seconds);
}

QString AppSettings::annotatorPath()
{
    QSettings s;
    const QString stored = s.value("save/annotatorPath").toString();
    if (!stored.trimmed().isEmpty()) return stored;
#ifdef Q_OS_WIN
    const QString exe = QStringLiteral("takeoff-annotator.exe");
#else
    const QString exe = QStringLiteral("takeoff-annotator");
#endif
    return QDir(QCoreApplication::applicationDirPath()).filePath(exe);
}

void AppSettings::setAnnotatorPath(const QString& path)
{
    QSettings s;
    if (path.trimmed().isEmpty()) {
        s.remove("save/annotatorPath");
        return;
    }
    s.setValue("save/annotatorPath", path);
}
