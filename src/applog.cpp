#include "applog.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QTextStream>
#include <cstdio>

namespace {

QMutex g_logMutex;
QString g_logPath;
QtMessageHandler g_previousHandler = nullptr;

const char* levelName(QtMsgType type)
{
    switch (type) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

void writeLine(const QString& path, const QString& line)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) return;
    QTextStream out(&file);
    out << line << '\n';
}

void messageHandler(QtMsgType type, const QMessageLogContext&, const QString& msg)
{
    const QString line = QString("%1 [%2] %3")
                             .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs),
                                  QString::fromLatin1(levelName(type)), msg);
    {
        QMutexLocker locker(&g_logMutex);
        if (!g_logPath.isEmpty()) writeLine(g_logPath, line);
    }
    std::fprintf(stderr, "%s\n", qPrintable(line));
    std::fflush(stderr);
}

} // namespace

QString AppLog::logDirectory()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) base = QDir::tempPath();
    return QDir(base).filePath("logs");
}

QString AppLog::guiLogPath()
{
    return QDir(logDirectory()).filePath("plantakeoff.log");
}

QString AppLog::annotatorLogPath()
{
    return QDir(logDirectory()).filePath("annotator.log");
}

QString AppLog::currentLogPath()
{
    QMutexLocker locker(&g_logMutex);
    return g_logPath;
}

bool AppLog::install(const QString& fileName)
{
    const QString path = QFileInfo(fileName).isAbsolute() ? fileName
                                                           : QDir(logDirectory()).filePath(fileName);
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return false;
    }
    {
        QMutexLocker locker(&g_logMutex);
        g_logPath = path;
    }
    QtMessageHandler previous = qInstallMessageHandler(messageHandler);
    if (previous != messageHandler) g_previousHandler = previous;
    return true;
}

void AppLog::uninstall()
{
    qInstallMessageHandler(g_previousHandler);
    g_previousHandler = nullptr;
    QMutexLocker locker(&g_logMutex);
    g_logPath.clear();
}

bool AppLog::appendRecord(const QString& path, const QString& message)
{
    if (path.isEmpty()) return false;
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) return false;

    QMutexLocker locker(&g_logMutex);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) return false;
    QTextStream out(&file);
    out << "=== " << QDateTime::currentDateTime().toString(Qt::ISODateWithMs) << " ===\n"
        << message << "\n\n";
    return true;
}
