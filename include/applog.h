#ifndef APPLOG_H
#define APPLOG_H

#include <QString>

// File-backed Qt message log. Messages keep going to stderr as well.
class AppLog {
public:
    // Installs the handler; fileName is relative to logDirectory()
    static bool install(const QString& fileName);
    static void uninstall();

    static QString logDirectory();
    static QString guiLogPath();
    static QString annotatorLogPath();
    static QString currentLogPath();

    // Timestamped record appended directly to a file, handler or not
    static bool appendRecord(const QString& path, const QString& message);
};

#endif // APPLOG_H
