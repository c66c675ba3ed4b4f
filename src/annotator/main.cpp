#include <QCoreApplication>
#include <QFileInfo>
#include <QStringList>
#include <QDebug>
#include <exception>
#include <cstdio>

#include "applog.h"
#include "save/annotationrequest.h"
#include "save/annotationwriter.h"

// takeoff-annotator <dest.pdf> <request.json> [<log file>]
// Exit status 0 only when dest.pdf was fully written.

static int fail(const QString& logPath, const QString& message)
{
    qWarning() << "[Annotator]" << message;
    if (!AppLog::appendRecord(logPath, message)) {
        std::fprintf(stderr, "could not write log %s\n", qPrintable(logPath));
    }
    return 1;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("PlanTakeoff");
    app.setOrganizationName("PlanTakeoff");

    const QStringList args = app.arguments();
    if (args.size() < 3) {
        std::fprintf(stderr, "usage: takeoff-annotator <dest.pdf> <request.json> [<log file>]\n");
        return 1;
    }

    const QString destPath = args.at(1);
    const QString requestPath = args.at(2);
    const QString logPath = args.size() > 3 ? args.at(3) : AppLog::annotatorLogPath();

    try {
        AnnotationRequest request;
        QString error;
        if (!AnnotationRequest::readFromFile(requestPath, &request, &error)) {
            return fail(logPath, QString("Request %1 rejected: %2").arg(requestPath, error));
        }

        AnnotationWriter writer;
        if (!writer.write(request, destPath)) {
            return fail(logPath, QString("Saving %1 failed: %2")
                                     .arg(QFileInfo(destPath).absoluteFilePath(), writer.lastError()));
        }
    } catch (const std::exception& e) {
        return fail(logPath, QString("Unexpected error while saving %1: %2")
                                 .arg(destPath, QString::fromLocal8Bit(e.what())));
    }

    return 0;
}
