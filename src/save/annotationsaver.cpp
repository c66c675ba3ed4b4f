#include "save/annotationsaver.h"
#include "document/renderpauseguard.h"
#include "applog.h"

#include <QProcess>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QDebug>

AnnotationSaver::AnnotationSaver()
    : m_logPath(AppLog::annotatorLogPath())
{
}

void AnnotationSaver::setExecutablePath(const QString& path)
{
    m_executablePath = path;
}

bool AnnotationSaver::isAvailable() const
{
    const QFileInfo info(m_executablePath);
    return info.exists() && info.isExecutable();
}

AnnotationSaveResult AnnotationSaver::save(const AnnotationRequest& request, const QString& destPath,
                                           BackgroundRenderer* renderer)
{
    AnnotationSaveResult result;
    result.logPath = m_logPath;

    if (destPath.isEmpty()) {
        result.errorMessage = "No destination file";
        m_lastError = result.errorMessage;
        return result;
    }

    // Rendering threads read the same document; keep them quiet until the worker is done
    RenderPauseGuard pause(renderer);

    QTemporaryDir tempDir;
    if (!tempDir.isValid()) {
        result.errorMessage = "Failed to create temporary directory";
        m_lastError = result.errorMessage;
        return result;
    }

    const QString requestPath = tempDir.filePath("request.json");
    QString error;
    if (!request.writeToFile(requestPath, &error)) {
        result.errorMessage = error;
        m_lastError = result.errorMessage;
        return result;
    }

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(m_executablePath, {destPath, requestPath, m_logPath});

    if (!process.waitForStarted(5000)) {
        result.errorMessage = QString("Failed to start %1: %2").arg(m_executablePath, process.errorString());
        m_lastError = result.errorMessage;
        qWarning() << "[Save]" << result.errorMessage;
        if (!AppLog::appendRecord(m_logPath, QString("Worker could not be launched while saving %1\n%2")
                                                 .arg(destPath, result.errorMessage))) {
            qWarning() << "[Save] Could not append to" << m_logPath;
        }
        return result;
    }

    if (!process.waitForFinished(m_timeoutMs)) {
        process.kill();
        process.waitForFinished(3000);
        result.errorMessage = QString("Annotator timed out after %1 s").arg(m_timeoutMs / 1000);
        m_lastError = result.errorMessage;
        qWarning() << "[Save]" << result.errorMessage;
        if (!AppLog::appendRecord(m_logPath, QString("Worker killed after timeout while saving %1").arg(destPath))) {
            qWarning() << "[Save] Could not append to" << m_logPath;
        }
        return result;
    }

    const QString output = QString::fromUtf8(process.readAll()).trimmed();
    result.exitCode = process.exitCode();

    if (process.exitStatus() == QProcess::CrashExit) {
        // A crashed worker never reaches its own log call
        result.errorMessage = QString("Annotator crashed while saving %1").arg(destPath);
        m_lastError = result.errorMessage;
        qWarning() << "[Save]" << result.errorMessage;
        const QString record = output.isEmpty() ? result.errorMessage
                                                : result.errorMessage + "\n" + output;
        if (!AppLog::appendRecord(m_logPath, record)) {
            qWarning() << "[Save] Could not append to" << m_logPath;
        }
        return result;
    }

    if (process.exitCode() != 0) {
        result.errorMessage = QString("Annotator failed with exit code %1").arg(process.exitCode());
        if (!output.isEmpty()) result.errorMessage += ": " + output;
        m_lastError = result.errorMessage;
        qWarning() << "[Save]" << result.errorMessage;
        return result;
    }

    qDebug() << "[Save] Annotated PDF written to" << destPath;
    result.success = true;
    return result;
}
