#ifndef ANNOTATIONSAVER_H
#define ANNOTATIONSAVER_H

#include <QString>
#include "save/annotationrequest.h"

class BackgroundRenderer;

struct AnnotationSaveResult {
    bool success{false};
    QString errorMessage;
    QString logPath;        // where the worker records failures
    int exitCode{-1};
};

/**
 * @brief AnnotationSaver - Runs takeoff-annotator for one save
 *
 * The worker runs in its own process so a crash inside the PDF library cannot
 * take the session down. The call blocks until the worker exits or the
 * timeout kills it. Background rendering is paused for the duration.
 */
class AnnotationSaver
{
public:
    AnnotationSaver();
    ~AnnotationSaver() = default;

    void setExecutablePath(const QString& path);
    QString executablePath() const { return m_executablePath; }

    void setTimeoutMs(int ms) { m_timeoutMs = ms; }
    int timeoutMs() const { return m_timeoutMs; }

    void setLogPath(const QString& path) { m_logPath = path; }
    QString logPath() const { return m_logPath; }

    bool isAvailable() const;

    AnnotationSaveResult save(const AnnotationRequest& request, const QString& destPath,
                              BackgroundRenderer* renderer = nullptr);

    QString lastError() const { return m_lastError; }

private:
    QString m_executablePath{"takeoff-annotator"};
    QString m_logPath;
    int m_timeoutMs{120000};
    QString m_lastError;
};

#endif // ANNOTATIONSAVER_H
