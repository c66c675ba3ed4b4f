#ifndef THUMBNAILRENDERER_H
#define THUMBNAILRENDERER_H

#include <QObject>
#include <QByteArray>
#include <QFuture>
#include <QImage>
#include <QAtomicInt>
#include "document/renderpauseguard.h"

/**
 * @brief ThumbnailRenderer - Renders page thumbnails on the global thread pool
 *
 * The worker opens its own Poppler document from the session bytes and walks
 * the pages in order, checking the cancel flag between pages. thumbnailReady
 * is delivered queued to receivers on the UI thread, tagged with the
 * generation of the start() call that produced it.
 */
class ThumbnailRenderer : public QObject, public BackgroundRenderer
{
    Q_OBJECT

public:
    explicit ThumbnailRenderer(QObject* parent = nullptr);
    ~ThumbnailRenderer() override;

    // Replaces any running job and bumps the generation; rendering starts at page 0
    void start(const QByteArray& pdfBytes, int pageCount, double scale);

    void stop() override;
    void resume() override;

    bool isRunning() const;
    int renderedCount() const { return m_nextPage.loadAcquire(); }
    int pageCount() const { return m_pageCount; }
    int generation() const { return m_generation; }

signals:
    void thumbnailReady(int generation, int page, const QImage& image);
    void finished();

private:
    void launch();
    void renderFrom(int firstPage, int generation);

    QByteArray m_bytes;
    int m_pageCount{0};
    double m_scale{0.2};
    int m_generation{0};
    QFuture<void> m_future;
    QAtomicInt m_cancel{0};
    QAtomicInt m_nextPage{0};
};

#endif // THUMBNAILRENDERER_H
