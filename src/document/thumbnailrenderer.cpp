#include "document/thumbnailrenderer.h"

#include <QtConcurrent/QtConcurrentRun>
#include <QDebug>

#include <poppler-qt6.h>
#include <memory>

ThumbnailRenderer::ThumbnailRenderer(QObject* parent)
    : QObject(parent)
{
}

ThumbnailRenderer::~ThumbnailRenderer()
{
    // Worker threads must not outlive the bytes they read
    stop();
}

void ThumbnailRenderer::start(const QByteArray& pdfBytes, int pageCount, double scale)
{
    stop();
    m_bytes = pdfBytes;
    m_pageCount = pageCount;
    m_scale = scale > 0.0 ? scale : 0.2;
    ++m_generation;
    m_nextPage.storeRelease(0);
    launch();
}

void ThumbnailRenderer::stop()
{
    m_cancel.storeRelease(1);
    if (m_future.isStarted()) {
        m_future.waitForFinished();
    }
}

void ThumbnailRenderer::resume()
{
    if (isRunning()) return;
    if (m_bytes.isEmpty() || m_nextPage.loadAcquire() >= m_pageCount) return;
    launch();
}

bool ThumbnailRenderer::isRunning() const
{
    return m_future.isStarted() && !m_future.isFinished();
}

void ThumbnailRenderer::launch()
{
    m_cancel.storeRelease(0);
    const int first = m_nextPage.loadAcquire();
    const int generation = m_generation;
    m_future = QtConcurrent::run([this, first, generation]() { renderFrom(first, generation); });
}

void ThumbnailRenderer::renderFrom(int firstPage, int generation)
{
    // Each run gets its own document; Poppler documents are not shared across threads
    std::unique_ptr<Poppler::Document> doc = Poppler::Document::loadFromData(m_bytes);
    if (!doc || doc->isLocked()) {
        qWarning() << "[Thumbnails] Could not open document for thumbnails";
        return;
    }
    doc->setRenderHint(Poppler::Document::Antialiasing, true);

    const double dpi = 72.0 * m_scale;
    for (int i = firstPage; i < m_pageCount; ++i) {
        if (m_cancel.loadAcquire()) return;
        std::unique_ptr<Poppler::Page> page = doc->page(i);
        QImage image;
        if (page) image = page->renderToImage(dpi, dpi);
        m_nextPage.storeRelease(i + 1);
        emit thumbnailReady(generation, i, image);
    }
    emit finished();
}
