#include "document/documentsession.h"

#include <QFile>
#include <QFileInfo>
#include <QDebug>

#include <poppler-qt6.h>

DocumentSession::DocumentSession(QObject* parent)
    : QObject(parent)
{
}

DocumentSession::~DocumentSession() = default;

bool DocumentSession::load(const QString& filePath)
{
    m_lastError.clear();
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QString("Cannot open %1: %2").arg(filePath, file.errorString());
        qWarning() << "[Document]" << m_lastError;
        return false;
    }
    const QByteArray bytes = file.readAll();
    file.close();
    return loadFromData(bytes, QFileInfo(filePath).absoluteFilePath());
}

bool DocumentSession::loadFromData(const QByteArray& bytes, const QString& filePath)
{
    m_lastError.clear();
    if (bytes.isEmpty()) {
        m_lastError = "The file is empty";
        return false;
    }

    // Build everything locally; commit only once the document is usable
    std::unique_ptr<Poppler::Document> doc = Poppler::Document::loadFromData(bytes);
    if (!doc) {
        m_lastError = "Not a readable PDF document";
        qWarning() << "[Document] Load failed:" << filePath;
        return false;
    }
    if (doc->isLocked()) {
        m_lastError = "The document is password protected";
        qWarning() << "[Document] Locked document:" << filePath;
        return false;
    }

    const int pages = doc->numPages();
    if (pages <= 0) {
        m_lastError = "The document has no pages";
        return false;
    }

    QVector<QSizeF> sizes;
    sizes.reserve(pages);
    for (int i = 0; i < pages; ++i) {
        std::unique_ptr<Poppler::Page> page = doc->page(i);
        if (!page) {
            m_lastError = QString("Page %1 could not be read").arg(i + 1);
            return false;
        }
        sizes.append(page->pageSizeF());
    }

    doc->setRenderHint(Poppler::Document::Antialiasing, true);
    doc->setRenderHint(Poppler::Document::TextAntialiasing, true);

    m_document = std::move(doc);
    m_originalBytes = bytes;
    m_filePath = filePath;
    m_pageSizes = sizes;
    m_currentPage = 0;

    qDebug() << "[Document] Loaded" << filePath << "with" << pages << "pages";
    emit documentLoaded(m_filePath, pages);
    emit currentPageChanged(m_currentPage);
    return true;
}

QSizeF DocumentSession::pageSize(int page) const
{
    if (!isValidPage(page)) return QSizeF();
    return m_pageSizes[page];
}

bool DocumentSession::setCurrentPage(int page)
{
    if (!isValidPage(page)) return false;
    if (page == m_currentPage) return true;
    m_currentPage = page;
    emit currentPageChanged(m_currentPage);
    return true;
}

QImage DocumentSession::renderPage(int page, double scale) const
{
    if (!m_document || !isValidPage(page) || scale <= 0.0) return QImage();
    std::unique_ptr<Poppler::Page> p = m_document->page(page);
    if (!p) return QImage();
    const double dpi = 72.0 * scale;
    return p->renderToImage(dpi, dpi);
}
