#ifndef DOCUMENTSESSION_H
#define DOCUMENTSESSION_H

#include <QObject>
#include <QByteArray>
#include <QImage>
#include <QSizeF>
#include <QString>
#include <QVector>
#include <memory>

namespace Poppler {
class Document;
}

/**
 * @brief DocumentSession - The drawing currently open for takeoff
 *
 * Holds the file bytes exactly as read at load time. Those bytes are what the
 * annotated save starts from; they are never modified. A failed load leaves
 * the previous document in place.
 */
class DocumentSession : public QObject
{
    Q_OBJECT

public:
    explicit DocumentSession(QObject* parent = nullptr);
    ~DocumentSession() override;

    bool load(const QString& filePath);
    bool loadFromData(const QByteArray& bytes, const QString& filePath = QString());

    bool isLoaded() const { return m_document != nullptr; }
    QString filePath() const { return m_filePath; }
    const QByteArray& originalBytes() const { return m_originalBytes; }

    int pageCount() const { return m_pageSizes.size(); }
    QSizeF pageSize(int page) const;        // PDF points
    bool isValidPage(int page) const { return page >= 0 && page < pageCount(); }

    int currentPage() const { return m_currentPage; }
    bool setCurrentPage(int page);

    // Rasterize at scale x 72 dpi; null image on failure
    QImage renderPage(int page, double scale) const;

    QString lastError() const { return m_lastError; }

signals:
    void documentLoaded(const QString& filePath, int pageCount);
    void currentPageChanged(int page);

private:
    std::unique_ptr<Poppler::Document> m_document;
    QByteArray m_originalBytes;
    QString m_filePath;
    QVector<QSizeF> m_pageSizes;
    int m_currentPage{0};
    QString m_lastError;
};

#endif // DOCUMENTSESSION_H
