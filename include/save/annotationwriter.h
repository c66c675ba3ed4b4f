#ifndef ANNOTATIONWRITER_H
#define ANNOTATIONWRITER_H

#include <QByteArray>
#include <QLineF>
#include <QRectF>
#include <QString>
#include "save/annotationrequest.h"

struct fz_context;
struct pdf_document;

/**
 * @brief AnnotationWriter - Burns markup shapes into a PDF as annotations (MuPDF)
 *
 * Rectangles become Square annotations filled with the shape color and no
 * border color; lines become Line annotations. Rectangles are clipped to the
 * page and skipped when nothing is left, as are zero-length lines. Any other
 * problem (unreadable document, page out of range) fails the whole request.
 */
class AnnotationWriter
{
public:
    AnnotationWriter();
    ~AnnotationWriter();

    AnnotationWriter(const AnnotationWriter&) = delete;
    AnnotationWriter& operator=(const AnnotationWriter&) = delete;

    // Produces the annotated document in memory
    bool annotate(const AnnotationRequest& request, QByteArray* output);

    // annotate() and replace destPath atomically; destPath is untouched on failure
    bool write(const AnnotationRequest& request, const QString& destPath);

    int annotationsAdded() const { return m_added; }
    int shapesSkipped() const { return m_skipped; }
    QString lastError() const { return m_lastError; }

    // Geometry rules, page coordinates in points
    static bool clipRectangle(const QRectF& rect, const QRectF& pageBounds, QRectF* clipped);
    static bool isDegenerateLine(const QLineF& line);
    static double effectiveStrokeWidth(double width);

private:
    enum class ShapeOutcome { Added, Skipped, Failed };
    ShapeOutcome addShape(pdf_document* doc, const MarkupShape& shape);

    fz_context* m_ctx{nullptr};
    int m_added{0};
    int m_skipped{0};
    QString m_lastError;
};

#endif // ANNOTATIONWRITER_H
