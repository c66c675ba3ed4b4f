#include "save/annotationwriter.h"

#include <QSaveFile>
#include <QDebug>

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

namespace {

// Owns the MuPDF objects of one request; dropped in reverse order
struct MuDocument {
    fz_context* ctx{nullptr};
    fz_buffer* input{nullptr};
    fz_stream* stream{nullptr};
    pdf_document* doc{nullptr};
    fz_buffer* output{nullptr};

    explicit MuDocument(fz_context* context) : ctx(context) {}
    ~MuDocument()
    {
        fz_drop_buffer(ctx, output);
        pdf_drop_document(ctx, doc);
        fz_drop_stream(ctx, stream);
        fz_drop_buffer(ctx, input);
    }
};

void fillRgb(const QColor& color, float rgb[3])
{
    rgb[0] = static_cast<float>(qBound(0.0, color.redF(), 1.0));
    rgb[1] = static_cast<float>(qBound(0.0, color.greenF(), 1.0));
    rgb[2] = static_cast<float>(qBound(0.0, color.blueF(), 1.0));
}

} // namespace

AnnotationWriter::AnnotationWriter()
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        m_lastError = "Failed to create MuPDF context";
        qWarning() << "[Annotator]" << m_lastError;
    }
}

AnnotationWriter::~AnnotationWriter()
{
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

bool AnnotationWriter::clipRectangle(const QRectF& rect, const QRectF& pageBounds, QRectF* clipped)
{
    const QRectF r = rect.normalized().intersected(pageBounds.normalized());
    if (r.isEmpty() || r.width() <= 0.0 || r.height() <= 0.0) return false;
    if (clipped) *clipped = r;
    return true;
}

bool AnnotationWriter::isDegenerateLine(const QLineF& line)
{
    return line.p1() == line.p2();
}

double AnnotationWriter::effectiveStrokeWidth(double width)
{
    return qMax(0.1, width);
}

AnnotationWriter::ShapeOutcome AnnotationWriter::addShape(pdf_document* doc, const MarkupShape& shape)
{
    pdf_page* page = nullptr;
    pdf_annot* annot = nullptr;
    ShapeOutcome outcome = ShapeOutcome::Skipped;
    fz_var(page);
    fz_var(annot);
    fz_var(outcome);

    float rgb[3];
    fillRgb(shape.color, rgb);

    fz_try(m_ctx) {
        page = pdf_load_page(m_ctx, doc, shape.pageIndex);
        const fz_rect b = fz_bound_page(m_ctx, &page->super);
        const QRectF pageRect(QPointF(b.x0, b.y0), QPointF(b.x1, b.y1));

        if (shape.kind == MarkupShape::Kind::Rectangle) {
            QRectF r;
            if (clipRectangle(shape.rect, pageRect, &r)) {
                annot = pdf_create_annot(m_ctx, page, PDF_ANNOT_SQUARE);
                pdf_set_annot_rect(m_ctx, annot, fz_make_rect(static_cast<float>(r.left()), static_cast<float>(r.top()),
                                                              static_cast<float>(r.right()), static_cast<float>(r.bottom())));
                pdf_set_annot_interior_color(m_ctx, annot, 3, rgb);
                pdf_set_annot_color(m_ctx, annot, 0, nullptr);
                pdf_update_annot(m_ctx, annot);
                outcome = ShapeOutcome::Added;
            }
        } else if (!isDegenerateLine(shape.line)) {
            annot = pdf_create_annot(m_ctx, page, PDF_ANNOT_LINE);
            pdf_set_annot_line(m_ctx, annot,
                               fz_make_point(static_cast<float>(shape.line.x1()), static_cast<float>(shape.line.y1())),
                               fz_make_point(static_cast<float>(shape.line.x2()), static_cast<float>(shape.line.y2())));
            pdf_set_annot_color(m_ctx, annot, 3, rgb);
            pdf_set_annot_border_width(m_ctx, annot, static_cast<float>(effectiveStrokeWidth(shape.strokeWidth)));
            pdf_update_annot(m_ctx, annot);
            outcome = ShapeOutcome::Added;
        }
    }
    fz_always(m_ctx) {
        pdf_drop_annot(m_ctx, annot);
        pdf_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        m_lastError = QString("Failed to annotate page %1: %2")
                          .arg(shape.pageIndex + 1)
                          .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        return ShapeOutcome::Failed;
    }
    return outcome;
}

bool AnnotationWriter::annotate(const AnnotationRequest& request, QByteArray* output)
{
    m_added = 0;
    m_skipped = 0;
    m_lastError.clear();

    if (!m_ctx) {
        m_lastError = "MuPDF context unavailable";
        return false;
    }
    if (!output) {
        m_lastError = "No output buffer";
        return false;
    }
    if (request.originalBytes.isEmpty()) {
        m_lastError = "Request carries no document";
        return false;
    }

    MuDocument mu(m_ctx);
    int pageCount = 0;
    fz_var(mu.input);
    fz_var(mu.stream);
    fz_var(mu.doc);
    fz_var(pageCount);

    fz_try(m_ctx) {
        mu.input = fz_new_buffer_from_copied_data(m_ctx,
                                                  reinterpret_cast<const unsigned char*>(request.originalBytes.constData()),
                                                  static_cast<size_t>(request.originalBytes.size()));
        mu.stream = fz_open_buffer(m_ctx, mu.input);
        mu.doc = pdf_open_document_with_stream(m_ctx, mu.stream);
        pageCount = pdf_count_pages(m_ctx, mu.doc);
    }
    fz_catch(m_ctx) {
        m_lastError = QString("Cannot open document: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        return false;
    }

    if (pageCount <= 0) {
        m_lastError = "The document has no pages";
        return false;
    }

    for (const MarkupShape& shape : request.shapes) {
        if (shape.pageIndex < 0 || shape.pageIndex >= pageCount) {
            m_lastError = QString("Shape targets page %1 but the document has %2 pages")
                              .arg(shape.pageIndex + 1)
                              .arg(pageCount);
            return false;
        }
        switch (addShape(mu.doc, shape)) {
            case ShapeOutcome::Added:   ++m_added; break;
            case ShapeOutcome::Skipped: ++m_skipped; break;
            case ShapeOutcome::Failed:  return false;
        }
    }

    fz_output* out = nullptr;
    fz_var(out);
    fz_var(mu.output);
    fz_try(m_ctx) {
        pdf_write_options opts = pdf_default_write_options;
        opts.do_garbage = 4;
        opts.do_compress = 1;
        mu.output = fz_new_buffer(m_ctx, 64 * 1024);
        out = fz_new_output_with_buffer(m_ctx, mu.output);
        pdf_write_document(m_ctx, mu.doc, out, &opts);
        fz_close_output(m_ctx, out);
    }
    fz_always(m_ctx) {
        fz_drop_output(m_ctx, out);
    }
    fz_catch(m_ctx) {
        m_lastError = QString("Cannot serialize document: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        return false;
    }

    unsigned char* data = nullptr;
    const size_t len = fz_buffer_storage(m_ctx, mu.output, &data);
    *output = QByteArray(reinterpret_cast<const char*>(data), static_cast<int>(len));
    return true;
}

bool AnnotationWriter::write(const AnnotationRequest& request, const QString& destPath)
{
    QByteArray pdf;
    if (!annotate(request, &pdf)) {
        qWarning() << "[Annotator]" << m_lastError;
        return false;
    }

    QSaveFile file(destPath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_lastError = QString("Cannot open %1 for writing: %2").arg(destPath, file.errorString());
        return false;
    }
    if (file.write(pdf) != pdf.size()) {
        file.cancelWriting();
        m_lastError = QString("Write to %1 failed: %2").arg(destPath, file.errorString());
        return false;
    }
    if (!file.commit()) {
        m_lastError = QString("Could not replace %1: %2").arg(destPath, file.errorString());
        return false;
    }

    qDebug() << "[Annotator] Wrote" << destPath << "annotations:" << m_added << "skipped:" << m_skipped;
    return true;
}
