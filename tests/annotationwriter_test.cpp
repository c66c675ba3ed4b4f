#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>
#include <QVector>

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include "save/annotationwriter.h"
#include "testpdf.h"
#include "qtprinters.h"

namespace {

struct AnnotInfo {
    int type{-1};
    int interiorComponents{0};
    float interior[4]{0, 0, 0, 0};
    fz_rect bounds{0, 0, 0, 0};      // page space, y down
    fz_point lineA{0, 0};
    fz_point lineB{0, 0};
};

// Annotations on one page of an in-memory PDF, read back through MuPDF
QVector<AnnotInfo> readAnnotations(const QByteArray& pdf, int pageIndex)
{
    QVector<AnnotInfo> out;
    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!ctx) return out;

    fz_buffer* buf = nullptr;
    fz_stream* stm = nullptr;
    pdf_document* doc = nullptr;
    pdf_page* page = nullptr;
    fz_var(buf);
    fz_var(stm);
    fz_var(doc);
    fz_var(page);

    fz_try(ctx) {
        buf = fz_new_buffer_from_copied_data(ctx, reinterpret_cast<const unsigned char*>(pdf.constData()),
                                             static_cast<size_t>(pdf.size()));
        stm = fz_open_buffer(ctx, buf);
        doc = pdf_open_document_with_stream(ctx, stm);
        page = pdf_load_page(ctx, doc, pageIndex);
        for (pdf_annot* a = pdf_first_annot(ctx, page); a; a = pdf_next_annot(ctx, a)) {
            AnnotInfo info;
            info.type = static_cast<int>(pdf_annot_type(ctx, a));
            info.bounds = pdf_bound_annot(ctx, a);
            if (info.type == PDF_ANNOT_SQUARE) {
                pdf_annot_interior_color(ctx, a, &info.interiorComponents, info.interior);
            } else if (info.type == PDF_ANNOT_LINE) {
                pdf_annot_line(ctx, a, &info.lineA, &info.lineB);
            }
            out.append(info);
        }
    }
    fz_always(ctx) {
        pdf_drop_page(ctx, page);
        pdf_drop_document(ctx, doc);
        fz_drop_stream(ctx, stm);
        fz_drop_buffer(ctx, buf);
    }
    fz_catch(ctx) {
        ADD_FAILURE() << "MuPDF could not read back the output: " << fz_caught_message(ctx);
    }
    fz_drop_context(ctx);
    return out;
}

MarkupShape rectOn(int page, const QRectF& r, const QColor& color = QColor(0, 0, 255, 80))
{
    MarkupShape s = MarkupShape::makeRectangle(r.topLeft(), r.bottomRight(), color);
    s.id = 1;
    s.pageIndex = page;
    return s;
}

MarkupShape lineOn(int page, const QPointF& a, const QPointF& b)
{
    MarkupShape s = MarkupShape::makeLine(a, b, Qt::red, 2.0);
    s.id = 2;
    s.pageIndex = page;
    return s;
}

// Stroke and appearance padding may widen the bounds slightly
constexpr float kBoundsTolerance = 1.5f;

void expectBoundsNear(const fz_rect& r, float x0, float y0, float x1, float y1)
{
    EXPECT_NEAR(r.x0, x0, kBoundsTolerance);
    EXPECT_NEAR(r.y0, y0, kBoundsTolerance);
    EXPECT_NEAR(r.x1, x1, kBoundsTolerance);
    EXPECT_NEAR(r.y1, y1, kBoundsTolerance);
}

} // namespace

TEST(AnnotationWriterTest, ClipRectangleRules) {
    const QRectF page(0, 0, 612, 792);
    QRectF clipped;
    EXPECT_TRUE(AnnotationWriter::clipRectangle(QRectF(10, 10, 40, 30), page, &clipped));
    EXPECT_EQ(clipped, QRectF(10, 10, 40, 30));
    EXPECT_TRUE(AnnotationWriter::clipRectangle(QRectF(600, 780, 100, 100), page, &clipped));
    EXPECT_EQ(clipped, QRectF(600, 780, 12, 12));
    EXPECT_FALSE(AnnotationWriter::clipRectangle(QRectF(700, 900, 10, 10), page, &clipped));
    EXPECT_FALSE(AnnotationWriter::clipRectangle(QRectF(10, 10, 0, 30), page, &clipped));
}

TEST(AnnotationWriterTest, LineRules) {
    EXPECT_TRUE(AnnotationWriter::isDegenerateLine(QLineF(5, 5, 5, 5)));
    EXPECT_FALSE(AnnotationWriter::isDegenerateLine(QLineF(5, 5, 6, 5)));
    EXPECT_DOUBLE_EQ(AnnotationWriter::effectiveStrokeWidth(0.0), 0.1);
    EXPECT_DOUBLE_EQ(AnnotationWriter::effectiveStrokeWidth(2.5), 2.5);
}

TEST(AnnotationWriterTest, RectangleBecomesFilledSquareAnnotation) {
    AnnotationRequest req;
    req.originalBytes = testpdf::makeBlankPdf(1);
    req.shapes << rectOn(0, QRectF(10, 10, 40, 30));

    AnnotationWriter writer;
    QByteArray out;
    ASSERT_TRUE(writer.annotate(req, &out)) << writer.lastError().toStdString();
    EXPECT_EQ(writer.annotationsAdded(), 1);
    EXPECT_EQ(writer.shapesSkipped(), 0);

    const QVector<AnnotInfo> annots = readAnnotations(out, 0);
    ASSERT_EQ(annots.size(), 1);
    EXPECT_EQ(annots[0].type, static_cast<int>(PDF_ANNOT_SQUARE));
    ASSERT_EQ(annots[0].interiorComponents, 3);
    EXPECT_NEAR(annots[0].interior[0], 0.0f, 1e-3f);
    EXPECT_NEAR(annots[0].interior[2], 1.0f, 1e-3f);
    expectBoundsNear(annots[0].bounds, 10, 10, 50, 40);
}

TEST(AnnotationWriterTest, ShapesOutsideThePageAreSkipped) {
    AnnotationRequest req;
    req.originalBytes = testpdf::makeBlankPdf(1);
    req.shapes << rectOn(0, QRectF(700, 900, 20, 20))
               << lineOn(0, QPointF(40, 40), QPointF(40, 40))
               << rectOn(0, QRectF(600, 780, 100, 100));

    AnnotationWriter writer;
    QByteArray out;
    ASSERT_TRUE(writer.annotate(req, &out)) << writer.lastError().toStdString();
    EXPECT_EQ(writer.annotationsAdded(), 1);
    EXPECT_EQ(writer.shapesSkipped(), 2);
    const QVector<AnnotInfo> annots = readAnnotations(out, 0);
    ASSERT_EQ(annots.size(), 1);
    expectBoundsNear(annots[0].bounds, 600, 780, 612, 792);
}

TEST(AnnotationWriterTest, LinesLandOnTheirOwnPage) {
    AnnotationRequest req;
    req.originalBytes = testpdf::makeBlankPdf(2);
    req.shapes << lineOn(1, QPointF(10, 10), QPointF(200, 300));

    AnnotationWriter writer;
    QByteArray out;
    ASSERT_TRUE(writer.annotate(req, &out)) << writer.lastError().toStdString();
    EXPECT_TRUE(readAnnotations(out, 0).isEmpty());
    const QVector<AnnotInfo> annots = readAnnotations(out, 1);
    ASSERT_EQ(annots.size(), 1);
    EXPECT_EQ(annots[0].type, static_cast<int>(PDF_ANNOT_LINE));
    EXPECT_NEAR(annots[0].lineA.x, 10.0f, 1e-2f);
    EXPECT_NEAR(annots[0].lineA.y, 10.0f, 1e-2f);
    EXPECT_NEAR(annots[0].lineB.x, 200.0f, 1e-2f);
    EXPECT_NEAR(annots[0].lineB.y, 300.0f, 1e-2f);
}

TEST(AnnotationWriterTest, NoShapesStillProducesAReadableCopy) {
    AnnotationRequest req;
    req.originalBytes = testpdf::makeBlankPdf(1);

    AnnotationWriter writer;
    QByteArray out;
    ASSERT_TRUE(writer.annotate(req, &out));
    EXPECT_TRUE(out.startsWith("%PDF"));
    EXPECT_TRUE(readAnnotations(out, 0).isEmpty());
}

TEST(AnnotationWriterTest, PageOutOfRangeFailsTheRequest) {
    AnnotationRequest req;
    req.originalBytes = testpdf::makeBlankPdf(1);
    req.shapes << rectOn(3, QRectF(10, 10, 40, 30));

    AnnotationWriter writer;
    QByteArray out;
    EXPECT_FALSE(writer.annotate(req, &out));
    EXPECT_TRUE(writer.lastError().contains("page 4"));
}

TEST(AnnotationWriterTest, UnreadableDocumentLeavesDestinationUntouched) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString dest = dir.filePath("plan.pdf");
    {
        QFile f(dest);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("original contents");
    }

    AnnotationRequest req;
    req.originalBytes = "this is not a pdf";
    req.shapes << rectOn(0, QRectF(10, 10, 40, 30));

    AnnotationWriter writer;
    EXPECT_FALSE(writer.write(req, dest));
    EXPECT_FALSE(writer.lastError().isEmpty());

    QFile f(dest);
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    EXPECT_EQ(f.readAll(), QByteArray("original contents"));
}

TEST(AnnotationWriterTest, WriteReplacesDestination) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString dest = dir.filePath("out.pdf");

    AnnotationRequest req;
    req.originalBytes = testpdf::makeBlankPdf(1);
    req.shapes << rectOn(0, QRectF(10, 10, 40, 30));

    AnnotationWriter writer;
    ASSERT_TRUE(writer.write(req, dest)) << writer.lastError().toStdString();
    QFile f(dest);
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    EXPECT_EQ(readAnnotations(f.readAll(), 0).size(), 1);
}
