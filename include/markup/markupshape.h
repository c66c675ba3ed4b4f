#ifndef MARKUPSHAPE_H
#define MARKUPSHAPE_H

#include <QColor>
#include <QJsonObject>
#include <QLineF>
#include <QPointF>
#include <QRectF>
#include <QtGlobal>

/**
 * @brief MarkupShape - A takeoff mark (filled box or line) on one page
 *
 * Geometry is in page-local coordinates: PDF points, origin at the top-left
 * corner of the page, y pointing down. Rectangles are kept normalized.
 */
struct MarkupShape {
    enum class Kind {
        Rectangle,
        Line
    };

    quint64 id{0};              // 0 = never committed
    Kind kind{Kind::Rectangle};
    int pageIndex{-1};          // -1 = template, not on any page yet
    QRectF rect;                // Rectangle geometry
    QLineF line;                // Line geometry
    QColor color{255, 0, 0, 80};
    double strokeWidth{2.0};    // Line only

    bool isCommitted() const { return pageIndex >= 0; }

    static MarkupShape makeRectangle(const QPointF& a, const QPointF& b, const QColor& color);
    static MarkupShape makeLine(const QPointF& a, const QPointF& b, const QColor& color, double width);

    // Drag geometry from anchor to the current pointer position
    void setDragGeometry(const QPointF& anchor, const QPointF& current);
    // Keep size/shape, move the reference point (top-left or first endpoint)
    void moveTo(const QPointF& pos);

    QRectF bounds() const;
    bool hitTest(const QPointF& pos, double tolerance) const;

    // Flat descriptor sent to the annotation worker
    QJsonObject toDescriptor() const;
    static bool fromDescriptor(const QJsonObject& obj, MarkupShape* out);

    static QString kindName(Kind kind);
};

#endif // MARKUPSHAPE_H
