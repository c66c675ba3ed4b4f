#include "markup/markupshape.h"

#include <QJsonArray>
#include <QtMath>

namespace {

QJsonArray pointPair(double a, double b)
{
    QJsonArray arr;
    arr.append(a);
    arr.append(b);
    return arr;
}

double clampUnit(double v)
{
    return qBound(0.0, v, 1.0);
}

QJsonArray colorToJson(const QColor& c)
{
    QJsonArray arr;
    arr.append(clampUnit(c.redF()));
    arr.append(clampUnit(c.greenF()));
    arr.append(clampUnit(c.blueF()));
    return arr;
}

QColor colorFromJson(const QJsonArray& arr)
{
    if (arr.size() < 3) return QColor(Qt::red);
    QColor c;
    c.setRgbF(clampUnit(arr.at(0).toDouble()),
              clampUnit(arr.at(1).toDouble()),
              clampUnit(arr.at(2).toDouble()));
    return c;
}

// Distance from p to segment ab
double segmentDistance(const QPointF& p, const QPointF& a, const QPointF& b)
{
    const QPointF ab = b - a;
    const double len2 = ab.x() * ab.x() + ab.y() * ab.y();
    if (len2 <= 0.0) return QLineF(p, a).length();
    double t = ((p.x() - a.x()) * ab.x() + (p.y() - a.y()) * ab.y()) / len2;
    t = qBound(0.0, t, 1.0);
    return QLineF(p, a + ab * t).length();
}

} // namespace

MarkupShape MarkupShape::makeRectangle(const QPointF& a, const QPointF& b, const QColor& color)
{
    MarkupShape s;
    s.kind = Kind::Rectangle;
    s.rect = QRectF(a, b).normalized();
    s.color = color;
    return s;
}

MarkupShape MarkupShape::makeLine(const QPointF& a, const QPointF& b, const QColor& color, double width)
{
    MarkupShape s;
    s.kind = Kind::Line;
    s.line = QLineF(a, b);
    s.color = color;
    s.strokeWidth = width;
    return s;
}

void MarkupShape::setDragGeometry(const QPointF& anchor, const QPointF& current)
{
    if (kind == Kind::Rectangle) {
        rect = QRectF(anchor, current).normalized();
    } else {
        line = QLineF(anchor, current);
    }
}

void MarkupShape::moveTo(const QPointF& pos)
{
    if (kind == Kind::Rectangle) {
        rect.moveTopLeft(pos);
    } else {
        const QPointF delta = line.p2() - line.p1();
        line = QLineF(pos, pos + delta);
    }
}

QRectF MarkupShape::bounds() const
{
    if (kind == Kind::Rectangle) return rect;
    const double half = strokeWidth / 2.0;
    return QRectF(line.p1(), line.p2()).normalized().adjusted(-half, -half, half, half);
}

bool MarkupShape::hitTest(const QPointF& pos, double tolerance) const
{
    if (kind == Kind::Rectangle) {
        return rect.adjusted(-tolerance, -tolerance, tolerance, tolerance).contains(pos);
    }
    return segmentDistance(pos, line.p1(), line.p2()) <= tolerance + strokeWidth / 2.0;
}

QString MarkupShape::kindName(Kind kind)
{
    return kind == Kind::Rectangle ? QStringLiteral("rect") : QStringLiteral("line");
}

QJsonObject MarkupShape::toDescriptor() const
{
    QJsonObject obj;
    obj["kind"] = kindName(kind);
    obj["page"] = pageIndex;
    obj["color"] = colorToJson(color);
    if (kind == Kind::Rectangle) {
        QJsonArray r;
        r.append(rect.left());
        r.append(rect.top());
        r.append(rect.right());
        r.append(rect.bottom());
        obj["rect"] = r;
    } else {
        obj["p1"] = pointPair(line.x1(), line.y1());
        obj["p2"] = pointPair(line.x2(), line.y2());
        obj["width"] = strokeWidth;
    }
    return obj;
}

bool MarkupShape::fromDescriptor(const QJsonObject& obj, MarkupShape* out)
{
    if (!out) return false;
    const QString kind = obj.value("kind").toString();
    if (!obj.contains("page")) return false;

    MarkupShape s;
    s.pageIndex = obj.value("page").toInt(-1);
    s.color = colorFromJson(obj.value("color").toArray());

    if (kind == "rect") {
        const QJsonArray r = obj.value("rect").toArray();
        if (r.size() != 4) return false;
        s.kind = Kind::Rectangle;
        s.rect = QRectF(QPointF(r.at(0).toDouble(), r.at(1).toDouble()),
                        QPointF(r.at(2).toDouble(), r.at(3).toDouble())).normalized();
    } else if (kind == "line") {
        const QJsonArray p1 = obj.value("p1").toArray();
        const QJsonArray p2 = obj.value("p2").toArray();
        if (p1.size() != 2 || p2.size() != 2) return false;
        s.kind = Kind::Line;
        s.line = QLineF(p1.at(0).toDouble(), p1.at(1).toDouble(),
                        p2.at(0).toDouble(), p2.at(1).toDouble());
        s.strokeWidth = obj.value("width").toDouble(0.0);
    } else {
        return false;
    }

    *out = s;
    return true;
}
