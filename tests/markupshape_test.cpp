#include <gtest/gtest.h>

#include <QJsonArray>
#include "markup/markupshape.h"
#include "qtprinters.h"

TEST(MarkupShapeTest, RectangleIsNormalizedFromAnyDragDirection) {
    const MarkupShape s = MarkupShape::makeRectangle(QPointF(50, 40), QPointF(10, 10), Qt::red);
    EXPECT_EQ(s.rect, QRectF(10, 10, 40, 30));
    EXPECT_FALSE(s.isCommitted());
}

TEST(MarkupShapeTest, MoveToKeepsSizeAndLineDirection) {
    MarkupShape r = MarkupShape::makeRectangle(QPointF(10, 10), QPointF(50, 40), Qt::red);
    r.moveTo(QPointF(100, 100));
    EXPECT_EQ(r.rect, QRectF(100, 100, 40, 30));

    MarkupShape l = MarkupShape::makeLine(QPointF(0, 0), QPointF(30, 40), Qt::blue, 2.0);
    l.moveTo(QPointF(10, 10));
    EXPECT_EQ(l.line.p1(), QPointF(10, 10));
    EXPECT_EQ(l.line.p2(), QPointF(40, 50));
}

TEST(MarkupShapeTest, HitTestHonorsTolerance) {
    const MarkupShape r = MarkupShape::makeRectangle(QPointF(10, 10), QPointF(50, 40), Qt::red);
    EXPECT_TRUE(r.hitTest(QPointF(30, 20), 0.0));
    EXPECT_FALSE(r.hitTest(QPointF(53, 20), 2.0));
    EXPECT_TRUE(r.hitTest(QPointF(53, 20), 4.0));

    const MarkupShape l = MarkupShape::makeLine(QPointF(0, 0), QPointF(100, 0), Qt::red, 2.0);
    EXPECT_TRUE(l.hitTest(QPointF(50, 3), 2.0));
    EXPECT_FALSE(l.hitTest(QPointF(50, 10), 2.0));
    EXPECT_FALSE(l.hitTest(QPointF(110, 0), 2.0));
}

TEST(MarkupShapeTest, DescriptorCarriesPageColorAndGeometry) {
    MarkupShape s = MarkupShape::makeRectangle(QPointF(10, 10), QPointF(50, 40), QColor(255, 0, 0, 80));
    s.id = 7;
    s.pageIndex = 2;

    const QJsonObject obj = s.toDescriptor();
    EXPECT_EQ(obj.value("kind").toString(), "rect");
    EXPECT_EQ(obj.value("page").toInt(), 2);
    const QJsonArray color = obj.value("color").toArray();
    ASSERT_EQ(color.size(), 3);
    EXPECT_DOUBLE_EQ(color.at(0).toDouble(), 1.0);
    EXPECT_DOUBLE_EQ(color.at(1).toDouble(), 0.0);
    const QJsonArray rect = obj.value("rect").toArray();
    ASSERT_EQ(rect.size(), 4);
    EXPECT_DOUBLE_EQ(rect.at(2).toDouble(), 50.0);
    EXPECT_DOUBLE_EQ(rect.at(3).toDouble(), 40.0);

    MarkupShape back;
    ASSERT_TRUE(MarkupShape::fromDescriptor(obj, &back));
    EXPECT_EQ(back.rect, s.rect);
    EXPECT_EQ(back.pageIndex, 2);
}

TEST(MarkupShapeTest, MalformedDescriptorIsRejected) {
    MarkupShape out;
    QJsonObject noPage{{"kind", "rect"}, {"rect", QJsonArray{0, 0, 1, 1}}};
    EXPECT_FALSE(MarkupShape::fromDescriptor(noPage, &out));

    QJsonObject badKind{{"kind", "ellipse"}, {"page", 0}};
    EXPECT_FALSE(MarkupShape::fromDescriptor(badKind, &out));

    QJsonObject shortLine{{"kind", "line"}, {"page", 0}, {"p1", QJsonArray{0, 0}}};
    EXPECT_FALSE(MarkupShape::fromDescriptor(shortLine, &out));
}
