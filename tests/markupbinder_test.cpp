#include <gtest/gtest.h>

#include <QVector>

#include "takeoff/markupbinder.h"
#include "takeoff/takeoffledger.h"
#include "takeoff/coloroptions.h"
#include "markup/markupcontroller.h"
#include "qtprinters.h"

namespace {

class MarkupBinderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ledger.setupDefaultCategories();
        QObject::connect(&binder, &MarkupBinder::shapeRejected,
                         [this](quint64 id) { rejected.append(id); });
    }

    void drag(const QPointF& a, const QPointF& b)
    {
        controller.pointerPressed(a, Qt::LeftButton);
        controller.pointerMoved(b);
        controller.pointerReleased(b, Qt::LeftButton);
    }

    TakeoffLedger ledger;
    MarkupController controller;
    MarkupBinder binder{&controller, &ledger};
    QVector<quint64> rejected;
};

} // namespace

TEST_F(MarkupBinderTest, DraggedShapeCountsForActiveEntry) {
    const int outlets = ledger.addEntry(0);
    ASSERT_TRUE(ledger.setEntryColor(outlets, "Blue", ColorOptions::colorFor("Blue")));
    ASSERT_TRUE(binder.beginDrawing(outlets, 0));
    EXPECT_EQ(ledger.activeEntry(), outlets);
    EXPECT_EQ(controller.state(), MarkupState::AwaitingTemplate);
    EXPECT_EQ(controller.activeColor().alpha(), ColorOptions::kMarkupAlpha);
    EXPECT_EQ(controller.activeColor().blue(), ColorOptions::colorFor("Blue").blue());

    drag(QPointF(10, 10), QPointF(50, 40));
    ASSERT_EQ(ledger.entryCount(outlets), 1);
    EXPECT_EQ(ledger.entry(outlets)->shapes[0].rect, QRectF(10, 10, 40, 30));

    // Stamping adds to the same entry
    controller.pointerPressed(QPointF(100, 100), Qt::LeftButton);
    EXPECT_EQ(ledger.entryCount(outlets), 2);
    EXPECT_TRUE(rejected.isEmpty());
}

TEST_F(MarkupBinderTest, BeginDrawingRejectsUnknownEntry) {
    EXPECT_FALSE(binder.beginDrawing(42, 0));
    EXPECT_FALSE(binder.beginDrawing(-1, 0));
    EXPECT_EQ(controller.state(), MarkupState::Idle);
}

TEST_F(MarkupBinderTest, MovedShapeReturnsToOwnerWhileAnotherEntryIsActive) {
    const int switches = ledger.addEntry(0);
    const int lights = ledger.addEntry(1);
    ASSERT_TRUE(binder.beginDrawing(switches, 0));
    drag(QPointF(10, 10), QPointF(50, 40));
    ASSERT_EQ(ledger.entryCount(switches), 1);
    const quint64 id = ledger.entry(switches)->shapes[0].id;

    ASSERT_TRUE(binder.beginDrawing(lights, 0));
    EXPECT_EQ(ledger.activeEntry(), lights);

    // Passed straight from ledger storage, which the detach rebuilds
    controller.moveShape(*ledger.findShape(id));
    EXPECT_EQ(controller.state(), MarkupState::Moving);
    EXPECT_EQ(ledger.activeEntry(), switches);
    EXPECT_EQ(ledger.entryCount(switches), 0);

    controller.pointerPressed(QPointF(200, 200), Qt::LeftButton);
    ASSERT_EQ(ledger.entryCount(switches), 1);
    EXPECT_EQ(ledger.entryCount(lights), 0);
    const MarkupShape& dropped = ledger.entry(switches)->shapes[0];
    EXPECT_EQ(dropped.id, id);
    EXPECT_EQ(dropped.rect, QRectF(200, 200, 40, 30));
}

TEST_F(MarkupBinderTest, DisablingDrawingDuringMoveDiscardsShape) {
    const int entry = ledger.addEntry(0);
    ASSERT_TRUE(binder.beginDrawing(entry, 0));
    drag(QPointF(10, 10), QPointF(50, 40));
    const MarkupShape shape = ledger.entry(entry)->shapes[0];

    controller.moveShape(shape);
    ASSERT_EQ(controller.state(), MarkupState::Moving);

    controller.setDrawingEnabled(false);
    EXPECT_EQ(controller.state(), MarkupState::Idle);
    EXPECT_EQ(ledger.entryCount(entry), 0);
    EXPECT_EQ(ledger.findShape(shape.id), nullptr);
    EXPECT_EQ(ledger.shapeTotal(), 0);
}

TEST_F(MarkupBinderTest, RemovingEntryDuringMoveStopsDrawing) {
    const int doomed = ledger.addEntry(0);
    const int kept = ledger.addEntry(0);
    ASSERT_TRUE(binder.beginDrawing(kept, 0));
    drag(QPointF(0, 0), QPointF(20, 20));
    ASSERT_TRUE(binder.beginDrawing(doomed, 0));
    drag(QPointF(10, 10), QPointF(50, 40));
    const MarkupShape shape = ledger.entry(doomed)->shapes[0];

    controller.moveShape(shape);
    ASSERT_TRUE(ledger.removeEntry(0, doomed));

    EXPECT_EQ(ledger.activeEntry(), -1);
    EXPECT_EQ(controller.state(), MarkupState::Idle);
    EXPECT_FALSE(controller.hasTemplate());
    EXPECT_EQ(ledger.entryCount(kept), 1);
    EXPECT_EQ(ledger.shapeTotal(), 1);

    // A press after the removal creates nothing
    EXPECT_FALSE(controller.pointerPressed(QPointF(100, 100), Qt::LeftButton));
    EXPECT_EQ(ledger.shapeTotal(), 1);
}

TEST_F(MarkupBinderTest, ShapeWithoutActiveEntryIsRejected) {
    // Drawing armed directly, with no entry to receive the result
    controller.setDrawingEnabled(true);
    drag(QPointF(10, 10), QPointF(50, 40));

    ASSERT_EQ(rejected.size(), 1);
    EXPECT_EQ(controller.state(), MarkupState::Idle);
    EXPECT_EQ(ledger.shapeTotal(), 0);
}

TEST_F(MarkupBinderTest, EntryStyleChangeFollowsWhileDrawing) {
    const int entry = ledger.addEntry(0);
    ASSERT_TRUE(binder.beginDrawing(entry, 0));
    ASSERT_TRUE(ledger.setEntryShapeKind(entry, MarkupShape::Kind::Line));
    EXPECT_EQ(controller.shapeKind(), MarkupShape::Kind::Line);

    ASSERT_TRUE(ledger.setEntryColor(entry, "Green", ColorOptions::colorFor("Green")));
    EXPECT_EQ(controller.activeColor().green(), ColorOptions::colorFor("Green").green());
}
