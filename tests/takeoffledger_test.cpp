#include <gtest/gtest.h>

#include <QVector>
#include "takeoff/takeoffledger.h"
#include "qtprinters.h"

namespace {

MarkupShape committedRect(quint64 id, int page = 0)
{
    MarkupShape s = MarkupShape::makeRectangle(QPointF(0, 0), QPointF(10, 10), Qt::red);
    s.id = id;
    s.pageIndex = page;
    return s;
}

class TakeoffLedgerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ledger.setupDefaultCategories();
        QObject::connect(&ledger, &TakeoffLedger::shapeDeleted,
                         [this](quint64 id) { deleted.append(id); });
    }

    TakeoffLedger ledger;
    QVector<quint64> deleted;
};

} // namespace

TEST_F(TakeoffLedgerTest, DefaultCategoriesEndWithNonCountingDemo) {
    ASSERT_EQ(ledger.categoryCount(), 6);
    EXPECT_EQ(ledger.category(0)->name, "General");
    const int demo = ledger.categoryIndex("Demo");
    ASSERT_EQ(demo, 5);
    EXPECT_FALSE(ledger.category(demo)->countsTowardDevices);
    EXPECT_FALSE(ledger.category(demo)->wireEnabled);
    EXPECT_TRUE(ledger.category(0)->wireEnabled);
    EXPECT_EQ(ledger.category(6), nullptr);
}

TEST_F(TakeoffLedgerTest, CountFollowsAttachAndDetach) {
    const int id = ledger.addEntry(0);
    ASSERT_GT(id, 0);
    EXPECT_EQ(ledger.entryCount(id), 0);

    EXPECT_TRUE(ledger.attachShape(id, committedRect(1)));
    EXPECT_TRUE(ledger.attachShape(id, committedRect(2)));
    EXPECT_EQ(ledger.entryCount(id), 2);
    EXPECT_EQ(ledger.entryForShape(2), id);

    EXPECT_TRUE(ledger.detachShape(1));
    EXPECT_EQ(ledger.entryCount(id), 1);
    EXPECT_FALSE(ledger.detachShape(1));
    EXPECT_EQ(ledger.entryForShape(1), -1);
}

TEST_F(TakeoffLedgerTest, UncommittedShapesAreRejected) {
    const int id = ledger.addEntry(0);
    MarkupShape templ = committedRect(5);
    templ.pageIndex = -1;
    EXPECT_FALSE(ledger.attachShape(id, templ));
    EXPECT_FALSE(ledger.attachShape(id, committedRect(0)));
    EXPECT_FALSE(ledger.attachShape(999, committedRect(6)));
    EXPECT_EQ(ledger.shapeTotal(), 0);
}

TEST_F(TakeoffLedgerTest, ShapeBelongsToOneEntryAtATime) {
    const int a = ledger.addEntry(0);
    const int b = ledger.addEntry(1);
    ledger.attachShape(a, committedRect(1));
    ledger.attachShape(b, committedRect(1));
    EXPECT_EQ(ledger.entryCount(a), 0);
    EXPECT_EQ(ledger.entryCount(b), 1);
    EXPECT_EQ(ledger.shapeTotal(), 1);
}

TEST_F(TakeoffLedgerTest, RemovingEntryDeletesOnlyItsShapes) {
    const int a = ledger.addEntry(0);
    const int b = ledger.addEntry(0);
    ledger.attachShape(a, committedRect(1));
    ledger.attachShape(a, committedRect(2));
    ledger.attachShape(b, committedRect(3));
    ledger.setActiveEntry(a);

    int activeAfter = 0;
    QObject::connect(&ledger, &TakeoffLedger::activeEntryChanged, [&activeAfter](int id) { activeAfter = id; });

    EXPECT_TRUE(ledger.removeEntry(0, a));
    EXPECT_EQ(ledger.entry(a), nullptr);
    EXPECT_EQ(deleted, (QVector<quint64>{1, 2}));
    EXPECT_EQ(ledger.entryCount(b), 1);
    EXPECT_EQ(ledger.findShape(3)->id, 3u);
    EXPECT_EQ(ledger.activeEntry(), -1);
    EXPECT_EQ(activeAfter, -1);

    EXPECT_FALSE(ledger.removeEntry(0, a));
}

TEST_F(TakeoffLedgerTest, ShapesOnPageFiltersByPage) {
    const int a = ledger.addEntry(0);
    const int b = ledger.addEntry(2);
    ledger.attachShape(a, committedRect(1, 0));
    ledger.attachShape(a, committedRect(2, 1));
    ledger.attachShape(b, committedRect(3, 1));

    EXPECT_EQ(ledger.shapesOnPage(0).size(), 1);
    EXPECT_EQ(ledger.shapesOnPage(1).size(), 2);
    EXPECT_EQ(ledger.allShapes().size(), 3);
}

TEST_F(TakeoffLedgerTest, ClearShapesKeepsEntries) {
    const int a = ledger.addEntry(0);
    ledger.setEntryName(a, "Switch");
    ledger.attachShape(a, committedRect(1));
    ledger.clearShapes();
    EXPECT_EQ(deleted, (QVector<quint64>{1}));
    ASSERT_NE(ledger.entry(a), nullptr);
    EXPECT_EQ(ledger.entry(a)->name, "Switch");
    EXPECT_EQ(ledger.shapeTotal(), 0);
}

TEST_F(TakeoffLedgerTest, MultipliersParseLeniently) {
    const int a = ledger.addEntry(0);
    ledger.setEntryLabor(a, "1.5");
    EXPECT_DOUBLE_EQ(ledger.entry(a)->laborMultiplier(), 1.5);
    ledger.setEntryLabor(a, "abc");
    EXPECT_DOUBLE_EQ(ledger.entry(a)->laborMultiplier(), 0.0);
    ledger.setEntryLabor(a, "-2");
    EXPECT_DOUBLE_EQ(ledger.entry(a)->laborMultiplier(), 0.0);
    ledger.setEntryWire(a, "NMD", "12-2", WireMaterial::Aluminum, " 25 ");
    EXPECT_DOUBLE_EQ(ledger.entry(a)->unitLength(), 25.0);
}

TEST_F(TakeoffLedgerTest, WireSubtotalsMergeMatchingKeys) {
    const int a = ledger.addEntry(0);
    const int b = ledger.addEntry(0);
    ledger.setEntryWire(a, "NMD", "14-2", WireMaterial::Copper, "10");
    ledger.setEntryWire(b, "NMD", "14-2", WireMaterial::Copper, "5");
    ledger.attachShape(a, committedRect(1));
    ledger.attachShape(a, committedRect(2));
    ledger.attachShape(b, committedRect(3));

    const WireTotals totals = ledger.wireSubtotals(0);
    ASSERT_EQ(totals.size(), 1);
    EXPECT_DOUBLE_EQ(totals.value(WireKey{"NMD", "14-2", WireMaterial::Copper}), 25.0);

    ledger.setEntryWire(b, "NMD", "14-2", WireMaterial::Aluminum, "5");
    EXPECT_EQ(ledger.wireSubtotals(0).size(), 2);
}

TEST_F(TakeoffLedgerTest, CountsChangedFiresOnShapeMutation) {
    int changes = 0;
    QObject::connect(&ledger, &TakeoffLedger::countsChanged, [&changes]() { ++changes; });
    const int a = ledger.addEntry(0);
    ledger.attachShape(a, committedRect(1));
    ledger.detachShape(1);
    EXPECT_EQ(changes, 2);
}
