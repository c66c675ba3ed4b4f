#ifndef TAKEOFFLEDGER_H
#define TAKEOFFLEDGER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QColor>
#include <QVector>
#include <QMap>
#include "markup/markupshape.h"

enum class WireMaterial {
    Copper,
    Aluminum
};

struct WireKey {
    QString type;       // e.g. "NMD"
    QString cable;      // e.g. "14-2"
    WireMaterial material{WireMaterial::Copper};

    bool operator==(const WireKey& other) const;
    bool operator<(const WireKey& other) const;

    static QString materialCode(WireMaterial material);   // "CU" / "AL"
    static WireMaterial materialFromCode(const QString& code);
};

using WireTotals = QMap<WireKey, double>;

// One countable takeoff row
struct TakeoffEntry {
    int id{-1};
    QString name;
    QString laborText;          // user text; parsed on use
    QString notes;
    QString colorName{"Red"};
    QColor color{255, 0, 0};
    MarkupShape::Kind shapeKind{MarkupShape::Kind::Rectangle};

    // Wire attributes, used only by wire-enabled categories
    QString wireType{"NMD"};
    QString wireCable{"14-2"};
    WireMaterial wireMaterial{WireMaterial::Copper};
    QString lengthText;

    QVector<MarkupShape> shapes;

    int liveCount() const { return shapes.size(); }
    double laborMultiplier() const;     // unparsable or negative -> 0
    double unitLength() const;          // unparsable or negative -> 0
    WireKey wireKey() const { return WireKey{wireType, wireCable, wireMaterial}; }
};

struct TakeoffCategory {
    QString name;
    bool wireEnabled{false};
    bool countsTowardDevices{true};
    QVector<TakeoffEntry> entries;
};

/**
 * @brief TakeoffLedger - Categories, their entries and the shapes each entry owns
 *
 * A shape counts for an entry exactly while it is in that entry's list.
 * Pointers returned by entry()/findShape() are valid until the next mutation.
 */
class TakeoffLedger : public QObject
{
    Q_OBJECT

public:
    explicit TakeoffLedger(QObject* parent = nullptr);

    static QStringList defaultCategoryNames();
    static QString nonCountingCategoryName() { return QStringLiteral("Demo"); }
    void setupDefaultCategories();

    int addCategory(const QString& name, bool wireEnabled, bool countsTowardDevices = true);
    int categoryCount() const { return m_categories.size(); }
    int categoryIndex(const QString& name) const;
    const TakeoffCategory* category(int index) const;
    const QVector<TakeoffCategory>& categories() const { return m_categories; }

    // Entries
    int addEntry(int categoryIndex);
    bool removeEntry(int categoryIndex, int entryId);
    const TakeoffEntry* entry(int entryId) const;
    int categoryOfEntry(int entryId) const;
    int entryCount(int entryId) const;

    // Entry that receives newly drawn shapes; -1 when none
    int activeEntry() const { return m_activeEntry; }
    bool setActiveEntry(int entryId);

    bool setEntryName(int entryId, const QString& name);
    bool setEntryLabor(int entryId, const QString& laborText);
    bool setEntryNotes(int entryId, const QString& notes);
    bool setEntryColor(int entryId, const QString& colorName, const QColor& color);
    bool setEntryShapeKind(int entryId, MarkupShape::Kind kind);
    bool setEntryWire(int entryId, const QString& type, const QString& cable,
                      WireMaterial material, const QString& lengthText);

    // Shapes
    bool attachShape(int entryId, const MarkupShape& shape);
    bool detachShape(quint64 shapeId);
    int entryForShape(quint64 shapeId) const;
    const MarkupShape* findShape(quint64 shapeId) const;
    QVector<MarkupShape> shapesOnPage(int pageIndex) const;
    QVector<MarkupShape> allShapes() const;
    int shapeTotal() const;
    void clearShapes();

    WireTotals wireSubtotals(int categoryIndex) const;

signals:
    void entryAdded(int categoryIndex, int entryId);
    void entryRemoved(int categoryIndex, int entryId);
    void entryChanged(int entryId);
    void shapeDeleted(quint64 shapeId);
    void countsChanged();
    void activeEntryChanged(int entryId);

private:
    TakeoffEntry* findEntry(int entryId);
    bool locateShape(quint64 shapeId, int* categoryIdx, int* entryIdx, int* shapeIdx) const;

    QVector<TakeoffCategory> m_categories;
    int m_nextEntryId{1};
    int m_activeEntry{-1};
};

#endif // TAKEOFFLEDGER_H
