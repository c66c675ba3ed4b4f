#include "takeoff/takeoffledger.h"
#include "takeoff/takeoffaggregator.h"

#include <QDebug>

namespace {

double parseNonNegative(const QString& text)
{
    bool ok = false;
    const double v = text.trimmed().toDouble(&ok);
    if (!ok || v < 0.0) return 0.0;
    return v;
}

} // namespace

bool WireKey::operator==(const WireKey& other) const
{
    return type == other.type && cable == other.cable && material == other.material;
}

bool WireKey::operator<(const WireKey& other) const
{
    if (type != other.type) return type < other.type;
    if (cable != other.cable) return cable < other.cable;
    return static_cast<int>(material) < static_cast<int>(other.material);
}

QString WireKey::materialCode(WireMaterial material)
{
    return material == WireMaterial::Aluminum ? QStringLiteral("AL") : QStringLiteral("CU");
}

WireMaterial WireKey::materialFromCode(const QString& code)
{
    return code.compare("AL", Qt::CaseInsensitive) == 0 ? WireMaterial::Aluminum : WireMaterial::Copper;
}

double TakeoffEntry::laborMultiplier() const
{
    return parseNonNegative(laborText);
}

double TakeoffEntry::unitLength() const
{
    return parseNonNegative(lengthText);
}

TakeoffLedger::TakeoffLedger(QObject* parent)
    : QObject(parent)
{
}

QStringList TakeoffLedger::defaultCategoryNames()
{
    return {"General", "Lighting", "Mechanical", "Fire Alarm", "Low Voltage", "Demo"};
}

void TakeoffLedger::setupDefaultCategories()
{
    m_categories.clear();
    for (const QString& name : defaultCategoryNames()) {
        const bool demo = (name == nonCountingCategoryName());
        addCategory(name, !demo, !demo);
    }
}

int TakeoffLedger::addCategory(const QString& name, bool wireEnabled, bool countsTowardDevices)
{
    TakeoffCategory cat;
    cat.name = name;
    cat.wireEnabled = wireEnabled;
    cat.countsTowardDevices = countsTowardDevices;
    m_categories.push_back(cat);
    return m_categories.size() - 1;
}

int TakeoffLedger::categoryIndex(const QString& name) const
{
    for (int i = 0; i < m_categories.size(); ++i) {
        if (m_categories[i].name.compare(name, Qt::CaseInsensitive) == 0) return i;
    }
    return -1;
}

const TakeoffCategory* TakeoffLedger::category(int index) const
{
    if (index < 0 || index >= m_categories.size()) return nullptr;
    return &m_categories[index];
}

int TakeoffLedger::addEntry(int categoryIndex)
{
    if (categoryIndex < 0 || categoryIndex >= m_categories.size()) return -1;
    TakeoffEntry entry;
    entry.id = m_nextEntryId++;
    m_categories[categoryIndex].entries.push_back(entry);
    emit entryAdded(categoryIndex, entry.id);
    return entry.id;
}

bool TakeoffLedger::removeEntry(int categoryIndex, int entryId)
{
    if (categoryIndex < 0 || categoryIndex >= m_categories.size()) return false;
    auto& entries = m_categories[categoryIndex].entries;
    for (int i = 0; i < entries.size(); ++i) {
        if (entries[i].id != entryId) continue;

        // Take the entry out first so listeners see a consistent ledger
        const TakeoffEntry removed = entries.takeAt(i);
        if (m_activeEntry == entryId) {
            m_activeEntry = -1;
            emit activeEntryChanged(m_activeEntry);
        }
        for (const MarkupShape& shape : removed.shapes) {
            emit shapeDeleted(shape.id);
        }
        emit entryRemoved(categoryIndex, entryId);
        emit countsChanged();
        return true;
    }
    return false;
}

TakeoffEntry* TakeoffLedger::findEntry(int entryId)
{
    for (auto& cat : m_categories) {
        for (auto& e : cat.entries) {
            if (e.id == entryId) return &e;
        }
    }
    return nullptr;
}

const TakeoffEntry* TakeoffLedger::entry(int entryId) const
{
    for (const auto& cat : m_categories) {
        for (const auto& e : cat.entries) {
            if (e.id == entryId) return &e;
        }
    }
    return nullptr;
}

int TakeoffLedger::categoryOfEntry(int entryId) const
{
    for (int c = 0; c < m_categories.size(); ++c) {
        for (const auto& e : m_categories[c].entries) {
            if (e.id == entryId) return c;
        }
    }
    return -1;
}

int TakeoffLedger::entryCount(int entryId) const
{
    const TakeoffEntry* e = entry(entryId);
    return e ? e->liveCount() : 0;
}

bool TakeoffLedger::setActiveEntry(int entryId)
{
    if (entryId != -1 && !entry(entryId)) return false;
    if (m_activeEntry == entryId) return true;
    m_activeEntry = entryId;
    emit activeEntryChanged(m_activeEntry);
    return true;
}

bool TakeoffLedger::setEntryName(int entryId, const QString& name)
{
    TakeoffEntry* e = findEntry(entryId);
    if (!e) return false;
    e->name = name;
    emit entryChanged(entryId);
    return true;
}

bool TakeoffLedger::setEntryLabor(int entryId, const QString& laborText)
{
    TakeoffEntry* e = findEntry(entryId);
    if (!e) return false;
    e->laborText = laborText;
    emit entryChanged(entryId);
    emit countsChanged();
    return true;
}

bool TakeoffLedger::setEntryNotes(int entryId, const QString& notes)
{
    TakeoffEntry* e = findEntry(entryId);
    if (!e) return false;
    e->notes = notes;
    emit entryChanged(entryId);
    return true;
}

bool TakeoffLedger::setEntryColor(int entryId, const QString& colorName, const QColor& color)
{
    TakeoffEntry* e = findEntry(entryId);
    if (!e) return false;
    e->colorName = colorName;
    e->color = color;
    emit entryChanged(entryId);
    return true;
}

bool TakeoffLedger::setEntryShapeKind(int entryId, MarkupShape::Kind kind)
{
    TakeoffEntry* e = findEntry(entryId);
    if (!e) return false;
    e->shapeKind = kind;
    emit entryChanged(entryId);
    return true;
}

bool TakeoffLedger::setEntryWire(int entryId, const QString& type, const QString& cable,
                                 WireMaterial material, const QString& lengthText)
{
    TakeoffEntry* e = findEntry(entryId);
    if (!e) return false;
    e->wireType = type;
    e->wireCable = cable;
    e->wireMaterial = material;
    e->lengthText = lengthText;
    emit entryChanged(entryId);
    emit countsChanged();
    return true;
}

bool TakeoffLedger::attachShape(int entryId, const MarkupShape& shape)
{
    if (!shape.isCommitted() || shape.id == 0) return false;
    TakeoffEntry* e = findEntry(entryId);
    if (!e) return false;
    // A shape belongs to exactly one entry
    if (entryForShape(shape.id) >= 0) {
        qWarning() << "[Ledger] Shape" << shape.id << "is already owned; re-homing";
        detachShape(shape.id);
        e = findEntry(entryId);
    }
    e->shapes.push_back(shape);
    emit countsChanged();
    return true;
}

bool TakeoffLedger::locateShape(quint64 shapeId, int* categoryIdx, int* entryIdx, int* shapeIdx) const
{
    for (int c = 0; c < m_categories.size(); ++c) {
        const auto& entries = m_categories[c].entries;
        for (int e = 0; e < entries.size(); ++e) {
            const auto& shapes = entries[e].shapes;
            for (int s = 0; s < shapes.size(); ++s) {
                if (shapes[s].id == shapeId) {
                    if (categoryIdx) *categoryIdx = c;
                    if (entryIdx) *entryIdx = e;
                    if (shapeIdx) *shapeIdx = s;
                    return true;
                }
            }
        }
    }
    return false;
}

bool TakeoffLedger::detachShape(quint64 shapeId)
{
    int c = -1, e = -1, s = -1;
    if (!locateShape(shapeId, &c, &e, &s)) return false;
    m_categories[c].entries[e].shapes.remove(s);
    emit countsChanged();
    return true;
}

int TakeoffLedger::entryForShape(quint64 shapeId) const
{
    int c = -1, e = -1;
    if (!locateShape(shapeId, &c, &e, nullptr)) return -1;
    return m_categories[c].entries[e].id;
}

const MarkupShape* TakeoffLedger::findShape(quint64 shapeId) const
{
    int c = -1, e = -1, s = -1;
    if (!locateShape(shapeId, &c, &e, &s)) return nullptr;
    return &m_categories[c].entries[e].shapes[s];
}

QVector<MarkupShape> TakeoffLedger::shapesOnPage(int pageIndex) const
{
    QVector<MarkupShape> out;
    for (const auto& cat : m_categories) {
        for (const auto& e : cat.entries) {
            for (const auto& s : e.shapes) {
                if (s.pageIndex == pageIndex) out.push_back(s);
            }
        }
    }
    return out;
}

QVector<MarkupShape> TakeoffLedger::allShapes() const
{
    QVector<MarkupShape> out;
    for (const auto& cat : m_categories) {
        for (const auto& e : cat.entries) {
            out += e.shapes;
        }
    }
    return out;
}

int TakeoffLedger::shapeTotal() const
{
    int total = 0;
    for (const auto& cat : m_categories) {
        for (const auto& e : cat.entries) total += e.liveCount();
    }
    return total;
}

void TakeoffLedger::clearShapes()
{
    bool any = false;
    for (auto& cat : m_categories) {
        for (auto& e : cat.entries) {
            const QVector<MarkupShape> shapes = e.shapes;
            e.shapes.clear();
            for (const MarkupShape& s : shapes) {
                any = true;
                emit shapeDeleted(s.id);
            }
        }
    }
    if (any) emit countsChanged();
}

WireTotals TakeoffLedger::wireSubtotals(int categoryIndex) const
{
    const TakeoffCategory* cat = category(categoryIndex);
    if (!cat) return WireTotals();
    return TakeoffAggregator::wireSubtotals(*cat);
}
