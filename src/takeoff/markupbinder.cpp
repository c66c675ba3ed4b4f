#include "takeoff/markupbinder.h"
#include "takeoff/takeoffledger.h"
#include "takeoff/coloroptions.h"
#include "markup/markupcontroller.h"

#include <QDebug>

MarkupBinder::MarkupBinder(MarkupController* controller, TakeoffLedger* ledger, QObject* parent)
    : QObject(parent)
    , m_controller(controller)
    , m_ledger(ledger)
{
    connect(m_controller, &MarkupController::shapeCreated, this, &MarkupBinder::onShapeCreated);
    connect(m_controller, &MarkupController::shapeDeleted, this, &MarkupBinder::onShapeDeleted);
    connect(m_controller, &MarkupController::shapeDetached, this, &MarkupBinder::onShapeDetached);
    connect(m_ledger, &TakeoffLedger::entryChanged, this, &MarkupBinder::onEntryChanged);
    connect(m_ledger, &TakeoffLedger::activeEntryChanged, this, &MarkupBinder::onActiveEntryChanged);
}

void MarkupBinder::applyEntryStyle(const TakeoffEntry& entry)
{
    QColor color = entry.color;
    color.setAlpha(ColorOptions::kMarkupAlpha);
    m_controller->setShapeKind(entry.shapeKind);
    m_controller->setActiveColor(color);
}

bool MarkupBinder::beginDrawing(int entryId, int page)
{
    if (entryId < 0 || !m_ledger->setActiveEntry(entryId)) return false;
    const TakeoffEntry* e = m_ledger->entry(entryId);
    if (!e) return false;

    applyEntryStyle(*e);
    m_controller->setStrokeWidth(2.0);
    m_controller->setCurrentPage(page);
    m_controller->setDrawingEnabled(true);
    return true;
}

void MarkupBinder::onShapeCreated(const MarkupShape& shape)
{
    const int entryId = m_ledger->activeEntry();
    if (entryId >= 0 && m_ledger->attachShape(entryId, shape)) return;

    // Nowhere to count it; stop drawing rather than leave an orphan
    qWarning() << "[Markup] No takeoff to receive shape" << shape.id;
    m_controller->setDrawingEnabled(false);
    emit shapeRejected(shape.id);
}

void MarkupBinder::onShapeDeleted(quint64 shapeId)
{
    m_ledger->detachShape(shapeId);
}

void MarkupBinder::onShapeDetached(quint64 shapeId)
{
    const int owner = m_ledger->entryForShape(shapeId);
    if (owner >= 0) {
        m_ledger->setActiveEntry(owner);
    }
    m_ledger->detachShape(shapeId);
}

void MarkupBinder::onEntryChanged(int entryId)
{
    if (entryId != m_ledger->activeEntry() || !m_controller->isDrawingEnabled()) return;
    if (m_controller->state() == MarkupState::Moving) return;
    const TakeoffEntry* e = m_ledger->entry(entryId);
    if (e) applyEntryStyle(*e);
}

void MarkupBinder::onActiveEntryChanged(int entryId)
{
    if (entryId < 0 && m_controller->isDrawingEnabled()) {
        m_controller->setDrawingEnabled(false);
    }
}
