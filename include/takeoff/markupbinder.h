#ifndef MARKUPBINDER_H
#define MARKUPBINDER_H

#include <QObject>
#include "markup/markupshape.h"

class MarkupController;
class TakeoffLedger;
struct TakeoffEntry;

/**
 * @brief MarkupBinder - Routes committed markup into the takeoff ledger
 *
 * New shapes go to the active entry. A shape picked up for a move leaves its
 * entry and that entry becomes active, so the drop returns it there.
 * Losing the active entry stops drawing.
 */
class MarkupBinder : public QObject
{
    Q_OBJECT

public:
    MarkupBinder(MarkupController* controller, TakeoffLedger* ledger, QObject* parent = nullptr);

    // Activates the entry and arms the controller with its color and shape
    bool beginDrawing(int entryId, int page);

signals:
    // A shape arrived while no entry could take it; drawing was stopped
    void shapeRejected(quint64 shapeId);

private slots:
    void onShapeCreated(const MarkupShape& shape);
    void onShapeDeleted(quint64 shapeId);
    void onShapeDetached(quint64 shapeId);
    void onEntryChanged(int entryId);
    void onActiveEntryChanged(int entryId);

private:
    void applyEntryStyle(const TakeoffEntry& entry);

    MarkupController* m_controller{nullptr};
    TakeoffLedger* m_ledger{nullptr};
};

#endif // MARKUPBINDER_H
