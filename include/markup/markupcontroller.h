#ifndef MARKUPCONTROLLER_H
#define MARKUPCONTROLLER_H

#include <QObject>
#include <QColor>
#include <QPointF>
#include "markup/markupshape.h"

// Markup interaction state machine
enum class MarkupState {
    Idle,               // Drawing disabled; canvas pans
    AwaitingTemplate,   // Drawing enabled, waiting for the first press
    DefiningTemplate,   // Dragging out the first shape
    TemplateReady,      // Template follows the pointer; each press stamps a copy
    Moving              // An existing shape follows the pointer until dropped
};

/**
 * @brief MarkupController - Turns pointer events into committed markup shapes
 *
 * The controller knows nothing about widgets or entries. Positions are
 * page-local. Committed shapes are announced through shapeCreated();
 * owners (the takeoff ledger) decide where they live.
 *
 * Moving reuses the stamping machinery: the moved shape becomes the template
 * and the next primary press drops it.
 */
class MarkupController : public QObject
{
    Q_OBJECT

public:
    explicit MarkupController(QObject* parent = nullptr);

    MarkupState state() const { return m_state; }
    bool isDrawingEnabled() const { return m_state != MarkupState::Idle; }
    bool isDragging() const { return m_state == MarkupState::DefiningTemplate; }

    void setDrawingEnabled(bool enabled);

    MarkupShape::Kind shapeKind() const { return m_kind; }
    void setShapeKind(MarkupShape::Kind kind);
    QColor activeColor() const { return m_color; }
    void setActiveColor(const QColor& color);
    double strokeWidth() const { return m_strokeWidth; }
    void setStrokeWidth(double width);

    int currentPage() const { return m_currentPage; }
    void setCurrentPage(int page);

    // Template / moving preview
    bool hasTemplate() const { return m_hasTemplate; }
    const MarkupShape& templateShape() const { return m_template; }

    // Pointer input. hitShape is the committed shape under the pointer, if any.
    // Returns true when the event was consumed by the state machine.
    bool pointerPressed(const QPointF& pos, Qt::MouseButton button, const MarkupShape* hitShape = nullptr);
    bool pointerMoved(const QPointF& pos);
    bool pointerReleased(const QPointF& pos, Qt::MouseButton button);

    // Context actions for a committed shape
    void deleteShape(const MarkupShape& shape);
    void moveShape(const MarkupShape& shape);

signals:
    void stateChanged(MarkupState state);
    void previewChanged();
    void shapeCreated(const MarkupShape& shape);
    void shapeDeleted(quint64 shapeId);
    void shapeDetached(quint64 shapeId);
    void contextActionsRequested(const MarkupShape& shape);

private:
    void setState(MarkupState state);
    void discardTemplate();
    MarkupShape commitTemplate(bool keepId);
    quint64 nextShapeId() { return m_nextId++; }

    MarkupState m_state{MarkupState::Idle};
    MarkupShape::Kind m_kind{MarkupShape::Kind::Rectangle};
    QColor m_color{255, 0, 0, 80};
    double m_strokeWidth{2.0};
    int m_currentPage{0};

    MarkupShape m_template;
    bool m_hasTemplate{false};
    QPointF m_anchor;
    quint64 m_nextId{1};
};

#endif // MARKUPCONTROLLER_H
