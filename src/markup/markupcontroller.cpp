#include "markup/markupcontroller.h"

#include <QDebug>

MarkupController::MarkupController(QObject* parent)
    : QObject(parent)
{
}

void MarkupController::setState(MarkupState state)
{
    if (m_state == state) return;
    m_state = state;
    emit stateChanged(m_state);
}

void MarkupController::discardTemplate()
{
    const bool had = m_hasTemplate;
    m_hasTemplate = false;
    m_template = MarkupShape();
    if (had) emit previewChanged();
}

void MarkupController::setDrawingEnabled(bool enabled)
{
    if (enabled) {
        // Fresh gesture: any previous template belongs to another entry/color
        if (m_state == MarkupState::Moving) {
            emit shapeDeleted(m_template.id);
        }
        discardTemplate();
        setState(MarkupState::AwaitingTemplate);
        return;
    }

    if (m_state == MarkupState::Moving) {
        // The detached shape was never dropped
        emit shapeDeleted(m_template.id);
    }
    discardTemplate();
    setState(MarkupState::Idle);
}

void MarkupController::setShapeKind(MarkupShape::Kind kind)
{
    if (m_kind == kind) return;
    m_kind = kind;
    // A half-built template of the other kind is meaningless
    if (m_state == MarkupState::DefiningTemplate || m_state == MarkupState::TemplateReady) {
        discardTemplate();
        setState(MarkupState::AwaitingTemplate);
    }
}

void MarkupController::setActiveColor(const QColor& color)
{
    m_color = color;
    if (m_hasTemplate && m_state != MarkupState::Moving) {
        m_template.color = color;
        emit previewChanged();
    }
}

void MarkupController::setStrokeWidth(double width)
{
    m_strokeWidth = width;
}

void MarkupController::setCurrentPage(int page)
{
    m_currentPage = page;
}

MarkupShape MarkupController::commitTemplate(bool keepId)
{
    MarkupShape shape = m_template;
    if (!keepId || shape.id == 0) {
        shape.id = nextShapeId();
    }
    shape.pageIndex = m_currentPage;
    if (shape.kind == MarkupShape::Kind::Rectangle) {
        shape.rect = shape.rect.normalized();
    }
    return shape;
}

bool MarkupController::pointerPressed(const QPointF& pos, Qt::MouseButton button, const MarkupShape* hitShape)
{
    // Drop or discard a shape being moved
    if (m_state == MarkupState::Moving) {
        if (button == Qt::LeftButton) {
            m_template.moveTo(pos);
            const MarkupShape dropped = commitTemplate(true);
            // The dropped geometry stays as template for further stamping
            m_template = dropped;
            m_template.id = 0;
            m_template.pageIndex = -1;
            setState(MarkupState::TemplateReady);
            emit shapeCreated(dropped);
            emit previewChanged();
            return true;
        }
        if (button == Qt::RightButton) {
            const quint64 id = m_template.id;
            discardTemplate();
            setState(MarkupState::Idle);
            emit shapeDeleted(id);
            return true;
        }
        return false;
    }

    if (button == Qt::RightButton) {
        if (hitShape && hitShape->isCommitted()) {
            emit contextActionsRequested(*hitShape);
            return true;
        }
        if (isDrawingEnabled()) {
            setDrawingEnabled(false);
            return true;
        }
        return false;
    }

    if (button != Qt::LeftButton) return false;

    switch (m_state) {
        case MarkupState::AwaitingTemplate:
            m_anchor = pos;
            if (m_kind == MarkupShape::Kind::Rectangle) {
                m_template = MarkupShape::makeRectangle(pos, pos, m_color);
            } else {
                m_template = MarkupShape::makeLine(pos, pos, m_color, m_strokeWidth);
            }
            m_hasTemplate = true;
            setState(MarkupState::DefiningTemplate);
            emit previewChanged();
            return true;

        case MarkupState::TemplateReady: {
            m_template.moveTo(pos);
            const MarkupShape stamped = commitTemplate(false);
            emit previewChanged();
            emit shapeCreated(stamped);
            return true;
        }

        case MarkupState::DefiningTemplate:
            // Press while already dragging (second button chord); ignore
            return true;

        default:
            return false;
    }
}

bool MarkupController::pointerMoved(const QPointF& pos)
{
    switch (m_state) {
        case MarkupState::DefiningTemplate:
            m_template.setDragGeometry(m_anchor, pos);
            emit previewChanged();
            return true;
        case MarkupState::TemplateReady:
        case MarkupState::Moving:
            if (!m_hasTemplate) return false;
            m_template.moveTo(pos);
            emit previewChanged();
            return true;
        default:
            return false;
    }
}

bool MarkupController::pointerReleased(const QPointF& pos, Qt::MouseButton button)
{
    if (m_state != MarkupState::DefiningTemplate || button != Qt::LeftButton) return false;

    m_template.setDragGeometry(m_anchor, pos);
    const MarkupShape created = commitTemplate(false);
    setState(MarkupState::TemplateReady);
    emit previewChanged();
    emit shapeCreated(created);
    return true;
}

void MarkupController::deleteShape(const MarkupShape& shape)
{
    if (shape.id == 0) return;
    emit shapeDeleted(shape.id);
}

void MarkupController::moveShape(const MarkupShape& target)
{
    if (target.id == 0) return;
    // target may live in a list that the detach below rebuilds
    const MarkupShape shape = target;

    if (m_state == MarkupState::Moving && m_template.id != shape.id) {
        emit shapeDeleted(m_template.id);
    }

    emit shapeDetached(shape.id);

    m_kind = shape.kind;
    m_color = shape.color;
    if (shape.kind == MarkupShape::Kind::Line) {
        m_strokeWidth = shape.strokeWidth;
    }
    m_template = shape;
    m_hasTemplate = true;
    setState(MarkupState::Moving);
    emit previewChanged();
    qDebug() << "[Markup] Moving shape" << shape.id;
}
