#include "canvas/markupcanvas.h"
#include "markup/markupcontroller.h"

#include <QPainter>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QKeyEvent>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QMimeData>
#include <QMenu>
#include <QFileInfo>
#include <QCursor>
#include <QDebug>

MarkupCanvas::MarkupCanvas(MarkupController* controller, QWidget *parent)
    : QWidget(parent)
    , m_controller(controller)
{
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setAcceptDrops(true);
    setMinimumSize(400, 300);
    updateTransform();

    if (m_controller) {
        connect(m_controller, &MarkupController::previewChanged, this, QOverload<>::of(&QWidget::update));
        connect(m_controller, &MarkupController::stateChanged, this, [this](MarkupState) {
            updateCursor();
            update();
        });
        connect(m_controller, &MarkupController::contextActionsRequested, this, &MarkupCanvas::showShapeMenu);
    }
}

void MarkupCanvas::setPage(int pageIndex, const QImage& image, const QSizeF& pageSize)
{
    const bool newPage = (pageIndex != m_pageIndex) || (pageSize != m_pageSize);
    m_pageIndex = pageIndex;
    m_pageImage = image;
    m_pageSize = pageSize;
    if (newPage) fitToWindow();
    update();
}

void MarkupCanvas::setShapes(const QVector<MarkupShape>& shapes)
{
    m_shapes = shapes;
    update();
}

const MarkupShape* MarkupCanvas::shapeAt(const QPointF& pagePos) const
{
    const double tolerance = kHitTolerancePx / m_zoom;
    // Last drawn is on top
    for (int i = m_shapes.size() - 1; i >= 0; --i) {
        if (m_shapes[i].hitTest(pagePos, tolerance)) return &m_shapes[i];
    }
    return nullptr;
}

void MarkupCanvas::updateTransform()
{
    m_pageToScreen = QTransform();
    m_pageToScreen.translate(m_offset.x(), m_offset.y());
    m_pageToScreen.scale(m_zoom, m_zoom);
    m_screenToPage = m_pageToScreen.inverted();
}

QPointF MarkupCanvas::screenToPage(const QPointF& screen) const
{
    return m_screenToPage.map(screen);
}

QPointF MarkupCanvas::pageToScreen(const QPointF& page) const
{
    return m_pageToScreen.map(page);
}

void MarkupCanvas::updateCursor()
{
    if (m_isPanning) {
        setCursor(Qt::ClosedHandCursor);
    } else if (m_controller && m_controller->isDrawingEnabled()) {
        setCursor(Qt::CrossCursor);
    } else {
        setCursor(Qt::ArrowCursor);
    }
}

void MarkupCanvas::fitToWindow()
{
    if (m_pageSize.isEmpty()) {
        m_zoom = 1.0;
        m_offset = QPointF();
    } else {
        const double margin = 20.0;
        const double scaleX = (width() - 2 * margin) / m_pageSize.width();
        const double scaleY = (height() - 2 * margin) / m_pageSize.height();
        m_zoom = qBound(0.05, qMin(scaleX, scaleY), 40.0);
        m_offset = QPointF((width() - m_pageSize.width() * m_zoom) / 2.0,
                           (height() - m_pageSize.height() * m_zoom) / 2.0);
    }
    m_followWindow = true;
    updateTransform();
    update();
    emit zoomChanged(m_zoom);
}

void MarkupCanvas::zoomIn()
{
    const QPointF center(width() / 2.0, height() / 2.0);
    const QPointF before = screenToPage(center);
    m_zoom = qBound(0.05, m_zoom * 1.2, 40.0);
    updateTransform();
    m_offset += center - pageToScreen(before);
    m_followWindow = false;
    updateTransform();
    update();
    emit zoomChanged(m_zoom);
}

void MarkupCanvas::zoomOut()
{
    const QPointF center(width() / 2.0, height() / 2.0);
    const QPointF before = screenToPage(center);
    m_zoom = qBound(0.05, m_zoom / 1.2, 40.0);
    updateTransform();
    m_offset += center - pageToScreen(before);
    m_followWindow = false;
    updateTransform();
    update();
    emit zoomChanged(m_zoom);
}

void MarkupCanvas::drawShape(QPainter& painter, const MarkupShape& shape, bool preview) const
{
    if (shape.kind == MarkupShape::Kind::Rectangle) {
        QColor fill = shape.color;
        if (fill.alpha() == 255) fill.setAlpha(80);
        painter.setBrush(fill);
        painter.setPen(preview ? QPen(shape.color.darker(), 0, Qt::DashLine) : Qt::NoPen);
        painter.drawRect(m_pageToScreen.mapRect(shape.rect));
    } else {
        QColor stroke = shape.color;
        stroke.setAlpha(preview ? 160 : 220);
        QPen pen(stroke, qMax(1.0, shape.strokeWidth * m_zoom));
        pen.setCapStyle(Qt::RoundCap);
        painter.setPen(pen);
        painter.setBrush(Qt::NoBrush);
        painter.drawLine(m_pageToScreen.map(shape.line));
    }
}

void MarkupCanvas::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);

    painter.fillRect(rect(), QColor(96, 96, 96));

    if (m_pageImage.isNull()) {
        painter.setPen(QColor(220, 220, 220));
        painter.drawText(rect(), Qt::AlignCenter, tr("Open or drop a PDF drawing"));
        return;
    }

    // Page
    const QRectF pageRect = m_pageToScreen.mapRect(QRectF(QPointF(0, 0), m_pageSize));
    painter.drawImage(pageRect, m_pageImage);

    // Committed markup
    for (const MarkupShape& shape : m_shapes) {
        drawShape(painter, shape, false);
    }

    // Template or moving shape
    if (m_controller && m_controller->hasTemplate()) {
        drawShape(painter, m_controller->templateShape(), true);
    }
}

void MarkupCanvas::wheelEvent(QWheelEvent *event)
{
    const double zoomFactor = 1.15;

    // Keep the page point under the cursor fixed
    const QPointF cursor = event->position();
    const QPointF pageBefore = screenToPage(cursor);

    double targetZoom = m_zoom;
    if (event->angleDelta().y() > 0) {
        targetZoom *= zoomFactor;
    } else if (event->angleDelta().y() < 0) {
        targetZoom /= zoomFactor;
    }
    m_zoom = qBound(0.05, targetZoom, 40.0);
    updateTransform();

    m_offset += cursor - pageToScreen(pageBefore);
    m_followWindow = false;
    updateTransform();
    update();
    emit zoomChanged(m_zoom);
    event->accept();
}

void MarkupCanvas::mousePressEvent(QMouseEvent *event)
{
    setFocus();
    m_lastPressGlobal = event->globalPosition().toPoint();
    const QPointF pagePos = screenToPage(event->position());

    if (m_controller && hasPage() && event->button() != Qt::MiddleButton) {
        m_controller->setCurrentPage(m_pageIndex);
        const MarkupShape* hit = (event->button() == Qt::RightButton) ? shapeAt(pagePos) : nullptr;
        // Copy: the menu may rebuild m_shapes while it is open
        const MarkupShape hitCopy = hit ? *hit : MarkupShape();
        if (m_controller->pointerPressed(pagePos, event->button(), hit ? &hitCopy : nullptr)) {
            event->accept();
            return;
        }
    }

    // Middle button always pans; left button pans while not drawing
    if (event->button() == Qt::MiddleButton ||
        (event->button() == Qt::LeftButton && !(m_controller && m_controller->isDrawingEnabled()))) {
        m_isPanning = true;
        m_lastMousePos = event->pos();
        updateCursor();
        event->accept();
        return;
    }

    QWidget::mousePressEvent(event);
}

void MarkupCanvas::mouseMoveEvent(QMouseEvent *event)
{
    const QPointF pagePos = screenToPage(event->position());
    emit mousePagePosition(pagePos);

    if (m_isPanning) {
        const QPoint delta = event->pos() - m_lastMousePos;
        m_offset += QPointF(delta);
        m_followWindow = false;
        m_lastMousePos = event->pos();
        updateTransform();
        update();
        return;
    }

    if (m_controller && hasPage()) {
        m_controller->pointerMoved(pagePos);
    }
}

void MarkupCanvas::mouseReleaseEvent(QMouseEvent *event)
{
    if (m_isPanning && (event->button() == Qt::MiddleButton || event->button() == Qt::LeftButton)) {
        m_isPanning = false;
        updateCursor();
        return;
    }

    if (m_controller && hasPage()) {
        m_controller->pointerReleased(screenToPage(event->position()), event->button());
    }
}

void MarkupCanvas::resizeEvent(QResizeEvent *event)
{
    Q_UNUSED(event);
    // Keep a zoom or pan the user chose; only a fitted view tracks the size
    if (m_followWindow) fitToWindow();
}

void MarkupCanvas::keyPressEvent(QKeyEvent *event)
{
    if (event->key() == Qt::Key_Escape) {
        if (m_controller && m_controller->isDrawingEnabled()) {
            m_controller->setDrawingEnabled(false);
            emit statusMessage(tr("Drawing cancelled"));
        }
        return;
    }
    if (event->key() == Qt::Key_Plus || event->key() == Qt::Key_Equal) {
        zoomIn();
        return;
    }
    if (event->key() == Qt::Key_Minus) {
        zoomOut();
        return;
    }
    QWidget::keyPressEvent(event);
}

void MarkupCanvas::showShapeMenu(const MarkupShape& hit)
{
    if (!m_controller) return;
    // hit points into m_shapes, which changes as soon as the ledger does
    const MarkupShape shape = hit;

    QMenu menu(this);
    QAction* moveAction = menu.addAction(tr("Move"));
    QAction* deleteAction = menu.addAction(tr("Delete"));
    QAction* chosen = menu.exec(m_lastPressGlobal.isNull() ? QCursor::pos() : m_lastPressGlobal);

    if (chosen == moveAction) {
        m_controller->moveShape(shape);
        emit statusMessage(tr("Click to place the shape, right-click to discard it"));
    } else if (chosen == deleteAction) {
        m_controller->deleteShape(shape);
    }
}

void MarkupCanvas::dragEnterEvent(QDragEnterEvent *event)
{
    if (!event->mimeData()->hasUrls()) return;
    for (const QUrl& url : event->mimeData()->urls()) {
        if (url.isLocalFile() && QFileInfo(url.toLocalFile()).suffix().compare("pdf", Qt::CaseInsensitive) == 0) {
            event->acceptProposedAction();
            return;
        }
    }
}

void MarkupCanvas::dropEvent(QDropEvent *event)
{
    for (const QUrl& url : event->mimeData()->urls()) {
        const QString path = url.toLocalFile();
        if (QFileInfo(path).suffix().compare("pdf", Qt::CaseInsensitive) == 0) {
            event->acceptProposedAction();
            emit fileDropped(path);
            return;
        }
    }
}
