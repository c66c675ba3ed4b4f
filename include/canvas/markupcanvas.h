#ifndef MARKUPCANVAS_H
#define MARKUPCANVAS_H

#include <QWidget>
#include <QPointF>
#include <QTransform>
#include <QVector>
#include <QImage>
#include <QSizeF>
#include "markup/markupshape.h"

class MarkupController;

/**
 * @brief MarkupCanvas - One PDF page with its markup, zoomable and pannable
 *
 * Screen events are mapped to page coordinates (points, y down) and handed to
 * the MarkupController. The canvas only draws; committed shapes come from the
 * ledger through setShapes().
 */
class MarkupCanvas : public QWidget {
    Q_OBJECT

public:
    explicit MarkupCanvas(MarkupController* controller, QWidget *parent = nullptr);
    ~MarkupCanvas() override = default;

    // Page image rendered at any scale; pageSize is the page in points
    void setPage(int pageIndex, const QImage& image, const QSizeF& pageSize);
    int pageIndex() const { return m_pageIndex; }
    bool hasPage() const { return !m_pageImage.isNull(); }

    void setShapes(const QVector<MarkupShape>& shapes);
    const QVector<MarkupShape>& shapes() const { return m_shapes; }

    // Topmost committed shape under a page position
    const MarkupShape* shapeAt(const QPointF& pagePos) const;

    double zoom() const { return m_zoom; }
    void fitToWindow();
    void zoomIn();
    void zoomOut();

    QPointF screenToPage(const QPointF& screen) const;
    QPointF pageToScreen(const QPointF& page) const;

signals:
    void mousePagePosition(const QPointF& pos);
    void zoomChanged(double zoom);
    void fileDropped(const QString& path);
    void statusMessage(const QString& message);

protected:
    void paintEvent(QPaintEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void dragEnterEvent(QDragEnterEvent *event) override;
    void dropEvent(QDropEvent *event) override;

private:
    void updateTransform();
    void updateCursor();
    void drawShape(QPainter& painter, const MarkupShape& shape, bool preview) const;
    void showShapeMenu(const MarkupShape& shape);

    MarkupController* m_controller{nullptr};

    int m_pageIndex{-1};
    QImage m_pageImage;
    QSizeF m_pageSize;
    QVector<MarkupShape> m_shapes;

    // View: screen = page * zoom + offset
    double m_zoom{1.0};
    QPointF m_offset;
    QTransform m_pageToScreen;
    QTransform m_screenToPage;
    bool m_followWindow{true};      // refit on resize until the user zooms or pans

    bool m_isPanning{false};
    QPoint m_lastMousePos;
    QPoint m_lastPressGlobal;

    static constexpr double kHitTolerancePx = 4.0;
};

#endif // MARKUPCANVAS_H
