#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QVector>
#include <QImage>
#include "save/annotationsaver.h"

class MarkupCanvas;
class MarkupController;
class MarkupBinder;
class TakeoffLedger;
class TakeoffPanel;
class DocumentSession;
class ThumbnailRenderer;
class QLabel;
class QListWidget;
class QListWidgetItem;
class QTabWidget;
class QMenu;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    bool openDocument(const QString& filePath);

    MarkupCanvas* canvas() const { return m_canvas; }
    TakeoffLedger* ledger() const { return m_ledger; }

protected:
    void closeEvent(QCloseEvent *event) override;
    void dragEnterEvent(QDragEnterEvent *event) override;
    void dropEvent(QDropEvent *event) override;

private slots:
    void openDocumentDialog();
    void savePdf();
    void savePdfAs();
    void exportSpreadsheet();
    void openRecentFile();
    void updateRecentFilesMenu();

    void showPage(int page);
    void onDocumentLoaded(const QString& filePath, int pageCount);
    void onThumbnailReady(int generation, int page, const QImage& image);
    void onThumbnailClicked(QListWidgetItem* item);

    void startDrawForEntry(int entryId);
    void onShapeRejected(quint64 shapeId);
    void onActiveEntryChanged(int entryId);

    void updateSummary();
    void refreshCanvasShapes();
    void updateCoordinates(const QPointF& pos);
    void updateZoom(double zoom);

private:
    void setupMenus();
    void setupStatusBar();
    void setupPanels();
    bool savePdfTo(const QString& destPath);
    void populateThumbnailList(int pageCount);

    DocumentSession* m_session{nullptr};
    ThumbnailRenderer* m_thumbnails{nullptr};
    MarkupController* m_controller{nullptr};
    MarkupBinder* m_binder{nullptr};
    TakeoffLedger* m_ledger{nullptr};
    AnnotationSaver m_saver;

    MarkupCanvas* m_canvas{nullptr};
    QListWidget* m_thumbnailList{nullptr};
    QTabWidget* m_categoryTabs{nullptr};
    QVector<TakeoffPanel*> m_panels;

    QLabel* m_hoursLabel{nullptr};
    QLabel* m_devicesLabel{nullptr};
    QLabel* m_pointsLabel{nullptr};
    QLabel* m_wireLabel{nullptr};
    QLabel* m_coordLabel{nullptr};
    QLabel* m_zoomLabel{nullptr};
    QLabel* m_pageLabel{nullptr};
    QMenu* m_recentMenu{nullptr};
};

#endif // MAINWINDOW_H
