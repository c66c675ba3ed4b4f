#include "app/mainwindow.h"
#include "appsettings.h"
#include "applog.h"
#include "canvas/markupcanvas.h"
#include "markup/markupcontroller.h"
#include "takeoff/markupbinder.h"
#include "takeoff/takeoffledger.h"
#include "takeoff/takeoffpanel.h"
#include "takeoff/takeoffaggregator.h"
#include "document/documentsession.h"
#include "document/thumbnailrenderer.h"
#include "export/estimateexporter.h"

#include <QApplication>
#include <QSplitter>
#include <QListWidget>
#include <QTabWidget>
#include <QLabel>
#include <QFrame>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QMenuBar>
#include <QMenu>
#include <QAction>
#include <QStatusBar>
#include <QFileDialog>
#include <QFileInfo>
#include <QFile>
#include <QMessageBox>
#include <QCloseEvent>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QMimeData>
#include <QPixmap>
#include <QIcon>
#include <QDebug>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    setWindowTitle("PlanTakeoff");
    resize(1200, 800);
    setAcceptDrops(true);

    m_session = new DocumentSession(this);
    m_thumbnails = new ThumbnailRenderer(this);
    m_controller = new MarkupController(this);
    m_ledger = new TakeoffLedger(this);
    m_ledger->setupDefaultCategories();
    m_binder = new MarkupBinder(m_controller, m_ledger, this);

    // Thumbnails | page | takeoffs
    auto* splitter = new QSplitter(Qt::Horizontal, this);
    setCentralWidget(splitter);

    m_thumbnailList = new QListWidget(splitter);
    m_thumbnailList->setViewMode(QListView::IconMode);
    m_thumbnailList->setIconSize(QSize(200, 200));
    m_thumbnailList->setResizeMode(QListView::Adjust);
    m_thumbnailList->setMovement(QListView::Static);
    m_thumbnailList->setSpacing(5);
    splitter->addWidget(m_thumbnailList);

    m_canvas = new MarkupCanvas(m_controller, splitter);
    splitter->addWidget(m_canvas);

    auto* right = new QWidget(splitter);
    auto* rightLayout = new QVBoxLayout(right);
    rightLayout->setContentsMargins(2, 2, 2, 2);
    rightLayout->setSpacing(4);

    auto* summary = new QFrame(right);
    auto* summaryLayout = new QVBoxLayout(summary);
    auto* countsRow = new QHBoxLayout();
    m_hoursLabel = new QLabel("Total Hours: 0.00", summary);
    m_devicesLabel = new QLabel("Total Devices: 0", summary);
    m_pointsLabel = new QLabel("Total Points: 0", summary);
    countsRow->addWidget(m_hoursLabel);
    countsRow->addWidget(m_devicesLabel);
    countsRow->addWidget(m_pointsLabel);
    summaryLayout->addLayout(countsRow);
    m_wireLabel = new QLabel("Wire Totals: -", summary);
    m_wireLabel->setWordWrap(true);
    summaryLayout->addWidget(m_wireLabel);
    rightLayout->addWidget(summary);

    m_categoryTabs = new QTabWidget(right);
    rightLayout->addWidget(m_categoryTabs, 1);
    splitter->addWidget(right);

    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 7);
    splitter->setStretchFactor(2, 2);
    splitter->setSizes({120, 900, 360});

    setupPanels();
    setupMenus();
    setupStatusBar();

    m_saver.setLogPath(AppLog::annotatorLogPath());

    // Document
    connect(m_session, &DocumentSession::documentLoaded, this, &MainWindow::onDocumentLoaded);
    connect(m_session, &DocumentSession::currentPageChanged, this, &MainWindow::showPage);
    connect(m_thumbnails, &ThumbnailRenderer::thumbnailReady, this, &MainWindow::onThumbnailReady);
    connect(m_thumbnailList, &QListWidget::itemClicked, this, &MainWindow::onThumbnailClicked);

    // Markup <-> ledger is handled by the binder; views follow the ledger
    connect(m_binder, &MarkupBinder::shapeRejected, this, &MainWindow::onShapeRejected);
    connect(m_ledger, &TakeoffLedger::countsChanged, this, &MainWindow::updateSummary);
    connect(m_ledger, &TakeoffLedger::countsChanged, this, &MainWindow::refreshCanvasShapes);
    connect(m_ledger, &TakeoffLedger::activeEntryChanged, this, &MainWindow::onActiveEntryChanged);

    // Canvas
    connect(m_canvas, &MarkupCanvas::mousePagePosition, this, &MainWindow::updateCoordinates);
    connect(m_canvas, &MarkupCanvas::zoomChanged, this, &MainWindow::updateZoom);
    connect(m_canvas, &MarkupCanvas::fileDropped, this, [this](const QString& path) { openDocument(path); });
    connect(m_canvas, &MarkupCanvas::statusMessage, this, [this](const QString& msg) {
        statusBar()->showMessage(msg, 5000);
    });

    updateSummary();
}

MainWindow::~MainWindow()
{
    m_thumbnails->stop();
}

void MainWindow::setupPanels()
{
    const QVector<TakeoffCategory>& cats = m_ledger->categories();
    for (int i = 0; i < cats.size(); ++i) {
        auto* panel = new TakeoffPanel(m_ledger, i, m_categoryTabs);
        m_categoryTabs->addTab(panel, cats[i].name);
        m_panels.append(panel);
        connect(panel, &TakeoffPanel::drawRequested, this, &MainWindow::startDrawForEntry);
        connect(panel, &TakeoffPanel::saveRequested, this, &MainWindow::exportSpreadsheet);
    }
}

void MainWindow::setupMenus()
{
    QMenu* fileMenu = menuBar()->addMenu("&File");

    QAction* openAction = fileMenu->addAction("&Open PDF...");
    openAction->setShortcut(QKeySequence::Open);
    connect(openAction, &QAction::triggered, this, &MainWindow::openDocumentDialog);

    m_recentMenu = fileMenu->addMenu("Recent &Files");
    updateRecentFilesMenu();

    fileMenu->addSeparator();

    QAction* saveAction = fileMenu->addAction("&Save PDF");
    saveAction->setShortcut(QKeySequence::Save);
    connect(saveAction, &QAction::triggered, this, &MainWindow::savePdf);

    QAction* saveAsAction = fileMenu->addAction("Save PDF &As...");
    saveAsAction->setShortcut(QKeySequence::SaveAs);
    connect(saveAsAction, &QAction::triggered, this, &MainWindow::savePdfAs);

    QAction* exportAction = fileMenu->addAction("&Export Spreadsheet");
    exportAction->setShortcut(QKeySequence("Ctrl+E"));
    connect(exportAction, &QAction::triggered, this, &MainWindow::exportSpreadsheet);

    fileMenu->addSeparator();
    QAction* exitAction = fileMenu->addAction("E&xit");
    exitAction->setShortcut(QKeySequence::Quit);
    connect(exitAction, &QAction::triggered, this, &QWidget::close);

    QMenu* viewMenu = menuBar()->addMenu("&View");
    QAction* zoomInAction = viewMenu->addAction("Zoom &In");
    zoomInAction->setShortcut(QKeySequence::ZoomIn);
    connect(zoomInAction, &QAction::triggered, m_canvas, &MarkupCanvas::zoomIn);
    QAction* zoomOutAction = viewMenu->addAction("Zoom &Out");
    zoomOutAction->setShortcut(QKeySequence::ZoomOut);
    connect(zoomOutAction, &QAction::triggered, m_canvas, &MarkupCanvas::zoomOut);
    QAction* fitAction = viewMenu->addAction("&Fit Page");
    fitAction->setShortcut(QKeySequence("Ctrl+0"));
    connect(fitAction, &QAction::triggered, m_canvas, &MarkupCanvas::fitToWindow);
}

void MainWindow::setupStatusBar()
{
    m_coordLabel = new QLabel("X: 0.0  Y: 0.0");
    m_coordLabel->setMinimumWidth(160);
    statusBar()->addWidget(m_coordLabel);

    m_pageLabel = new QLabel("");
    m_pageLabel->setMinimumWidth(100);
    statusBar()->addWidget(m_pageLabel);

    m_zoomLabel = new QLabel("Zoom: 100%");
    m_zoomLabel->setMinimumWidth(100);
    statusBar()->addPermanentWidget(m_zoomLabel);
}

void MainWindow::openDocumentDialog()
{
    const QString fileName = QFileDialog::getOpenFileName(this, "Open PDF", AppSettings::lastDirectory(),
                                                          "PDF Files (*.pdf)");
    if (fileName.isEmpty()) return;
    openDocument(fileName);
}

bool MainWindow::openDocument(const QString& filePath)
{
    // The thumbnail worker reads the current bytes; quiesce it before they change
    m_thumbnails->stop();
    if (!m_session->load(filePath)) {
        QMessageBox::warning(this, "Open PDF",
                             QString("Could not open %1\n\n%2").arg(QFileInfo(filePath).fileName(), m_session->lastError()));
        m_thumbnails->resume();
        return false;
    }
    return true;
}

void MainWindow::onDocumentLoaded(const QString& filePath, int pageCount)
{
    // Markup belongs to the previous drawing
    m_controller->setDrawingEnabled(false);
    m_ledger->clearShapes();

    AppSettings::setLastDirectory(QFileInfo(filePath).absolutePath());
    AppSettings::addRecentFile(filePath);
    updateRecentFilesMenu();

    populateThumbnailList(pageCount);
    m_thumbnails->start(m_session->originalBytes(), pageCount, AppSettings::thumbnailScale());

    setWindowTitle(QString("PlanTakeoff - %1").arg(QFileInfo(filePath).fileName()));
    statusBar()->showMessage(QString("Loaded %1 (%2 pages)").arg(QFileInfo(filePath).fileName()).arg(pageCount), 3000);
}

void MainWindow::populateThumbnailList(int pageCount)
{
    m_thumbnailList->clear();
    for (int i = 0; i < pageCount; ++i) {
        auto* item = new QListWidgetItem(QString::number(i + 1));
        item->setData(Qt::UserRole, i);
        m_thumbnailList->addItem(item);
    }
}

void MainWindow::onThumbnailReady(int generation, int page, const QImage& image)
{
    // Still queued from the previous document
    if (generation != m_thumbnails->generation()) return;
    if (page < 0 || page >= m_thumbnailList->count() || image.isNull()) return;
    m_thumbnailList->item(page)->setIcon(QIcon(QPixmap::fromImage(image)));
}

void MainWindow::onThumbnailClicked(QListWidgetItem* item)
{
    if (!item) return;
    m_session->setCurrentPage(item->data(Qt::UserRole).toInt());
}

void MainWindow::showPage(int page)
{
    if (!m_session->isValidPage(page)) return;
    const QImage image = m_session->renderPage(page, AppSettings::pageRenderScale());
    if (image.isNull()) {
        qWarning() << "[MainWindow] Page" << page + 1 << "failed to render";
    }
    m_canvas->setPage(page, image, m_session->pageSize(page));
    m_controller->setCurrentPage(page);
    refreshCanvasShapes();
    m_pageLabel->setText(QString("Page %1 / %2").arg(page + 1).arg(m_session->pageCount()));
    if (page < m_thumbnailList->count()) m_thumbnailList->setCurrentRow(page);
}

void MainWindow::refreshCanvasShapes()
{
    m_canvas->setShapes(m_ledger->shapesOnPage(m_canvas->pageIndex()));
}

void MainWindow::startDrawForEntry(int entryId)
{
    if (!m_session->isLoaded()) {
        statusBar()->showMessage("Open a PDF before drawing", 3000);
        return;
    }

    if (!m_binder->beginDrawing(entryId, m_session->currentPage())) return;
    m_canvas->setFocus();
    statusBar()->showMessage("Drag to define the shape, then click to stamp copies. Right-click or Esc to stop.", 5000);
}

void MainWindow::onShapeRejected(quint64)
{
    statusBar()->showMessage("Select a takeoff and press Draw first", 5000);
}

void MainWindow::onActiveEntryChanged(int entryId)
{
    // Follow the entry that receives shapes, including one reclaimed by a move
    const int cat = m_ledger->categoryOfEntry(entryId);
    if (cat >= 0 && cat < m_categoryTabs->count()) m_categoryTabs->setCurrentIndex(cat);
}

void MainWindow::updateSummary()
{
    const TakeoffSummary s = TakeoffAggregator::computeTotals(m_ledger->categories());
    m_hoursLabel->setText(QString("Total Hours: %1").arg(s.totalHours, 0, 'f', 2));
    m_devicesLabel->setText(QString("Total Devices: %1").arg(s.totalDeviceCount));
    m_pointsLabel->setText(QString("Total Points: %1").arg(s.totalPointCount));
    m_wireLabel->setText(QString("Wire Totals: %1").arg(TakeoffAggregator::describeWireTotals(s.wireTotals)));
}

void MainWindow::savePdf()
{
    if (!m_session->isLoaded()) {
        QMessageBox::warning(this, "Save PDF", "No PDF is currently loaded.");
        return;
    }
    savePdfTo(m_session->filePath());
}

void MainWindow::savePdfAs()
{
    if (!m_session->isLoaded()) {
        QMessageBox::warning(this, "Save PDF As", "No PDF is currently loaded.");
        return;
    }
    const QString fileName = QFileDialog::getSaveFileName(this, "Save PDF As", m_session->filePath(),
                                                          "PDF Files (*.pdf)");
    if (fileName.isEmpty()) return;
    savePdfTo(fileName);
}

bool MainWindow::savePdfTo(const QString& destPath)
{
    AnnotationRequest request;
    request.originalBytes = m_session->originalBytes();
    request.shapes = m_ledger->allShapes();

    m_saver.setExecutablePath(AppSettings::annotatorPath());
    m_saver.setTimeoutMs(AppSettings::annotatorTimeoutSeconds() * 1000);

    QApplication::setOverrideCursor(Qt::WaitCursor);
    const AnnotationSaveResult result = m_saver.save(request, destPath, m_thumbnails);
    QApplication::restoreOverrideCursor();

    if (!result.success) {
        QMessageBox::critical(this, "Save failed",
                              QString("The annotated PDF could not be written. The original document is unchanged.\n\n"
                                      "%1\n\nDetails were logged to:\n%2")
                                  .arg(result.errorMessage, result.logPath));
        return false;
    }
    statusBar()->showMessage(QString("Saved %1 (%2 markups)").arg(QFileInfo(destPath).fileName()).arg(request.shapes.size()), 5000);
    return true;
}

void MainWindow::exportSpreadsheet()
{
    const QString outPath = EstimateExporter::outputPathFor(m_session->filePath());
    if (outPath.isEmpty()) {
        QMessageBox::warning(this, "Save failed", "No PDF is currently loaded.");
        return;
    }

    EstimateExporter exporter;
    exporter.setCategories(m_ledger->categories());
    if (!exporter.exportToXlsx(outPath)) {
        QMessageBox::critical(this, "Save error", exporter.lastError());
        return;
    }
    QMessageBox::information(this, "Saved", QString("Spreadsheet written to:\n%1").arg(outPath));
}

void MainWindow::updateRecentFilesMenu()
{
    if (!m_recentMenu) return;
    m_recentMenu->clear();

    const QStringList recentFiles = AppSettings::recentFiles();
    if (recentFiles.isEmpty()) {
        QAction* emptyAction = m_recentMenu->addAction("(No recent files)");
        emptyAction->setEnabled(false);
        return;
    }

    for (const QString& filePath : recentFiles) {
        if (!QFile::exists(filePath)) continue;
        QAction* action = m_recentMenu->addAction(QFileInfo(filePath).fileName());
        action->setData(filePath);
        action->setToolTip(filePath);
        connect(action, &QAction::triggered, this, &MainWindow::openRecentFile);
    }

    m_recentMenu->addSeparator();
    QAction* clearAction = m_recentMenu->addAction("Clear Recent Files");
    connect(clearAction, &QAction::triggered, this, [this]() {
        AppSettings::clearRecentFiles();
        updateRecentFilesMenu();
    });
}

void MainWindow::openRecentFile()
{
    QAction* action = qobject_cast<QAction*>(sender());
    if (!action) return;
    const QString filePath = action->data().toString();
    if (filePath.isEmpty() || !QFile::exists(filePath)) {
        QMessageBox::warning(this, "Error", "File not found.");
        return;
    }
    openDocument(filePath);
}

void MainWindow::updateCoordinates(const QPointF& pos)
{
    m_coordLabel->setText(QString("X: %1  Y: %2").arg(pos.x(), 0, 'f', 1).arg(pos.y(), 0, 'f', 1));
}

void MainWindow::updateZoom(double zoom)
{
    m_zoomLabel->setText(QString("Zoom: %1%").arg(qRound(zoom * 100.0)));
}

void MainWindow::dragEnterEvent(QDragEnterEvent *event)
{
    if (event->mimeData()->hasUrls()) event->acceptProposedAction();
}

void MainWindow::dropEvent(QDropEvent *event)
{
    const QList<QUrl> urls = event->mimeData()->urls();
    if (urls.isEmpty()) return;
    const QString filePath = urls.first().toLocalFile();
    if (!filePath.endsWith(".pdf", Qt::CaseInsensitive)) return;
    openDocument(filePath);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (m_ledger->shapeTotal() > 0) {
        const QMessageBox::StandardButton reply = QMessageBox::question(
            this, "Exit PlanTakeoff",
            "Are you sure you want to exit?\n\nMarkup that was not saved to a PDF will be lost.",
            QMessageBox::Yes | QMessageBox::No,
            QMessageBox::No);
        if (reply != QMessageBox::Yes) {
            event->ignore();
            return;
        }
    }
    m_thumbnails->stop();
    event->accept();
}
