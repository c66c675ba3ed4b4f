#include <gtest/gtest.h>

#include <QEventLoop>
#include <QTimer>
#include <QCoreApplication>
#include <QMutex>
#include <QSemaphore>
#include <QThread>
#include <QVector>
#include <thread>

#include "document/thumbnailrenderer.h"
#include "testpdf.h"

namespace {

QVector<int> firstPages(int count)
{
    QVector<int> pages;
    for (int i = 0; i < count; ++i) pages.append(i);
    return pages;
}

} // namespace

TEST(ThumbnailRendererTest, RendersEveryPageInOrder) {
    ThumbnailRenderer renderer;
    QObject receiver;
    QVector<int> pages;
    QVector<int> generations;
    QEventLoop loop;
    QObject::connect(&renderer, &ThumbnailRenderer::thumbnailReady, &receiver,
                     [&pages, &generations](int generation, int page, const QImage& image) {
                         if (!image.isNull()) pages.append(page);
                         generations.append(generation);
                     });
    QObject::connect(&renderer, &ThumbnailRenderer::finished, &loop, &QEventLoop::quit, Qt::QueuedConnection);
    QTimer::singleShot(10000, &loop, &QEventLoop::quit);

    renderer.start(testpdf::makeBlankPdf(3, QSizeF(100, 100)), 3, 0.5);
    loop.exec();
    renderer.stop();
    QCoreApplication::processEvents();

    EXPECT_EQ(pages, firstPages(3));
    EXPECT_EQ(generations, (QVector<int>{1, 1, 1}));
    EXPECT_EQ(renderer.renderedCount(), 3);
    EXPECT_FALSE(renderer.isRunning());

    // Nothing left to do
    renderer.resume();
    EXPECT_FALSE(renderer.isRunning());
}

TEST(ThumbnailRendererTest, StopPausesMidDocumentAndResumeContinues) {
    const int pageCount = 40;
    ThumbnailRenderer renderer;

    QMutex mutex;
    QVector<int> pages;
    QSemaphore firstPageDone;
    QSemaphore gate;
    // Runs on the worker thread; holds the worker on page 0 until released
    QObject::connect(&renderer, &ThumbnailRenderer::thumbnailReady, &renderer,
                     [&](int, int page, const QImage&) {
                         {
                             QMutexLocker locker(&mutex);
                             pages.append(page);
                         }
                         if (page == 0) {
                             firstPageDone.release();
                             gate.acquire();
                         }
                     },
                     Qt::DirectConnection);

    renderer.start(testpdf::makeBlankPdf(pageCount, QSizeF(100, 100)), pageCount, 0.5);
    ASSERT_TRUE(firstPageDone.tryAcquire(1, 10000));
    EXPECT_TRUE(renderer.isRunning());

    // stop() blocks until the worker returns, so it cannot run on this thread
    std::thread stopper([&renderer]() { renderer.stop(); });
    QThread::msleep(100);
    gate.release();
    stopper.join();

    EXPECT_FALSE(renderer.isRunning());
    const int done = renderer.renderedCount();
    EXPECT_GE(done, 1);
    EXPECT_LT(done, pageCount);

    QEventLoop loop;
    QObject::connect(&renderer, &ThumbnailRenderer::finished, &loop, &QEventLoop::quit, Qt::QueuedConnection);
    QTimer::singleShot(10000, &loop, &QEventLoop::quit);
    renderer.resume();
    loop.exec();
    renderer.stop();

    EXPECT_EQ(renderer.renderedCount(), pageCount);
    QMutexLocker locker(&mutex);
    // Every page exactly once: the resumed run starts where the first one stopped
    EXPECT_EQ(pages, firstPages(pageCount));
    EXPECT_EQ(pages.count(0), 1);
}

TEST(ThumbnailRendererTest, RestartTagsThumbnailsWithNewGeneration) {
    ThumbnailRenderer renderer;
    EXPECT_EQ(renderer.generation(), 0);

    renderer.start(testpdf::makeBlankPdf(1, QSizeF(100, 100)), 1, 0.5);
    renderer.stop();
    EXPECT_EQ(renderer.generation(), 1);

    QObject receiver;
    QVector<int> generations;
    QEventLoop loop;
    QObject::connect(&renderer, &ThumbnailRenderer::thumbnailReady, &receiver,
                     [&generations](int generation, int, const QImage&) { generations.append(generation); });
    QObject::connect(&renderer, &ThumbnailRenderer::finished, &loop, &QEventLoop::quit, Qt::QueuedConnection);
    QTimer::singleShot(10000, &loop, &QEventLoop::quit);

    renderer.start(testpdf::makeBlankPdf(2, QSizeF(100, 100)), 2, 0.5);
    loop.exec();
    renderer.stop();
    QCoreApplication::processEvents();

    EXPECT_EQ(renderer.generation(), 2);
    EXPECT_EQ(generations, (QVector<int>{2, 2}));
}

TEST(ThumbnailRendererTest, StopIsSafeWhenIdle) {
    ThumbnailRenderer renderer;
    renderer.stop();
    renderer.resume();
    EXPECT_FALSE(renderer.isRunning());
    EXPECT_EQ(renderer.renderedCount(), 0);
}
