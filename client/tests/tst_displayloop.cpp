#include <QtTest>
#include <QSignalSpy>
#include <QBuffer>
#include <QElapsedTimer>
#include "backend/AppContext.h"
#include "backend/controllers/DisplayLoop.h"
#include "fakes/FakeHttpClient.h"
#include "fakes/FakeMediaCatalog.h"
#include "fakes/RecordingCanvas.h"

namespace {

class CountingForegroundHint : public IForegroundHint {
public:
    explicit CountingForegroundHint(int* calls) : m_calls(calls) {}
    bool bringToFront() override {
        ++*m_calls;
        return true;
    }

private:
    int* m_calls;
};

KioskConfig testConfig(double displaySeconds) {
    KioskConfig config;
    config.serverUrl = QUrl("http://plex.local:32400");
    config.authToken = "token";
    config.dwell.displaySeconds = displaySeconds;
    config.dwell.timeFormat = "%H:%M";
    config.dwell.recentItemCount = 3;
    return config;
}

LibraryItem movie(const QString& title) {
    LibraryItem item;
    item.kind = LibraryItem::Movie;
    item.ratingKey = title;
    item.title = title;
    item.summary = "Plot of " + title;
    return item;
}

// Catalog and canvas stay owned by the context; the test keeps raw pointers to inspect them
struct Harness {
    FakeMediaCatalog* catalog = nullptr;
    RecordingCanvas* canvas = nullptr;
    FakeHttpClient* http = nullptr;
    int foregroundCalls = 0;
    std::unique_ptr<AppContext> context;

    explicit Harness(double displaySeconds) {
        auto catalogPtr = std::make_unique<FakeMediaCatalog>();
        auto canvasPtr = std::make_unique<RecordingCanvas>();
        auto httpPtr = std::make_unique<FakeHttpClient>();
        catalog = catalogPtr.get();
        canvas = canvasPtr.get();
        http = httpPtr.get();
        auto images = std::make_unique<ImageFetcher>(http);
        context = std::make_unique<AppContext>(testConfig(displaySeconds), std::move(catalogPtr), std::move(images),
                                               std::move(canvasPtr),
                                               std::make_unique<CountingForegroundHint>(&foregroundCalls),
                                               std::move(httpPtr));
    }
};

}

class TestDisplayLoop : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        qRegisterMetaType<DisplayLoop::State>();
    }

    void rotatesRecentItemsThenIdles() {
        Harness h(0.01);
        h.catalog->recent = CatalogResult<QList<LibraryItem>>::success({movie("A"), movie("B"), movie("C"), movie("D")});
        h.catalog->counts = CatalogResult<QHash<QString, int>>::success({{"Movies", 12}, {"TV Shows", 4}});

        DisplayLoop loop(h.context.get());
        QSignalSpy slides(&loop, &DisplayLoop::slidePresented);
        QSignalSpy idle(&loop, &DisplayLoop::idlePresented);
        QSignalSpy states(&loop, &DisplayLoop::stateChanged);
        // Stop on the idle frame
        h.canvas->onPresent = [&loop](int count) {
            if (count == 4) loop.requestStop();
        };

        QCOMPARE(loop.run(), DisplayLoop::kExitOk);

        QCOMPARE(h.catalog->playingCalls, 1);
        QCOMPARE(h.catalog->recentCalls, 1);
        QCOMPARE(h.catalog->lastRecentLimit, 3);
        QCOMPARE(h.foregroundCalls, 1);
        QCOMPARE(slides.count(), 3);
        QCOMPARE(slides.at(0).at(1).toString(), QString("A"));
        QCOMPARE(slides.at(2).at(1).toString(), QString("C"));
        QCOMPARE(idle.count(), 1);
        QCOMPARE(h.canvas->presentCount, 4);
        QVERIFY(h.canvas->texts.contains("Total Movies: 12"));
        QVERIFY(h.canvas->texts.contains("Total TV Shows: 4"));
        QVERIFY(h.canvas->texts.contains("Currently Playing: 0"));

        QList<DisplayLoop::State> seen;
        for (const auto& args : states) {
            seen.append(args.at(0).value<DisplayLoop::State>());
        }
        QCOMPARE(seen, QList<DisplayLoop::State>({DisplayLoop::State::Rotating, DisplayLoop::State::Idle,
                                                  DisplayLoop::State::Stopped}));
        QCOMPARE(loop.state(), DisplayLoop::State::Stopped);
    }

    void everyFrameDwellsBeforeTheNext() {
        Harness h(0.1);
        h.catalog->recent = CatalogResult<QList<LibraryItem>>::success({movie("A"), movie("B"), movie("C")});

        DisplayLoop loop(h.context.get());
        QElapsedTimer clock;
        qint64 secondCycleStartMs = -1;
        // Present 5 is the first slide of the second cycle
        h.canvas->onPresent = [&](int count) {
            if (count == 5) {
                secondCycleStartMs = clock.elapsed();
                loop.requestStop();
            }
        };

        clock.start();
        QCOMPARE(loop.run(), DisplayLoop::kExitOk);

        QCOMPARE(loop.cyclesCompleted(), 1);
        QCOMPARE(h.catalog->recentCalls, 2);
        QCOMPARE(h.foregroundCalls, 2);
        // Three slides and the idle screen, 100 ms each
        QVERIFY2(secondCycleStartMs >= 390, qPrintable(QString::number(secondCycleStartMs)));
        QVERIFY2(secondCycleStartMs < 2000, qPrintable(QString::number(secondCycleStartMs)));
    }

    void playbackTakesPriorityOverRecent() {
        Harness h(0.01);
        PlaybackItem item;
        item.kind = PlaybackItem::Movie;
        item.title = "Now Showing";
        item.usernames = {"alice"};
        h.catalog->playing = CatalogResult<QList<PlaybackItem>>::success({item});
        h.catalog->recent = CatalogResult<QList<LibraryItem>>::success({movie("A")});

        DisplayLoop loop(h.context.get());
        QSignalSpy slides(&loop, &DisplayLoop::slidePresented);
        h.canvas->onPresent = [&loop](int count) {
            if (count == 2) loop.requestStop();
        };

        QCOMPARE(loop.run(), DisplayLoop::kExitOk);
        QCOMPARE(h.catalog->recentCalls, 0);
        QCOMPARE(slides.count(), 1);
        QCOMPARE(slides.first().at(1).toString(), QString("Now Showing"));
        QVERIFY(h.canvas->texts.contains("User: alice"));
        QVERIFY(h.canvas->texts.contains("Currently Playing: 1"));
    }

    void catalogFailuresFallThroughToIdle() {
        Harness h(0.01);
        const KioskError down(KioskError::CatalogQueryError, "test", QString(), "server down");
        h.catalog->playing = CatalogResult<QList<PlaybackItem>>::failure(down);
        h.catalog->recent = CatalogResult<QList<LibraryItem>>::failure(down);
        h.catalog->counts = CatalogResult<QHash<QString, int>>::failure(down);

        DisplayLoop loop(h.context.get());
        QSignalSpy slides(&loop, &DisplayLoop::slidePresented);
        QSignalSpy idle(&loop, &DisplayLoop::idlePresented);
        h.canvas->onPresent = [&loop](int count) {
            if (count == 1) loop.requestStop();
        };

        QCOMPARE(loop.run(), DisplayLoop::kExitOk);
        QCOMPARE(h.catalog->recentCalls, 1);
        QCOMPARE(slides.count(), 0);
        QCOMPARE(idle.count(), 1);
        QVERIFY(h.canvas->texts.contains("Total Movies: --"));
        QVERIFY(h.canvas->texts.contains("Total TV Shows: --"));
        QVERIFY(!loop.fatalError().isError());
    }

    void drawsFetchedArtwork() {
        Harness h(0.01);
        LibraryItem item = movie("A");
        item.art = "/a/art";
        h.catalog->recent = CatalogResult<QList<LibraryItem>>::success({item});

        QImage image(4, 4, QImage::Format_RGB32);
        image.fill(Qt::green);
        QByteArray bytes;
        QBuffer buffer(&bytes);
        buffer.open(QIODevice::WriteOnly);
        image.save(&buffer, "PNG");
        h.http->responses.insert("fake:///a/art?800x480", bytes);

        DisplayLoop loop(h.context.get());
        h.canvas->onPresent = [&loop](int count) {
            if (count == 1) loop.requestStop();
        };

        QCOMPARE(loop.run(), DisplayLoop::kExitOk);
        QVERIFY(h.canvas->ops.contains("image 0,0 800x480"));
        // No poster path, so no poster draw
        QVERIFY(!h.canvas->ops.contains("image 50,90 200x300"));
    }

    void stopInterruptsDwellPromptly() {
        Harness h(30.0);
        h.catalog->recent = CatalogResult<QList<LibraryItem>>::success({movie("A")});

        DisplayLoop loop(h.context.get());
        QTimer::singleShot(100, &loop, &DisplayLoop::requestStop);

        QElapsedTimer clock;
        clock.start();
        QCOMPARE(loop.run(), DisplayLoop::kExitOk);
        QVERIFY2(clock.elapsed() < 1000, qPrintable(QString::number(clock.elapsed())));
        QCOMPARE(h.canvas->presentCount, 1);
        QCOMPARE(loop.cyclesCompleted(), 0);
        QVERIFY(loop.isStopRequested());
    }

    void stopDuringShowLookupSkipsRemainingItems() {
        Harness h(30.0);
        QList<LibraryItem> shows;
        for (const QString& key : {"70", "71", "72"}) {
            LibraryItem item;
            item.kind = LibraryItem::Show;
            item.ratingKey = key;
            item.title = "Show " + key;
            shows.append(item);
        }
        h.catalog->recent = CatalogResult<QList<LibraryItem>>::success(shows);

        DisplayLoop loop(h.context.get());
        // Quit arrives while the first lookup is still waiting on the server
        h.catalog->onResolve = [&loop](const QString&) { loop.requestStop(); };

        QCOMPARE(loop.run(), DisplayLoop::kExitOk);
        QCOMPARE(h.catalog->resolvedKeys, QStringList({"70"}));
        QCOMPARE(h.canvas->presentCount, 0);
        QCOMPARE(loop.state(), DisplayLoop::State::Stopped);
    }

    void presentFailureEndsWithRenderError() {
        Harness h(0.01);
        h.catalog->recent = CatalogResult<QList<LibraryItem>>::success({movie("A"), movie("B")});
        h.canvas->presentResult = false;

        DisplayLoop loop(h.context.get());
        QSignalSpy slides(&loop, &DisplayLoop::slidePresented);

        QCOMPARE(loop.run(), DisplayLoop::kExitRenderFailure);
        QCOMPARE(loop.fatalError().kind, KioskError::RenderBackendError);
        QCOMPARE(slides.count(), 0);
        QCOMPARE(h.canvas->presentCount, 1);
        QCOMPARE(loop.state(), DisplayLoop::State::Stopped);
    }
};

QTEST_MAIN(TestDisplayLoop)
#include "tst_displayloop.moc"
