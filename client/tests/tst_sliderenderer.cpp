#include <QtTest>
#include "frontend/rendering/SlideRenderer.h"
#include "fakes/RecordingCanvas.h"

namespace {
QImage solidImage(const QSize& size) {
    QImage image(size, QImage::Format_RGB32);
    image.fill(Qt::darkGray);
    return image;
}
}

class TestSlideRenderer : public QObject {
    Q_OBJECT

private slots:
    void drawsLayersInOrder() {
        RecordingCanvas canvas;
        SlideRenderer renderer(&canvas, "%H:%M");

        Slide slide;
        slide.title = "T";
        slide.description = "Hello world";
        QVERIFY(renderer.drawSlide(slide, solidImage(QSize(1920, 1080)), solidImage(QSize(200, 300))));

        QCOMPARE(canvas.ops, QStringList({
            "clear",
            "image 0,0 800x480",
            "rect alpha=128",
            "image 50,90 200x300",
            "text Title 301,91 T",
            "text Title 300,90 T",
            "text Body 300,140 Hello world",
            "present",
        }));
    }

    void missingArtworkSkipsImages() {
        RecordingCanvas canvas;
        SlideRenderer renderer(&canvas, "%H:%M");

        Slide slide;
        slide.title = "T";
        slide.description = "D";
        QVERIFY(renderer.drawSlide(slide, std::nullopt, std::nullopt));

        QCOMPARE(canvas.ops.mid(0, 2), QStringList({"clear", "rect alpha=128"}));
        for (const QString& op : canvas.ops) {
            QVERIFY2(!op.startsWith("image"), qPrintable(op));
        }
    }

    void descriptionIsLimitedToFiveLines() {
        RecordingCanvas canvas;
        SlideRenderer renderer(&canvas, "%H:%M");

        // 10 words of 4 characters fit on a 500 px line
        QStringList words;
        for (int i = 0; i < 100; ++i) {
            words.append("word");
        }
        const QString description = words.join(' ');
        const QStringList lines = renderer.descriptionLines(description);
        QCOMPARE(lines.size(), 5);
        for (const QString& line : lines) {
            QVERIFY(canvas.measureText(line, FontRole::Body) < 500);
        }
    }

    void emptyDescriptionUsesPlaceholder() {
        RecordingCanvas canvas;
        SlideRenderer renderer(&canvas, "%H:%M");
        QCOMPARE(renderer.descriptionLines(QString()), QStringList({QString::fromLatin1(Slide::kNoDescription)}));
    }

    void seasonAndEpisodeRowsFollowDescription() {
        RecordingCanvas canvas;
        SlideRenderer renderer(&canvas, "%H:%M");

        Slide slide;
        slide.title = "The Show";
        slide.description = "One line";
        slide.seasonEpisodeInfo = Slide::SeasonEpisodeInfo{3, 30};
        QVERIFY(renderer.drawSlide(slide, std::nullopt, std::nullopt));

        QVERIFY(canvas.ops.contains("text Body 300,190 Seasons: 3"));
        QVERIFY(canvas.ops.contains("text Body 300,220 Episodes: 30"));
    }

    void playbackRowsShowViewerModeAndEnd() {
        RecordingCanvas canvas;
        SlideRenderer renderer(&canvas, "%H:%M");

        Slide slide;
        slide.source = Slide::Playback;
        slide.title = "Pilot";
        slide.description = "One line";
        slide.playbackInfo = Slide::PlaybackInfo{"alice", Slide::kDirectPlay, QDateTime(QDate(2024, 6, 1), QTime(20, 1, 0))};
        QVERIFY(renderer.drawSlide(slide, std::nullopt, std::nullopt));

        QVERIFY(canvas.ops.contains("text Body 300,190 User: alice"));
        QVERIFY(canvas.ops.contains("text Body 300,220 Status: Direct Play"));
        QVERIFY(canvas.ops.contains("text Body 300,250 Ends: 20:01"));
        QCOMPARE(canvas.ops.last(), QString("present"));
    }

    void idleScreenCentersClockAndShowsCounters() {
        RecordingCanvas canvas;
        SlideRenderer renderer(&canvas, "%H:%M");

        IdleSummary summary;
        summary.clockText = "12:34";
        summary.movieCount = 10;
        summary.playingCount = 2;
        QVERIFY(renderer.drawIdle(summary));

        QCOMPARE(canvas.ops, QStringList({
            "clear",
            "text Clock 375,230 12:34",
            "text Body 50,400 Total Movies: 10",
            "text Body 300,400 Total TV Shows: --",
            "text Body 550,400 Currently Playing: 2",
            "present",
        }));
    }

    void idleCountersScaleWithWidth() {
        RecordingCanvas canvas(QSize(1600, 900));
        SlideRenderer renderer(&canvas, "%H:%M");

        IdleSummary summary;
        summary.clockText = "12:34";
        QVERIFY(renderer.drawIdle(summary));

        QVERIFY(canvas.ops.contains("text Body 100,820 Total Movies: --"));
        QVERIFY(canvas.ops.contains("text Body 600,820 Total TV Shows: --"));
        QVERIFY(canvas.ops.contains("text Body 1100,820 Currently Playing: 0"));
    }

    void reportsPresentFailure() {
        RecordingCanvas canvas;
        canvas.presentResult = false;
        SlideRenderer renderer(&canvas, "%H:%M");

        QVERIFY(!renderer.drawIdle(IdleSummary()));
        Slide slide;
        slide.title = "T";
        QVERIFY(!renderer.drawSlide(slide, std::nullopt, std::nullopt));
    }
};

QTEST_MAIN(TestSlideRenderer)
#include "tst_sliderenderer.moc"
