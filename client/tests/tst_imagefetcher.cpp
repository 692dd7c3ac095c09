#include <QtTest>
#include <QBuffer>
#include "backend/media/ImageFetcher.h"
#include "backend/media/ImageMemoryCache.h"
#include "fakes/FakeHttpClient.h"

namespace {
const QString kPosterUrl = QStringLiteral("http://plex.local:32400/photo/poster");

QByteArray pngBytes(const QSize& size) {
    QImage image(size, QImage::Format_RGB32);
    image.fill(Qt::red);
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    image.save(&buffer, "PNG");
    return bytes;
}
}

class TestImageFetcher : public QObject {
    Q_OBJECT

private slots:
    void decodesImage() {
        FakeHttpClient http;
        http.responses.insert(kPosterUrl, pngBytes(QSize(4, 6)));
        ImageFetcher fetcher(&http);

        const auto image = fetcher.fetch(kPosterUrl);
        QVERIFY(image.has_value());
        QCOMPARE(image->size(), QSize(4, 6));
        QVERIFY(!fetcher.lastError().isError());
    }

    void failedRequestIsAbsentImage() {
        FakeHttpClient http;
        ImageFetcher fetcher(&http);

        QVERIFY(!fetcher.fetch(kPosterUrl).has_value());
        QCOMPARE(fetcher.lastError().kind, KioskError::ImageFetchError);
        QCOMPARE(fetcher.lastError().identifier, kPosterUrl);
    }

    void undecodableBytesAreAbsentImage() {
        FakeHttpClient http;
        http.responses.insert(kPosterUrl, "definitely not an image");
        ImageFetcher fetcher(&http);

        QVERIFY(!fetcher.fetch(kPosterUrl).has_value());
        QCOMPARE(fetcher.lastError().kind, KioskError::ImageFetchError);
    }

    void emptyUrlMakesNoRequest() {
        FakeHttpClient http;
        ImageFetcher fetcher(&http);

        QVERIFY(!fetcher.fetch(QString()).has_value());
        QVERIFY(http.requested.isEmpty());
    }

    void cacheAvoidsSecondDownload() {
        FakeHttpClient http;
        http.responses.insert(kPosterUrl, pngBytes(QSize(2, 2)));
        ImageFetcher fetcher(&http, 60000);

        QVERIFY(fetcher.fetch(kPosterUrl).has_value());
        QVERIFY(fetcher.fetch(kPosterUrl).has_value());
        QCOMPARE(http.requested.size(), 1);
        QCOMPARE(fetcher.cache().getCachedImageCount(), 1);
        QVERIFY(fetcher.cache().getTotalCachedBytes() > 0);
    }

    void disabledCacheDownloadsEveryTime() {
        FakeHttpClient http;
        http.responses.insert(kPosterUrl, pngBytes(QSize(2, 2)));
        ImageFetcher fetcher(&http);

        QVERIFY(fetcher.fetch(kPosterUrl).has_value());
        QVERIFY(fetcher.fetch(kPosterUrl).has_value());
        QCOMPARE(http.requested.size(), 2);
        QCOMPARE(fetcher.cache().getCachedImageCount(), 0);
    }

    void fetchEvictsExpiredEntriesForOtherUrls() {
        const QString backdropUrl = QStringLiteral("http://plex.local:32400/photo/backdrop");
        FakeHttpClient http;
        http.responses.insert(kPosterUrl, pngBytes(QSize(2, 2)));
        http.responses.insert(backdropUrl, pngBytes(QSize(3, 3)));
        ImageFetcher fetcher(&http, 200);

        QVERIFY(fetcher.fetch(kPosterUrl).has_value());
        QCOMPARE(fetcher.cache().getCachedImageCount(), 1);

        QTest::qWait(300);
        // The poster is never asked for again
        QVERIFY(fetcher.fetch(backdropUrl).has_value());
        QCOMPARE(fetcher.cache().getCachedImageCount(), 1);
        QVERIFY(!fetcher.cache().lookup(kPosterUrl).has_value());
    }

    void cacheEntriesExpire() {
        ImageMemoryCache cache(200);
        QImage image(2, 2, QImage::Format_RGB32);
        image.fill(Qt::blue);
        cache.store("a", image);
        cache.store("b", image);
        QVERIFY(cache.lookup("a").has_value());

        QTest::qWait(300);
        QVERIFY(!cache.lookup("a").has_value());
        cache.purgeExpired();
        QCOMPARE(cache.getCachedImageCount(), 0);

        cache.store("c", image);
        cache.clearCache();
        QCOMPARE(cache.getCachedImageCount(), 0);
    }
};

QTEST_MAIN(TestImageFetcher)
#include "tst_imagefetcher.moc"
