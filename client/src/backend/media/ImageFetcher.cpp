#include "backend/media/ImageFetcher.h"
#include "backend/network/HttpClient.h"
#include <QByteArray>
#include <QDebug>

ImageFetcher::ImageFetcher(HttpClient* http, qint64 cacheLifetimeMs)
    : m_http(http)
    , m_cache(cacheLifetimeMs)
{
}

std::optional<QImage> ImageFetcher::fetch(const QString& url) {
    m_lastError = KioskError();
    if (url.isEmpty()) {
        return std::nullopt;
    }

    m_cache.purgeExpired();
    if (auto cached = m_cache.lookup(url)) {
        return cached;
    }

    if (!m_http) {
        m_lastError = KioskError(KioskError::ImageFetchError, "fetchImage", url, "no HTTP client");
        qWarning() << m_lastError;
        return std::nullopt;
    }

    QByteArray bytes;
    QString error;
    if (!m_http->get(QUrl(url), &bytes, &error)) {
        m_lastError = KioskError(KioskError::ImageFetchError, "fetchImage", url, error);
        qWarning() << m_lastError;
        return std::nullopt;
    }

    QImage image;
    if (bytes.isEmpty() || !image.loadFromData(bytes)) {
        m_lastError = KioskError(KioskError::ImageFetchError, "decodeImage", url,
                                 QStringLiteral("could not decode %1 bytes").arg(bytes.size()));
        qWarning() << m_lastError;
        return std::nullopt;
    }

    qDebug() << "ImageFetcher: Decoded" << image.size() << "from" << url;
    m_cache.store(url, image);
    return image;
}
