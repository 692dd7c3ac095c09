#ifndef IMAGEFETCHER_H
#define IMAGEFETCHER_H

#include <QString>
#include <QImage>
#include <optional>
#include "backend/media/ImageMemoryCache.h"
#include "backend/errors/KioskError.h"

class HttpClient;

/**
 * @brief Downloads and decodes artwork.
 *
 * fetch() never fails loudly: an empty URL, a failed request or undecodable
 * bytes all come back as std::nullopt so the renderer can fall back to a
 * solid fill. The last failure is kept for diagnostics.
 */
class ImageFetcher {
public:
    explicit ImageFetcher(HttpClient* http, qint64 cacheLifetimeMs = 0);

    std::optional<QImage> fetch(const QString& url);

    const KioskError& lastError() const { return m_lastError; }
    ImageMemoryCache& cache() { return m_cache; }

private:
    HttpClient* m_http;
    ImageMemoryCache m_cache;
    KioskError m_lastError;
};

#endif // IMAGEFETCHER_H
