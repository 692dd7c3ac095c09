#ifndef IMAGEMEMORYCACHE_H
#define IMAGEMEMORYCACHE_H

#include <QString>
#include <QHash>
#include <QImage>
#include <QElapsedTimer>
#include <optional>

/**
 * ImageMemoryCache
 *
 * Keeps decoded artwork in memory for a bounded time, keyed by URL, so that
 * a slide shown again a cycle later does not hit the server twice.
 *
 * - Entries expire lifetimeMs after they were stored
 * - Expired entries are evicted on lookup and by purgeExpired(), which the
 *   fetcher runs before every request
 * - A lifetime of 0 disables the cache entirely
 */
class ImageMemoryCache {
public:
    explicit ImageMemoryCache(qint64 lifetimeMs = 0);

    bool isEnabled() const { return m_lifetimeMs > 0; }

    std::optional<QImage> lookup(const QString& url);
    void store(const QString& url, const QImage& image);

    // Drop entries older than the lifetime
    void purgeExpired();

    int getCachedImageCount() const { return m_entries.size(); }
    qint64 getTotalCachedBytes() const;

    void clearCache();

private:
    struct Entry {
        QImage image;
        qint64 storedAtMs = 0;
    };

    bool isExpired(const Entry& entry) const;

    qint64 m_lifetimeMs;
    QElapsedTimer m_clock;
    QHash<QString, Entry> m_entries;  // url → decoded image
};

#endif // IMAGEMEMORYCACHE_H
