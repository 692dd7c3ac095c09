#include "backend/media/ImageMemoryCache.h"
#include <QDebug>

ImageMemoryCache::ImageMemoryCache(qint64 lifetimeMs)
    : m_lifetimeMs(lifetimeMs)
{
    m_clock.start();
}

bool ImageMemoryCache::isExpired(const Entry& entry) const {
    return (m_clock.elapsed() - entry.storedAtMs) >= m_lifetimeMs;
}

std::optional<QImage> ImageMemoryCache::lookup(const QString& url) {
    if (!isEnabled() || url.isEmpty()) {
        return std::nullopt;
    }

    auto it = m_entries.find(url);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    if (isExpired(it.value())) {
        m_entries.erase(it);
        qDebug() << "ImageMemoryCache: Expired" << url;
        return std::nullopt;
    }
    qDebug() << "ImageMemoryCache: Cache hit for" << url;
    return it.value().image;
}

void ImageMemoryCache::store(const QString& url, const QImage& image) {
    if (!isEnabled() || url.isEmpty() || image.isNull()) {
        return;
    }
    Entry entry;
    entry.image = image;
    entry.storedAtMs = m_clock.elapsed();
    m_entries.insert(url, entry);
}

void ImageMemoryCache::purgeExpired() {
    if (!isEnabled()) {
        return;
    }
    int removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end(); ) {
        if (isExpired(it.value())) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        qDebug() << "ImageMemoryCache: Purged" << removed << "expired image(s)";
    }
}

qint64 ImageMemoryCache::getTotalCachedBytes() const {
    qint64 total = 0;
    for (const auto& entry : m_entries) {
        total += entry.image.sizeInBytes();
    }
    return total;
}

void ImageMemoryCache::clearCache() {
    qDebug() << "ImageMemoryCache: Clearing cache (" << m_entries.size() << "images)";
    m_entries.clear();
}
