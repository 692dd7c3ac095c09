#ifndef SLIDEFACTORY_H
#define SLIDEFACTORY_H

#include <QList>
#include <QSize>
#include <QDateTime>
#include <functional>
#include "backend/domain/slides/Slide.h"
#include "backend/domain/models/PlaybackItem.h"
#include "backend/domain/models/LibraryItem.h"

class IMediaCatalog;

/**
 * @brief Turns catalog records into slides.
 *
 * Artwork paths are rewritten through the catalog's image transcoder so the
 * server returns images already sized for the background and the poster.
 * Show and season entries are described by their owning show; when that
 * lookup fails the slide falls back to the entry's own title, a fixed
 * description and zero counts.
 */
class SlideFactory {
public:
    using StopPredicate = std::function<bool()>;

    explicit SlideFactory(IMediaCatalog* catalog,
                          const QSize& backgroundSize = QSize(800, 480),
                          const QSize& posterSize = QSize(200, 300));

    Slide fromPlayback(const PlaybackItem& item, const QDateTime& now) const;
    Slide fromLibrary(const LibraryItem& item) const;

    QList<Slide> fromPlaybackItems(const QList<PlaybackItem>& items, const QDateTime& now) const;
    // Skips entries that have no slide representation (episodes, music, photos).
    // shouldStop is asked before each entry; once it returns true the slides built so far are returned.
    QList<Slide> fromLibraryItems(const QList<LibraryItem>& items, const StopPredicate& shouldStop = StopPredicate()) const;

    static bool isSlideable(LibraryItem::Kind kind);

private:
    std::optional<QString> transcoded(const QString& path, const QSize& size) const;

    IMediaCatalog* m_catalog;
    QSize m_backgroundSize;
    QSize m_posterSize;
};

#endif // SLIDEFACTORY_H
