#include "backend/domain/slides/SlideFactory.h"
#include "backend/domain/slides/ArtworkChains.h"
#include "backend/catalog/IMediaCatalog.h"
#include <QDebug>

namespace {
QString descriptionOrPlaceholder(const QString& text) {
    return text.trimmed().isEmpty() ? QString::fromLatin1(Slide::kNoDescription) : text;
}
}

SlideFactory::SlideFactory(IMediaCatalog* catalog, const QSize& backgroundSize, const QSize& posterSize)
    : m_catalog(catalog)
    , m_backgroundSize(backgroundSize)
    , m_posterSize(posterSize)
{
}

std::optional<QString> SlideFactory::transcoded(const QString& path, const QSize& size) const {
    if (path.isEmpty()) {
        return std::nullopt;
    }
    const QString url = m_catalog ? m_catalog->transcodeImageUrl(path, size.width(), size.height()) : path;
    if (url.isEmpty()) {
        return std::nullopt;
    }
    return url;
}

bool SlideFactory::isSlideable(LibraryItem::Kind kind) {
    return kind == LibraryItem::Movie || kind == LibraryItem::Show || kind == LibraryItem::Season;
}

Slide SlideFactory::fromPlayback(const PlaybackItem& item, const QDateTime& now) const {
    Slide slide;
    slide.source = Slide::Playback;
    slide.title = item.title;

    QString fanart;
    QString poster;
    if (item.kind == PlaybackItem::Episode) {
        fanart = ArtworkChains::firstNonEmpty(ArtworkChains::episodeFanart(), item);
        poster = ArtworkChains::firstNonEmpty(ArtworkChains::episodePoster(), item);
        slide.description = item.grandparentTitle.isEmpty()
            ? item.summary
            : QStringLiteral("%1: %2").arg(item.grandparentTitle, item.summary);
    } else {
        fanart = ArtworkChains::firstNonEmpty(ArtworkChains::movieFanart(), item);
        poster = ArtworkChains::firstNonEmpty(ArtworkChains::moviePoster(), item);
        slide.description = item.summary;
    }
    slide.description = descriptionOrPlaceholder(slide.description);
    slide.fanartUrl = transcoded(fanart, m_backgroundSize);
    slide.posterUrl = transcoded(poster, m_posterSize);

    Slide::PlaybackInfo info;
    info.viewer = item.usernames.isEmpty() ? QString::fromLatin1(Slide::kUnknownUser) : item.usernames.first();
    info.mode = QString::fromLatin1(item.transcoding ? Slide::kTranscoding : Slide::kDirectPlay);
    info.estimatedEnd = item.estimatedEndTime(now);
    slide.playbackInfo = info;
    return slide;
}

Slide SlideFactory::fromLibrary(const LibraryItem& item) const {
    Slide slide;
    slide.source = Slide::Library;
    slide.posterUrl = transcoded(item.thumb, m_posterSize);

    if (item.kind != LibraryItem::Show && item.kind != LibraryItem::Season) {
        slide.title = item.title;
        slide.description = descriptionOrPlaceholder(item.summary);
        slide.fanartUrl = transcoded(item.art, m_backgroundSize);
        return slide;
    }

    Slide::SeasonEpisodeInfo counts;
    const QString showKey = item.owningShowKey();
    ShowLookup lookup = m_catalog
        ? m_catalog->resolveShow(showKey)
        : ShowLookup::failure(KioskError(KioskError::MetadataResolutionError, "resolveShow", showKey, "no catalog"));

    if (lookup.ok()) {
        slide.title = lookup.value.title.isEmpty() ? item.title : lookup.value.title;
        slide.description = descriptionOrPlaceholder(lookup.value.summary);
        slide.fanartUrl = transcoded(lookup.value.art, m_backgroundSize);
        counts.seasons = lookup.value.seasonCount;
        counts.episodes = lookup.value.episodeCount;
    } else {
        qWarning() << "SlideFactory: Falling back for" << LibraryItem::kindName(item.kind)
                   << item.ratingKey << "-" << lookup.error;
        slide.title = item.title;
        slide.description = QString::fromLatin1(Slide::kDescriptionNotAvailable);
        slide.fanartUrl = transcoded(item.art, m_backgroundSize);
    }
    slide.seasonEpisodeInfo = counts;
    return slide;
}

QList<Slide> SlideFactory::fromPlaybackItems(const QList<PlaybackItem>& items, const QDateTime& now) const {
    QList<Slide> slides;
    slides.reserve(items.size());
    for (const auto& item : items) {
        slides.append(fromPlayback(item, now));
    }
    return slides;
}

QList<Slide> SlideFactory::fromLibraryItems(const QList<LibraryItem>& items, const StopPredicate& shouldStop) const {
    QList<Slide> slides;
    for (const auto& item : items) {
        if (shouldStop && shouldStop()) {
            qDebug() << "SlideFactory: Stopped after" << slides.size() << "of" << items.size() << "item(s)";
            break;
        }
        if (!isSlideable(item.kind)) {
            qDebug() << "SlideFactory: Skipping" << LibraryItem::kindName(item.kind) << item.title;
            continue;
        }
        slides.append(fromLibrary(item));
    }
    return slides;
}
