#include "backend/domain/slides/ArtworkChains.h"

namespace ArtworkChains {

const Chain& episodeFanart() {
    static const Chain chain = {
        [](const PlaybackItem& item) { return item.grandparentArt; },
        [](const PlaybackItem& item) { return item.parentArt; },
        [](const PlaybackItem& item) { return item.art; },
    };
    return chain;
}

const Chain& episodePoster() {
    static const Chain chain = {
        [](const PlaybackItem& item) { return item.grandparentThumb; },
        [](const PlaybackItem& item) { return item.thumb; },
    };
    return chain;
}

const Chain& movieFanart() {
    static const Chain chain = {
        [](const PlaybackItem& item) { return item.art; },
        [](const PlaybackItem& item) { return item.thumb; },
    };
    return chain;
}

const Chain& moviePoster() {
    static const Chain chain = {
        [](const PlaybackItem& item) { return item.thumb; },
    };
    return chain;
}

QString firstNonEmpty(const Chain& chain, const PlaybackItem& item) {
    for (const auto& extract : chain) {
        const QString value = extract(item);
        if (!value.trimmed().isEmpty()) {
            return value;
        }
    }
    return QString();
}

}
