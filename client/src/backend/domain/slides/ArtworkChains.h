#ifndef ARTWORKCHAINS_H
#define ARTWORKCHAINS_H

#include <QString>
#include <QVector>
#include <functional>
#include "backend/domain/models/PlaybackItem.h"

/**
 * Ordered candidate lists for picking artwork off a playback session.
 * The first extractor that yields a non-empty path wins.
 */
namespace ArtworkChains {

using Extractor = std::function<QString(const PlaybackItem&)>;
using Chain = QVector<Extractor>;

// Episode background: show art, then season art, then the episode's own art
const Chain& episodeFanart();
// Episode poster: show poster, then the episode thumbnail
const Chain& episodePoster();
// Movie background: its art, then its poster
const Chain& movieFanart();
const Chain& moviePoster();

QString firstNonEmpty(const Chain& chain, const PlaybackItem& item);

}

#endif // ARTWORKCHAINS_H
