#ifndef SLIDE_H
#define SLIDE_H

#include <QString>
#include <QDateTime>
#include <optional>

/**
 * @brief Render-ready view of one playback session or library entry.
 *
 * Slides are plain values rebuilt every poll cycle. Playback slides carry
 * playbackInfo, show and season slides carry seasonEpisodeInfo, movie
 * library slides carry neither.
 */
struct Slide {
    enum Source { Playback, Library };

    struct SeasonEpisodeInfo {
        int seasons = 0;
        int episodes = 0;
    };

    struct PlaybackInfo {
        QString viewer;
        QString mode;           // "Direct Play" or "Transcoding"
        QDateTime estimatedEnd;
    };

    Source source = Library;
    QString title;
    QString description;        // never empty, see kNoDescription
    std::optional<QString> posterUrl;
    std::optional<QString> fanartUrl;
    std::optional<SeasonEpisodeInfo> seasonEpisodeInfo;
    std::optional<PlaybackInfo> playbackInfo;

    static const char* const kNoDescription;
    static const char* const kDescriptionNotAvailable;
    static const char* const kUnknownUser;
    static const char* const kDirectPlay;
    static const char* const kTranscoding;
};

#endif // SLIDE_H
