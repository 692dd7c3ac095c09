#ifndef PLAYBACKITEM_H
#define PLAYBACKITEM_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QJsonObject>

// One active playback session as reported by /status/sessions.
struct PlaybackItem {
    enum Kind { Movie, Episode, Other };

    QString ratingKey;
    QString title;
    Kind kind = Other;
    QString grandparentTitle;   // show title for episodes
    QString summary;

    // Artwork paths (server-relative), any of which may be empty
    QString art;
    QString parentArt;
    QString grandparentArt;
    QString thumb;
    QString grandparentThumb;

    QStringList usernames;
    bool transcoding = false;

    qint64 positionMs = 0;
    qint64 durationMs = 0;

    qint64 remainingMs() const;
    QDateTime estimatedEndTime(const QDateTime& now) const;

    static Kind kindFromString(const QString& type);
    static PlaybackItem fromJson(const QJsonObject& json);
};

#endif // PLAYBACKITEM_H
