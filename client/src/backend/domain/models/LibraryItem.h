#ifndef LIBRARYITEM_H
#define LIBRARYITEM_H

#include <QString>
#include <QJsonObject>

// One entry of /library/recentlyAdded.
struct LibraryItem {
    enum Kind { Movie, Show, Season, Episode, Other };

    QString ratingKey;
    QString parentRatingKey;    // owning show for seasons
    QString title;
    Kind kind = Other;
    QString summary;
    QString thumb;
    QString art;

    // Rating key of the show whose metadata describes this item (show or season only)
    QString owningShowKey() const;

    static Kind kindFromString(const QString& type);
    static QString kindName(Kind kind);
    static LibraryItem fromJson(const QJsonObject& json);
};

// Resolved owning show of a season or show entry.
struct ShowMetadata {
    QString ratingKey;
    QString title;
    QString summary;
    QString art;
    int seasonCount = 0;
    int episodeCount = 0;

    static ShowMetadata fromJson(const QJsonObject& json);
};

#endif // LIBRARYITEM_H
