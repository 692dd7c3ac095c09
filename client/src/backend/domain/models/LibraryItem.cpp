#include "backend/domain/models/LibraryItem.h"
#include <QJsonValue>
#include <QVariant>

QString LibraryItem::owningShowKey() const {
    switch (kind) {
    case Show: return ratingKey;
    case Season: return parentRatingKey;
    default: return QString();
    }
}

LibraryItem::Kind LibraryItem::kindFromString(const QString& type) {
    if (type == "movie") return Movie;
    if (type == "show") return Show;
    if (type == "season") return Season;
    if (type == "episode") return Episode;
    return Other;
}

QString LibraryItem::kindName(Kind kind) {
    switch (kind) {
    case Movie: return QStringLiteral("movie");
    case Show: return QStringLiteral("show");
    case Season: return QStringLiteral("season");
    case Episode: return QStringLiteral("episode");
    case Other: break;
    }
    return QStringLiteral("other");
}

LibraryItem LibraryItem::fromJson(const QJsonObject& json) {
    LibraryItem item;
    // ratingKey is a string in JSON responses but tolerate numbers
    item.ratingKey = json.value("ratingKey").toVariant().toString();
    item.parentRatingKey = json.value("parentRatingKey").toVariant().toString();
    item.title = json.value("title").toString();
    item.kind = kindFromString(json.value("type").toString());
    item.summary = json.value("summary").toString();
    item.thumb = json.value("thumb").toString();
    item.art = json.value("art").toString();
    return item;
}

ShowMetadata ShowMetadata::fromJson(const QJsonObject& json) {
    ShowMetadata show;
    show.ratingKey = json.value("ratingKey").toVariant().toString();
    show.title = json.value("title").toString();
    show.summary = json.value("summary").toString();
    show.art = json.value("art").toString();
    // Counts are filled from the season children by the catalog
    return show;
}
