#include "backend/domain/models/PlaybackItem.h"
#include <QJsonArray>
#include <QJsonValue>
#include <QVariant>
#include <QtGlobal>

namespace {
// Plex sends numbers as JSON numbers, older servers occasionally as strings
qint64 readMillis(const QJsonObject& json, const QString& key) {
    const QJsonValue value = json.value(key);
    if (value.isString()) {
        return value.toString().toLongLong();
    }
    return static_cast<qint64>(value.toDouble(0));
}
}

qint64 PlaybackItem::remainingMs() const {
    return qMax<qint64>(0, durationMs - positionMs);
}

QDateTime PlaybackItem::estimatedEndTime(const QDateTime& now) const {
    // Round to the nearest whole second
    const qint64 remainingSecs = (remainingMs() + 500) / 1000;
    return now.addSecs(remainingSecs);
}

PlaybackItem::Kind PlaybackItem::kindFromString(const QString& type) {
    if (type == "movie") return Movie;
    if (type == "episode") return Episode;
    return Other;
}

PlaybackItem PlaybackItem::fromJson(const QJsonObject& json) {
    PlaybackItem item;
    item.ratingKey = json.value("ratingKey").toVariant().toString();
    item.title = json.value("title").toString();
    item.kind = kindFromString(json.value("type").toString());
    item.grandparentTitle = json.value("grandparentTitle").toString();
    item.summary = json.value("summary").toString();
    item.art = json.value("art").toString();
    item.parentArt = json.value("parentArt").toString();
    item.grandparentArt = json.value("grandparentArt").toString();
    item.thumb = json.value("thumb").toString();
    item.grandparentThumb = json.value("grandparentThumb").toString();

    // "User" is a single object on current servers, an array on some older ones
    const QJsonValue user = json.value("User");
    if (user.isObject()) {
        const QString name = user.toObject().value("title").toString();
        if (!name.isEmpty()) item.usernames.append(name);
    } else if (user.isArray()) {
        for (const auto& entry : user.toArray()) {
            const QString name = entry.toObject().value("title").toString();
            if (!name.isEmpty()) item.usernames.append(name);
        }
    }

    const QJsonValue transcode = json.value("TranscodeSession");
    item.transcoding = (transcode.isObject() && !transcode.toObject().isEmpty())
                       || (transcode.isArray() && !transcode.toArray().isEmpty());

    item.durationMs = qMax<qint64>(0, readMillis(json, "duration"));
    item.positionMs = qBound<qint64>(0, readMillis(json, "viewOffset"), item.durationMs);
    return item;
}
