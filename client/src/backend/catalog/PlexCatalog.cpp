#include "backend/catalog/PlexCatalog.h"
#include "backend/network/HttpClient.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonValue>
#include <QUrlQuery>
#include <QVariant>
#include <QDebug>

namespace {

bool readContainer(const QByteArray& payload, QJsonObject* container, QString* errorMessage) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage) *errorMessage = QStringLiteral("invalid JSON: %1").arg(parseError.errorString());
        return false;
    }
    const QJsonValue value = doc.object().value("MediaContainer");
    if (!value.isObject()) {
        if (errorMessage) *errorMessage = QStringLiteral("response has no MediaContainer");
        return false;
    }
    *container = value.toObject();
    return true;
}

// Empty containers omit the array entirely
QJsonArray childArray(const QJsonObject& container, const QString& key) {
    return container.value(key).toArray();
}

int readInt(const QJsonValue& value) {
    if (value.isString()) return value.toString().toInt();
    return value.toInt(0);
}

const QString CONTAINER_START = QStringLiteral("X-Plex-Container-Start");
const QString CONTAINER_SIZE = QStringLiteral("X-Plex-Container-Size");

}

PlexCatalog::PlexCatalog(const QUrl& serverUrl, HttpClient* http)
    : m_serverUrl(serverUrl)
    , m_http(http)
{
}

QUrl PlexCatalog::endpoint(const QString& path, const QList<QPair<QString, QString>>& query) const {
    QUrl url(m_serverUrl);
    QString basePath = url.path();
    if (basePath.endsWith('/')) basePath.chop(1);
    url.setPath(basePath + path);
    if (!query.isEmpty()) {
        QUrlQuery q;
        q.setQueryItems(query);
        url.setQuery(q);
    }
    return url;
}

bool PlexCatalog::fetch(const QUrl& url, QByteArray* payload, QString* errorMessage) {
    if (!m_http) {
        if (errorMessage) *errorMessage = QStringLiteral("no HTTP client");
        return false;
    }
    return m_http->get(url, payload, errorMessage);
}

CatalogResult<QList<PlaybackItem>> PlexCatalog::currentlyPlaying() {
    using Result = CatalogResult<QList<PlaybackItem>>;
    QByteArray payload;
    QString error;
    QList<PlaybackItem> items;
    if (!fetch(endpoint("/status/sessions"), &payload, &error) || !parseSessions(payload, &items, &error)) {
        return Result::failure(KioskError(KioskError::CatalogQueryError, "currentlyPlaying", "/status/sessions", error));
    }
    qDebug() << "PlexCatalog: Currently playing:" << items.size() << "session(s)";
    return Result::success(items);
}

CatalogResult<QList<LibraryItem>> PlexCatalog::recentlyAdded(int limit) {
    using Result = CatalogResult<QList<LibraryItem>>;
    QByteArray payload;
    QString error;
    QList<LibraryItem> items;
    const QUrl url = endpoint("/library/recentlyAdded", {{CONTAINER_START, "0"}, {CONTAINER_SIZE, QString::number(limit)}});
    if (!fetch(url, &payload, &error) || !parseLibraryItems(payload, &items, &error)) {
        return Result::failure(KioskError(KioskError::CatalogQueryError, "recentlyAdded", "/library/recentlyAdded", error));
    }
    // Older servers ignore the container size hint
    if (limit >= 0 && items.size() > limit) {
        items = items.mid(0, limit);
    }
    qDebug() << "PlexCatalog: Recently added:" << items.size() << "item(s)";
    return Result::success(items);
}

ShowLookup PlexCatalog::resolveShow(const QString& ratingKey) {
    if (ratingKey.isEmpty()) {
        return ShowLookup::failure(KioskError(KioskError::MetadataResolutionError, "resolveShow", QString(), "no rating key"));
    }

    const QString path = QStringLiteral("/library/metadata/%1").arg(ratingKey);
    QByteArray payload;
    QString error;
    ShowMetadata show;
    if (!fetch(endpoint(path), &payload, &error) || !parseShow(payload, &show, &error)) {
        return ShowLookup::failure(KioskError(KioskError::MetadataResolutionError, "resolveShow", ratingKey, error));
    }

    QByteArray childrenPayload;
    if (!fetch(endpoint(path + "/children"), &childrenPayload, &error)
        || !parseSeasonCounts(childrenPayload, &show.seasonCount, &show.episodeCount, &error)) {
        return ShowLookup::failure(KioskError(KioskError::MetadataResolutionError, "resolveShowSeasons", ratingKey, error));
    }

    qDebug() << "PlexCatalog: Resolved show" << ratingKey << show.title
             << "seasons:" << show.seasonCount << "episodes:" << show.episodeCount;
    return ShowLookup::success(show);
}

CatalogResult<QHash<QString, int>> PlexCatalog::libraryCounts(const QStringList& sectionNames) {
    using Result = CatalogResult<QHash<QString, int>>;
    QByteArray payload;
    QString error;
    QHash<QString, QString> titleToKey;
    if (!fetch(endpoint("/library/sections"), &payload, &error) || !parseSections(payload, &titleToKey, &error)) {
        return Result::failure(KioskError(KioskError::CatalogQueryError, "libraryCounts", "/library/sections", error));
    }

    QHash<QString, int> counts;
    for (const QString& name : sectionNames) {
        const QString key = titleToKey.value(name);
        if (key.isEmpty()) {
            qWarning() << "PlexCatalog: Library section not found:" << name;
            continue;
        }
        const QUrl url = endpoint(QStringLiteral("/library/sections/%1/all").arg(key),
                                  {{CONTAINER_START, "0"}, {CONTAINER_SIZE, "0"}});
        QByteArray sectionPayload;
        int total = 0;
        if (!fetch(url, &sectionPayload, &error) || !parseTotalSize(sectionPayload, &total, &error)) {
            qWarning() << KioskError(KioskError::CatalogQueryError, "libraryCounts", name, error);
            continue;
        }
        counts.insert(name, total);
    }
    return Result::success(counts);
}

QString PlexCatalog::transcodeImageUrl(const QString& sourcePath, int width, int height) const {
    if (sourcePath.isEmpty()) {
        return QString();
    }
    return endpoint("/photo/:/transcode", {
        {"url", sourcePath},
        {"width", QString::number(width)},
        {"height", QString::number(height)},
        {"minSize", "1"},
        {"upscale", "1"},
    }).toString(QUrl::FullyEncoded);
}

bool PlexCatalog::parseSessions(const QByteArray& payload, QList<PlaybackItem>* items, QString* errorMessage) {
    QJsonObject container;
    if (!readContainer(payload, &container, errorMessage)) return false;
    items->clear();
    for (const auto& value : childArray(container, "Metadata")) {
        items->append(PlaybackItem::fromJson(value.toObject()));
    }
    return true;
}

bool PlexCatalog::parseLibraryItems(const QByteArray& payload, QList<LibraryItem>* items, QString* errorMessage) {
    QJsonObject container;
    if (!readContainer(payload, &container, errorMessage)) return false;
    items->clear();
    for (const auto& value : childArray(container, "Metadata")) {
        items->append(LibraryItem::fromJson(value.toObject()));
    }
    return true;
}

bool PlexCatalog::parseShow(const QByteArray& payload, ShowMetadata* show, QString* errorMessage) {
    QJsonObject container;
    if (!readContainer(payload, &container, errorMessage)) return false;
    const QJsonArray metadata = childArray(container, "Metadata");
    if (metadata.isEmpty()) {
        if (errorMessage) *errorMessage = QStringLiteral("no metadata returned");
        return false;
    }
    const QJsonObject entry = metadata.first().toObject();
    const QString type = entry.value("type").toString();
    if (type != "show") {
        if (errorMessage) *errorMessage = QStringLiteral("expected a show, got '%1'").arg(type);
        return false;
    }
    *show = ShowMetadata::fromJson(entry);
    return true;
}

bool PlexCatalog::parseSeasonCounts(const QByteArray& payload, int* seasons, int* episodes, QString* errorMessage) {
    QJsonObject container;
    if (!readContainer(payload, &container, errorMessage)) return false;
    int seasonCount = 0;
    int episodeCount = 0;
    for (const auto& value : childArray(container, "Metadata")) {
        const QJsonObject season = value.toObject();
        if (season.value("type").toString() != "season") continue;
        ++seasonCount;
        episodeCount += readInt(season.value("leafCount"));
    }
    *seasons = seasonCount;
    *episodes = episodeCount;
    return true;
}

bool PlexCatalog::parseSections(const QByteArray& payload, QHash<QString, QString>* titleToKey, QString* errorMessage) {
    QJsonObject container;
    if (!readContainer(payload, &container, errorMessage)) return false;
    titleToKey->clear();
    for (const auto& value : childArray(container, "Directory")) {
        const QJsonObject section = value.toObject();
        titleToKey->insert(section.value("title").toString(), section.value("key").toVariant().toString());
    }
    return true;
}

bool PlexCatalog::parseTotalSize(const QByteArray& payload, int* total, QString* errorMessage) {
    QJsonObject container;
    if (!readContainer(payload, &container, errorMessage)) return false;
    // totalSize is only present when paging was requested; fall back to size
    if (container.contains("totalSize")) {
        *total = readInt(container.value("totalSize"));
    } else if (container.contains("size")) {
        *total = readInt(container.value("size"));
    } else {
        if (errorMessage) *errorMessage = QStringLiteral("response has no size information");
        return false;
    }
    return true;
}
