#ifndef PLEXCATALOG_H
#define PLEXCATALOG_H

#include <QUrl>
#include <QByteArray>
#include <QList>
#include <QPair>
#include "backend/catalog/IMediaCatalog.h"

class HttpClient;

/**
 * @brief IMediaCatalog backed by the Plex Media Server HTTP API.
 *
 * All responses are requested as JSON. The parse helpers are static so that
 * payloads captured from a server can be checked without a network.
 */
class PlexCatalog : public IMediaCatalog {
public:
    PlexCatalog(const QUrl& serverUrl, HttpClient* http);
    ~PlexCatalog() override = default;

    CatalogResult<QList<PlaybackItem>> currentlyPlaying() override;
    CatalogResult<QList<LibraryItem>> recentlyAdded(int limit) override;
    ShowLookup resolveShow(const QString& ratingKey) override;
    CatalogResult<QHash<QString, int>> libraryCounts(const QStringList& sectionNames) override;
    QString transcodeImageUrl(const QString& sourcePath, int width, int height) const override;

    // Payload parsers. Return false and fill errorMessage on malformed input.
    static bool parseSessions(const QByteArray& payload, QList<PlaybackItem>* items, QString* errorMessage = nullptr);
    static bool parseLibraryItems(const QByteArray& payload, QList<LibraryItem>* items, QString* errorMessage = nullptr);
    static bool parseShow(const QByteArray& payload, ShowMetadata* show, QString* errorMessage = nullptr);
    static bool parseSeasonCounts(const QByteArray& payload, int* seasons, int* episodes, QString* errorMessage = nullptr);
    static bool parseSections(const QByteArray& payload, QHash<QString, QString>* titleToKey, QString* errorMessage = nullptr);
    static bool parseTotalSize(const QByteArray& payload, int* total, QString* errorMessage = nullptr);

private:
    QUrl endpoint(const QString& path, const QList<QPair<QString, QString>>& query = {}) const;
    bool fetch(const QUrl& url, QByteArray* payload, QString* errorMessage);

    QUrl m_serverUrl;
    HttpClient* m_http;
};

#endif // PLEXCATALOG_H
