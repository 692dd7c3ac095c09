#ifndef IMEDIACATALOG_H
#define IMEDIACATALOG_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QHash>
#include <utility>
#include "backend/domain/models/PlaybackItem.h"
#include "backend/domain/models/LibraryItem.h"
#include "backend/errors/KioskError.h"

/**
 * @brief Either a value or the reason it could not be produced.
 */
template <typename T>
struct CatalogResult {
    T value{};
    KioskError error;

    bool ok() const { return !error.isError(); }

    static CatalogResult success(T v) {
        CatalogResult result;
        result.value = std::move(v);
        return result;
    }
    static CatalogResult failure(KioskError e) {
        CatalogResult result;
        result.error = std::move(e);
        return result;
    }
};

using ShowLookup = CatalogResult<ShowMetadata>;

/**
 * @brief Read-only view of the media server used by the display loop.
 *
 * Implementations block until the answer is available (or their timeout
 * expires) and report failures through the result, never by throwing.
 */
class IMediaCatalog {
public:
    virtual ~IMediaCatalog() = default;

    virtual CatalogResult<QList<PlaybackItem>> currentlyPlaying() = 0;
    virtual CatalogResult<QList<LibraryItem>> recentlyAdded(int limit) = 0;
    virtual ShowLookup resolveShow(const QString& ratingKey) = 0;
    // Section title -> item count. Unknown sections are absent from the map.
    virtual CatalogResult<QHash<QString, int>> libraryCounts(const QStringList& sectionNames) = 0;
    // Builds an absolute URL that asks the server for a resized copy of a server-relative image path.
    virtual QString transcodeImageUrl(const QString& sourcePath, int width, int height) const = 0;
};

#endif // IMEDIACATALOG_H
