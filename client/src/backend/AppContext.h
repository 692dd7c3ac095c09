#ifndef APPCONTEXT_H
#define APPCONTEXT_H

#include <memory>
#include "backend/config/KioskSettings.h"
#include "backend/network/HttpClient.h"
#include "backend/catalog/IMediaCatalog.h"
#include "backend/media/ImageFetcher.h"
#include "frontend/rendering/ICanvas.h"
#include "platform/ForegroundHint.h"

/**
 * @brief Everything the display loop needs, built once at startup.
 *
 * Owns the collaborators. The configuration is copied in and never changes
 * afterwards.
 */
class AppContext {
public:
    AppContext(const KioskConfig& config,
               std::unique_ptr<IMediaCatalog> catalog,
               std::unique_ptr<ImageFetcher> imageFetcher,
               std::unique_ptr<ICanvas> canvas,
               std::unique_ptr<IForegroundHint> foregroundHint = nullptr,
               std::unique_ptr<HttpClient> http = nullptr);
    ~AppContext() = default;

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    const KioskConfig& config() const { return m_config; }
    IMediaCatalog* catalog() const { return m_catalog.get(); }
    ImageFetcher* imageFetcher() const { return m_imageFetcher.get(); }
    ICanvas* canvas() const { return m_canvas.get(); }
    IForegroundHint* foregroundHint() const { return m_foregroundHint.get(); }

private:
    const KioskConfig m_config;
    // Declared first so it outlives the catalog and fetcher that use it
    std::unique_ptr<HttpClient> m_http;
    std::unique_ptr<IMediaCatalog> m_catalog;
    std::unique_ptr<ImageFetcher> m_imageFetcher;
    std::unique_ptr<ICanvas> m_canvas;
    std::unique_ptr<IForegroundHint> m_foregroundHint;
};

#endif // APPCONTEXT_H
