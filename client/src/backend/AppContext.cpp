#include "backend/AppContext.h"
#include <utility>

AppContext::AppContext(const KioskConfig& config,
                       std::unique_ptr<IMediaCatalog> catalog,
                       std::unique_ptr<ImageFetcher> imageFetcher,
                       std::unique_ptr<ICanvas> canvas,
                       std::unique_ptr<IForegroundHint> foregroundHint,
                       std::unique_ptr<HttpClient> http)
    : m_config(config)
    , m_http(std::move(http))
    , m_catalog(std::move(catalog))
    , m_imageFetcher(std::move(imageFetcher))
    , m_canvas(std::move(canvas))
    , m_foregroundHint(std::move(foregroundHint))
{
    if (!m_foregroundHint) {
        m_foregroundHint = std::make_unique<NullForegroundHint>();
    }
}
