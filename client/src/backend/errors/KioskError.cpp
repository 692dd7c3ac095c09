#include "backend/errors/KioskError.h"

QString KioskError::kindName(Kind kind) {
    switch (kind) {
    case None: return QStringLiteral("None");
    case ConfigError: return QStringLiteral("ConfigError");
    case CatalogQueryError: return QStringLiteral("CatalogQueryError");
    case ImageFetchError: return QStringLiteral("ImageFetchError");
    case MetadataResolutionError: return QStringLiteral("MetadataResolutionError");
    case RenderBackendError: return QStringLiteral("RenderBackendError");
    }
    return QStringLiteral("Unknown");
}

QString KioskError::toString() const {
    QString text = QStringLiteral("%1 in %2").arg(kindName(kind), operation.isEmpty() ? QStringLiteral("?") : operation);
    if (!identifier.isEmpty()) {
        text += QStringLiteral(" [%1]").arg(identifier);
    }
    if (!cause.isEmpty()) {
        text += QStringLiteral(": %1").arg(cause);
    }
    return text;
}

QDebug operator<<(QDebug debug, const KioskError& error) {
    QDebugStateSaver saver(debug);
    debug.noquote() << error.toString();
    return debug;
}
