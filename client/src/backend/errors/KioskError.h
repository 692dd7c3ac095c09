#ifndef KIOSKERROR_H
#define KIOSKERROR_H

#include <QString>
#include <QDebug>

/**
 * @brief Describes a failure somewhere in the kiosk pipeline.
 *
 * Only ConfigError and RenderBackendError are fatal. The other kinds are
 * logged where they happen and the affected slide or cycle degrades.
 */
struct KioskError {
    enum Kind {
        None,
        ConfigError,
        CatalogQueryError,
        ImageFetchError,
        MetadataResolutionError,
        RenderBackendError
    };

    Kind kind = None;
    QString operation;   // e.g. "currentlyPlaying", "fetchImage"
    QString identifier;  // URL, rating key, config key...
    QString cause;

    KioskError() = default;
    KioskError(Kind k, const QString& op, const QString& id, const QString& why)
        : kind(k), operation(op), identifier(id), cause(why) {}

    bool isError() const { return kind != None; }
    bool isFatal() const { return kind == ConfigError || kind == RenderBackendError; }

    static QString kindName(Kind kind);
    QString toString() const;
};

QDebug operator<<(QDebug debug, const KioskError& error);

#endif // KIOSKERROR_H
