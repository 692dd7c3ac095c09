#ifndef KIOSKSETTINGS_H
#define KIOSKSETTINGS_H

#include <QString>
#include <QSize>
#include <QUrl>
#include <QtGlobal>
#include "backend/errors/KioskError.h"

/**
 * @brief Slide rotation timing, fixed for the process lifetime.
 */
struct DwellConfig {
    // One day
    static constexpr double kMaxDisplaySeconds = 86400.0;

    double displaySeconds = 0.0;
    QString timeFormat;     // strftime style, e.g. "%H:%M"
    int recentItemCount = 0;

    qint64 displayMs() const { return qRound64(displaySeconds * 1000.0); }
};

struct KioskConfig {
    QUrl serverUrl;
    QString authToken;
    DwellConfig dwell;

    // Optional keys
    QSize screenSize = QSize(800, 480);
    bool fullscreen = false;
    QString fontFamily = QStringLiteral("Arial");
    int requestTimeoutMs = 10000;
    int imageCacheSeconds = 0;
    QString movieSection = QStringLiteral("Movies");
    QString showSection = QStringLiteral("TV Shows");
    bool raiseWindow = false;
};

/**
 * @brief Loads the kiosk configuration from an INI file.
 *
 * All keys live in the [kiosk] group. The file is read exactly once at
 * startup; a missing or invalid required key is a ConfigError and the
 * process does not start.
 */
class KioskSettings {
public:
    KioskSettings() = default;

    bool load(const QString& path, KioskError* error = nullptr);

    const KioskConfig& config() const { return m_config; }
    QString sourcePath() const { return m_sourcePath; }

    // Resolution order: explicit path, MARQUEE_CONFIG, AppConfigLocation/marquee.ini
    static QString resolveConfigPath(const QString& explicitPath);

private:
    KioskConfig m_config;
    QString m_sourcePath;
};

#endif // KIOSKSETTINGS_H
