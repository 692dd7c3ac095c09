#include "backend/config/KioskSettings.h"
#include <QSettings>
#include <QFileInfo>
#include <QStandardPaths>
#include <QDir>
#include <QVariant>
#include <QStringList>
#include <QDebug>

namespace {
    const QString CONFIG_GROUP = QStringLiteral("kiosk");
    const QString CONFIG_FILE_NAME = QStringLiteral("marquee.ini");

    bool fail(KioskError* error, const QString& key, const QString& cause) {
        if (error) {
            *error = KioskError(KioskError::ConfigError, QStringLiteral("loadConfig"), key, cause);
        }
        return false;
    }

    // INI values containing commas come back as a QStringList unless quoted
    QString readText(const QSettings& settings, const QString& key, const QString& fallback = QString()) {
        const QVariant value = settings.value(key, fallback);
        if (value.typeId() == QMetaType::QStringList) {
            return value.toStringList().join(QStringLiteral(", "));
        }
        return value.toString();
    }

    bool readRequiredString(const QSettings& settings, const QString& key, QString* out, KioskError* error) {
        if (!settings.contains(key)) {
            return fail(error, key, QStringLiteral("missing required key"));
        }
        const QString value = readText(settings, key).trimmed();
        if (value.isEmpty()) {
            return fail(error, key, QStringLiteral("value is empty"));
        }
        *out = value;
        return true;
    }

    bool readPositiveInt(const QSettings& settings, const QString& key, bool required, int* out, KioskError* error) {
        if (!settings.contains(key)) {
            return required ? fail(error, key, QStringLiteral("missing required key")) : true;
        }
        bool ok = false;
        const int value = settings.value(key).toString().trimmed().toInt(&ok);
        if (!ok || value <= 0) {
            return fail(error, key, QStringLiteral("expected a positive integer, got '%1'").arg(settings.value(key).toString()));
        }
        *out = value;
        return true;
    }

    bool readBool(const QSettings& settings, const QString& key, bool* out, KioskError* error) {
        if (!settings.contains(key)) {
            return true;
        }
        const QString raw = settings.value(key).toString().trimmed().toLower();
        if (raw == "true" || raw == "1" || raw == "yes" || raw == "on") {
            *out = true;
        } else if (raw == "false" || raw == "0" || raw == "no" || raw == "off") {
            *out = false;
        } else {
            return fail(error, key, QStringLiteral("expected a boolean, got '%1'").arg(raw));
        }
        return true;
    }
}

QString KioskSettings::resolveConfigPath(const QString& explicitPath) {
    if (!explicitPath.isEmpty()) {
        return explicitPath;
    }
    const QString fromEnv = qEnvironmentVariable("MARQUEE_CONFIG");
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (base.isEmpty()) base = QDir::homePath() + "/.config/Marquee";
    return base + "/" + CONFIG_FILE_NAME;
}

bool KioskSettings::load(const QString& path, KioskError* error) {
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        return fail(error, path, QStringLiteral("configuration file not found"));
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        return fail(error, path, QStringLiteral("configuration file could not be parsed"));
    }
    settings.beginGroup(CONFIG_GROUP);

    KioskConfig config;

    QString serverUrl;
    if (!readRequiredString(settings, "serverUrl", &serverUrl, error)) return false;
    config.serverUrl = QUrl(serverUrl);
    if (!config.serverUrl.isValid() || config.serverUrl.host().isEmpty()
        || (config.serverUrl.scheme() != "http" && config.serverUrl.scheme() != "https")) {
        return fail(error, "serverUrl", QStringLiteral("'%1' is not an http(s) URL").arg(serverUrl));
    }

    if (!readRequiredString(settings, "authToken", &config.authToken, error)) return false;

    if (!settings.contains("displaySeconds")) {
        return fail(error, "displaySeconds", QStringLiteral("missing required key"));
    }
    bool ok = false;
    config.dwell.displaySeconds = settings.value("displaySeconds").toString().trimmed().toDouble(&ok);
    if (!ok || !(config.dwell.displaySeconds > 0.0)) {
        return fail(error, "displaySeconds", QStringLiteral("expected a number greater than 0, got '%1'")
                    .arg(settings.value("displaySeconds").toString()));
    }
    if (config.dwell.displaySeconds > DwellConfig::kMaxDisplaySeconds) {
        return fail(error, "displaySeconds", QStringLiteral("at most %1 seconds allowed, got '%2'")
                    .arg(DwellConfig::kMaxDisplaySeconds).arg(settings.value("displaySeconds").toString()));
    }

    // Not trimmed: leading/trailing spaces are part of a strftime pattern
    config.dwell.timeFormat = readText(settings, "timeFormat");
    if (config.dwell.timeFormat.isEmpty()) {
        return fail(error, "timeFormat", QStringLiteral("missing required key"));
    }

    if (!readPositiveInt(settings, "recentItemCount", true, &config.dwell.recentItemCount, error)) return false;

    int width = config.screenSize.width();
    int height = config.screenSize.height();
    if (!readPositiveInt(settings, "screenWidth", false, &width, error)) return false;
    if (!readPositiveInt(settings, "screenHeight", false, &height, error)) return false;
    config.screenSize = QSize(width, height);

    if (!readBool(settings, "fullscreen", &config.fullscreen, error)) return false;
    if (!readBool(settings, "raiseWindow", &config.raiseWindow, error)) return false;
    if (!readPositiveInt(settings, "requestTimeoutMs", false, &config.requestTimeoutMs, error)) return false;

    if (settings.contains("imageCacheSeconds")) {
        const int cacheSeconds = settings.value("imageCacheSeconds").toString().trimmed().toInt(&ok);
        if (!ok || cacheSeconds < 0) {
            return fail(error, "imageCacheSeconds", QStringLiteral("expected a non-negative integer"));
        }
        config.imageCacheSeconds = cacheSeconds;
    }

    config.fontFamily = readText(settings, "fontFamily", config.fontFamily);
    config.movieSection = readText(settings, "movieSection", config.movieSection);
    config.showSection = readText(settings, "showSection", config.showSection);

    settings.endGroup();

    m_config = config;
    m_sourcePath = path;

    qInfo() << "KioskSettings: Loaded" << path << "- server:" << m_config.serverUrl.toString()
            << "dwell:" << m_config.dwell.displaySeconds << "s"
            << "recent items:" << m_config.dwell.recentItemCount
            << "screen:" << m_config.screenSize;
    return true;
}
