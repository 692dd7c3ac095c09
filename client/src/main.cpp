#include <QApplication>
#include <QCommandLineParser>
#include <QTimer>
#include <QDebug>
#include <csignal>
#include <memory>
#include "backend/AppContext.h"
#include "backend/catalog/PlexCatalog.h"
#include "backend/config/KioskSettings.h"
#include "backend/controllers/DisplayLoop.h"
#include "backend/media/ImageFetcher.h"
#include "backend/network/HttpClient.h"
#include "frontend/rendering/QtCanvas.h"
#include "frontend/ui/KioskWindow.h"
#include "platform/ForegroundHint.h"

namespace {
constexpr int kExitConfigError = 1;

volatile std::sig_atomic_t gTerminationRequested = 0;

void onTerminationSignal(int) {
    gTerminationRequested = 1;
}
}

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);

    app.setApplicationName("Marquee");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Marquee");

    QCommandLineParser parser;
    parser.setApplicationDescription("Now playing and recently added kiosk for a Plex server");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList() << "c" << "config",
                                    "Path to the kiosk configuration file.", "path");
    parser.addOption(configOption);
    parser.process(app);

    KioskSettings settings;
    KioskError error;
    const QString configPath = KioskSettings::resolveConfigPath(parser.value(configOption));
    if (!settings.load(configPath, &error)) {
        qCritical() << "Marquee: Cannot start -" << error;
        return kExitConfigError;
    }
    const KioskConfig& config = settings.config();
    qInfo() << "Marquee: Using configuration" << settings.sourcePath() << "server" << config.serverUrl.toString();

    // The loop decides when to exit, not the last window
    app.setQuitOnLastWindowClosed(false);

    KioskWindow window(config.screenSize, config.fullscreen);

    auto http = std::make_unique<HttpClient>(config.authToken, config.requestTimeoutMs);
    auto catalog = std::make_unique<PlexCatalog>(config.serverUrl, http.get());
    auto images = std::make_unique<ImageFetcher>(http.get(), static_cast<qint64>(config.imageCacheSeconds) * 1000);

    auto canvas = std::make_unique<QtCanvas>(config.screenSize, config.fontFamily, &window);
    QString canvasError;
    if (!canvas->initialize(&canvasError)) {
        qCritical() << "Marquee: Cannot start -"
                    << KioskError(KioskError::RenderBackendError, "initialize", QString(), canvasError);
        return DisplayLoop::kExitRenderFailure;
    }

    std::unique_ptr<IForegroundHint> foregroundHint;
    if (config.raiseWindow) {
        foregroundHint = std::make_unique<WidgetForegroundHint>(&window);
    }

    AppContext context(config, std::move(catalog), std::move(images), std::move(canvas),
                       std::move(foregroundHint), std::move(http));
    DisplayLoop loop(&context);

    QObject::connect(&window, &KioskWindow::quitRequested, &loop, &DisplayLoop::requestStop);

    std::signal(SIGINT, onTerminationSignal);
    std::signal(SIGTERM, onTerminationSignal);
    QTimer signalPoll;
    QObject::connect(&signalPoll, &QTimer::timeout, &loop, [&loop]() {
        if (gTerminationRequested) {
            loop.requestStop();
        }
    });
    signalPoll.start(DisplayLoop::kCancelCheckIntervalMs);

    window.showKiosk();
    const int exitCode = loop.run();
    qInfo() << "Marquee: Exiting with code" << exitCode;
    return exitCode;
}
