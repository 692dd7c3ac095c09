#include "backend/controllers/DisplayLoop.h"
#include "backend/AppContext.h"
#include "backend/util/TimeFormat.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QThread>
#include <QDebug>
#include <optional>

DisplayLoop::DisplayLoop(AppContext* context, QObject* parent)
    : QObject(parent)
    , m_context(context)
    , m_slideFactory(context->catalog(), context->config().screenSize)
    , m_renderer(context->canvas(), context->config().dwell.timeFormat)
{
}

void DisplayLoop::requestStop() {
    if (!m_stopRequested) {
        qInfo() << "DisplayLoop: Stop requested in state" << m_state;
    }
    m_stopRequested = true;
}

void DisplayLoop::setState(State state) {
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

void DisplayLoop::failRender(const QString& operation) {
    m_fatalError = KioskError(KioskError::RenderBackendError, operation, QString(),
                              QStringLiteral("frame could not be presented"));
    qCritical() << "DisplayLoop:" << m_fatalError;
    m_stopRequested = true;
}

int DisplayLoop::run() {
    qInfo() << "DisplayLoop: Starting, dwell" << m_context->config().dwell.displaySeconds << "s";
    while (!m_stopRequested) {
        if (!runCycle()) {
            break;
        }
        ++m_cyclesCompleted;
    }
    setState(State::Stopped);
    qInfo() << "DisplayLoop: Stopped after" << m_cyclesCompleted << "cycle(s)";
    return m_fatalError.isError() ? kExitRenderFailure : kExitOk;
}

bool DisplayLoop::runCycle() {
    setState(State::Polling);
    if (!m_context->foregroundHint()->bringToFront()) {
        qDebug() << "DisplayLoop: Window could not be brought to front";
    }

    QList<PlaybackItem> playing;
    const QList<Slide> slides = pollSlides(&playing);
    if (m_stopRequested) return false;

    setState(State::Rotating);
    for (int i = 0; i < slides.size(); ++i) {
        if (!presentSlide(slides.at(i))) return false;
        emit slidePresented(i, slides.at(i).title);
        if (!dwell()) return false;
    }

    setState(State::Idle);
    if (!presentIdle(playing.size())) return false;
    emit idlePresented();
    return dwell();
}

QList<Slide> DisplayLoop::pollSlides(QList<PlaybackItem>* playing) {
    IMediaCatalog* catalog = m_context->catalog();

    auto sessions = catalog->currentlyPlaying();
    if (!sessions.ok()) {
        qWarning() << "DisplayLoop: Treating as nothing playing -" << sessions.error;
    } else {
        *playing = sessions.value;
    }
    if (!playing->isEmpty()) {
        return m_slideFactory.fromPlaybackItems(*playing, QDateTime::currentDateTime());
    }

    auto recent = catalog->recentlyAdded(m_context->config().dwell.recentItemCount);
    if (!recent.ok()) {
        qWarning() << "DisplayLoop: No recently added items this cycle -" << recent.error;
        return {};
    }
    // Quit requests are delivered while show lookups wait on the server
    return m_slideFactory.fromLibraryItems(recent.value, [this]() { return m_stopRequested; });
}

bool DisplayLoop::presentSlide(const Slide& slide) {
    ImageFetcher* images = m_context->imageFetcher();
    std::optional<QImage> fanart;
    std::optional<QImage> poster;
    if (images) {
        if (slide.fanartUrl) fanart = images->fetch(*slide.fanartUrl);
        if (slide.posterUrl) poster = images->fetch(*slide.posterUrl);
    }
    qDebug() << "DisplayLoop: Showing" << slide.title
             << "fanart:" << fanart.has_value() << "poster:" << poster.has_value();

    if (!m_renderer.drawSlide(slide, fanart, poster)) {
        failRender("drawSlide");
        return false;
    }
    return true;
}

bool DisplayLoop::presentIdle(int playingCount) {
    const KioskConfig& config = m_context->config();

    IdleSummary summary;
    summary.clockText = TimeFormat::formatStrftime(QDateTime::currentDateTime(), config.dwell.timeFormat);
    // Count from this cycle's sessions query
    summary.playingCount = playingCount;

    auto counts = m_context->catalog()->libraryCounts({config.movieSection, config.showSection});
    if (counts.ok()) {
        if (counts.value.contains(config.movieSection)) summary.movieCount = counts.value.value(config.movieSection);
        if (counts.value.contains(config.showSection)) summary.showCount = counts.value.value(config.showSection);
    } else {
        qWarning() << "DisplayLoop: Library counts unavailable -" << counts.error;
    }

    qDebug() << "DisplayLoop: Idle screen" << summary.clockText
             << "movies:" << (summary.movieCount ? *summary.movieCount : -1)
             << "shows:" << (summary.showCount ? *summary.showCount : -1)
             << "playing:" << summary.playingCount;

    if (!m_renderer.drawIdle(summary)) {
        failRender("drawIdle");
        return false;
    }
    return true;
}

bool DisplayLoop::dwell() {
    const qint64 durationMs = m_context->config().dwell.displayMs();
    QElapsedTimer timer;
    timer.start();
    while (!m_stopRequested) {
        const qint64 remaining = durationMs - timer.elapsed();
        if (remaining <= 0) {
            return true;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents);
        if (m_stopRequested) {
            break;
        }
        QThread::msleep(static_cast<unsigned long>(qMin<qint64>(remaining, kCancelCheckIntervalMs)));
    }
    return false;
}
