#ifndef DISPLAYLOOP_H
#define DISPLAYLOOP_H

#include <QObject>
#include <QList>
#include <QString>
#include "backend/domain/slides/Slide.h"
#include "backend/domain/slides/SlideFactory.h"
#include "backend/domain/models/PlaybackItem.h"
#include "backend/errors/KioskError.h"
#include "frontend/rendering/SlideRenderer.h"

class AppContext;

/**
 * @brief Drives the kiosk: Polling -> Rotating -> Idle -> Polling ...
 *
 * Runs on the GUI thread and blocks inside run() until stop is requested.
 * Dwell periods keep the Qt event queue serviced and look at the stop flag
 * every kCancelCheckIntervalMs, so a close or quit key takes effect within
 * one check interval.
 *
 * Catalog and artwork failures degrade the current cycle or slide and are
 * logged. Only a failed present() (render backend) ends the loop with an
 * error.
 */
class DisplayLoop : public QObject {
    Q_OBJECT

public:
    enum class State { Polling, Rotating, Idle, Stopped };
    Q_ENUM(State)

    static constexpr int kCancelCheckIntervalMs = 20;
    static constexpr int kExitOk = 0;
    static constexpr int kExitRenderFailure = 2;

    explicit DisplayLoop(AppContext* context, QObject* parent = nullptr);
    ~DisplayLoop() override = default;

    // Blocks until requestStop(); returns the process exit code
    int run();

    State state() const { return m_state; }
    int cyclesCompleted() const { return m_cyclesCompleted; }
    bool isStopRequested() const { return m_stopRequested; }
    const KioskError& fatalError() const { return m_fatalError; }

public slots:
    void requestStop();

signals:
    void stateChanged(DisplayLoop::State state);
    void slidePresented(int index, const QString& title);
    void idlePresented();

private:
    // One Polling/Rotating/Idle pass; false once the loop must end
    bool runCycle();
    QList<Slide> pollSlides(QList<PlaybackItem>* playing);
    bool presentSlide(const Slide& slide);
    bool presentIdle(int playingCount);
    // Waits displaySeconds; false if stop was requested meanwhile
    bool dwell();
    void setState(State state);
    void failRender(const QString& operation);

    AppContext* m_context;
    SlideFactory m_slideFactory;
    SlideRenderer m_renderer;
    State m_state = State::Polling;
    bool m_stopRequested = false;
    int m_cyclesCompleted = 0;
    KioskError m_fatalError;
};

#endif // DISPLAYLOOP_H
