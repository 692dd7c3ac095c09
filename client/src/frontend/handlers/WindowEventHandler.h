#ifndef WINDOWEVENTHANDLER_H
#define WINDOWEVENTHANDLER_H

#include <QObject>
#include <QCloseEvent>
#include <QKeyEvent>

class KioskWindow;

/**
 * @brief Handler for kiosk window lifecycle events
 *
 * Manages:
 * - Window close (turned into a quit request)
 * - Quit keys (Esc, Q)
 * - Minimize/restore tracking, logged so a stuck kiosk can be diagnosed
 */
class WindowEventHandler : public QObject {
    Q_OBJECT

public:
    explicit WindowEventHandler(KioskWindow* window, QObject* parent = nullptr);
    ~WindowEventHandler() override = default;

    void handleCloseEvent(QCloseEvent* event);
    // Returns true if the key was consumed
    bool handleKeyPressEvent(QKeyEvent* event);
    void handleChangeEvent(QEvent* event);

    bool isMinimized() const { return m_minimized; }

    static bool isQuitKey(int key);

signals:
    void quitRequested();

private:
    KioskWindow* m_window;
    bool m_minimized = false;
};

#endif // WINDOWEVENTHANDLER_H
