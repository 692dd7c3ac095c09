#ifndef FOREGROUNDHINT_H
#define FOREGROUNDHINT_H

#include <QPointer>

class QWidget;

/**
 * Asks the window system to put the kiosk in front of other windows.
 * A hint only: callers must not depend on it succeeding.
 */
class IForegroundHint {
public:
    virtual ~IForegroundHint() = default;
    virtual bool bringToFront() = 0;
};

// Default: does nothing
class NullForegroundHint : public IForegroundHint {
public:
    bool bringToFront() override { return true; }
};

// Restores a minimized window, raises it and requests activation
class WidgetForegroundHint : public IForegroundHint {
public:
    explicit WidgetForegroundHint(QWidget* window);
    bool bringToFront() override;

private:
    QPointer<QWidget> m_window;
};

#endif // FOREGROUNDHINT_H
