#include "platform/ForegroundHint.h"
#include <QWidget>
#include <QDebug>

WidgetForegroundHint::WidgetForegroundHint(QWidget* window)
    : m_window(window)
{
}

bool WidgetForegroundHint::bringToFront() {
    if (!m_window) {
        qDebug() << "WidgetForegroundHint: No window to raise";
        return false;
    }

    if (m_window->windowState() & Qt::WindowMinimized) {
        m_window->setWindowState(m_window->windowState() & ~Qt::WindowMinimized);
        if (m_window->isFullScreen()) {
            m_window->showFullScreen();
        } else {
            m_window->showNormal();
        }
    }
    if (!m_window->isVisible()) {
        m_window->show();
    }
    m_window->raise();
    m_window->activateWindow();

    // Most window managers refuse focus stealing; report what we got
    const bool active = m_window->isActiveWindow();
    if (!active) {
        qDebug() << "WidgetForegroundHint: Window raised but not activated";
    }
    return active;
}
