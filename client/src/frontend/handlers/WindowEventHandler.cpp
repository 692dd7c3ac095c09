#include "frontend/handlers/WindowEventHandler.h"
#include "frontend/ui/KioskWindow.h"
#include <QDebug>

WindowEventHandler::WindowEventHandler(KioskWindow* window, QObject* parent)
    : QObject(parent)
    , m_window(window)
{
}

bool WindowEventHandler::isQuitKey(int key) {
    return key == Qt::Key_Escape || key == Qt::Key_Q;
}

void WindowEventHandler::handleCloseEvent(QCloseEvent* event) {
    // The display loop owns shutdown; the window only asks
    qInfo() << "WindowEventHandler: Window close requested";
    event->accept();
    emit quitRequested();
}

bool WindowEventHandler::handleKeyPressEvent(QKeyEvent* event) {
    if (!isQuitKey(event->key())) {
        return false;
    }
    qInfo() << "WindowEventHandler: Quit key pressed";
    event->accept();
    emit quitRequested();
    return true;
}

void WindowEventHandler::handleChangeEvent(QEvent* event) {
    if (event->type() != QEvent::WindowStateChange || !m_window) {
        return;
    }
    const bool minimized = (m_window->windowState() & Qt::WindowMinimized);
    if (minimized != m_minimized) {
        m_minimized = minimized;
        qDebug() << "WindowEventHandler: Window" << (minimized ? "minimized" : "restored");
    }
}
