#include "frontend/ui/KioskWindow.h"
#include "frontend/handlers/WindowEventHandler.h"
#include "frontend/ui/theme/KioskPalette.h"
#include <QPainter>
#include <QPaintEvent>
#include <QKeyEvent>
#include <QCloseEvent>

KioskWindow::KioskWindow(const QSize& screenSize, bool fullscreen, QWidget* parent)
    : QWidget(parent)
    , m_eventHandler(new WindowEventHandler(this, this))
    , m_fullscreen(fullscreen)
{
    setWindowTitle(QStringLiteral("Plex Now Playing"));
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setCursor(Qt::BlankCursor);
    if (!m_fullscreen) {
        setFixedSize(screenSize);
    }
    connect(m_eventHandler, &WindowEventHandler::quitRequested, this, &KioskWindow::quitRequested);
}

void KioskWindow::showKiosk() {
    if (m_fullscreen) {
        showFullScreen();
    } else {
        show();
    }
}

void KioskWindow::showFrame(const QImage& frame) {
    m_frame = frame;
    // Synchronous: the display loop does not return to an event loop between frames
    repaint();
}

void KioskWindow::paintEvent(QPaintEvent* event) {
    Q_UNUSED(event);
    QPainter painter(this);
    if (m_frame.isNull()) {
        painter.fillRect(rect(), KioskPalette::gBackgroundColor);
        return;
    }
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.drawImage(rect(), m_frame);
}

void KioskWindow::keyPressEvent(QKeyEvent* event) {
    if (!m_eventHandler->handleKeyPressEvent(event)) {
        QWidget::keyPressEvent(event);
    }
}

void KioskWindow::closeEvent(QCloseEvent* event) {
    m_eventHandler->handleCloseEvent(event);
}

void KioskWindow::changeEvent(QEvent* event) {
    m_eventHandler->handleChangeEvent(event);
    QWidget::changeEvent(event);
}
