#include "frontend/rendering/QtCanvas.h"
#include "frontend/ui/KioskWindow.h"
#include "frontend/ui/theme/KioskPalette.h"
#include <QPainter>
#include <QFontMetrics>
#include <QFontInfo>
#include <QDebug>

QtCanvas::QtCanvas(const QSize& size, const QString& fontFamily, KioskWindow* window)
    : m_size(size)
    , m_fontFamily(fontFamily)
    , m_window(window)
    , m_hadWindow(window != nullptr)
{
    for (FontRole role : {FontRole::Title, FontRole::Body, FontRole::Clock}) {
        m_fonts.insert(static_cast<int>(role), KioskPalette::fontFor(role, m_fontFamily));
    }
}

bool QtCanvas::initialize(QString* errorMessage) {
    if (m_size.isEmpty()) {
        if (errorMessage) *errorMessage = QStringLiteral("invalid canvas size %1x%2").arg(m_size.width()).arg(m_size.height());
        return false;
    }
    m_backBuffer = QImage(m_size, QImage::Format_RGB32);
    if (m_backBuffer.isNull()) {
        if (errorMessage) *errorMessage = QStringLiteral("could not allocate a %1x%2 back buffer").arg(m_size.width()).arg(m_size.height());
        return false;
    }
    m_backBuffer.fill(KioskPalette::gBackgroundColor);
    qDebug() << "QtCanvas: Initialized" << m_size << "font family:" << m_fontFamily
             << "resolved to" << QFontInfo(font(FontRole::Body)).family();
    return true;
}

const QFont& QtCanvas::font(FontRole role) const {
    auto it = m_fonts.constFind(static_cast<int>(role));
    return it.value();
}

void QtCanvas::clear(const QColor& color) {
    m_backBuffer.fill(color);
}

void QtCanvas::drawImage(const QImage& image, const QRect& target) {
    if (image.isNull() || target.isEmpty()) {
        return;
    }
    QPainter painter(&m_backBuffer);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.drawImage(target, image);
}

void QtCanvas::drawRect(const QRect& rect, const QColor& color, int alpha) {
    QColor fill(color);
    fill.setAlpha(qBound(0, alpha, 255));
    QPainter painter(&m_backBuffer);
    painter.fillRect(rect, fill);
}

void QtCanvas::drawText(const QString& text, FontRole role, const QPoint& topLeft, const QColor& color) {
    if (text.isEmpty()) {
        return;
    }
    QPainter painter(&m_backBuffer);
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    painter.setFont(font(role));
    painter.setPen(color);
    const QFontMetrics fm(font(role));
    painter.drawText(topLeft.x(), topLeft.y() + fm.ascent(), text);
}

int QtCanvas::measureText(const QString& text, FontRole role) const {
    return QFontMetrics(font(role)).horizontalAdvance(text);
}

int QtCanvas::lineHeight(FontRole role) const {
    return QFontMetrics(font(role)).height();
}

bool QtCanvas::present() {
    if (m_backBuffer.isNull()) {
        qCritical() << "QtCanvas: present() without a back buffer";
        return false;
    }
    // The window was destroyed underneath us
    if (m_hadWindow && !m_window) {
        qCritical() << "QtCanvas: Kiosk window is gone";
        return false;
    }
    m_presented = m_backBuffer.copy();
    if (m_window) {
        m_window->showFrame(m_presented);
    }
    return true;
}
