#ifndef QTCANVAS_H
#define QTCANVAS_H

#include <QImage>
#include <QFont>
#include <QHash>
#include <QPointer>
#include "frontend/rendering/ICanvas.h"

class KioskWindow;

/**
 * @brief ICanvas on top of a QImage back buffer.
 *
 * Every draw call paints into the back buffer with QPainter. present()
 * hands a copy of the finished frame to the kiosk window. Without a window
 * (offscreen use) present() only keeps the frame.
 */
class QtCanvas : public ICanvas {
public:
    QtCanvas(const QSize& size, const QString& fontFamily, KioskWindow* window = nullptr);
    ~QtCanvas() override = default;

    // Allocates the back buffer; false means the display surface is unusable
    bool initialize(QString* errorMessage = nullptr);

    QSize size() const override { return m_size; }
    void clear(const QColor& color) override;
    void drawImage(const QImage& image, const QRect& target) override;
    void drawRect(const QRect& rect, const QColor& color, int alpha) override;
    void drawText(const QString& text, FontRole role, const QPoint& topLeft, const QColor& color) override;
    int measureText(const QString& text, FontRole role) const override;
    int lineHeight(FontRole role) const override;
    bool present() override;

    const QImage& lastPresentedFrame() const { return m_presented; }

private:
    const QFont& font(FontRole role) const;

    QSize m_size;
    QString m_fontFamily;
    QPointer<KioskWindow> m_window;
    bool m_hadWindow;
    QImage m_backBuffer;
    QImage m_presented;
    QHash<int, QFont> m_fonts;
};

#endif // QTCANVAS_H
