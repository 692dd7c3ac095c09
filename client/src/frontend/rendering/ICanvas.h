#ifndef ICANVAS_H
#define ICANVAS_H

#include <QColor>
#include <QImage>
#include <QPoint>
#include <QRect>
#include <QSize>
#include <QString>

enum class FontRole {
    Title,
    Body,
    Clock
};

/**
 * @brief Minimal 2D drawing surface used by the slide renderer.
 *
 * Draw calls compose into a back buffer; nothing becomes visible until
 * present(). Text positions are the top-left corner of the text box.
 */
class ICanvas {
public:
    virtual ~ICanvas() = default;

    virtual QSize size() const = 0;

    virtual void clear(const QColor& color) = 0;
    // Scales the image into target
    virtual void drawImage(const QImage& image, const QRect& target) = 0;
    virtual void drawRect(const QRect& rect, const QColor& color, int alpha) = 0;
    virtual void drawText(const QString& text, FontRole role, const QPoint& topLeft, const QColor& color) = 0;

    virtual int measureText(const QString& text, FontRole role) const = 0;
    virtual int lineHeight(FontRole role) const = 0;

    // Returns false when the frame could not be shown (unusable display surface)
    virtual bool present() = 0;
};

#endif // ICANVAS_H
