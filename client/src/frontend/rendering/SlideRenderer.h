#ifndef SLIDERENDERER_H
#define SLIDERENDERER_H

#include <QImage>
#include <QPoint>
#include <QRect>
#include <QString>
#include <optional>
#include "backend/domain/slides/Slide.h"

class ICanvas;

// Numbers shown on the clock screen. Missing counts render as "--".
struct IdleSummary {
    QString clockText;
    std::optional<int> movieCount;
    std::optional<int> showCount;
    int playingCount = 0;
};

/**
 * @brief Draws the slide and idle screens.
 *
 * Each draw starts from a cleared canvas and ends with present(); nothing is
 * carried over from the previous frame. Layout coordinates are for the
 * 800x480 reference screen; the fanart and the idle screen follow the
 * actual canvas size.
 */
class SlideRenderer {
public:
    struct Layout {
        QRect posterRect = QRect(50, 90, 200, 300);
        int textLeft = 300;
        int titleTop = 90;
        int descriptionTop = 140;
        int descriptionWidth = 500;
        int lineHeight = 30;
        int maxDescriptionLines = 5;
        int shadowOffset = 1;
        int blockGap = 20;          // space between the description and the info rows
        int blockRowHeight = 30;
        int footerOffset = 80;      // idle counters, distance from the bottom edge
    };

    SlideRenderer(ICanvas* canvas, const QString& timeFormat, const Layout& layout = Layout());

    // Returns the result of ICanvas::present()
    bool drawSlide(const Slide& slide, const std::optional<QImage>& fanart, const std::optional<QImage>& poster);
    bool drawIdle(const IdleSummary& summary);

    QStringList descriptionLines(const QString& description) const;

    const Layout& layout() const { return m_layout; }

private:
    void drawShadowedTitle(const QString& title, const QPoint& topLeft);
    int drawInfoRows(const QStringList& rows, int top);

    ICanvas* m_canvas;
    QString m_timeFormat;
    Layout m_layout;
};

#endif // SLIDERENDERER_H
