#include "frontend/rendering/SlideRenderer.h"
#include "frontend/rendering/ICanvas.h"
#include "frontend/ui/theme/KioskPalette.h"
#include "backend/text/TextLayout.h"
#include "backend/util/TimeFormat.h"
#include <QStringList>

namespace {
QString countText(const std::optional<int>& count) {
    return count ? QString::number(*count) : QStringLiteral("--");
}
}

SlideRenderer::SlideRenderer(ICanvas* canvas, const QString& timeFormat, const Layout& layout)
    : m_canvas(canvas)
    , m_timeFormat(timeFormat)
    , m_layout(layout)
{
}

QStringList SlideRenderer::descriptionLines(const QString& description) const {
    const QString text = description.isEmpty() ? QString::fromLatin1(Slide::kNoDescription) : description;
    const QStringList lines = TextLayout::wrap(text, m_layout.descriptionWidth, [this](const QString& candidate) {
        return m_canvas->measureText(candidate, FontRole::Body);
    });
    return TextLayout::truncate(lines, m_layout.maxDescriptionLines);
}

void SlideRenderer::drawShadowedTitle(const QString& title, const QPoint& topLeft) {
    const QPoint shadowPos = topLeft + QPoint(m_layout.shadowOffset, m_layout.shadowOffset);
    m_canvas->drawText(title, FontRole::Title, shadowPos, KioskPalette::gShadowColor);
    m_canvas->drawText(title, FontRole::Title, topLeft, KioskPalette::gTextColor);
}

int SlideRenderer::drawInfoRows(const QStringList& rows, int top) {
    int y = top + m_layout.blockGap;
    for (const QString& row : rows) {
        m_canvas->drawText(row, FontRole::Body, QPoint(m_layout.textLeft, y), KioskPalette::gTextColor);
        y += m_layout.blockRowHeight;
    }
    return y;
}

bool SlideRenderer::drawSlide(const Slide& slide, const std::optional<QImage>& fanart, const std::optional<QImage>& poster) {
    const QRect screen(QPoint(0, 0), m_canvas->size());

    // The clear doubles as the solid fallback when there is no fanart
    m_canvas->clear(KioskPalette::gBackgroundColor);
    if (fanart && !fanart->isNull()) {
        m_canvas->drawImage(*fanart, screen);
    }
    m_canvas->drawRect(screen, KioskPalette::gOverlayColor, KioskPalette::gOverlayAlpha);

    if (poster && !poster->isNull()) {
        m_canvas->drawImage(*poster, m_layout.posterRect);
    }

    drawShadowedTitle(slide.title, QPoint(m_layout.textLeft, m_layout.titleTop));

    int y = m_layout.descriptionTop;
    for (const QString& line : descriptionLines(slide.description)) {
        m_canvas->drawText(line, FontRole::Body, QPoint(m_layout.textLeft, y), KioskPalette::gTextColor);
        y += m_layout.lineHeight;
    }

    if (slide.seasonEpisodeInfo) {
        y = drawInfoRows({
            QStringLiteral("Seasons: %1").arg(slide.seasonEpisodeInfo->seasons),
            QStringLiteral("Episodes: %1").arg(slide.seasonEpisodeInfo->episodes),
        }, y);
    }

    if (slide.playbackInfo) {
        QStringList rows = {
            QStringLiteral("User: %1").arg(slide.playbackInfo->viewer),
            QStringLiteral("Status: %1").arg(slide.playbackInfo->mode),
        };
        const QString ends = TimeFormat::formatStrftime(slide.playbackInfo->estimatedEnd, m_timeFormat);
        if (!ends.isEmpty()) {
            rows.append(QStringLiteral("Ends: %1").arg(ends));
        }
        drawInfoRows(rows, y);
    }

    return m_canvas->present();
}

bool SlideRenderer::drawIdle(const IdleSummary& summary) {
    const QSize size = m_canvas->size();
    m_canvas->clear(KioskPalette::gBackgroundColor);

    const int clockWidth = m_canvas->measureText(summary.clockText, FontRole::Clock);
    const int clockHeight = m_canvas->lineHeight(FontRole::Clock);
    const QPoint clockPos((size.width() - clockWidth) / 2, (size.height() - clockHeight) / 2);
    m_canvas->drawText(summary.clockText, FontRole::Clock, clockPos, KioskPalette::gTextColor);

    // Reference positions 50/300/550 on an 800 px wide screen
    const int footerY = size.height() - m_layout.footerOffset;
    const auto columnX = [&size](int referenceX) { return referenceX * size.width() / 800; };
    m_canvas->drawText(QStringLiteral("Total Movies: %1").arg(countText(summary.movieCount)),
                       FontRole::Body, QPoint(columnX(50), footerY), KioskPalette::gTextColor);
    m_canvas->drawText(QStringLiteral("Total TV Shows: %1").arg(countText(summary.showCount)),
                       FontRole::Body, QPoint(columnX(300), footerY), KioskPalette::gTextColor);
    m_canvas->drawText(QStringLiteral("Currently Playing: %1").arg(summary.playingCount),
                       FontRole::Body, QPoint(columnX(550), footerY), KioskPalette::gTextColor);

    return m_canvas->present();
}
