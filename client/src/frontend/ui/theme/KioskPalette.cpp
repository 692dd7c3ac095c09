#include "frontend/ui/theme/KioskPalette.h"

namespace KioskPalette {

// ============================================================================
// COLORS
// ============================================================================

QColor gBackgroundColor = QColor(0, 0, 0);
QColor gOverlayColor = QColor(0, 0, 0);
int gOverlayAlpha = 128;                    // 50% black over the fanart
QColor gTextColor = QColor(255, 255, 255);
QColor gShadowColor = QColor(0, 0, 0);

// ============================================================================
// TYPOGRAPHY
// ============================================================================

int gTitleFontSizePx = 30;
int gBodyFontSizePx = 25;
int gClockFontSizePx = 80;

QFont fontFor(FontRole role, const QString& family) {
    QFont font(family);
    font.setStyleHint(QFont::SansSerif);
    switch (role) {
    case FontRole::Title:
        font.setPixelSize(gTitleFontSizePx);
        font.setBold(true);
        break;
    case FontRole::Body:
        font.setPixelSize(gBodyFontSizePx);
        break;
    case FontRole::Clock:
        font.setPixelSize(gClockFontSizePx);
        break;
    }
    return font;
}

} // namespace KioskPalette
