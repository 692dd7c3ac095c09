#ifndef KIOSKPALETTE_H
#define KIOSKPALETTE_H

#include <QColor>
#include <QFont>
#include <QString>
#include "frontend/rendering/ICanvas.h"

/**
 * @brief Colors and fonts of the kiosk screens.
 *
 * Edit these values to restyle the slideshow; the layout code reads them on
 * every draw.
 */
namespace KioskPalette {

// ============================================================================
// COLORS
// ============================================================================

extern QColor gBackgroundColor;     // Fill used when no fanart is available
extern QColor gOverlayColor;        // Contrast overlay above the fanart
extern int gOverlayAlpha;           // 0 = transparent, 255 = opaque
extern QColor gTextColor;
extern QColor gShadowColor;         // Title drop shadow

// ============================================================================
// TYPOGRAPHY (pixel sizes)
// ============================================================================

extern int gTitleFontSizePx;
extern int gBodyFontSizePx;
extern int gClockFontSizePx;

QFont fontFor(FontRole role, const QString& family);

} // namespace KioskPalette

#endif // KIOSKPALETTE_H
