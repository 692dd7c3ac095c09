#ifndef TEXTLAYOUT_H
#define TEXTLAYOUT_H

#include <QString>
#include <QStringList>
#include <functional>

namespace TextLayout {

using MeasureFn = std::function<int(const QString&)>;

constexpr int kDefaultMaxLines = 5;

/**
 * @brief Greedy word wrap of a single paragraph.
 *
 * Words are separated by spaces (runs collapse). A word is appended to the
 * current line while the measured width of "line word" stays strictly below
 * maxWidthPx; otherwise the line is committed and the word starts a new one.
 * A word that is wider than maxWidthPx on its own still gets its own line.
 * Lines never carry a trailing space. Empty text gives an empty list.
 */
QStringList wrap(const QString& text, int maxWidthPx, const MeasureFn& measure);

// Presentation policy: keep at most maxLines lines.
QStringList truncate(const QStringList& lines, int maxLines = kDefaultMaxLines);

}

#endif // TEXTLAYOUT_H
