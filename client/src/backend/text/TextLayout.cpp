#include "backend/text/TextLayout.h"

namespace TextLayout {

QStringList wrap(const QString& text, int maxWidthPx, const MeasureFn& measure) {
    QStringList lines;
    if (text.isEmpty() || !measure) {
        return lines;
    }

    const QStringList words = text.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    QString current;
    for (const QString& word : words) {
        if (current.isEmpty()) {
            current = word;
            continue;
        }
        const QString candidate = current + QLatin1Char(' ') + word;
        if (measure(candidate) < maxWidthPx) {
            current = candidate;
        } else {
            lines.append(current);
            current = word;
        }
    }
    if (!current.isEmpty()) {
        lines.append(current);
    }
    return lines;
}

QStringList truncate(const QStringList& lines, int maxLines) {
    if (maxLines <= 0) {
        return QStringList();
    }
    return lines.mid(0, maxLines);
}

}
