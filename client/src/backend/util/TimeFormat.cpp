#include "backend/util/TimeFormat.h"
#include <QByteArray>
#include <ctime>
#include <vector>

namespace TimeFormat {

QString formatStrftime(const QDateTime& time, const QString& pattern) {
    if (pattern.isEmpty() || !time.isValid()) {
        return QString();
    }

    const QDateTime local = time.toLocalTime();
    const QDate date = local.date();
    const QTime clock = local.time();

    std::tm tm{};
    tm.tm_year = date.year() - 1900;
    tm.tm_mon = date.month() - 1;
    tm.tm_mday = date.day();
    tm.tm_hour = clock.hour();
    tm.tm_min = clock.minute();
    tm.tm_sec = clock.second();
    tm.tm_wday = date.dayOfWeek() % 7; // Qt: Monday=1..Sunday=7
    tm.tm_yday = date.dayOfYear() - 1;
    tm.tm_isdst = -1;

    const QByteArray fmt = pattern.toLocal8Bit();
    // strftime returns 0 both for "buffer too small" and for empty output; grow a few times
    std::vector<char> buffer(64 + static_cast<size_t>(fmt.size()) * 4);
    for (int attempt = 0; attempt < 4; ++attempt) {
        const size_t written = std::strftime(buffer.data(), buffer.size(), fmt.constData(), &tm);
        if (written > 0) {
            return QString::fromLocal8Bit(buffer.data(), static_cast<int>(written));
        }
        buffer.resize(buffer.size() * 4);
    }
    return QString();
}

}
