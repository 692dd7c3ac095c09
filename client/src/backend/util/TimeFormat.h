#ifndef TIMEFORMAT_H
#define TIMEFORMAT_H

#include <QDateTime>
#include <QString>

namespace TimeFormat {

// Formats a local time with a strftime-style pattern ("%H:%M:%S", "%I:%M %p").
// Returns an empty string if the pattern produces no output.
QString formatStrftime(const QDateTime& time, const QString& pattern);

}

#endif // TIMEFORMAT_H
