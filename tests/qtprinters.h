#ifndef QTPRINTERS_H
#define QTPRINTERS_H

#include <QString>
#include <ostream>

// Readable gtest failure output for Qt strings
inline void PrintTo(const QString& s, std::ostream* os)
{
    *os << '"' << s.toStdString() << '"';
}

#endif // QTPRINTERS_H
