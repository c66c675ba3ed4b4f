#ifndef TESTPDF_H
#define TESTPDF_H

#include <QByteArray>
#include <QSizeF>

namespace testpdf {

// Smallest valid PDF with pageCount blank pages of the given size in points
QByteArray makeBlankPdf(int pageCount = 1, const QSizeF& pageSize = QSizeF(612, 792));

} // namespace testpdf

#endif // TESTPDF_H
