#ifndef ESTIMATEEXPORTER_H
#define ESTIMATEEXPORTER_H

#include <QString>
#include <QVariant>
#include <QVector>
#include "takeoff/takeoffledger.h"

// One written spreadsheet row; row numbers are 1-based sheet rows
struct EstimateRow {
    int row{0};
    QString label;
    QVariant value;
};

/**
 * @brief EstimateExporter - Single-sheet estimate workbook
 *
 * Layout: named entries as (name, count) from row 4, categories in display
 * order separated by one blank row, then ("Labor", total hours rounded to
 * two decimals). Unnamed entries are not listed but their hours still count.
 */
class EstimateExporter
{
public:
    EstimateExporter();
    ~EstimateExporter() = default;

    static constexpr int kFirstDataRow = 4;
    static QString sheetName() { return QStringLiteral("Estimate"); }

    void setCategories(const QVector<TakeoffCategory>& categories);

    // Rows in sheet order; blank separator rows are not listed
    QVector<EstimateRow> buildRows() const;

    // Same base name as the drawing, .xlsx extension
    static QString outputPathFor(const QString& pdfPath);

    bool exportToXlsx(const QString& filePath);

    QString lastError() const { return m_lastError; }

private:
    QVector<TakeoffCategory> m_categories;
    QString m_lastError;
};

#endif // ESTIMATEEXPORTER_H
