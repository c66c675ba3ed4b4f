#include "export/estimateexporter.h"
#include "takeoff/takeoffaggregator.h"

#include <QFileInfo>
#include <QDir>
#include <QSaveFile>
#include <QDebug>
#include <QtMath>

#include <xlsxdocument.h>

EstimateExporter::EstimateExporter()
{
}

void EstimateExporter::setCategories(const QVector<TakeoffCategory>& categories)
{
    m_categories = categories;
}

QVector<EstimateRow> EstimateExporter::buildRows() const
{
    QVector<EstimateRow> rows;
    int row = kFirstDataRow;

    for (int c = 0; c < m_categories.size(); ++c) {
        for (const TakeoffEntry& e : m_categories[c].entries) {
            const QString name = e.name.trimmed();
            if (name.isEmpty()) continue;
            rows.append({row++, name, QVariant(e.liveCount())});
        }
        // Blank divider between categories, not after the last one
        if (c + 1 < m_categories.size()) ++row;
    }

    const double totalLabor = TakeoffAggregator::computeTotals(m_categories).totalHours;
    const double rounded = qRound64(totalLabor * 100.0) / 100.0;
    rows.append({row, QStringLiteral("Labor"), QVariant(rounded)});
    return rows;
}

QString EstimateExporter::outputPathFor(const QString& pdfPath)
{
    if (pdfPath.isEmpty()) return QString();
    const QFileInfo info(pdfPath);
    return info.dir().filePath(info.completeBaseName() + ".xlsx");
}

bool EstimateExporter::exportToXlsx(const QString& filePath)
{
    m_lastError.clear();
    if (filePath.isEmpty()) {
        m_lastError = "No output path";
        return false;
    }

    QXlsx::Document xlsx;
    const QStringList sheets = xlsx.sheetNames();
    if (sheets.isEmpty()) {
        if (!xlsx.addSheet(sheetName())) {
            m_lastError = "Could not create worksheet";
            return false;
        }
    } else if (!xlsx.renameSheet(sheets.first(), sheetName())) {
        m_lastError = "Could not name worksheet";
        return false;
    }
    xlsx.selectSheet(sheetName());

    for (const EstimateRow& r : buildRows()) {
        if (!xlsx.write(r.row, 1, r.label) || !xlsx.write(r.row, 2, r.value)) {
            m_lastError = QString("Could not write row %1").arg(r.row);
            return false;
        }
    }

    QSaveFile out(filePath);
    if (!out.open(QIODevice::WriteOnly)) {
        m_lastError = QString("Cannot open %1 for writing: %2").arg(filePath, out.errorString());
        return false;
    }
    if (!xlsx.saveAs(&out)) {
        out.cancelWriting();
        m_lastError = QString("Failed to encode workbook for %1").arg(filePath);
        return false;
    }
    if (!out.commit()) {
        m_lastError = QString("Failed to write %1: %2").arg(filePath, out.errorString());
        return false;
    }

    qDebug() << "[Estimate] Spreadsheet written to" << filePath;
    return true;
}
