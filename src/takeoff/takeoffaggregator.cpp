#include "takeoff/takeoffaggregator.h"

#include <QStringList>

TakeoffSummary TakeoffAggregator::computeTotals(const QVector<TakeoffCategory>& categories)
{
    TakeoffSummary summary;
    for (const TakeoffCategory& cat : categories) {
        const int count = categoryCount(cat);
        summary.totalHours += categoryHours(cat);
        summary.totalPointCount += count;
        if (!cat.countsTowardDevices) continue;

        summary.totalDeviceCount += count;
        if (cat.wireEnabled) {
            const WireTotals sub = wireSubtotals(cat);
            for (auto it = sub.cbegin(); it != sub.cend(); ++it) {
                summary.wireTotals[it.key()] += it.value();
            }
        }
    }
    return summary;
}

WireTotals TakeoffAggregator::wireSubtotals(const TakeoffCategory& category)
{
    WireTotals totals;
    if (!category.wireEnabled) return totals;
    for (const TakeoffEntry& e : category.entries) {
        const double length = e.unitLength();
        const int count = e.liveCount();
        if (length <= 0.0 || count <= 0) continue;
        totals[e.wireKey()] += length * count;
    }
    return totals;
}

double TakeoffAggregator::categoryHours(const TakeoffCategory& category)
{
    double hours = 0.0;
    for (const TakeoffEntry& e : category.entries) {
        hours += e.liveCount() * e.laborMultiplier();
    }
    return hours;
}

int TakeoffAggregator::categoryCount(const TakeoffCategory& category)
{
    int count = 0;
    for (const TakeoffEntry& e : category.entries) count += e.liveCount();
    return count;
}

QString TakeoffAggregator::describeWireTotals(const WireTotals& totals)
{
    if (totals.isEmpty()) return QStringLiteral("-");
    QStringList parts;
    for (auto it = totals.cbegin(); it != totals.cend(); ++it) {
        parts << QString("%1 %2/%3 (%4)")
                     .arg(it.value(), 0, 'f', 2)
                     .arg(it.key().type, it.key().cable, WireKey::materialCode(it.key().material));
    }
    return parts.join("; ");
}
