#ifndef TAKEOFFAGGREGATOR_H
#define TAKEOFFAGGREGATOR_H

#include <QString>
#include <QVector>
#include "takeoff/takeoffledger.h"

struct TakeoffSummary {
    double totalHours{0.0};
    int totalDeviceCount{0};    // excludes non-counting categories
    int totalPointCount{0};     // every live shape
    WireTotals wireTotals;
};

// Stateless totals over the ledger; cheap enough to rerun on every change
class TakeoffAggregator
{
public:
    static TakeoffSummary computeTotals(const QVector<TakeoffCategory>& categories);

    // Per-category wire length keyed by (type, cable, material)
    static WireTotals wireSubtotals(const TakeoffCategory& category);

    // Hours and live shapes of a single category, for the panel footer
    static double categoryHours(const TakeoffCategory& category);
    static int categoryCount(const TakeoffCategory& category);

    // "12.50 NMD/14-2 (CU); 3.00 AC90/12-2 (AL)" or "-"
    static QString describeWireTotals(const WireTotals& totals);
};

#endif // TAKEOFFAGGREGATOR_H
