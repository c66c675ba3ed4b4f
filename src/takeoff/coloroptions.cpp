#include "takeoff/coloroptions.h"

const QVector<NamedColor>& ColorOptions::palette()
{
    static const QVector<NamedColor> colors = {
        {"Red", QColor("#FF0000")},
        {"Green", QColor("#00FF00")},
        {"Blue", QColor("#0000FF")},
        {"Yellow", QColor("#FFFF00")},
        {"Magenta", QColor("#FF00FF")},
        {"Cyan", QColor("#00FFFF")},
        {"Maroon", QColor("#800000")},
        {"Dark Green", QColor("#008000")},
        {"Navy", QColor("#000080")},
        {"Olive", QColor("#808000")},
        {"Purple", QColor("#800080")},
        {"Teal", QColor("#008080")},
        {"Silver", QColor("#C0C0C0")},
        {"Orange", QColor("#FFA500")},
        {"Brown", QColor("#A52A2A")},
        {"Burly Wood", QColor("#DEB887")},
        {"Cadet Blue", QColor("#5F9EA0")},
        {"Chartreuse", QColor("#7FFF00")},
        {"Chocolate", QColor("#D2691E")},
        {"Coral", QColor("#FF7F50")},
        {"Cornflower Blue", QColor("#6495ED")},
        {"Crimson", QColor("#DC143C")},
        {"Dark Turquoise", QColor("#00CED1")},
        {"Dark Violet", QColor("#9400D3")},
        {"Gold", QColor("#FFD700")},
    };
    return colors;
}

QStringList ColorOptions::colorNames()
{
    QStringList names;
    for (const auto& c : palette()) names << c.name;
    return names;
}

QColor ColorOptions::colorFor(const QString& name)
{
    for (const auto& c : palette()) {
        if (c.name == name) return c.color;
    }
    return QColor(Qt::red);
}

QStringList ColorOptions::wireTypes()
{
    return {"NMD", "AC90", "SOW", "SJOW"};
}

QStringList ColorOptions::cableSpecs()
{
    return {
        "14-2", "14-3", "14-4",
        "12-2", "12-3", "12-4",
        "10-2", "10-3", "10-4",
        "8-2", "8-3", "8-4",
        "6-2", "6-3", "6-4",
        "4-2", "4-3", "4-4",
        "2-2", "2-3", "2-4",
        "1/0-3", "1/0-4", "2/0-3", "2/0-4",
        "3/0-3", "3/0-4", "4/0-3", "4/0-4",
        "250 MCM", "300 MCM", "350 MCM", "500 MCM"
    };
}

QStringList ColorOptions::materials()
{
    return {"CU", "AL"};
}
