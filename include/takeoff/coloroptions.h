#ifndef COLOROPTIONS_H
#define COLOROPTIONS_H

#include <QColor>
#include <QString>
#include <QStringList>
#include <QVector>

struct NamedColor {
    QString name;
    QColor color;
};

// Fixed choices offered by the takeoff entry editor
class ColorOptions
{
public:
    static const QVector<NamedColor>& palette();
    static QStringList colorNames();
    static QColor colorFor(const QString& name);   // unknown names map to Red

    static QStringList wireTypes();
    static QStringList cableSpecs();
    static QStringList materials();

    // Fill alpha used for on-screen markup
    static constexpr int kMarkupAlpha = 80;
};

#endif // COLOROPTIONS_H
