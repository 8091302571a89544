#pragma once

#include <QColor>
#include <QString>

namespace lumactl {

struct ColorResult {
    bool ok = false;
    bool hasColor = false;
    QColor color;
    QString error;
};

// Resolves user text to a color: "black"/"auto", then a color name, then
// RRGGBB or AARRGGBB hex (any '#' ignored). A null string means no color.
// Names that resolve to black other than "black" itself are treated as
// unknown and fall through to hex parsing.
ColorResult resolveColor(const QString &text);

QString colorToHex(const QColor &color);

} // namespace lumactl
