#include "color_resolver.h"

#include <QStringList>

namespace lumactl {

namespace {

QColor colorFromName(const QString &text)
{
    static const QStringList names = QColor::colorNames();
    for (const QString &name : names) {
        if (name.compare(text, Qt::CaseInsensitive) == 0)
            return QColor(name);
    }
    return QColor(Qt::black);
}

bool colorFromArgbHex(const QString &digits, QColor *out)
{
    if (digits.size() != 8)
        return false;

    for (const QChar ch : digits) {
        const char16_t c = ch.unicode();
        const bool hex = (c >= u'0' && c <= u'9') || (c >= u'a' && c <= u'f') || (c >= u'A' && c <= u'F');
        if (!hex)
            return false;
    }

    bool ok = false;
    const uint argb = digits.toUInt(&ok, 16);
    if (!ok)
        return false;

    *out = QColor::fromRgba(static_cast<QRgb>(argb));
    return true;
}

} // namespace

ColorResult resolveColor(const QString &text)
{
    ColorResult result;
    if (text.isNull()) {
        result.ok = true;
        return result;
    }

    const QString upper = text.toUpper();
    if (upper == QLatin1String("BLACK") || upper == QLatin1String("AUTO")) {
        result.ok = true;
        result.hasColor = true;
        result.color = QColor(Qt::black);
        return result;
    }

    const QColor named = colorFromName(text);
    if (named.red() != 0 || named.green() != 0 || named.blue() != 0) {
        result.ok = true;
        result.hasColor = true;
        result.color = named;
        return result;
    }

    QString digits = text;
    digits.remove(QLatin1Char('#'));
    if (digits.size() != 8)
        digits.prepend(QStringLiteral("FF"));

    QColor parsed;
    if (!colorFromArgbHex(digits, &parsed)) {
        result.error = QStringLiteral("Not a valid text or hex color: %1").arg(text);
        return result;
    }

    result.ok = true;
    result.hasColor = true;
    result.color = parsed;
    return result;
}

QString colorToHex(const QColor &color)
{
    return QStringLiteral("#%1%2%3")
        .arg(color.red(), 2, 16, QLatin1Char('0'))
        .arg(color.green(), 2, 16, QLatin1Char('0'))
        .arg(color.blue(), 2, 16, QLatin1Char('0'))
        .toUpper();
}

} // namespace lumactl
