#include "colorwidgets/ColorFormat.h"

namespace tinct {
namespace colorwidgets {

QString formatName(ColorFormat format)
{
    switch (format) {
        case ColorFormat::Hex:
            return QStringLiteral("hex");
        case ColorFormat::Rgb:
            return QStringLiteral("rgb");
        case ColorFormat::Hsl:
            return QStringLiteral("hsl");
        case ColorFormat::Hsv:
            return QStringLiteral("hsv");
        case ColorFormat::Vec:
            return QStringLiteral("vec");
    }
    return QString();
}

std::optional<ColorFormat> formatFromName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    for (ColorFormat format : {ColorFormat::Hex, ColorFormat::Rgb, ColorFormat::Hsl,
                               ColorFormat::Hsv, ColorFormat::Vec}) {
        if (formatName(format) == key)
            return format;
    }
    return std::nullopt;
}

QStringList formatNames()
{
    return {QStringLiteral("hex"), QStringLiteral("rgb"), QStringLiteral("hsl"),
            QStringLiteral("hsv"), QStringLiteral("vec")};
}

ColorFormat nextFormat(ColorFormat format)
{
    switch (format) {
        case ColorFormat::Hex:
            return ColorFormat::Rgb;
        case ColorFormat::Rgb:
            return ColorFormat::Hsl;
        case ColorFormat::Hsl:
            return ColorFormat::Hsv;
        case ColorFormat::Hsv:
            return ColorFormat::Vec;
        case ColorFormat::Vec:
            return ColorFormat::Hex;
    }
    return ColorFormat::Hex;
}

QString modelName(PolarModel model)
{
    return model == PolarModel::Hsl ? QStringLiteral("hsl") : QStringLiteral("hsv");
}

std::optional<PolarModel> modelFromName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("hsv"))
        return PolarModel::Hsv;
    if (key == QLatin1String("hsl"))
        return PolarModel::Hsl;
    return std::nullopt;
}

}  // namespace colorwidgets
}  // namespace tinct
