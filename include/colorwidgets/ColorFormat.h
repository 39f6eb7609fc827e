#ifndef TINCT_COLOR_FORMAT_H
#define TINCT_COLOR_FORMAT_H

#include <QString>
#include <QStringList>

#include <optional>

namespace tinct {
namespace colorwidgets {

// Textual renderings a Color can be emitted in.
enum class ColorFormat {
    Hex,  // #rrggbb / #rrggbbaa
    Rgb,  // rgb() / rgba()
    Hsl,  // hsl() / hsla()
    Hsv,  // hsv() / hsva()
    Vec   // vec3() / vec4()
};

// Polar model that is authoritative for a Color.
enum class PolarModel {
    Hsv,
    Hsl
};

QString formatName(ColorFormat format);
std::optional<ColorFormat> formatFromName(const QString& name);
QStringList formatNames();

// Hex -> Rgb -> Hsl -> Hsv -> Vec -> Hex
ColorFormat nextFormat(ColorFormat format);

QString modelName(PolarModel model);
std::optional<PolarModel> modelFromName(const QString& name);

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_COLOR_FORMAT_H
