#ifndef TINCT_COLOR_PARSER_H
#define TINCT_COLOR_PARSER_H

#include "colorwidgets/Color.h"

#include <QString>
#include <QStringList>

#include <optional>

namespace tinct {
namespace colorwidgets {

/**
 * @brief Rejected color text and the reason it was rejected
 */
struct ColorParseError
{
    QString text;
    QString reason;

    QString message() const { return QString("Invalid color \"%1\": %2").arg(text, reason); }
};

/**
 * @brief Outcome of ColorParser::parse: a Color or a ColorParseError
 */
struct ColorParseResult
{
    std::optional<Color> color;
    ColorParseError error;

    bool isSuccess() const { return color.has_value(); }

    static ColorParseResult success(const Color& c) { return {c, {}}; }

    static ColorParseResult failure(const QString& text, const QString& reason)
    {
        return {std::nullopt, {text, reason}};
    }
};

/**
 * ColorParser - CSS-style color text to Color
 *
 * Supported formats (case-insensitive, surrounding whitespace ignored):
 * - "#f00", "#f008", "#ff0000", "#ff000080" ('#' optional)
 * - "rgb(255, 0, 0)", "rgba(255, 0, 0, 0.5)", "rgb(255 0 0 / 50%)", "rgb(100% 0% 0%)"
 * - "hsl(120deg, 50%, 25%)", "hsla(0.5turn 50% 25% / 0.3)", hue in deg/rad/grad/turn
 * - "hsv(120, 100%, 100%)", "hsva(...)"
 * - "vec3(1.00, 0.50, 0.00)", "vec4(1.00, 0.50, 0.00, 0.25)"
 * - CSS color names ("red", "darkorange", "transparent")
 *
 * Channel, saturation, level and alpha values outside their range are clamped,
 * as CSS does for computed values.
 */
class ColorParser
{
public:
    ColorParser() = delete;

    // hsl() text yields an HSL color, hsv() an HSV color, everything else HSV from RGB.
    static ColorParseResult parse(const QString& text);

    // As above, then expressed in the requested polar model.
    static ColorParseResult parse(const QString& text, PolarModel model);

private:
    struct Arguments
    {
        QStringList channels;
        QString alpha;  // empty when absent
        bool legacy = false;  // comma-separated form
    };

    static ColorParseResult parseText(const QString& text, std::optional<PolarModel> model);
    static ColorParseResult parseHex(const QString& text, const QString& digits,
                                     PolarModel model);
    static ColorParseResult parseFunction(const QString& text, const QString& name,
                                          const QString& body,
                                          std::optional<PolarModel> model);
    // bareFourth: a fourth space-separated value is alpha (vec4 r g b a)
    static std::optional<Arguments> splitArguments(const QString& body, bool bareFourth,
                                                   QString* reason);

    static std::optional<double> parseNumber(const QString& token);
    static std::optional<float> parseRgbChannel(const QString& token);
    // legacy: a bare number in [0, 1] is a unit fraction, as in hsl(90deg, .2, .5)
    static std::optional<float> parsePercentage(const QString& token, bool legacy = false);
    static std::optional<float> parseAlpha(const QString& token);
    static std::optional<float> parseHue(const QString& token);
    static std::optional<float> parseUnit(const QString& token);
};

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_COLOR_PARSER_H
