#ifndef TINCT_COLOR_H
#define TINCT_COLOR_H

#include "colorwidgets/ColorConversion.h"
#include "colorwidgets/ColorFormat.h"

#include <QColor>
#include <QMetaType>
#include <QString>
#include <QtGlobal>

#include <array>

namespace tinct {
namespace colorwidgets {

/**
 * @brief Color held in RGB and in one authoritative polar model at once.
 *
 * All components are unit-interval floats; hue is a fraction of a full turn.
 * The polar triple (hue, saturation, level) is authoritative: every polar
 * setter recomputes the full RGB triple from it, so the two representations
 * never disagree. Level is value for PolarModel::Hsv and lightness for
 * PolarModel::Hsl.
 *
 * Numeric inputs are not clamped; the picker surfaces clamp before calling.
 */
class Color
{
public:
    // Opaque black, HSV model
    Color() = default;

    static Color fromRgb(float r, float g, float b, float a = 1.0f,
                         PolarModel model = PolarModel::Hsv);
    static Color fromHsv(float h, float s, float v, float a = 1.0f);
    static Color fromHsl(float h, float s, float l, float a = 1.0f);
    static Color fromQColor(const QColor& color, PolarModel model = PolarModel::Hsv);

    // Same color expressed in another polar model; hue is preserved.
    Color toModel(PolarModel model) const;

    PolarModel model() const { return m_model; }

    float red() const { return m_rgb.x; }
    float green() const { return m_rgb.y; }
    float blue() const { return m_rgb.z; }
    float alpha() const { return m_alpha; }

    float hue() const { return m_polar.x; }
    float saturation() const { return m_polar.y; }
    float level() const { return m_polar.z; }

    // Polar triples in either model, converted when not authoritative
    Triple rgb() const { return m_rgb; }
    Triple hsv() const;
    Triple hsl() const;

    void setHue(float h);
    void setSaturation(float s);
    void setLevel(float level);
    void setAlpha(float a);

    // 8-bit RGBA, round(x * 255) clamped to [0, 255]
    std::array<quint8, 4> toPixel() const;
    QColor toQColor() const;

    bool isOpaque() const;

    QString toHexString() const;
    QString toRgbString() const;
    QString toHslString() const;
    QString toHsvString() const;
    QString toVecString() const;
    QString toString(ColorFormat format) const;

    // Exact component-wise comparison
    bool operator==(const Color& other) const;
    bool operator!=(const Color& other) const { return !(*this == other); }

private:
    void syncRgb();

    static quint8 quantize(float x);

    PolarModel m_model = PolarModel::Hsv;
    Triple m_rgb;
    Triple m_polar;
    float m_alpha = 1.0f;
};

}  // namespace colorwidgets
}  // namespace tinct

Q_DECLARE_METATYPE(tinct::colorwidgets::Color)

#endif  // TINCT_COLOR_H
