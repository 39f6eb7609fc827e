#include "colorwidgets/Color.h"

#include <cmath>

namespace tinct {
namespace colorwidgets {

Color Color::fromRgb(float r, float g, float b, float a, PolarModel model)
{
    Color c;
    c.m_model = model;
    c.m_rgb = {r, g, b};
    c.m_polar = model == PolarModel::Hsl ? ColorConversion::rgbToHsl(r, g, b)
                                         : ColorConversion::rgbToHsv(r, g, b);
    c.m_alpha = a;
    return c;
}

Color Color::fromHsv(float h, float s, float v, float a)
{
    Color c;
    c.m_model = PolarModel::Hsv;
    c.m_polar = {h, s, v};
    c.m_alpha = a;
    c.syncRgb();
    return c;
}

Color Color::fromHsl(float h, float s, float l, float a)
{
    Color c;
    c.m_model = PolarModel::Hsl;
    c.m_polar = {h, s, l};
    c.m_alpha = a;
    c.syncRgb();
    return c;
}

Color Color::fromQColor(const QColor& color, PolarModel model)
{
    const QColor rgb = color.toRgb();
    return fromRgb(rgb.redF(), rgb.greenF(), rgb.blueF(), rgb.alphaF(), model);
}

Color Color::toModel(PolarModel model) const
{
    if (model == m_model)
        return *this;

    Color c = *this;
    c.m_model = model;
    c.m_polar = model == PolarModel::Hsl ? hsl() : hsv();
    c.syncRgb();
    return c;
}

Triple Color::hsv() const
{
    if (m_model == PolarModel::Hsv)
        return m_polar;
    return ColorConversion::hslToHsv(m_polar.x, m_polar.y, m_polar.z);
}

Triple Color::hsl() const
{
    if (m_model == PolarModel::Hsl)
        return m_polar;
    return ColorConversion::hsvToHsl(m_polar.x, m_polar.y, m_polar.z);
}

// ========== Mutators ==========

void Color::setHue(float h)
{
    m_polar.x = h;
    syncRgb();
}

void Color::setSaturation(float s)
{
    m_polar.y = s;
    syncRgb();
}

void Color::setLevel(float level)
{
    m_polar.z = level;
    syncRgb();
}

void Color::setAlpha(float a)
{
    m_alpha = a;
}

void Color::syncRgb()
{
    m_rgb = m_model == PolarModel::Hsl
                ? ColorConversion::hslToRgb(m_polar.x, m_polar.y, m_polar.z)
                : ColorConversion::hsvToRgb(m_polar.x, m_polar.y, m_polar.z);
}

// ========== Output ==========

quint8 Color::quantize(float x)
{
    return static_cast<quint8>(qRound(qBound(0.0f, x, 1.0f) * 255.0f));
}

std::array<quint8, 4> Color::toPixel() const
{
    return {quantize(m_rgb.x), quantize(m_rgb.y), quantize(m_rgb.z), quantize(m_alpha)};
}

QColor Color::toQColor() const
{
    const auto px = toPixel();
    return QColor(px[0], px[1], px[2], px[3]);
}

bool Color::isOpaque() const
{
    return ColorConversion::fuzzyEqual(m_alpha, 1.0f);
}

QString Color::toHexString() const
{
    const auto px = toPixel();
    QString hex = QString("#%1%2%3")
                      .arg(int(px[0]), 2, 16, QChar('0'))
                      .arg(int(px[1]), 2, 16, QChar('0'))
                      .arg(int(px[2]), 2, 16, QChar('0'));
    // Alpha form follows the 8-bit alpha, not isOpaque()
    if (px[3] != 255)
        hex += QString("%1").arg(int(px[3]), 2, 16, QChar('0'));
    return hex;
}

QString Color::toRgbString() const
{
    const auto px = toPixel();
    if (px[3] == 255)
        return QString("rgb(%1, %2, %3)").arg(int(px[0])).arg(int(px[1])).arg(int(px[2]));

    return QString("rgba(%1, %2, %3, %4%)")
        .arg(int(px[0]))
        .arg(int(px[1]))
        .arg(int(px[2]))
        .arg(qRound(px[3] / 255.0 * 100.0));
}

QString Color::toHslString() const
{
    const Triple c = hsl();
    const int h = qRound(c.x * 360.0f);
    const int s = qRound(c.y * 100.0f);
    const int l = qRound(c.z * 100.0f);

    if (isOpaque())
        return QString("hsl(%1deg, %2%, %3%)").arg(h).arg(s).arg(l);
    return QString("hsla(%1deg, %2%, %3%, %4%)").arg(h).arg(s).arg(l).arg(qRound(m_alpha * 100.0f));
}

QString Color::toHsvString() const
{
    const Triple c = hsv();
    const int h = qRound(c.x * 360.0f);
    const int s = qRound(c.y * 100.0f);
    const int v = qRound(c.z * 100.0f);

    if (isOpaque())
        return QString("hsv(%1deg, %2%, %3%)").arg(h).arg(s).arg(v);
    return QString("hsva(%1deg, %2%, %3%, %4%)").arg(h).arg(s).arg(v).arg(qRound(m_alpha * 100.0f));
}

QString Color::toVecString() const
{
    auto n = [](float x) { return QString::number(x, 'f', 2); };

    if (isOpaque())
        return QString("vec3(%1, %2, %3)").arg(n(m_rgb.x), n(m_rgb.y), n(m_rgb.z));
    return QString("vec4(%1, %2, %3, %4)").arg(n(m_rgb.x), n(m_rgb.y), n(m_rgb.z), n(m_alpha));
}

QString Color::toString(ColorFormat format) const
{
    switch (format) {
        case ColorFormat::Hex:
            return toHexString();
        case ColorFormat::Rgb:
            return toRgbString();
        case ColorFormat::Hsl:
            return toHslString();
        case ColorFormat::Hsv:
            return toHsvString();
        case ColorFormat::Vec:
            return toVecString();
    }
    return toHexString();
}

bool Color::operator==(const Color& other) const
{
    return m_model == other.m_model && m_rgb.x == other.m_rgb.x && m_rgb.y == other.m_rgb.y &&
           m_rgb.z == other.m_rgb.z && m_polar.x == other.m_polar.x &&
           m_polar.y == other.m_polar.y && m_polar.z == other.m_polar.z &&
           m_alpha == other.m_alpha;
}

}  // namespace colorwidgets
}  // namespace tinct
