#include "colorwidgets/ColorConversion.h"

#include <algorithm>
#include <cfloat>
#include <cmath>

namespace tinct {
namespace colorwidgets {

bool ColorConversion::fuzzyEqual(float a, float b)
{
    return std::fabs(a - b) <= FLT_EPSILON;
}

float ColorConversion::wrap(float x, float m)
{
    float r = std::fmod(x, m);
    if (r < 0.0f)
        r += m;
    // fmod of a tiny negative value can round up to m
    return r >= m ? 0.0f : r;
}

// ========== HSV ==========

Triple ColorConversion::hsvToRgb(float h, float s, float v)
{
    const float c = v * s;
    const float h6 = h * 6.0f;
    const float x = c * (1.0f - std::fabs(wrap(h6, 2.0f) - 1.0f));

    float r, g, b;
    if (h6 <= 1.0f) {
        r = c; g = x; b = 0.0f;
    } else if (h6 <= 2.0f) {
        r = x; g = c; b = 0.0f;
    } else if (h6 <= 3.0f) {
        r = 0.0f; g = c; b = x;
    } else if (h6 <= 4.0f) {
        r = 0.0f; g = x; b = c;
    } else if (h6 <= 5.0f) {
        r = x; g = 0.0f; b = c;
    } else {
        r = c; g = 0.0f; b = x;
    }

    const float m = v - c;
    return {r + m, g + m, b + m};
}

Triple ColorConversion::rgbToHsv(float r, float g, float b)
{
    const float v = std::max({r, g, b});
    const float min = std::min({r, g, b});
    const float c = v - min;

    const float h = hueFromRgb(r, g, b, v, c);
    const float s = fuzzyEqual(v, 0.0f) ? 0.0f : c / v;

    return {h, s, v};
}

// ========== HSL ==========

float ColorConversion::hueToRgb(float p, float q, float t)
{
    t = wrap(t, 1.0f);
    if (t < 1.0f / 6.0f)
        return p + (q - p) * 6.0f * t;
    if (t < 1.0f / 2.0f)
        return q;
    if (t < 2.0f / 3.0f)
        return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
    return p;
}

Triple ColorConversion::hslToRgb(float h, float s, float l)
{
    if (fuzzyEqual(s, 0.0f))
        return {l, l, l};

    const float q = l < 0.5f ? l * (1.0f + s) : l + s - l * s;
    const float p = 2.0f * l - q;

    return {hueToRgb(p, q, h + 1.0f / 3.0f), hueToRgb(p, q, h),
            hueToRgb(p, q, h - 1.0f / 3.0f)};
}

Triple ColorConversion::rgbToHsl(float r, float g, float b)
{
    const float max = std::max({r, g, b});
    const float min = std::min({r, g, b});
    const float l = (max + min) / 2.0f;

    if (fuzzyEqual(max, min))
        return {0.0f, 0.0f, l};

    const float d = max - min;
    const float s = l > 0.5f ? d / (2.0f - max - min) : d / (max + min);

    return {hueFromRgb(r, g, b, max, d), s, l};
}

// ========== Interconversion ==========

Triple ColorConversion::hsvToHsl(float h, float s, float v)
{
    const float l = v * (1.0f - s / 2.0f);
    const float sl = (fuzzyEqual(l, 0.0f) || fuzzyEqual(l, 1.0f))
                         ? 0.0f
                         : (v - l) / std::min(l, 1.0f - l);
    return {h, sl, l};
}

Triple ColorConversion::hslToHsv(float h, float s, float l)
{
    const float v = l + s * std::min(l, 1.0f - l);
    const float sv = fuzzyEqual(v, 0.0f) ? 0.0f : 2.0f * (1.0f - l / v);
    return {h, sv, v};
}

float ColorConversion::hueFromRgb(float r, float g, float b, float max, float chroma)
{
    if (fuzzyEqual(chroma, 0.0f))
        return 0.0f;

    float h;
    if (fuzzyEqual(max, r)) {
        h = wrap((g - b) / chroma, 6.0f);
    } else if (fuzzyEqual(max, g)) {
        h = (b - r) / chroma + 2.0f;
    } else {
        h = (r - g) / chroma + 4.0f;
    }
    return h / 6.0f;
}

}  // namespace colorwidgets
}  // namespace tinct
