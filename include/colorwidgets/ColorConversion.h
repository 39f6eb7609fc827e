#ifndef TINCT_COLOR_CONVERSION_H
#define TINCT_COLOR_CONVERSION_H

namespace tinct {
namespace colorwidgets {

/**
 * @brief Three unit-interval color components.
 *
 * Meaning depends on context: (r, g, b), (h, s, v) or (h, s, l).
 * Hue is expressed as a fraction of a full turn.
 */
struct Triple
{
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

/**
 * ColorConversion - conversions between RGB, HSV and HSL
 *
 * All components are unit-interval floats. Inputs are not clamped.
 * Comparisons against extremes use fuzzyEqual() rather than exact equality.
 */
class ColorConversion
{
public:
    ColorConversion() = delete;

    // |a - b| <= FLT_EPSILON
    static bool fuzzyEqual(float a, float b);

    // Euclidean remainder, always in [0, m)
    static float wrap(float x, float m);

    // Sector boundaries are inclusive upper bounds: h*6 == 1 is in the first sector.
    static Triple hsvToRgb(float h, float s, float v);
    static Triple rgbToHsv(float r, float g, float b);

    static Triple hslToRgb(float h, float s, float l);
    static Triple rgbToHsl(float r, float g, float b);

    // Direct interconversion, hue passes through untouched.
    static Triple hsvToHsl(float h, float s, float v);
    static Triple hslToHsv(float h, float s, float l);

private:
    static float hueFromRgb(float r, float g, float b, float max, float chroma);
    static float hueToRgb(float p, float q, float t);
};

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_COLOR_CONVERSION_H
