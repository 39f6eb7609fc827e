#ifndef TINCT_PLANE_SURFACE_H
#define TINCT_PLANE_SURFACE_H

#include "colorwidgets/PickerSurface.h"
#include "colorwidgets/ShapeUtils.h"

namespace tinct {
namespace colorwidgets {

/**
 * @brief Saturation x value (HSV) or saturation x lightness (HSL) plane.
 *
 * The variant follows the model of the color it is given:
 * - x maps to saturation in [0, 1], left to right
 * - HSV: y maps to value, inverted (top row is value 1)
 * - HSL: y maps to lightness, not inverted (top row is lightness 0)
 */
class PlaneSurface : public PickerSurface
{
public:
    PlaneSurface() = default;

    QRectF indicatorBounds(const Color& color) const override;

    // Indicator circle after clamping; stroked with STROKE_WIDTH
    Circle indicatorCircle(const Color& color) const;

protected:
    Color sample(const Color& color, int x, int y, int width, int height) const override;
    void applyPosition(qreal fx, qreal fy, Color& color) const override;
    void paintIndicator(QPainter& painter, const Color& color) const override;
    Qt::CursorShape hoverCursor() const override { return Qt::CrossCursor; }

private:
    static qreal levelToFraction(const Color& color);
    static float fractionToLevel(PolarModel model, qreal fy);

    static constexpr qreal INDICATOR_RADIUS = 4.5;
    static constexpr qreal INDICATOR_INSET = 1.0;
};

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_PLANE_SURFACE_H
