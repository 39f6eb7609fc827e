#ifndef TINCT_HUE_SURFACE_H
#define TINCT_HUE_SURFACE_H

#include "colorwidgets/SliderSurface.h"

namespace tinct {
namespace colorwidgets {

// y maps to hue in [0, 1), top to bottom. Saturation and level come from the color.
class HueSurface : public SliderSurface
{
public:
    HueSurface() = default;

protected:
    qreal positionOf(const Color& color) const override;
    Color sampleRow(const Color& color, qreal fy) const override;
    void applyPosition(qreal fx, qreal fy, Color& color) const override;
};

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_HUE_SURFACE_H
