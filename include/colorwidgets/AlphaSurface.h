#ifndef TINCT_ALPHA_SURFACE_H
#define TINCT_ALPHA_SURFACE_H

#include "colorwidgets/SliderSurface.h"

namespace tinct {
namespace colorwidgets {

// y maps to alpha, inverted (top row is opaque). The polar triple comes from the color.
class AlphaSurface : public SliderSurface
{
public:
    AlphaSurface() = default;

protected:
    qreal positionOf(const Color& color) const override;
    Color sampleRow(const Color& color, qreal fy) const override;
    void applyPosition(qreal fx, qreal fy, Color& color) const override;
};

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_ALPHA_SURFACE_H
