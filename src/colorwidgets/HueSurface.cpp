#include "colorwidgets/HueSurface.h"

namespace tinct {
namespace colorwidgets {

qreal HueSurface::positionOf(const Color& color) const
{
    return color.hue();
}

Color HueSurface::sampleRow(const Color& color, qreal fy) const
{
    Color c = color;
    c.setHue(static_cast<float>(fy));
    c.setAlpha(1.0f);
    return c;
}

void HueSurface::applyPosition(qreal /*fx*/, qreal fy, Color& color) const
{
    color.setHue(static_cast<float>(fy));
}

}  // namespace colorwidgets
}  // namespace tinct
