#include "colorwidgets/AlphaSurface.h"

namespace tinct {
namespace colorwidgets {

qreal AlphaSurface::positionOf(const Color& color) const
{
    return 1.0 - color.alpha();
}

Color AlphaSurface::sampleRow(const Color& color, qreal fy) const
{
    Color c = color;
    c.setAlpha(static_cast<float>(1.0 - fy));
    return c;
}

void AlphaSurface::applyPosition(qreal /*fx*/, qreal fy, Color& color) const
{
    color.setAlpha(static_cast<float>(1.0 - fy));
}

}  // namespace colorwidgets
}  // namespace tinct
