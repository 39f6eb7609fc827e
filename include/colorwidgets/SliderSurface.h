#ifndef TINCT_SLIDER_SURFACE_H
#define TINCT_SLIDER_SURFACE_H

#include "colorwidgets/PickerSurface.h"

namespace tinct {
namespace colorwidgets {

/**
 * @brief Vertical 1-D surface controlling a single color component.
 *
 * Columns are uniform; the controlled component varies along y. The
 * indicator is a thin horizontal bar at the component's position.
 */
class SliderSurface : public PickerSurface
{
public:
    QRectF indicatorBounds(const Color& color) const override;

    // Bar rectangle after clamping; stroked with STROKE_WIDTH
    QRectF indicatorRect(const Color& color) const;

protected:
    SliderSurface() = default;

    // Position of the controlled component along y, as a fraction of the height
    virtual qreal positionOf(const Color& color) const = 0;

    Color sample(const Color& color, int x, int y, int width, int height) const override;
    // Candidate color for a row at fraction fy of the height
    virtual Color sampleRow(const Color& color, qreal fy) const = 0;

    void paintIndicator(QPainter& painter, const Color& color) const override;

    Qt::CursorShape hoverCursor() const override { return Qt::OpenHandCursor; }
    Qt::CursorShape dragCursor() const override { return Qt::ClosedHandCursor; }

private:
    static constexpr qreal BAR_HEIGHT = 5.0;
    static constexpr qreal BAR_INSET = 1.0;
    static constexpr qreal BAR_RADIUS = 0.5;
};

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_SLIDER_SURFACE_H
