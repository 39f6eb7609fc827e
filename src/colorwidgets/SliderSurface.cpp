#include "colorwidgets/SliderSurface.h"

#include "colorwidgets/ShapeUtils.h"

#include <QPainter>
#include <QPen>

namespace tinct {
namespace colorwidgets {

Color SliderSurface::sample(const Color& color, int /*x*/, int y, int /*width*/, int height) const
{
    return sampleRow(color, static_cast<qreal>(y) / height);
}

QRectF SliderSurface::indicatorRect(const Color& color) const
{
    const QSize size = pixelSize();
    const qreal y = positionOf(color) * size.height();

    QRectF bar(0.0, y, size.width(), BAR_HEIGHT);
    bar = ShapeUtils::translate(bar, 0.0, -BAR_HEIGHT / 2);
    bar = ShapeUtils::shrink(bar, QSizeF(BAR_INSET, 0.0));
    bar = ShapeUtils::shrink(bar, QSizeF(STROKE_WIDTH / 2, STROKE_WIDTH / 2));

    // Keep room for the stroke on every side and for the shadow below
    QRectF bounds = ShapeUtils::shrink(QRectF(QPointF(0, 0), QSizeF(size)),
                                       QSizeF(STROKE_WIDTH / 2, STROKE_WIDTH / 2));
    bounds.setBottom(bounds.bottom() - SHADOW_OFFSET);

    return ShapeUtils::clamp(bar, bounds);
}

QRectF SliderSurface::indicatorBounds(const Color& color) const
{
    const QRectF bar = indicatorRect(color);
    const QRectF shadow = ShapeUtils::translate(bar, 0.0, SHADOW_OFFSET);
    return ShapeUtils::strokeBounds(bar, STROKE_WIDTH)
        .united(ShapeUtils::strokeBounds(shadow, STROKE_WIDTH));
}

void SliderSurface::paintIndicator(QPainter& painter, const Color& color) const
{
    const QRectF bar = indicatorRect(color);
    const QRectF shadow = ShapeUtils::translate(bar, 0.0, SHADOW_OFFSET);

    painter.setBrush(Qt::NoBrush);
    painter.setPen(QPen(shadowColor(), STROKE_WIDTH));
    painter.drawRoundedRect(shadow, BAR_RADIUS, BAR_RADIUS);
    painter.setPen(QPen(Qt::white, STROKE_WIDTH));
    painter.drawRoundedRect(bar, BAR_RADIUS, BAR_RADIUS);
}

}  // namespace colorwidgets
}  // namespace tinct
