#include "colorwidgets/PlaneSurface.h"

#include <QPainter>
#include <QPen>

namespace tinct {
namespace colorwidgets {

Color PlaneSurface::sample(const Color& color, int x, int y, int width, int height) const
{
    Color c = color;
    c.setSaturation(static_cast<float>(x) / width);
    c.setLevel(fractionToLevel(color.model(), static_cast<qreal>(y) / height));
    c.setAlpha(1.0f);
    return c;
}

void PlaneSurface::applyPosition(qreal fx, qreal fy, Color& color) const
{
    color.setSaturation(static_cast<float>(fx));
    color.setLevel(fractionToLevel(color.model(), fy));
}

float PlaneSurface::fractionToLevel(PolarModel model, qreal fy)
{
    // value grows upwards, lightness grows downwards
    return static_cast<float>(model == PolarModel::Hsv ? 1.0 - fy : fy);
}

qreal PlaneSurface::levelToFraction(const Color& color)
{
    return color.model() == PolarModel::Hsv ? 1.0 - color.level() : color.level();
}

// ========== Indicator ==========

Circle PlaneSurface::indicatorCircle(const Color& color) const
{
    const QSize size = pixelSize();
    const QPointF center(color.saturation() * size.width(), levelToFraction(color) * size.height());

    const QRectF bounds = ShapeUtils::shrink(
        ShapeUtils::shrink(QRectF(QPointF(0, 0), QSizeF(size)),
                           QSizeF(INDICATOR_INSET, INDICATOR_INSET)),
        QSizeF(STROKE_WIDTH / 2, STROKE_WIDTH / 2));

    const Circle circle = ShapeUtils::shrink(Circle{center, INDICATOR_RADIUS}, STROKE_WIDTH / 2);
    return ShapeUtils::clamp(circle, bounds);
}

QRectF PlaneSurface::indicatorBounds(const Color& color) const
{
    const Circle circle = indicatorCircle(color);
    const Circle shadow = ShapeUtils::translate(circle, 0.0, SHADOW_OFFSET);
    return ShapeUtils::strokeBounds(circle, STROKE_WIDTH)
        .united(ShapeUtils::strokeBounds(shadow, STROKE_WIDTH));
}

void PlaneSurface::paintIndicator(QPainter& painter, const Color& color) const
{
    const Circle circle = indicatorCircle(color);
    const Circle shadow = ShapeUtils::translate(circle, 0.0, SHADOW_OFFSET);

    painter.setBrush(Qt::NoBrush);
    painter.setPen(QPen(shadowColor(), STROKE_WIDTH));
    painter.drawEllipse(shadow.center, shadow.radius, shadow.radius);
    painter.setPen(QPen(Qt::white, STROKE_WIDTH));
    painter.drawEllipse(circle.center, circle.radius, circle.radius);
}

}  // namespace colorwidgets
}  // namespace tinct
