#include "colorwidgets/ShapeUtils.h"

#include <algorithm>

namespace tinct {
namespace colorwidgets {

QRectF ShapeUtils::translate(const QRectF& rect, qreal dx, qreal dy)
{
    return rect.translated(dx, dy);
}

Circle ShapeUtils::translate(const Circle& circle, qreal dx, qreal dy)
{
    return {circle.center + QPointF(dx, dy), circle.radius};
}

QRectF ShapeUtils::shrink(const QRectF& rect, const QSizeF& margin)
{
    return rect.adjusted(margin.width(), margin.height(), -margin.width(), -margin.height());
}

Circle ShapeUtils::shrink(const Circle& circle, qreal margin)
{
    return {circle.center, circle.radius - margin};
}

QRectF ShapeUtils::clamp(const QRectF& rect, const QRectF& bounds)
{
    // max first, then min: an oversized rect ends up flush with the far edge
    const qreal x = std::min(std::max(rect.left(), bounds.left()), bounds.right() - rect.width());
    const qreal y = std::min(std::max(rect.top(), bounds.top()), bounds.bottom() - rect.height());
    return QRectF(x, y, rect.width(), rect.height());
}

Circle ShapeUtils::clamp(const Circle& circle, const QRectF& bounds)
{
    const qreal r = circle.radius;
    const qreal x = std::min(std::max(circle.center.x(), bounds.left() + r), bounds.right() - r);
    const qreal y = std::min(std::max(circle.center.y(), bounds.top() + r), bounds.bottom() - r);
    return {QPointF(x, y), r};
}

QRectF ShapeUtils::strokeBounds(const QRectF& rect, qreal strokeWidth)
{
    const qreal half = strokeWidth / 2.0;
    return rect.adjusted(-half, -half, half, half);
}

QRectF ShapeUtils::strokeBounds(const Circle& circle, qreal strokeWidth)
{
    const qreal r = circle.radius + strokeWidth / 2.0;
    return QRectF(circle.center.x() - r, circle.center.y() - r, 2 * r, 2 * r);
}

}  // namespace colorwidgets
}  // namespace tinct
