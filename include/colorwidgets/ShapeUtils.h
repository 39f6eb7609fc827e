#ifndef TINCT_SHAPE_UTILS_H
#define TINCT_SHAPE_UTILS_H

#include <QPointF>
#include <QRectF>
#include <QSizeF>

namespace tinct {
namespace colorwidgets {

struct Circle
{
    QPointF center;
    qreal radius = 0.0;
};

/**
 * ShapeUtils - indicator geometry helpers
 *
 * translate() offsets a shape, shrink() insets it symmetrically and clamp()
 * moves it inside a bounding rectangle. clamp() only ever changes the
 * origin (or center), never the size.
 */
class ShapeUtils
{
public:
    ShapeUtils() = delete;

    static QRectF translate(const QRectF& rect, qreal dx, qreal dy);
    static Circle translate(const Circle& circle, qreal dx, qreal dy);

    // Inset each side by margin.width() horizontally and margin.height() vertically
    static QRectF shrink(const QRectF& rect, const QSizeF& margin);
    static Circle shrink(const Circle& circle, qreal margin);

    static QRectF clamp(const QRectF& rect, const QRectF& bounds);
    static Circle clamp(const Circle& circle, const QRectF& bounds);

    // Area covered when stroked with a pen of the given width
    static QRectF strokeBounds(const QRectF& rect, qreal strokeWidth);
    static QRectF strokeBounds(const Circle& circle, qreal strokeWidth);
};

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_SHAPE_UTILS_H
