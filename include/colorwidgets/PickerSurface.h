#ifndef TINCT_PICKER_SURFACE_H
#define TINCT_PICKER_SURFACE_H

#include "colorwidgets/Color.h"

#include <QImage>
#include <QPointF>
#include <QRectF>
#include <QSize>
#include <QSizeF>

class QPainter;

namespace tinct {
namespace colorwidgets {

/**
 * @brief Render + interaction unit behind one gradient control.
 *
 * A surface remembers only its last extent and whether a drag is in
 * progress. It reads a Color to render and writes into a caller-owned Color
 * when the pointer interacts with it:
 *
 *   Idle --pointerDown--> Dragging   (mutates)
 *   Dragging --pointerMove--> Dragging (mutates)
 *   Dragging --pointerUp--> Idle
 *
 * A pointer move while Idle mutates nothing; the widget only refreshes its
 * cursor from cursorHint().
 *
 * Pixel output is QImage::Format_RGBA8888: tightly packed, non-premultiplied
 * RGBA8, row-major, top to bottom, floor(width) x floor(height).
 */
class PickerSurface
{
public:
    enum class State { Idle, Dragging };

    virtual ~PickerSurface();

    // Must be called before pointer positions can be mapped.
    void resize(qreal width, qreal height);
    void resize(const QSizeF& extent);
    QSizeF extent() const { return m_extent; }
    QSize pixelSize() const;

    // Gradient followed by the position indicator
    QImage render(const Color& color) const;
    QImage renderGradient(const Color& color) const;

    // Area touched by the indicator (stroke and shadow included)
    virtual QRectF indicatorBounds(const Color& color) const = 0;

    // Each returns true when the color was mutated.
    bool onPointerDown(const QPointF& pos, Color& color);
    bool onPointerMove(const QPointF& pos, Color& color);
    void onPointerUp();

    State state() const { return m_state; }
    bool isDragging() const { return m_state == State::Dragging; }
    Qt::CursorShape cursorHint() const;

protected:
    PickerSurface() = default;

    // Candidate color for pixel (x, y) of a width x height gradient
    virtual Color sample(const Color& color, int x, int y, int width, int height) const = 0;

    // fx, fy: pointer position as a fraction of the extent, already clamped to [0, 1]
    virtual void applyPosition(qreal fx, qreal fy, Color& color) const = 0;

    virtual void paintIndicator(QPainter& painter, const Color& color) const = 0;

    virtual Qt::CursorShape hoverCursor() const = 0;
    virtual Qt::CursorShape dragCursor() const { return hoverCursor(); }

    qreal fractionX(qreal x) const;
    qreal fractionY(qreal y) const;

    static QColor shadowColor();

    static constexpr qreal STROKE_WIDTH = 2.0;
    static constexpr qreal SHADOW_OFFSET = 1.0;

private:
    void mapPointer(const QPointF& pos, Color& color) const;

    QSizeF m_extent;
    State m_state = State::Idle;
};

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_PICKER_SURFACE_H
