#include "colorwidgets/PickerSurface.h"

#include <QPainter>

#include <cmath>
#include <cstring>

namespace tinct {
namespace colorwidgets {

PickerSurface::~PickerSurface() = default;

void PickerSurface::resize(qreal width, qreal height)
{
    m_extent = QSizeF(width, height);
}

void PickerSurface::resize(const QSizeF& extent)
{
    m_extent = extent;
}

QSize PickerSurface::pixelSize() const
{
    const int w = static_cast<int>(std::floor(qMax<qreal>(0.0, m_extent.width())));
    const int h = static_cast<int>(std::floor(qMax<qreal>(0.0, m_extent.height())));
    return QSize(w, h);
}

// ========== Rendering ==========

QImage PickerSurface::renderGradient(const Color& color) const
{
    const QSize size = pixelSize();
    if (size.isEmpty()) {
        return QImage();
    }

    const int width = size.width();
    const int height = size.height();

    QImage image(width, height, QImage::Format_RGBA8888);
    for (int y = 0; y < height; ++y) {
        uchar* line = image.scanLine(y);
        for (int x = 0; x < width; ++x) {
            const auto px = sample(color, x, y, width, height).toPixel();
            std::memcpy(line + x * 4, px.data(), 4);
        }
    }
    return image;
}

QImage PickerSurface::render(const Color& color) const
{
    QImage image = renderGradient(color);
    if (image.isNull()) {
        return image;
    }

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing);
    paintIndicator(painter, color);
    painter.end();

    return image;
}

QColor PickerSurface::shadowColor()
{
    return QColor(0, 0, 0, 51);  // 20% black
}

// ========== Pointer Interaction ==========

bool PickerSurface::onPointerDown(const QPointF& pos, Color& color)
{
    m_state = State::Dragging;
    mapPointer(pos, color);
    return true;
}

bool PickerSurface::onPointerMove(const QPointF& pos, Color& color)
{
    if (m_state != State::Dragging) {
        return false;
    }
    mapPointer(pos, color);
    return true;
}

void PickerSurface::onPointerUp()
{
    m_state = State::Idle;
}

Qt::CursorShape PickerSurface::cursorHint() const
{
    return m_state == State::Dragging ? dragCursor() : hoverCursor();
}

void PickerSurface::mapPointer(const QPointF& pos, Color& color) const
{
    applyPosition(fractionX(pos.x()), fractionY(pos.y()), color);
}

qreal PickerSurface::fractionX(qreal x) const
{
    const qreal w = m_extent.width();
    if (w <= 0.0)
        return 0.0;
    return qBound(0.0, x, w) / w;
}

qreal PickerSurface::fractionY(qreal y) const
{
    const qreal h = m_extent.height();
    if (h <= 0.0)
        return 0.0;
    return qBound(0.0, y, h) / h;
}

}  // namespace colorwidgets
}  // namespace tinct
