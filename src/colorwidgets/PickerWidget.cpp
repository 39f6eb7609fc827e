#include "colorwidgets/PickerWidget.h"

#include <QMouseEvent>
#include <QPainter>
#include <QResizeEvent>

namespace tinct {
namespace colorwidgets {

PickerWidget::PickerWidget(std::unique_ptr<PickerSurface> surface, QWidget* parent)
    : QWidget(parent), m_surface(std::move(surface))
{
    setMouseTracking(true);
    setSizePolicy(QSizePolicy::Fixed, QSizePolicy::Fixed);
    m_surface->resize(QSizeF(size()));
    updateCursor();
}

PickerWidget::~PickerWidget() = default;

QSize PickerWidget::sizeHint() const
{
    return QSize(25, 256);
}

void PickerWidget::setColor(const Color& color)
{
    if (m_color == color)
        return;
    m_color = color;
    m_imageDirty = true;
    update();
}

void PickerWidget::setCheckerSize(int size)
{
    m_checkerSize = qMax(0, size);
    update();
}

// ========== Painting ==========

void PickerWidget::paintEvent(QPaintEvent*)
{
    if (m_imageDirty) {
        m_image = m_surface->render(m_color);
        m_imageDirty = false;
    }

    QPainter painter(this);
    if (m_checkerSize > 0) {
        drawCheckerboard(painter, rect());
    }
    if (!m_image.isNull()) {
        painter.drawImage(QPoint(0, 0), m_image);
    }
}

void PickerWidget::drawCheckerboard(QPainter& painter, const QRect& rect) const
{
    const int size = m_checkerSize;
    for (int y = rect.top(); y <= rect.bottom(); y += size) {
        for (int x = rect.left(); x <= rect.right(); x += size) {
            bool light = ((x / size) + (y / size)) % 2 == 0;
            painter.fillRect(x, y, size, size, light ? Qt::white : QColor(204, 204, 204));
        }
    }
}

void PickerWidget::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    m_surface->resize(QSizeF(event->size()));
    m_imageDirty = true;
}

// ========== Mouse Interaction ==========

void PickerWidget::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton)
        return;

    if (m_surface->onPointerDown(event->position(), m_color)) {
        m_imageDirty = true;
        update();
        emit colorChanged(m_color);
    }
    updateCursor();
}

void PickerWidget::mouseMoveEvent(QMouseEvent* event)
{
    if (m_surface->onPointerMove(event->position(), m_color)) {
        m_imageDirty = true;
        update();
        emit colorChanged(m_color);
    }
    updateCursor();
}

void PickerWidget::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || !m_surface->isDragging())
        return;

    m_surface->onPointerUp();
    updateCursor();
    emit colorSelected(m_color);
}

void PickerWidget::updateCursor()
{
    setCursor(m_surface->cursorHint());
}

}  // namespace colorwidgets
}  // namespace tinct
