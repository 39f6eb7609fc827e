#include "colorwidgets/ColorPreview.h"

#include <QFontDatabase>
#include <QMouseEvent>
#include <QPainter>

namespace tinct {
namespace colorwidgets {

ColorPreview::ColorPreview(QWidget* parent) : QWidget(parent)
{
    setMinimumSize(40, 20);
    setSizePolicy(QSizePolicy::Preferred, QSizePolicy::Fixed);
    setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    setCursor(Qt::PointingHandCursor);
}

QSize ColorPreview::sizeHint() const
{
    return QSize(60, 40);
}

QColor ColorPreview::contrastingTextColor(const Color& color)
{
    // ITU-R BT.709 luma, composited over the checkerboard's mean gray
    const qreal checkerLuma = 0.9;
    const qreal luma = 0.2126 * color.red() + 0.7152 * color.green() + 0.0722 * color.blue();
    const qreal a = qBound(0.0f, color.alpha(), 1.0f);
    const qreal composite = a * luma + (1.0 - a) * checkerLuma;
    return composite > 0.5 ? Qt::black : Qt::white;
}

void ColorPreview::paintEvent(QPaintEvent*)
{
    QPainter painter(this);
    const QRect r = rect();

    if (!m_color.isOpaque()) {
        drawCheckerboard(painter, r);
    }
    painter.fillRect(r, m_color.toQColor());

    if (!m_label.isEmpty()) {
        painter.setPen(contrastingTextColor(m_color));
        painter.drawText(r, Qt::AlignCenter, m_label);
    }
}

void ColorPreview::drawCheckerboard(QPainter& painter, const QRect& rect)
{
    const int size = qMax(1, m_checkerSize);
    for (int y = rect.top(); y <= rect.bottom(); y += size) {
        for (int x = rect.left(); x <= rect.right(); x += size) {
            bool light = ((x / size) + (y / size)) % 2 == 0;
            painter.fillRect(x, y, size, size, light ? Qt::white : QColor(204, 204, 204));
        }
    }
}

void ColorPreview::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        emit clicked();
    }
}

// Getter/Setter
void ColorPreview::setColor(const Color& color)
{
    if (m_color != color) {
        m_color = color;
        update();
    }
}

void ColorPreview::setLabel(const QString& label)
{
    if (m_label != label) {
        m_label = label;
        update();
    }
}

void ColorPreview::setCheckerSize(int size)
{
    m_checkerSize = qMax(1, size);
    update();
}

}  // namespace colorwidgets
}  // namespace tinct
