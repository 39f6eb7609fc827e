#ifndef TINCT_PICKER_WIDGET_H
#define TINCT_PICKER_WIDGET_H

#include "colorwidgets/Color.h"
#include "colorwidgets/PickerSurface.h"

#include <QImage>
#include <QWidget>

#include <memory>

namespace tinct {
namespace colorwidgets {

/**
 * @brief QWidget host for one PickerSurface.
 *
 * Forwards mouse press/move/release to the surface, keeps the cursor in sync
 * with the surface's hint and paints the surface's rendered image. setColor()
 * never emits; colorChanged() is only emitted for pointer-driven changes.
 */
class PickerWidget : public QWidget
{
    Q_OBJECT
    Q_PROPERTY(tinct::colorwidgets::Color color READ color WRITE setColor)
    Q_PROPERTY(int checkerSize READ checkerSize WRITE setCheckerSize)

public:
    explicit PickerWidget(std::unique_ptr<PickerSurface> surface, QWidget* parent = nullptr);
    ~PickerWidget() override;

    Color color() const { return m_color; }
    const PickerSurface* surface() const { return m_surface.get(); }

    // Cell size of the checkerboard painted behind the gradient; 0 disables it
    int checkerSize() const { return m_checkerSize; }
    void setCheckerSize(int size);

    QSize sizeHint() const override;

public slots:
    void setColor(const tinct::colorwidgets::Color& color);

signals:
    void colorChanged(const tinct::colorwidgets::Color& color);
    void colorSelected(const tinct::colorwidgets::Color& color);  // Emitted on mouse release

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;

private:
    void updateCursor();
    void drawCheckerboard(QPainter& painter, const QRect& rect) const;

    std::unique_ptr<PickerSurface> m_surface;
    Color m_color;
    int m_checkerSize = 0;

    QImage m_image;
    bool m_imageDirty = true;
};

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_PICKER_WIDGET_H
