#ifndef TINCT_COLOR_PREVIEW_H
#define TINCT_COLOR_PREVIEW_H

#include "colorwidgets/Color.h"

#include <QWidget>

namespace tinct {
namespace colorwidgets {

/**
 * @brief Swatch showing a Color over a checkerboard with a centered label.
 *
 * The label is drawn in a monospace font, black or white depending on the
 * luma of the swatch as it appears over the checkerboard.
 */
class ColorPreview : public QWidget
{
    Q_OBJECT
    Q_PROPERTY(tinct::colorwidgets::Color color READ color WRITE setColor)
    Q_PROPERTY(QString label READ label WRITE setLabel)
    Q_PROPERTY(int checkerSize READ checkerSize WRITE setCheckerSize)

public:
    explicit ColorPreview(QWidget* parent = nullptr);

    Color color() const { return m_color; }
    QString label() const { return m_label; }
    int checkerSize() const { return m_checkerSize; }

    // Black or white, whichever reads better over color
    static QColor contrastingTextColor(const Color& color);

    QSize sizeHint() const override;

public slots:
    void setColor(const tinct::colorwidgets::Color& color);
    void setLabel(const QString& label);
    void setCheckerSize(int size);

signals:
    void clicked();

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;

private:
    void drawCheckerboard(QPainter& painter, const QRect& rect);

    Color m_color;
    QString m_label;
    int m_checkerSize = 6;
};

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_COLOR_PREVIEW_H
