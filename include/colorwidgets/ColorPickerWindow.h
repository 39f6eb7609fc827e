#ifndef TINCT_COLOR_PICKER_WINDOW_H
#define TINCT_COLOR_PICKER_WINDOW_H

#include "colorwidgets/Color.h"
#include "colorwidgets/ColorFormat.h"
#include "colorwidgets/PickerLayout.h"

#include <QWidget>

namespace tinct {
namespace colorwidgets {

class ColorPreview;
class PickerWidget;

/**
 * @brief Frameless picker window: two swatches above a plane, hue and alpha row.
 *
 * - Current swatch: shows the color as text in the selected format; click
 *   cycles the format
 * - Initial swatch: click restores the color the window was opened with
 * - Enter accepts, Escape cancels, Tab cycles the format
 *
 * accepted() or cancelled() is emitted exactly once.
 */
class ColorPickerWindow : public QWidget
{
    Q_OBJECT

public:
    ColorPickerWindow(const Color& initial, ColorFormat format,
                      const PickerLayout& layout = PickerLayout(), QWidget* parent = nullptr);
    ~ColorPickerWindow() override;

    Color color() const { return m_color; }
    Color initialColor() const { return m_initialColor; }
    ColorFormat format() const { return m_format; }
    QString colorText() const { return m_color.toString(m_format); }
    const PickerLayout& pickerLayout() const { return m_layout; }

    PickerWidget* planeWidget() const { return m_plane; }
    PickerWidget* hueWidget() const { return m_hue; }
    PickerWidget* alphaWidget() const { return m_alpha; }
    ColorPreview* currentSwatch() const { return m_currentSwatch; }
    ColorPreview* initialSwatch() const { return m_initialSwatch; }

public slots:
    void setColor(const tinct::colorwidgets::Color& color);
    void setFormat(tinct::colorwidgets::ColorFormat format);
    void cycleFormat();
    void restoreInitialColor();
    void accept();
    void cancel();

signals:
    void colorChanged(const tinct::colorwidgets::Color& color);
    void formatChanged(tinct::colorwidgets::ColorFormat format);
    void colorSelected(const QString& text);  // A drag on any picker ended
    void accepted(const QString& text);
    void cancelled();

protected:
    void keyPressEvent(QKeyEvent* event) override;
    void closeEvent(QCloseEvent* event) override;
    bool focusNextPrevChild(bool next) override;

private:
    void setupUi();
    void connectSignals();
    void updateChildren();
    void onPickerReleased();

    PickerLayout m_layout;
    Color m_color;
    Color m_initialColor;
    ColorFormat m_format = ColorFormat::Hex;
    bool m_finished = false;

    ColorPreview* m_currentSwatch = nullptr;
    ColorPreview* m_initialSwatch = nullptr;
    PickerWidget* m_plane = nullptr;
    PickerWidget* m_hue = nullptr;
    PickerWidget* m_alpha = nullptr;
};

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_COLOR_PICKER_WINDOW_H
