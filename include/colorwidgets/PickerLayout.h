#ifndef TINCT_PICKER_LAYOUT_H
#define TINCT_PICKER_LAYOUT_H

#include <QSize>

namespace tinct {
namespace colorwidgets {

/**
 * @brief Pixel sizes of the picker window.
 *
 *   +--------------------------------------------+
 *   | current swatch                             |
 *   | initial swatch                             |
 *   | pad | plane | pad | hue | pad | alpha | pad |
 *   +--------------------------------------------+
 */
struct PickerLayout
{
    int padding = 10;
    int pickerSize = 256;
    int sliderSize = 25;
    int currentSwatchSize = 50;
    int initialSwatchSize = 30;
    int checkerSize = 6;

    int windowWidth() const { return 4 * padding + pickerSize + 2 * sliderSize; }
    int windowHeight() const
    {
        return currentSwatchSize + initialSwatchSize + 2 * padding + pickerSize;
    }
    QSize windowSize() const { return QSize(windowWidth(), windowHeight()); }

    bool operator==(const PickerLayout& other) const
    {
        return padding == other.padding && pickerSize == other.pickerSize &&
               sliderSize == other.sliderSize &&
               currentSwatchSize == other.currentSwatchSize &&
               initialSwatchSize == other.initialSwatchSize &&
               checkerSize == other.checkerSize;
    }
    bool operator!=(const PickerLayout& other) const { return !(*this == other); }
};

}  // namespace colorwidgets
}  // namespace tinct

#endif  // TINCT_PICKER_LAYOUT_H
