#ifndef TINCT_COLOR_WIDGETS_H
#define TINCT_COLOR_WIDGETS_H

/**
 * @file ColorWidgets.h
 * @brief Main header file for the Tinct color widgets library
 *
 * This header includes all color components for convenient access.
 * You can either include this file to get all components, or include
 * individual headers for specific components.
 *
 * Components included:
 * - Color / ColorConversion: RGB, HSV and HSL model with conversions
 * - ColorParser: CSS color text to Color
 * - ColorFormat: output formats and polar model names
 * - ShapeUtils: indicator geometry helpers
 * - PlaneSurface, HueSurface, AlphaSurface: pointer-to-color picker surfaces
 * - PickerWidget: QWidget host for a picker surface
 * - ColorPreview: swatch with a contrasting label
 * - ColorPickerWindow: the complete frameless picker
 *
 * Example usage:
 * @code
 * #include "colorwidgets/ColorWidgets.h"
 *
 * using namespace tinct::colorwidgets;
 *
 * // Headless conversion
 * ColorParseResult result = ColorParser::parse("hsl(30deg 100% 50%)");
 * QString hex = result.color->toHexString();  // "#ff8000"
 *
 * // Or drive a surface directly
 * PlaneSurface plane;
 * plane.resize(200, 200);
 * Color color = *result.color;
 * plane.onPointerDown(QPointF(100, 50), color);
 * @endcode
 */

#include "colorwidgets/AlphaSurface.h"
#include "colorwidgets/Color.h"
#include "colorwidgets/ColorConversion.h"
#include "colorwidgets/ColorFormat.h"
#include "colorwidgets/ColorParser.h"
#include "colorwidgets/ColorPickerWindow.h"
#include "colorwidgets/ColorPreview.h"
#include "colorwidgets/HueSurface.h"
#include "colorwidgets/PickerLayout.h"
#include "colorwidgets/PickerWidget.h"
#include "colorwidgets/PlaneSurface.h"
#include "colorwidgets/ShapeUtils.h"

#endif  // TINCT_COLOR_WIDGETS_H
