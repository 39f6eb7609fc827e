#include "colorwidgets/ColorPickerWindow.h"

#include "colorwidgets/AlphaSurface.h"
#include "colorwidgets/ColorPreview.h"
#include "colorwidgets/HueSurface.h"
#include "colorwidgets/PickerWidget.h"
#include "colorwidgets/PlaneSurface.h"

#include <QCloseEvent>
#include <QDebug>
#include <QKeyEvent>

namespace tinct {
namespace colorwidgets {

ColorPickerWindow::ColorPickerWindow(const Color& initial, ColorFormat format,
                                     const PickerLayout& layout, QWidget* parent)
    : QWidget(parent, Qt::Window | Qt::FramelessWindowHint)
    , m_layout(layout)
    , m_color(initial)
    , m_initialColor(initial)
    , m_format(format)
{
    setWindowTitle(tr("Color Picker"));
    setFocusPolicy(Qt::StrongFocus);
    setupUi();
    connectSignals();
    updateChildren();
}

ColorPickerWindow::~ColorPickerWindow() = default;

void ColorPickerWindow::setupUi()
{
    const PickerLayout& l = m_layout;
    setFixedSize(l.windowSize());

    m_currentSwatch = new ColorPreview(this);
    m_currentSwatch->setGeometry(0, 0, l.windowWidth(), l.currentSwatchSize);
    m_currentSwatch->setCheckerSize(l.checkerSize);

    m_initialSwatch = new ColorPreview(this);
    m_initialSwatch->setGeometry(0, l.currentSwatchSize, l.windowWidth(), l.initialSwatchSize);
    m_initialSwatch->setCheckerSize(l.checkerSize);
    m_initialSwatch->setColor(m_initialColor);

    const int top = l.currentSwatchSize + l.initialSwatchSize + l.padding;

    m_plane = new PickerWidget(std::make_unique<PlaneSurface>(), this);
    m_plane->setGeometry(l.padding, top, l.pickerSize, l.pickerSize);

    m_hue = new PickerWidget(std::make_unique<HueSurface>(), this);
    m_hue->setGeometry(2 * l.padding + l.pickerSize, top, l.sliderSize, l.pickerSize);

    m_alpha = new PickerWidget(std::make_unique<AlphaSurface>(), this);
    m_alpha->setGeometry(3 * l.padding + l.pickerSize + l.sliderSize, top,
                         l.sliderSize, l.pickerSize);
    m_alpha->setCheckerSize(l.checkerSize);
}

void ColorPickerWindow::connectSignals()
{
    connect(m_plane, &PickerWidget::colorChanged, this, &ColorPickerWindow::setColor);
    connect(m_hue, &PickerWidget::colorChanged, this, &ColorPickerWindow::setColor);
    connect(m_alpha, &PickerWidget::colorChanged, this, &ColorPickerWindow::setColor);

    for (PickerWidget* picker : {m_plane, m_hue, m_alpha}) {
        connect(picker, &PickerWidget::colorSelected, this,
                [this](const Color&) { onPickerReleased(); });
    }

    connect(m_currentSwatch, &ColorPreview::clicked, this, &ColorPickerWindow::cycleFormat);
    connect(m_initialSwatch, &ColorPreview::clicked, this,
            &ColorPickerWindow::restoreInitialColor);
}

void ColorPickerWindow::onPickerReleased()
{
    const QString text = colorText();
    qDebug() << "ColorPickerWindow: Selected" << text;
    emit colorSelected(text);
}

void ColorPickerWindow::updateChildren()
{
    m_plane->setColor(m_color);
    m_hue->setColor(m_color);
    m_alpha->setColor(m_color);

    m_currentSwatch->setColor(m_color);
    m_currentSwatch->setLabel(colorText());
    m_initialSwatch->setLabel(m_initialColor.toString(m_format));
}

void ColorPickerWindow::setColor(const Color& color)
{
    if (m_color == color)
        return;
    m_color = color;
    updateChildren();
    emit colorChanged(m_color);
}

void ColorPickerWindow::setFormat(ColorFormat format)
{
    if (m_format == format)
        return;
    m_format = format;
    updateChildren();
    emit formatChanged(m_format);
}

void ColorPickerWindow::cycleFormat()
{
    setFormat(nextFormat(m_format));
}

void ColorPickerWindow::restoreInitialColor()
{
    setColor(m_initialColor);
}

void ColorPickerWindow::accept()
{
    if (m_finished)
        return;
    m_finished = true;

    const QString text = colorText();
    qDebug() << "ColorPickerWindow: Accepted" << text;
    emit accepted(text);
    close();
}

void ColorPickerWindow::cancel()
{
    if (m_finished)
        return;
    m_finished = true;

    qDebug() << "ColorPickerWindow: Cancelled";
    emit cancelled();
    close();
}

void ColorPickerWindow::keyPressEvent(QKeyEvent* event)
{
    switch (event->key()) {
        case Qt::Key_Escape:
            cancel();
            break;
        case Qt::Key_Return:
        case Qt::Key_Enter:
            accept();
            break;
        case Qt::Key_Tab:
            cycleFormat();
            break;
        default:
            QWidget::keyPressEvent(event);
            break;
    }
}

void ColorPickerWindow::closeEvent(QCloseEvent* event)
{
    // Closing through the window manager counts as cancel
    if (!m_finished) {
        m_finished = true;
        qDebug() << "ColorPickerWindow: Closed without accepting";
        emit cancelled();
    }
    QWidget::closeEvent(event);
}

bool ColorPickerWindow::focusNextPrevChild(bool /*next*/)
{
    // Tab is a format shortcut here, not focus navigation
    return false;
}

}  // namespace colorwidgets
}  // namespace tinct
