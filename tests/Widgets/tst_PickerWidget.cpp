#include <QtTest>
#include <QMouseEvent>
#include <QSignalSpy>

#include "colorwidgets/AlphaSurface.h"
#include "colorwidgets/HueSurface.h"
#include "colorwidgets/PickerWidget.h"
#include "colorwidgets/PlaneSurface.h"

using tinct::colorwidgets::AlphaSurface;
using tinct::colorwidgets::Color;
using tinct::colorwidgets::HueSurface;
using tinct::colorwidgets::PickerWidget;
using tinct::colorwidgets::PlaneSurface;

/**
 * @brief Tests PickerWidget event forwarding and signals.
 *
 * Tests:
 * - Press/move/release drive the surface and emit colorChanged
 * - colorSelected on release only
 * - Hover moves and right-button presses change nothing
 * - setColor is silent
 * - Cursor follows the surface's hint
 */
class tst_PickerWidget : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testPress_EmitsColorChanged();
    void testDrag_EmitsForEveryMove();
    void testRelease_EmitsColorSelected();
    void testHover_DoesNotEmit();
    void testRightButton_Ignored();
    void testSetColor_IsSilent();
    void testCursor_FollowsDragState();
    void testResize_UpdatesSurfaceExtent();
    void testPlane_PressSetsSaturationAndValue();
    void testAlpha_CheckerSize();

private:
    void sendMouse(QWidget* widget, QEvent::Type type, const QPointF& pos,
                   Qt::MouseButton button = Qt::LeftButton);

    PickerWidget* m_widget = nullptr;
};

void tst_PickerWidget::init()
{
    m_widget = new PickerWidget(std::make_unique<HueSurface>());
    m_widget->resize(25, 200);
    m_widget->setColor(Color::fromHsv(0.0f, 1.0f, 1.0f));
    m_widget->show();
    QVERIFY(QTest::qWaitForWindowExposed(m_widget));
}

void tst_PickerWidget::cleanup()
{
    delete m_widget;
    m_widget = nullptr;
}

void tst_PickerWidget::sendMouse(QWidget* widget, QEvent::Type type, const QPointF& pos,
                                 Qt::MouseButton button)
{
    const Qt::MouseButtons buttons =
        type == QEvent::MouseButtonRelease ? Qt::NoButton : Qt::MouseButtons(button);
    QMouseEvent event(type, pos, widget->mapToGlobal(pos), button, buttons, Qt::NoModifier);
    QCoreApplication::sendEvent(widget, &event);
}

// ============================================================================
// Signals
// ============================================================================

void tst_PickerWidget::testPress_EmitsColorChanged()
{
    QSignalSpy spy(m_widget, &PickerWidget::colorChanged);
    QVERIFY(spy.isValid());

    sendMouse(m_widget, QEvent::MouseButtonPress, QPointF(10, 50));

    QCOMPARE(spy.count(), 1);
    const Color emitted = spy.at(0).at(0).value<Color>();
    QVERIFY(qAbs(emitted.hue() - 0.25f) < 1e-5f);
    QVERIFY(m_widget->color() == emitted);
}

void tst_PickerWidget::testDrag_EmitsForEveryMove()
{
    QSignalSpy spy(m_widget, &PickerWidget::colorChanged);

    sendMouse(m_widget, QEvent::MouseButtonPress, QPointF(10, 20), Qt::LeftButton);
    sendMouse(m_widget, QEvent::MouseMove, QPointF(10, 40), Qt::NoButton);
    sendMouse(m_widget, QEvent::MouseMove, QPointF(10, 80), Qt::NoButton);

    QCOMPARE(spy.count(), 3);
    QVERIFY(qAbs(m_widget->color().hue() - 0.4f) < 1e-5f);
}

void tst_PickerWidget::testRelease_EmitsColorSelected()
{
    QSignalSpy selectedSpy(m_widget, &PickerWidget::colorSelected);

    sendMouse(m_widget, QEvent::MouseButtonPress, QPointF(10, 100));
    QCOMPARE(selectedSpy.count(), 0);

    sendMouse(m_widget, QEvent::MouseButtonRelease, QPointF(10, 100));
    QCOMPARE(selectedSpy.count(), 1);
    QVERIFY(qAbs(selectedSpy.at(0).at(0).value<Color>().hue() - 0.5f) < 1e-5f);

    // A second release without a press is ignored
    sendMouse(m_widget, QEvent::MouseButtonRelease, QPointF(10, 100));
    QCOMPARE(selectedSpy.count(), 1);
}

void tst_PickerWidget::testHover_DoesNotEmit()
{
    QSignalSpy spy(m_widget, &PickerWidget::colorChanged);
    const Color before = m_widget->color();

    sendMouse(m_widget, QEvent::MouseMove, QPointF(10, 150), Qt::NoButton);

    QCOMPARE(spy.count(), 0);
    QVERIFY(m_widget->color() == before);
}

void tst_PickerWidget::testRightButton_Ignored()
{
    QSignalSpy spy(m_widget, &PickerWidget::colorChanged);

    sendMouse(m_widget, QEvent::MouseButtonPress, QPointF(10, 150), Qt::RightButton);

    QCOMPARE(spy.count(), 0);
    QVERIFY(!m_widget->surface()->isDragging());
}

void tst_PickerWidget::testSetColor_IsSilent()
{
    QSignalSpy spy(m_widget, &PickerWidget::colorChanged);

    m_widget->setColor(Color::fromHsv(0.6f, 0.5f, 0.5f));

    QCOMPARE(spy.count(), 0);
    QCOMPARE(m_widget->color().hue(), 0.6f);
}

// ============================================================================
// Cursor / geometry
// ============================================================================

void tst_PickerWidget::testCursor_FollowsDragState()
{
    QCOMPARE(m_widget->cursor().shape(), Qt::OpenHandCursor);

    sendMouse(m_widget, QEvent::MouseButtonPress, QPointF(10, 50));
    QCOMPARE(m_widget->cursor().shape(), Qt::ClosedHandCursor);

    sendMouse(m_widget, QEvent::MouseButtonRelease, QPointF(10, 50));
    QCOMPARE(m_widget->cursor().shape(), Qt::OpenHandCursor);
}

void tst_PickerWidget::testResize_UpdatesSurfaceExtent()
{
    QCOMPARE(m_widget->surface()->extent(), QSizeF(25, 200));

    m_widget->resize(30, 100);
    QCOMPARE(m_widget->surface()->extent(), QSizeF(30, 100));

    sendMouse(m_widget, QEvent::MouseButtonPress, QPointF(10, 50));
    QVERIFY(qAbs(m_widget->color().hue() - 0.5f) < 1e-5f);
}

void tst_PickerWidget::testPlane_PressSetsSaturationAndValue()
{
    PickerWidget plane(std::make_unique<PlaneSurface>());
    plane.resize(200, 200);
    plane.setColor(Color::fromHsv(0.3f, 1.0f, 1.0f));
    plane.show();
    QVERIFY(QTest::qWaitForWindowExposed(&plane));

    QCOMPARE(plane.cursor().shape(), Qt::CrossCursor);

    sendMouse(&plane, QEvent::MouseButtonPress, QPointF(100, 50));
    QVERIFY(qAbs(plane.color().saturation() - 0.5f) < 1e-5f);
    QVERIFY(qAbs(plane.color().level() - 0.75f) < 1e-5f);
    QCOMPARE(plane.color().hue(), 0.3f);
}

void tst_PickerWidget::testAlpha_CheckerSize()
{
    PickerWidget alpha(std::make_unique<AlphaSurface>());
    QCOMPARE(alpha.checkerSize(), 0);

    alpha.setCheckerSize(6);
    QCOMPARE(alpha.checkerSize(), 6);

    alpha.setCheckerSize(-4);
    QCOMPARE(alpha.checkerSize(), 0);
}

QTEST_MAIN(tst_PickerWidget)
#include "tst_PickerWidget.moc"
