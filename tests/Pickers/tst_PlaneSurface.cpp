#include <QtTest>
#include "colorwidgets/PlaneSurface.h"

using tinct::colorwidgets::Circle;
using tinct::colorwidgets::Color;
using tinct::colorwidgets::PlaneSurface;

namespace {

bool nearlyEqual(float a, float b)
{
    return qAbs(a - b) < 1e-5f;
}

} // namespace

/**
 * @brief Unit tests for PlaneSurface.
 *
 * Tests:
 * - Pointer mapping for the HSV and HSL variants
 * - Clamping of out-of-bounds pointer positions
 * - Indicator placement near the edges
 * - Gradient pixels and image format
 */
class tst_PlaneSurface : public QObject
{
    Q_OBJECT

private slots:
    void init();

    // Pointer mapping
    void testPointer_HsvSetsSaturationAndValue();
    void testPointer_HslSetsSaturationAndLightness();
    void testPointer_Corners();
    void testPointer_ClampsOutOfBounds();
    void testPointer_KeepsHueAndAlpha();

    // Indicator
    void testIndicator_FollowsColor();
    void testIndicatorBounds_StayInsideAtCorners_data();
    void testIndicatorBounds_StayInsideAtCorners();

    // Rendering
    void testRender_FormatAndSize();
    void testRender_HsvCorners();
    void testRender_HslTopIsBlack();
    void testRender_IsOpaque();
    void testRender_EmptyExtent();
    void testPixelSize_Floors();

    void testCursor_IsCross();

private:
    PlaneSurface m_surface;
};

void tst_PlaneSurface::init()
{
    m_surface = PlaneSurface();
    m_surface.resize(200, 200);
}

// ============================================================================
// Pointer mapping
// ============================================================================

void tst_PlaneSurface::testPointer_HsvSetsSaturationAndValue()
{
    Color color = Color::fromHsv(0.3f, 1.0f, 1.0f);
    QVERIFY(m_surface.onPointerDown(QPointF(100, 50), color));

    QVERIFY(nearlyEqual(color.saturation(), 0.5f));
    QVERIFY(nearlyEqual(color.level(), 0.75f));
}

void tst_PlaneSurface::testPointer_HslSetsSaturationAndLightness()
{
    Color color = Color::fromHsl(0.3f, 1.0f, 0.5f);
    QVERIFY(m_surface.onPointerDown(QPointF(100, 50), color));

    QVERIFY(nearlyEqual(color.saturation(), 0.5f));
    QVERIFY(nearlyEqual(color.level(), 0.25f));
}

void tst_PlaneSurface::testPointer_Corners()
{
    Color hsv = Color::fromHsv(0.0f, 0.5f, 0.5f);
    m_surface.onPointerDown(QPointF(0, 0), hsv);
    QCOMPARE(hsv.saturation(), 0.0f);
    QCOMPARE(hsv.level(), 1.0f);
    m_surface.onPointerMove(QPointF(200, 200), hsv);
    QCOMPARE(hsv.saturation(), 1.0f);
    QCOMPARE(hsv.level(), 0.0f);
    m_surface.onPointerUp();

    Color hsl = Color::fromHsl(0.0f, 0.5f, 0.5f);
    m_surface.onPointerDown(QPointF(0, 0), hsl);
    QCOMPARE(hsl.level(), 0.0f);
    m_surface.onPointerMove(QPointF(200, 200), hsl);
    QCOMPARE(hsl.saturation(), 1.0f);
    QCOMPARE(hsl.level(), 1.0f);
}

void tst_PlaneSurface::testPointer_ClampsOutOfBounds()
{
    Color color = Color::fromHsv(0.0f, 0.5f, 0.5f);

    m_surface.onPointerDown(QPointF(-50, 300), color);
    QCOMPARE(color.saturation(), 0.0f);
    QCOMPARE(color.level(), 0.0f);

    m_surface.onPointerMove(QPointF(300, -50), color);
    QCOMPARE(color.saturation(), 1.0f);
    QCOMPARE(color.level(), 1.0f);
}

void tst_PlaneSurface::testPointer_KeepsHueAndAlpha()
{
    Color color = Color::fromHsv(0.3f, 1.0f, 1.0f, 0.4f);
    m_surface.onPointerDown(QPointF(20, 180), color);

    QCOMPARE(color.hue(), 0.3f);
    QCOMPARE(color.alpha(), 0.4f);
}

// ============================================================================
// Indicator
// ============================================================================

void tst_PlaneSurface::testIndicator_FollowsColor()
{
    const Circle circle = m_surface.indicatorCircle(Color::fromHsv(0.0f, 0.5f, 0.25f));
    QCOMPARE(circle.center, QPointF(100, 150));
    QCOMPARE(circle.radius, 3.5);
}

void tst_PlaneSurface::testIndicatorBounds_StayInsideAtCorners_data()
{
    QTest::addColumn<float>("saturation");
    QTest::addColumn<float>("level");

    QTest::newRow("top-left") << 0.0f << 1.0f;
    QTest::newRow("top-right") << 1.0f << 1.0f;
    QTest::newRow("bottom-left") << 0.0f << 0.0f;
    QTest::newRow("bottom-right") << 1.0f << 0.0f;
}

void tst_PlaneSurface::testIndicatorBounds_StayInsideAtCorners()
{
    QFETCH(float, saturation);
    QFETCH(float, level);

    const QRectF bounds = m_surface.indicatorBounds(Color::fromHsv(0.0f, saturation, level));
    QVERIFY2(QRectF(0, 0, 200, 200).contains(bounds),
             qPrintable(QString("indicator bounds (%1, %2, %3, %4)")
                            .arg(bounds.x()).arg(bounds.y())
                            .arg(bounds.width()).arg(bounds.height())));
}

// ============================================================================
// Rendering
// ============================================================================

void tst_PlaneSurface::testRender_FormatAndSize()
{
    const QImage image = m_surface.render(Color::fromHsv(0.0f, 1.0f, 1.0f));
    QCOMPARE(image.size(), QSize(200, 200));
    QCOMPARE(image.format(), QImage::Format_RGBA8888);
}

void tst_PlaneSurface::testRender_HsvCorners()
{
    const QImage image = m_surface.renderGradient(Color::fromHsv(0.0f, 1.0f, 1.0f));

    // Top-left: saturation 0, value 1
    const uchar* top = image.constScanLine(0);
    QCOMPARE(int(top[0]), 255);
    QCOMPARE(int(top[1]), 255);
    QCOMPARE(int(top[2]), 255);
    QCOMPARE(int(top[3]), 255);

    // Top-right: saturation 199/200, value 1, byte order R G B A
    const uchar* px = top + 199 * 4;
    QCOMPARE(int(px[0]), 255);
    QCOMPARE(int(px[1]), 1);
    QCOMPARE(int(px[2]), 1);
    QCOMPARE(int(px[3]), 255);

    // Bottom row approaches black
    const uchar* bottom = image.constScanLine(199);
    QVERIFY(bottom[0] <= 2);
}

void tst_PlaneSurface::testRender_HslTopIsBlack()
{
    const QImage image = m_surface.renderGradient(Color::fromHsl(0.0f, 1.0f, 0.5f));
    const uchar* px = image.constScanLine(0);
    QCOMPARE(int(px[0]), 0);
    QCOMPARE(int(px[1]), 0);
    QCOMPARE(int(px[2]), 0);
    QCOMPARE(int(px[3]), 255);
}

void tst_PlaneSurface::testRender_IsOpaque()
{
    const QImage image = m_surface.renderGradient(Color::fromHsv(0.6f, 1.0f, 1.0f, 0.1f));
    for (int y = 0; y < image.height(); y += 20) {
        const uchar* line = image.constScanLine(y);
        for (int x = 0; x < image.width(); x += 20) {
            QCOMPARE(int(line[x * 4 + 3]), 255);
        }
    }
}

void tst_PlaneSurface::testRender_EmptyExtent()
{
    m_surface.resize(0, 100);
    QVERIFY(m_surface.render(Color()).isNull());

    m_surface.resize(100, 0.5);
    QVERIFY(m_surface.render(Color()).isNull());
}

void tst_PlaneSurface::testPixelSize_Floors()
{
    m_surface.resize(100.7, 50.2);
    QCOMPARE(m_surface.pixelSize(), QSize(100, 50));
    QCOMPARE(m_surface.render(Color()).size(), QSize(100, 50));
}

void tst_PlaneSurface::testCursor_IsCross()
{
    QCOMPARE(m_surface.cursorHint(), Qt::CrossCursor);

    Color color;
    m_surface.onPointerDown(QPointF(10, 10), color);
    QCOMPARE(m_surface.cursorHint(), Qt::CrossCursor);
}

QTEST_MAIN(tst_PlaneSurface)
#include "tst_PlaneSurface.moc"
