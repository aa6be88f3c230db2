#include <QtTest/QtTest>
#include <QImage>
#include <QPainter>

#include "annotations/AnnotationRenderer.h"
#include "annotations/ClassRegistry.h"

class TestAnnotationRenderer : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void testDraw_UsesClassColor();
    void testDraw_UnknownClassIsGrey();
    void testDraw_SelectedBoxIsYellowWithHandles();
    void testDraw_PreviewIsDashed();
    void testDraw_LabelUsesClassColorBackground();
    void testDraw_NothingOutsideBoxes();

private:
    QImage render(const AnnotationSet& annotations, int selectedIndex = -1,
                  const QRectF& preview = QRectF(), bool labels = false);

    ClassRegistry m_registry;
};

void TestAnnotationRenderer::init()
{
    m_registry.clear();
    m_registry.addClass("cat", QColor(255, 0, 0));
    m_registry.addClass("dog", QColor(0, 0, 255));
}

QImage TestAnnotationRenderer::render(const AnnotationSet& annotations, int selectedIndex,
                                      const QRectF& preview, bool labels)
{
    QImage image(200, 200, QImage::Format_ARGB32);
    image.fill(Qt::transparent);

    AnnotationRenderer renderer(&m_registry);
    renderer.setShowLabels(labels);

    QPainter painter(&image);
    renderer.draw(painter, annotations, selectedIndex, preview);
    painter.end();
    return image;
}

void TestAnnotationRenderer::testDraw_UsesClassColor()
{
    const QImage image = render({BoxAnnotation{20, 40, 60, 40, 1}});

    // Middle of the left edge
    QCOMPARE(image.pixelColor(20, 60), QColor(0, 0, 255));
    // Interior is not filled
    QCOMPARE(image.pixelColor(50, 60).alpha(), 0);
}

void TestAnnotationRenderer::testDraw_UnknownClassIsGrey()
{
    const QImage image = render({BoxAnnotation{20, 40, 60, 40, 42}});
    QCOMPARE(image.pixelColor(20, 60), QColor(128, 128, 128));
}

void TestAnnotationRenderer::testDraw_SelectedBoxIsYellowWithHandles()
{
    const QImage image = render({BoxAnnotation{20, 40, 60, 40, 0},
                                 BoxAnnotation{120, 40, 60, 40, 0}}, 1);

    QCOMPARE(image.pixelColor(20, 60), QColor(255, 0, 0));
    QCOMPARE(image.pixelColor(120, 60), QColor(255, 255, 0));
    QVERIFY(image.pixelColor(150, 60).alpha() > 0);

    // White handle interior just inside the top-left corner marker
    QCOMPARE(image.pixelColor(122, 38), QColor(Qt::white));
    QCOMPARE(image.pixelColor(178, 82), QColor(Qt::white));
}

void TestAnnotationRenderer::testDraw_PreviewIsDashed()
{
    const QImage image = render(AnnotationSet(), -1, QRectF(20, 100, 160, 60));

    int red = 0;
    for (int x = 25; x < 175; ++x) {
        if (image.pixelColor(x, 100) == QColor(Qt::red)) {
            ++red;
        }
    }
    QVERIFY(red > 0);
    QVERIFY(red < 150);
}

void TestAnnotationRenderer::testDraw_LabelUsesClassColorBackground()
{
    const QImage image = render({BoxAnnotation{20, 80, 120, 40, 1}}, -1, QRectF(), true);

    // Left padding of the label above the box
    QCOMPARE(image.pixelColor(21, 75), QColor(0, 0, 255));
}

void TestAnnotationRenderer::testDraw_NothingOutsideBoxes()
{
    const QImage image = render({BoxAnnotation{20, 40, 60, 40, 0}});
    QCOMPARE(image.pixelColor(150, 150).alpha(), 0);
    QCOMPARE(image.pixelColor(5, 5).alpha(), 0);
}

QTEST_MAIN(TestAnnotationRenderer)
#include "tst_AnnotationRenderer.moc"
