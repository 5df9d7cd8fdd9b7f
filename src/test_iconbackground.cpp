#include <QtTest>
#include "iconbackground.h"
#include "icondesign.h"

class TestIconBackground : public QObject
{
    Q_OBJECT

private slots:
    void gradientEndpointsMatchStops();
    void gradientIsDiagonal();
    void cornerRadiusScalesWithSize();
    void maskOpaqueCenterTransparentCorners_data();
    void maskOpaqueCenterTransparentCorners();
    void maskCoversStraightEdges();
    void maskIsMirrorSymmetric_data();
    void maskIsMirrorSymmetric();
    void maskArcMeetsStraightEdges_data();
    void maskArcMeetsStraightEdges();
    void applyMaskClipsAlphaOnly();
    void applyMaskRejectsSizeMismatch();

private:
    static int maskAt(const QImage& mask, int x, int y) { return mask.constScanLine(y)[x]; }
    static int radiusFor(int size) { return IconBackground::cornerRadius(size, IconDesign().cornerRadiusRatio); }
    static void addMaskSizes();
};

void TestIconBackground::gradientEndpointsMatchStops()
{
    const IconDesign design;
    const int size = 1024;
    const QImage canvas = IconBackground::gradient(size, design.gradientStart, design.gradientEnd);

    QCOMPARE(canvas.size(), QSize(size, size));

    const QRgb first = canvas.pixel(0, 0);
    QCOMPARE(qRed(first), design.gradientStart.red());
    QCOMPARE(qGreen(first), design.gradientStart.green());
    QCOMPARE(qBlue(first), design.gradientStart.blue());
    QCOMPARE(qAlpha(first), 255);

    const QRgb last = canvas.pixel(size - 1, size - 1);
    QVERIFY(qAbs(qRed(last) - design.gradientEnd.red()) <= 1);
    QVERIFY(qAbs(qGreen(last) - design.gradientEnd.green()) <= 1);
    QVERIFY(qAbs(qBlue(last) - design.gradientEnd.blue()) <= 1);
    QCOMPARE(qAlpha(last), 255);
}

void TestIconBackground::gradientIsDiagonal()
{
    const QImage canvas = IconBackground::gradient(64, QColor(0, 0, 0), QColor(200, 100, 50));

    // Constant along anti-diagonals
    QCOMPARE(canvas.pixel(10, 0), canvas.pixel(0, 10));
    QCOMPARE(canvas.pixel(40, 7), canvas.pixel(7, 40));
    QCOMPARE(canvas.pixel(20, 30), canvas.pixel(30, 20));

    // Ratio (x + y) / (2 * size), truncated
    const QRgb mid = canvas.pixel(32, 32);
    QCOMPARE(qRed(mid), 100);
    QCOMPARE(qGreen(mid), 50);
    QCOMPARE(qBlue(mid), 25);
}

void TestIconBackground::cornerRadiusScalesWithSize()
{
    QCOMPARE(IconBackground::cornerRadius(1024, IconDesign().cornerRadiusRatio), 225);
    QCOMPARE(IconBackground::cornerRadius(100, IconDesign().cornerRadiusRatio), 22);
    QCOMPARE(IconBackground::cornerRadius(16, IconDesign().cornerRadiusRatio), 3);
}

void TestIconBackground::addMaskSizes()
{
    QTest::addColumn<int>("size");
    QTest::newRow("1024") << 1024;
    QTest::newRow("256") << 256;
    QTest::newRow("64") << 64;
    QTest::newRow("33") << 33;
    QTest::newRow("16") << 16;
}

void TestIconBackground::maskOpaqueCenterTransparentCorners_data()
{
    addMaskSizes();
}

void TestIconBackground::maskOpaqueCenterTransparentCorners()
{
    QFETCH(int, size);
    const QImage mask = IconBackground::roundedMask(size, radiusFor(size));

    QCOMPARE(mask.format(), QImage::Format_Alpha8);
    QCOMPARE(mask.size(), QSize(size, size));

    QCOMPARE(maskAt(mask, size / 2, size / 2), 255);
    QCOMPARE(maskAt(mask, 0, 0), 0);
    QCOMPARE(maskAt(mask, size - 1, 0), 0);
    QCOMPARE(maskAt(mask, 0, size - 1), 0);
    QCOMPARE(maskAt(mask, size - 1, size - 1), 0);
}

void TestIconBackground::maskCoversStraightEdges()
{
    const int size = 256;
    const QImage mask = IconBackground::roundedMask(size, radiusFor(size));

    QCOMPARE(maskAt(mask, 0, size / 2), 255);
    QCOMPARE(maskAt(mask, size - 1, size / 2), 255);
    QCOMPARE(maskAt(mask, size / 2, 0), 255);
    QCOMPARE(maskAt(mask, size / 2, size - 1), 255);

    // Strictly binary
    for (int y = 0; y < size; y++) {
        for (int x = 0; x < size; x++) {
            const int value = maskAt(mask, x, y);
            QVERIFY(value == 0 || value == 255);
        }
    }
}

void TestIconBackground::maskIsMirrorSymmetric_data()
{
    addMaskSizes();
}

void TestIconBackground::maskIsMirrorSymmetric()
{
    QFETCH(int, size);
    const QImage mask = IconBackground::roundedMask(size, radiusFor(size));

    QCOMPARE(mask, mask.mirrored(true, false));
    QCOMPARE(mask, mask.mirrored(false, true));
    QCOMPARE(mask, mask.mirrored(true, true));
}

void TestIconBackground::maskArcMeetsStraightEdges_data()
{
    addMaskSizes();
}

void TestIconBackground::maskArcMeetsStraightEdges()
{
    QFETCH(int, size);
    const int radius = radiusFor(size);
    const int last = size - 1;
    const int arcRow = radius - 1;
    const QImage mask = IconBackground::roundedMask(size, radius);

    // The last arc row before the straight edges reaches the outer columns and rows
    QCOMPARE(maskAt(mask, 0, arcRow), 255);
    QCOMPARE(maskAt(mask, last, arcRow), 255);
    QCOMPARE(maskAt(mask, 0, last - arcRow), 255);
    QCOMPARE(maskAt(mask, last, last - arcRow), 255);
    QCOMPARE(maskAt(mask, arcRow, 0), 255);
    QCOMPARE(maskAt(mask, arcRow, last), 255);
    QCOMPARE(maskAt(mask, last - arcRow, 0), 255);
    QCOMPARE(maskAt(mask, last - arcRow, last), 255);

    // Row 0 leaves the same number of transparent pixels on both sides
    int leftGap = 0;
    while (leftGap < size && maskAt(mask, leftGap, 0) == 0) {
        leftGap++;
    }
    int rightGap = 0;
    while (rightGap < size && maskAt(mask, last - rightGap, 0) == 0) {
        rightGap++;
    }
    QCOMPARE(leftGap, rightGap);
}

void TestIconBackground::applyMaskClipsAlphaOnly()
{
    const IconDesign design;
    const int size = 128;
    const QImage canvas = IconBackground::gradient(size, design.gradientStart, design.gradientEnd);
    const QImage result = IconBackground::render(size, design.gradientStart, design.gradientEnd, design.cornerRadiusRatio);

    QCOMPARE(result.size(), QSize(size, size));
    QVERIFY(result.hasAlphaChannel());

    QCOMPARE(qAlpha(result.pixel(0, 0)), 0);
    QCOMPARE(qAlpha(result.pixel(size - 1, size - 1)), 0);

    const QRgb center = result.pixel(size / 2, size / 2);
    QCOMPARE(qAlpha(center), 255);
    QCOMPARE(center, canvas.pixel(size / 2, size / 2));
}

void TestIconBackground::applyMaskRejectsSizeMismatch()
{
    const QImage canvas = IconBackground::gradient(32, Qt::black, Qt::white);
    const QImage mask = IconBackground::roundedMask(16, 3);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Mask size .* does not match canvas size"));
    QVERIFY(IconBackground::applyMask(canvas, mask).isNull());
}

QTEST_GUILESS_MAIN(TestIconBackground)
#include "test_iconbackground.moc"
