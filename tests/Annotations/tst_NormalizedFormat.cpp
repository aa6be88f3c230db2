#include <QtTest/QtTest>

#include "annotations/BoxAnnotation.h"
#include "annotations/NormalizedFormat.h"

/**
 * @brief Tests for the pixel <-> normalized label conversion.
 */
class TestNormalizedFormat : public QObject
{
    Q_OBJECT

private slots:
    void testToNormalized_ExportLine();
    void testToNormalized_RejectsZeroDimensions();
    void testToNormalized_OutsideImageIsNotClipped();
    void testRoundTrip_data();
    void testRoundTrip();
    void testFromNormalized_TruncatesClassId();
    void testFromNormalized_RejectsWrongFieldCount();
    void testFromNormalized_RejectsZeroDimensions();
    void testFromNormalized_RejectsOutOfRangeFields_data();
    void testFromNormalized_RejectsOutOfRangeFields();
    void testParseLine_ToleratesExtraWhitespace();
    void testParseLine_RejectsMalformed_data();
    void testParseLine_RejectsMalformed();
    void testBoxJson_RoundTripsAllFields();
    void testBoxJson_MissingFieldsDefaultToZero();
    void testMeetsMinimumSize();

private:
    static bool closeTo(double actual, double expected);
};

bool TestNormalizedFormat::closeTo(double actual, double expected)
{
    return qAbs(actual - expected) <= 1e-6 * qMax(1.0, qAbs(expected));
}

void TestNormalizedFormat::testToNormalized_ExportLine()
{
    const BoxAnnotation box{0.0, 0.0, 100.0, 50.0, 2};

    const auto record = NormalizedFormat::toNormalized(box, 200, 100);
    QVERIFY(record.has_value());
    QCOMPARE(record->classId, qint64(2));
    QCOMPARE(NormalizedFormat::formatLine(*record),
             QStringLiteral("2 0.250000 0.250000 0.500000 0.500000"));
}

void TestNormalizedFormat::testToNormalized_RejectsZeroDimensions()
{
    const BoxAnnotation box{0.0, 0.0, 100.0, 50.0, 0};

    AnnotationError error;
    QVERIFY(!NormalizedFormat::toNormalized(box, 0, 100, &error).has_value());
    QCOMPARE(error.code, AnnotationError::Code::InvalidImageDimensions);

    error = AnnotationError();
    QVERIFY(!NormalizedFormat::toNormalized(box, 100, 0, &error).has_value());
    QCOMPARE(error.code, AnnotationError::Code::InvalidImageDimensions);
}

void TestNormalizedFormat::testToNormalized_OutsideImageIsNotClipped()
{
    // Box hangs off the right edge of a 100x100 image
    const BoxAnnotation box{150.0, -20.0, 100.0, 40.0, 1};

    const auto record = NormalizedFormat::toNormalized(box, 100, 100);
    QVERIFY(record.has_value());
    QVERIFY(closeTo(record->xCenter, 2.0));
    QVERIFY(closeTo(record->yCenter, 0.0));
    QVERIFY(closeTo(record->width, 1.0));
    QVERIFY(closeTo(record->height, 0.4));
}

void TestNormalizedFormat::testRoundTrip_data()
{
    QTest::addColumn<double>("x");
    QTest::addColumn<double>("y");
    QTest::addColumn<double>("width");
    QTest::addColumn<double>("height");
    QTest::addColumn<int>("imageWidth");
    QTest::addColumn<int>("imageHeight");

    QTest::newRow("full image") << 0.0 << 0.0 << 640.0 << 480.0 << 640 << 480;
    QTest::newRow("centered") << 100.0 << 50.0 << 200.0 << 100.0 << 400 << 200;
    QTest::newRow("fractional") << 12.5 << 33.25 << 47.75 << 11.125 << 1920 << 1080;
    QTest::newRow("bottom right corner") << 1000.0 << 700.0 << 24.0 << 20.0 << 1024 << 720;
}

void TestNormalizedFormat::testRoundTrip()
{
    QFETCH(double, x);
    QFETCH(double, y);
    QFETCH(double, width);
    QFETCH(double, height);
    QFETCH(int, imageWidth);
    QFETCH(int, imageHeight);

    const BoxAnnotation box{x, y, width, height, 3};
    const auto record = NormalizedFormat::toNormalized(box, imageWidth, imageHeight);
    QVERIFY(record.has_value());

    const auto restored = NormalizedFormat::fromNormalized(record->toFields(), imageWidth, imageHeight);
    QVERIFY(restored.has_value());
    QCOMPARE(restored->classId, qint64(3));
    QVERIFY(closeTo(restored->x, x));
    QVERIFY(closeTo(restored->y, y));
    QVERIFY(closeTo(restored->width, width));
    QVERIFY(closeTo(restored->height, height));
}

void TestNormalizedFormat::testFromNormalized_TruncatesClassId()
{
    const auto box = NormalizedFormat::fromNormalized({2.9, 0.5, 0.5, 0.2, 0.2}, 100, 100);
    QVERIFY(box.has_value());
    QCOMPARE(box->classId, qint64(2));
    QVERIFY(closeTo(box->x, 40.0));
    QVERIFY(closeTo(box->y, 40.0));
    QVERIFY(closeTo(box->width, 20.0));
    QVERIFY(closeTo(box->height, 20.0));
}

void TestNormalizedFormat::testFromNormalized_RejectsWrongFieldCount()
{
    AnnotationError error;
    QVERIFY(!NormalizedFormat::fromNormalized({0.0, 0.5, 0.5, 0.2}, 100, 100, &error).has_value());
    QCOMPARE(error.code, AnnotationError::Code::MalformedRecord);

    error = AnnotationError();
    QVERIFY(!NormalizedFormat::fromNormalized({0.0, 0.5, 0.5, 0.2, 0.2, 0.1}, 100, 100, &error)
                 .has_value());
    QCOMPARE(error.code, AnnotationError::Code::MalformedRecord);
}

void TestNormalizedFormat::testFromNormalized_RejectsZeroDimensions()
{
    AnnotationError error;
    QVERIFY(!NormalizedFormat::fromNormalized({0.0, 0.5, 0.5, 0.2, 0.2}, 0, 0, &error).has_value());
    QCOMPARE(error.code, AnnotationError::Code::InvalidImageDimensions);
}

void TestNormalizedFormat::testFromNormalized_RejectsOutOfRangeFields_data()
{
    QTest::addColumn<QString>("line");

    QTest::newRow("negative class") << QStringLiteral("-3 0.5 0.5 0.2 0.2");
    QTest::newRow("huge class") << QStringLiteral("1e300 0.5 0.5 0.1 0.1");
    QTest::newRow("class 2^63") << QStringLiteral("9223372036854775808 0.5 0.5 0.1 0.1");
    QTest::newRow("negative width") << QStringLiteral("0 0.5 0.5 -0.2 0.2");
    QTest::newRow("negative height") << QStringLiteral("0 0.5 0.5 0.2 -0.2");
}

void TestNormalizedFormat::testFromNormalized_RejectsOutOfRangeFields()
{
    QFETCH(QString, line);

    // Syntactically fine, rejected on conversion
    const auto fields = NormalizedFormat::parseLine(line);
    QVERIFY(fields.has_value());

    AnnotationError error;
    QVERIFY(!NormalizedFormat::fromNormalized(*fields, 100, 100, &error).has_value());
    QCOMPARE(error.code, AnnotationError::Code::MalformedRecord);
}

void TestNormalizedFormat::testParseLine_ToleratesExtraWhitespace()
{
    const auto fields = NormalizedFormat::parseLine(QStringLiteral("  1\t0.5   0.25 0.1 0.2 \n"));
    QVERIFY(fields.has_value());
    QCOMPARE(fields->size(), 5);
    QCOMPARE(fields->at(0), 1.0);
    QCOMPARE(fields->at(2), 0.25);
    QCOMPARE(fields->at(4), 0.2);
}

void TestNormalizedFormat::testParseLine_RejectsMalformed_data()
{
    QTest::addColumn<QString>("line");

    QTest::newRow("word") << QStringLiteral("garbage");
    QTest::newRow("too few") << QStringLiteral("0 0.1 0.1 0.2");
    QTest::newRow("too many") << QStringLiteral("0 0.1 0.1 0.2 0.2 0.3");
    QTest::newRow("not a number") << QStringLiteral("0 0.1 abc 0.2 0.2");
    QTest::newRow("infinite") << QStringLiteral("0 0.1 inf 0.2 0.2");
    QTest::newRow("empty") << QString();
}

void TestNormalizedFormat::testParseLine_RejectsMalformed()
{
    QFETCH(QString, line);

    AnnotationError error;
    QVERIFY(!NormalizedFormat::parseLine(line, &error).has_value());
    QCOMPARE(error.code, AnnotationError::Code::MalformedRecord);
}

void TestNormalizedFormat::testBoxJson_RoundTripsAllFields()
{
    const BoxAnnotation box{10.5, 20.0, 30.25, 40.0, 7};
    const QJsonObject json = box.toJson();

    QCOMPARE(json.value("x").toDouble(), 10.5);
    QCOMPARE(json.value("class_id").toInt(), 7);
    QCOMPARE(BoxAnnotation::fromJson(json), box);
}

void TestNormalizedFormat::testBoxJson_MissingFieldsDefaultToZero()
{
    QJsonObject json;
    json["x"] = 5.0;
    json["width"] = 20.0;

    const BoxAnnotation box = BoxAnnotation::fromJson(json);
    QCOMPARE(box.x, 5.0);
    QCOMPARE(box.y, 0.0);
    QCOMPARE(box.width, 20.0);
    QCOMPARE(box.height, 0.0);
    QCOMPARE(box.classId, qint64(0));
}

void TestNormalizedFormat::testMeetsMinimumSize()
{
    QVERIFY(meetsMinimumSize(QRectF(0, 0, 11, 11)));
    QVERIFY(!meetsMinimumSize(QRectF(0, 0, 10, 50)));
    QVERIFY(!meetsMinimumSize(QRectF(0, 0, 50, 10)));
    QVERIFY(!meetsMinimumSize(QRectF(0, 0, 5, 5)));
}

QTEST_MAIN(TestNormalizedFormat)
#include "tst_NormalizedFormat.moc"
