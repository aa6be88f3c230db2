#include <QtTest/QtTest>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QTemporaryDir>

#include "annotations/ClassRegistry.h"

#include <yaml-cpp/yaml.h>

class TestClassRegistry : public QObject
{
    Q_OBJECT

private slots:
    void testAddClass_AssignsIncreasingIds();
    void testAddClass_ExistingNameReturnsSameId();
    void testAddClass_GeneratedColorInRange();
    void testLookup_UnknownIdFallbacks();
    void testUpdateClass();
    void testRemoveClass_ReusesOnlyHighestId();
    void testAddOrUpdateClass_AdvancesNextId();
    void testClassNames_OrderedById();
    void testMerge_ReusesMatchingNames();
    void testSaveLoadJson_Roundtrip();
    void testLoadJson_FillsMissingFields();
    void testLoadJson_InvalidFileKeepsClasses();
    void testExportDataYaml();
    void testExportDataYaml_EscapesSpecialNames();

private:
    static QByteArray readFile(const QString& path);
};

QByteArray TestClassRegistry::readFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

void TestClassRegistry::testAddClass_AssignsIncreasingIds()
{
    ClassRegistry registry;
    QCOMPARE(registry.addClass("cat", QColor(255, 0, 0)), qint64(0));
    QCOMPARE(registry.addClass("dog", QColor(0, 255, 0)), qint64(1));
    QCOMPARE(registry.count(), 2);
    QCOMPARE(registry.nextClassId(), qint64(2));
    QCOMPARE(registry.classColor(1), QColor(0, 255, 0));
}

void TestClassRegistry::testAddClass_ExistingNameReturnsSameId()
{
    ClassRegistry registry;
    registry.addClass("cat", QColor(255, 0, 0));
    registry.addClass("dog");

    QCOMPARE(registry.addClass("cat", QColor(0, 0, 255)), qint64(0));
    QCOMPARE(registry.count(), 2);
    QCOMPARE(registry.classColor(0), QColor(255, 0, 0));
}

void TestClassRegistry::testAddClass_GeneratedColorInRange()
{
    ClassRegistry registry;
    for (int i = 0; i < 20; ++i) {
        const qint64 id = registry.addClass(QStringLiteral("class_%1").arg(i));
        const QColor color = registry.classColor(id);
        QVERIFY(color.red() >= 50 && color.red() <= 200);
        QVERIFY(color.green() >= 50 && color.green() <= 200);
        QVERIFY(color.blue() >= 50 && color.blue() <= 200);
    }
}

void TestClassRegistry::testLookup_UnknownIdFallbacks()
{
    ClassRegistry registry;
    QCOMPARE(registry.className(7), QStringLiteral("Unknown(7)"));
    QCOMPARE(registry.classColor(7), QColor(128, 128, 128));
    QVERIFY(!registry.classInfo(7).has_value());
    QVERIFY(!registry.findByName("cat").has_value());
}

void TestClassRegistry::testUpdateClass()
{
    ClassRegistry registry;
    registry.addClass("cat", QColor(255, 0, 0));

    QVERIFY(registry.updateClass(0, "kitten", QColor(10, 20, 30)));
    QCOMPARE(registry.className(0), QStringLiteral("kitten"));
    QCOMPARE(registry.classColor(0), QColor(10, 20, 30));

    QVERIFY(!registry.updateClass(5, "ghost", QColor(1, 2, 3)));
    QCOMPARE(registry.count(), 1);
}

void TestClassRegistry::testRemoveClass_ReusesOnlyHighestId()
{
    ClassRegistry registry;
    registry.addClass("a");
    registry.addClass("b");
    registry.addClass("c");

    QVERIFY(registry.removeClass(1));
    QCOMPARE(registry.nextClassId(), qint64(3));

    QVERIFY(registry.removeClass(2));
    QCOMPARE(registry.nextClassId(), qint64(1));

    QVERIFY(!registry.removeClass(2));
    QCOMPARE(registry.addClass("d"), qint64(1));
}

void TestClassRegistry::testAddOrUpdateClass_AdvancesNextId()
{
    ClassRegistry registry;
    QCOMPARE(registry.addOrUpdateClass(5, "truck", QColor(1, 2, 3)), qint64(5));
    QCOMPARE(registry.nextClassId(), qint64(6));

    QCOMPARE(registry.addOrUpdateClass(5, "lorry", QColor(4, 5, 6)), qint64(5));
    QCOMPARE(registry.className(5), QStringLiteral("lorry"));
    QCOMPARE(registry.count(), 1);
}

void TestClassRegistry::testClassNames_OrderedById()
{
    ClassRegistry registry;
    registry.addOrUpdateClass(2, "c", QColor(1, 1, 1));
    registry.addOrUpdateClass(0, "a", QColor(1, 1, 1));
    registry.addOrUpdateClass(1, "b", QColor(1, 1, 1));

    QCOMPARE(registry.classNames(), QStringList({"a", "b", "c"}));
}

void TestClassRegistry::testMerge_ReusesMatchingNames()
{
    ClassRegistry registry;
    registry.addClass("cat");
    registry.addClass("dog");

    ClassRegistry other;
    other.addClass("bird");
    other.addClass("dog");

    const QHash<qint64, qint64> mapping = registry.merge(other);
    QCOMPARE(mapping.value(0), qint64(2));  // bird is new
    QCOMPARE(mapping.value(1), qint64(1));  // dog already present
    QCOMPARE(registry.count(), 3);
}

void TestClassRegistry::testSaveLoadJson_Roundtrip()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString path = tempDir.filePath("classes.json");

    ClassRegistry registry;
    registry.addClass("cat", QColor(200, 100, 50));
    registry.addOrUpdateClass(4, "dog", QColor(60, 70, 80));
    QVERIFY(registry.saveToJson(path));

    const QJsonArray array = QJsonDocument::fromJson(readFile(path)).array();
    QCOMPARE(array.size(), 2);
    QCOMPARE(array.at(1).toObject().value("id").toInt(), 4);
    QCOMPARE(array.at(1).toObject().value("color").toArray(), QJsonArray({60, 70, 80}));

    ClassRegistry loaded;
    QVERIFY(loaded.loadFromJson(path));
    QCOMPARE(loaded.count(), 2);
    QCOMPARE(loaded.className(4), QStringLiteral("dog"));
    QCOMPARE(loaded.classColor(0), QColor(200, 100, 50));
    QCOMPARE(loaded.nextClassId(), qint64(5));
}

void TestClassRegistry::testLoadJson_FillsMissingFields()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString path = tempDir.filePath("classes.json");

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"([{"id": 3}, {"name": "person", "color": [10, 20, 30]}])");
    file.close();

    ClassRegistry registry;
    QVERIFY(registry.loadFromJson(path));
    QCOMPARE(registry.className(3), QStringLiteral("class_3"));
    QVERIFY(registry.classColor(3).isValid());
    // Entry without an id takes the current entry count
    QCOMPARE(registry.className(1), QStringLiteral("person"));
    QCOMPARE(registry.nextClassId(), qint64(4));
}

void TestClassRegistry::testLoadJson_InvalidFileKeepsClasses()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString path = tempDir.filePath("classes.json");

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ broken");
    file.close();

    ClassRegistry registry;
    registry.addClass("cat");

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("ClassRegistry: Invalid class file.*"));
    AnnotationError error;
    QVERIFY(!registry.loadFromJson(path, &error));
    QCOMPARE(error.code, AnnotationError::Code::PersistenceError);
    QCOMPARE(registry.count(), 1);
}

void TestClassRegistry::testExportDataYaml()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString path = tempDir.filePath("out/data.yaml");

    ClassRegistry registry;
    registry.addClass("cat");
    registry.addClass("hot dog");
    QVERIFY(registry.exportDataYaml(path, "/datasets/pets"));

    const QString text = QString::fromUtf8(readFile(path));
    QVERIFY(text.indexOf("names:") < text.indexOf("nc:"));
    QVERIFY(text.indexOf("train:") < text.indexOf("val:"));

    const YAML::Node yaml = YAML::LoadFile(path.toStdString());
    QCOMPARE(yaml["path"].as<std::string>(), std::string("/datasets/pets"));
    QCOMPARE(yaml["train"].as<std::string>(), std::string("images/train"));
    QCOMPARE(yaml["val"].as<std::string>(), std::string("images/val"));
    QCOMPARE(yaml["test"].as<std::string>(), std::string("images/test"));
    QCOMPARE(yaml["nc"].as<int>(), 2);
    QCOMPARE(yaml["names"].size(), size_t(2));
    QCOMPARE(yaml["names"][0].as<std::string>(), std::string("cat"));
    QCOMPARE(yaml["names"][1].as<std::string>(), std::string("hot dog"));
}

void TestClassRegistry::testExportDataYaml_EscapesSpecialNames()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString path = tempDir.filePath("data.yaml");

    ClassRegistry registry;
    registry.addClass("a\nb");
    registry.addClass("say \"hi\": now");
    QVERIFY(registry.exportDataYaml(path));

    const YAML::Node yaml = YAML::LoadFile(path.toStdString());
    QCOMPARE(yaml["names"][0].as<std::string>(), std::string("a\nb"));
    QCOMPARE(yaml["names"][1].as<std::string>(), std::string("say \"hi\": now"));
    QCOMPARE(yaml["path"].as<std::string>(), std::string("./dataset"));
}

QTEST_MAIN(TestClassRegistry)
#include "tst_ClassRegistry.moc"
