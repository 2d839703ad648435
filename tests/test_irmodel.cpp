/**
 * @file test_irmodel.cpp
 * @brief Unit tests for IRInstance and IRModel
 *
 * Tests instance identity, checksums, normalization and filtering.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonArray>
#include "ir/irmodel.h"
#include "loaders/loader.h"
#include "sync/dmo.h"

using namespace Bridge;

class TestIRModel : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Value Conversion Tests ==========
    void testValueToString();

    // ========== Instance Tests ==========
    void testInstanceKey();
    void testInstanceKeyFromNumber();
    void testCreateKeyStable();
    void testChecksumIgnoresAttributeOrder();
    void testChecksumChangesWithData();
    void testIsValidMissingPrimaryKey();

    // ========== Model Tests ==========
    void testNormalizedDeduplicates();
    void testEntityInstancesUnknown();
    void testEntityInstancesFilter();
    void testInstancesForDMO();
    void testCompare();
    void testFromLoader();
    void testFromLoaderOpenFailure();

private:
    QString writeSource(const QJsonObject &doc);

    QTemporaryDir *m_tempDir;
};

void TestIRModel::initTestCase()
{
    qDebug() << "Starting IRModel tests";
}

void TestIRModel::cleanupTestCase()
{
    qDebug() << "IRModel tests complete";
}

void TestIRModel::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
}

void TestIRModel::cleanup()
{
    delete m_tempDir;
    m_tempDir = nullptr;
}

QString TestIRModel::writeSource(const QJsonObject &doc)
{
    const QString path = m_tempDir->filePath("source.json");
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(QJsonDocument(doc).toJson());
        file.close();
    }
    return path;
}

// ========== Value Conversion Tests ==========

void TestIRModel::testValueToString()
{
    QCOMPARE(irValueToString(QJsonValue("abc")), QString("abc"));
    QCOMPARE(irValueToString(QJsonValue(42)), QString("42"));
    QCOMPARE(irValueToString(QJsonValue(true)), QString("true"));
    QCOMPARE(irValueToString(QJsonValue(QJsonValue::Null)), QString());

    QJsonObject obj;
    obj["a"] = 1;
    QCOMPARE(irValueToString(obj), QString("{\"a\":1}"));
}

// ========== Instance Tests ==========

void TestIRModel::testInstanceKey()
{
    QJsonObject data;
    data["id"] = "P-101";
    data["name"] = "Pump";

    IRInstance instance("id", "Component", data);
    QCOMPARE(instance.key(), QString("Component-P-101"));
    QCOMPARE(instance.codeValue(), instance.key());
    QCOMPARE(instance.userLabel(), QString("P-101"));
    QCOMPARE(instance.getString("name"), QString("Pump"));
    QVERIFY(instance.has("name"));
    QVERIFY(!instance.has("tag"));
}

void TestIRModel::testInstanceKeyFromNumber()
{
    QJsonObject data;
    data["id"] = 7;

    IRInstance instance("id", "Component", data);
    QCOMPARE(instance.key(), QString("Component-7"));
}

void TestIRModel::testCreateKeyStable()
{
    QCOMPARE(IRInstance::createKey("Component", "1"), QString("Component-1"));
    QCOMPARE(IRInstance::createKey("Component", "1"), IRInstance::createKey("Component", "1"));
}

void TestIRModel::testChecksumIgnoresAttributeOrder()
{
    QJsonObject a;
    a["id"] = "1";
    a["name"] = "Pump";
    a["weight"] = 12;

    QJsonObject b;
    b["weight"] = 12;
    b["name"] = "Pump";
    b["id"] = "1";

    IRInstance first("id", "Component", a);
    IRInstance second("id", "Component", b);
    QCOMPARE(first.checksum(), second.checksum());
    QCOMPARE(first.checksum().length(), 32);
}

void TestIRModel::testChecksumChangesWithData()
{
    QJsonObject a;
    a["id"] = "1";
    a["name"] = "Pump";

    QJsonObject b = a;
    b["name"] = "Valve";

    QVERIFY(IRInstance("id", "Component", a).checksum() != IRInstance("id", "Component", b).checksum());
}

void TestIRModel::testIsValidMissingPrimaryKey()
{
    QJsonObject data;
    data["name"] = "Pump";

    IRInstance instance("id", "Component", data);
    QString error;
    QVERIFY(!instance.isValid(&error));
    QCOMPARE(error, QString("id does not exist on Component"));

    data["id"] = "1";
    QVERIFY(IRInstance("id", "Component", data).isValid());
}

// ========== Model Tests ==========

void TestIRModel::testNormalizedDeduplicates()
{
    QJsonObject first;
    first["id"] = "a";
    first["name"] = "First";

    QJsonObject other;
    other["id"] = "b";

    QJsonObject last;
    last["id"] = "A";
    last["name"] = "Last";

    IREntity entity("Component", QList<IRInstance>()
        << IRInstance("id", "Component", first)
        << IRInstance("id", "Component", other)
        << IRInstance("id", "Component", last));

    IREntity result = IRModel::normalized(entity);
    QCOMPARE(result.instances.size(), 2);
    QCOMPARE(result.instances.at(0).getString("name"), QString("Last"));
    QCOMPARE(result.instances.at(1).userLabel(), QString("b"));
}

void TestIRModel::testEntityInstancesUnknown()
{
    IRModel model;
    QVERIFY(model.isEmpty());
    QVERIFY(model.entityInstances("Missing").isEmpty());
    QVERIFY(model.relationshipInstances("Missing").isEmpty());
}

void TestIRModel::testEntityInstancesFilter()
{
    QList<IRInstance> instances;
    for (int i = 1; i <= 4; ++i) {
        QJsonObject data;
        data["id"] = i;
        data["active"] = (i % 2 == 0);
        instances.append(IRInstance("id", "Component", data));
    }

    IRModel model(QList<IREntity>() << IREntity("Component", instances), QList<IRRelationship>());
    QVERIFY(model.hasEntity("Component"));
    QCOMPARE(model.entityInstances("Component").size(), 4);

    QList<IRInstance> active = model.entityInstances("Component", [](const IRInstance &instance) {
        return instance.get("active").toBool();
    });
    QCOMPARE(active.size(), 2);
    QCOMPARE(active.at(0).userLabel(), QString("2"));
}

void TestIRModel::testInstancesForDMO()
{
    QJsonObject a;
    a["id"] = "r1";
    a["from"] = "1";
    a["to"] = "2";

    IRModel model(QList<IREntity>(),
                  QList<IRRelationship>() << IRRelationship("Connection", QList<IRInstance>()
                                                             << IRInstance("id", "Connection", a)));

    LinkDMO dmo;
    dmo.irEntity = "Connection";
    QCOMPARE(model.instancesFor(dmo).size(), 1);

    dmo.doSyncInstance = [](const IRInstance &) { return false; };
    QVERIFY(model.instancesFor(dmo).isEmpty());

    RecordDMO records;
    records.irEntity = "Connection";
    QVERIFY(model.instancesFor(records).isEmpty());
}

void TestIRModel::testCompare()
{
    QJsonObject data;
    data["id"] = "1";

    IRModel a(QList<IREntity>() << IREntity("Component", QList<IRInstance>() << IRInstance("id", "Component", data)),
              QList<IRRelationship>());
    IRModel b(QList<IREntity>() << IREntity("Component", QList<IRInstance>() << IRInstance("id", "Component", data)),
              QList<IRRelationship>());
    QVERIFY(IRModel::compare(a, b));

    data["name"] = "changed";
    IRModel c(QList<IREntity>() << IREntity("Component", QList<IRInstance>() << IRInstance("id", "Component", data)),
              QList<IRRelationship>());
    QVERIFY(!IRModel::compare(a, c));
}

void TestIRModel::testFromLoader()
{
    QJsonObject row;
    row["id"] = "1";
    row["name"] = "Pump";

    QJsonObject link;
    link["id"] = "c1";

    QJsonObject doc;
    doc["Component"] = QJsonArray() << row;
    doc["Connection"] = QJsonArray() << link;
    doc["Ignored"] = QJsonArray() << row;

    LoaderProps props;
    props.format = "json";
    props.entities << "Component";
    props.relationships << "Connection";

    QScopedPointer<Loader> loader(createLoader(props));
    QVERIFY(loader);

    IRModel model;
    QString error;
    QVERIFY2(IRModel::fromLoader(loader.data(), DataConnection::file("loader", writeSource(doc)), &model, &error),
             qPrintable(error));

    QCOMPARE(model.entityKeys(), QStringList() << "Component");
    QCOMPARE(model.relationshipKeys(), QStringList() << "Connection");
    QVERIFY(!model.hasEntity("Ignored"));
    QVERIFY(!loader->isOpen());

    model.clear();
    QVERIFY(model.isEmpty());
}

void TestIRModel::testFromLoaderOpenFailure()
{
    LoaderProps props;
    props.format = "json";

    QScopedPointer<Loader> loader(createLoader(props));
    IRModel model;
    QString error;
    QVERIFY(!IRModel::fromLoader(loader.data(),
                                 DataConnection::file("loader", m_tempDir->filePath("missing.json")),
                                 &model, &error));
    QVERIFY(error.contains("missing.json"));
    QVERIFY(!loader->isOpen());
}

QTEST_MAIN(TestIRModel)
#include "test_irmodel.moc"
