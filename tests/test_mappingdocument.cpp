/**
 * @file test_mappingdocument.cpp
 * @brief Unit tests for JSON mapping documents
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include "mappingdocument.h"
#include "sync/syncengine.h"

using namespace Bridge;

class TestMappingDocument : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Apply Tests ==========
    void testApply();
    void testApplyDefinedClass();
    void testApplyLinksAndForeignKeys();
    void testApplyChildRecords();
    void testApplyAspects();

    // ========== Error Tests ==========
    void testMissingConnector();
    void testUnknownGroupKind();
    void testUnknownLoaderFormat();
    void testUnknownEndpointType();
    void testConstructionError();

    // ========== File Tests ==========
    void testLoadFile();
    void testLoadResolvesSchemaPaths();
    void testLoadMissingFile();
    void testLoadInvalidJson();

private:
    QJsonObject baseDocument() const;
    QJsonObject componentRecord() const;

    SyncEngine *m_engine;
    QTemporaryDir *m_tempDir;
};

void TestMappingDocument::initTestCase()
{
    qDebug() << "Starting MappingDocument tests";
}

void TestMappingDocument::cleanupTestCase()
{
    qDebug() << "MappingDocument tests complete";
}

void TestMappingDocument::init()
{
    m_engine = new SyncEngine();
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
}

void TestMappingDocument::cleanup()
{
    delete m_engine;
    delete m_tempDir;
    m_engine = nullptr;
    m_tempDir = nullptr;
}

QJsonObject TestMappingDocument::baseDocument() const
{
    QJsonObject dynamic;
    dynamic["schemaName"] = "Plant";

    QJsonObject connector;
    connector["connectorName"] = "plant";
    connector["appId"] = "plant-app";
    connector["dynamicSchema"] = dynamic;

    QJsonObject linkGroup;
    linkGroup["key"] = "LinkModel1";
    linkGroup["container"] = "Subject1";
    linkGroup["kind"] = "link";

    QJsonObject physicalGroup;
    physicalGroup["key"] = "PhysicalModel1";
    physicalGroup["container"] = "Subject1";
    physicalGroup["kind"] = "Physical";

    QJsonObject props;
    props["format"] = "json";
    props["entities"] = QJsonArray() << "Component";
    props["relationships"] = QJsonArray() << "Connection";

    QJsonObject loader;
    loader["key"] = "loader";
    loader["group"] = "LinkModel1";
    loader["props"] = props;

    QJsonObject doc;
    doc["connector"] = connector;
    doc["containers"] = QJsonArray() << "Subject1";
    doc["groups"] = QJsonArray() << linkGroup << physicalGroup;
    doc["loader"] = loader;
    return doc;
}

QJsonObject TestMappingDocument::componentRecord() const
{
    QJsonObject record;
    record["key"] = "Component";
    record["group"] = "PhysicalModel1";
    record["irEntity"] = "Component";
    record["class"] = "Core:PhysicalElement";
    return record;
}

// ========== Apply Tests ==========

void TestMappingDocument::testApply()
{
    QJsonObject doc = baseDocument();
    doc["records"] = QJsonArray() << componentRecord();

    QString error;
    QVERIFY2(MappingDocument::apply(doc, m_engine, &error), qPrintable(error));

    QCOMPARE(m_engine->config().connectorName, QString("plant"));
    QCOMPARE(m_engine->config().dynamicSchemaName, QString("Plant"));

    const NodeTree &tree = m_engine->tree();
    QCOMPARE(tree.size(), 5);
    QVERIFY(tree.constructionErrors().isEmpty());
    QVERIFY(tree.find("Subject1", NodeKind::Container));
    QCOMPARE(tree.find("PhysicalModel1", NodeKind::Group)->asGroup()->groupKind, GroupKind::Physical);

    const Node *loader = tree.find("loader", NodeKind::LoaderConfig);
    QVERIFY(loader);
    QVERIFY(loader->asLoader()->loader);
    QCOMPARE(loader->asLoader()->loader->props().entities, QStringList() << "Component");

    const RecordNode *record = tree.find("Component", NodeKind::Record)->asRecord();
    QVERIFY(record->owner.isGroup());
    QCOMPARE(record->owner.key(), QString("PhysicalModel1"));
    QVERIFY(!record->dmo.target.isDefined);
    QVERIFY(tree.definedClasses().isEmpty());
    QVERIFY(tree.validate("loader", QString()));
}

void TestMappingDocument::testApplyDefinedClass()
{
    QJsonObject definition;
    definition["name"] = "Component";
    definition["baseClass"] = "Core:PhysicalElement";
    definition["properties"] = QJsonArray() << QJsonObject{{"name", "rating"}, {"type", "int"}};

    QJsonObject record = componentRecord();
    record["class"] = "Plant:Component";
    record["definition"] = definition;

    QJsonObject doc = baseDocument();
    doc["records"] = QJsonArray() << record;

    QString error;
    QVERIFY2(MappingDocument::apply(doc, m_engine, &error), qPrintable(error));

    const RecordNode *node = m_engine->tree().find("Component", NodeKind::Record)->asRecord();
    QVERIFY(node->dmo.target.isDefined);
    QCOMPARE(node->dmo.target.fullName("Plant"), QString("Plant:Component"));

    const DefinedClasses &defined = m_engine->tree().definedClasses();
    QCOMPARE(defined.entities.size(), 1);
    QCOMPARE(defined.entities.first().baseClass, QString("Core:PhysicalElement"));
    QCOMPARE(defined.entities.first().properties.size(), 1);
    QVERIFY(defined.relationships.isEmpty());
}

void TestMappingDocument::testApplyLinksAndForeignKeys()
{
    QJsonObject link;
    link["key"] = "Connection";
    link["container"] = "Subject1";
    link["irEntity"] = "Connection";
    link["class"] = "Core:ElementRefersToElements";
    link["source"] = "Component";
    link["fromAttr"] = "from";
    link["target"] = "Component";
    link["toAttr"] = "to";

    QJsonObject fk;
    fk["key"] = "Feeds";
    fk["container"] = "Subject1";
    fk["irEntity"] = "Connection";
    fk["class"] = "Core:ElementRefersToElements";
    fk["source"] = "Component";
    fk["fromAttr"] = "from";
    fk["toType"] = "targetentity";
    fk["toAttr"] = "locator";
    fk["refProperty"] = "FedBy";

    QJsonObject doc = baseDocument();
    doc["records"] = QJsonArray() << componentRecord();
    doc["links"] = QJsonArray() << link;
    doc["foreignKeys"] = QJsonArray() << fk;

    QString error;
    QVERIFY2(MappingDocument::apply(doc, m_engine, &error), qPrintable(error));

    const LinkNode *linkNode = m_engine->tree().find("Connection", NodeKind::Link)->asLink();
    QCOMPARE(linkNode->dmo.fromType, EndpointType::IREntity);
    QCOMPARE(linkNode->dmo.toType, EndpointType::IREntity);
    QCOMPARE(linkNode->sourceKey, QString("Component"));
    QCOMPARE(linkNode->dmo.toAttr, QString("to"));

    const ForeignKeyNode *fkNode = m_engine->tree().find("Feeds", NodeKind::ForeignKey)->asForeignKey();
    QCOMPARE(fkNode->dmo.toType, EndpointType::TargetEntity);
    QCOMPARE(fkNode->dmo.refProperty, QString("FedBy"));
    QVERIFY(fkNode->targetKey.isEmpty());
}

void TestMappingDocument::testApplyChildRecords()
{
    QJsonObject parent = componentRecord();
    parent["subCollectionClass"] = "Core:PhysicalModel";

    QJsonObject child;
    child["key"] = "Port";
    child["parentRecord"] = "Component";
    child["irEntity"] = "Port";
    child["class"] = "Core:PhysicalElement";
    child["parentAttr"] = "component";

    QJsonObject doc = baseDocument();
    doc["records"] = QJsonArray() << parent << child;

    QString error;
    QVERIFY2(MappingDocument::apply(doc, m_engine, &error), qPrintable(error));

    const RecordNode *port = m_engine->tree().find("Port", NodeKind::Record)->asRecord();
    QCOMPARE(port->owner.kind(), RecordOwner::Kind::ParentRecord);
    QCOMPARE(port->owner.key(), QString("Component"));
    QCOMPARE(port->dmo.parentAttr, QString("component"));
    QCOMPARE(m_engine->tree().groupOf("Port"), QString("PhysicalModel1"));
}

void TestMappingDocument::testApplyAspects()
{
    QJsonObject definition;
    definition["name"] = "Rating";
    definition["baseClass"] = "Core:ElementUniqueAspect";

    QJsonObject aspect;
    aspect["key"] = "Rating";
    aspect["container"] = "Subject1";
    aspect["irEntity"] = "Rating";
    aspect["element"] = "Component";
    aspect["elementAttr"] = "component";
    aspect["class"] = "Plant:Rating";
    aspect["definition"] = definition;

    QJsonObject doc = baseDocument();
    doc["records"] = QJsonArray() << componentRecord();
    doc["aspects"] = QJsonArray() << aspect;

    QString error;
    QVERIFY2(MappingDocument::apply(doc, m_engine, &error), qPrintable(error));

    const AspectNode *node = m_engine->tree().find("Rating", NodeKind::Aspect)->asAspect();
    QCOMPARE(node->elementKey, QString("Component"));
    QCOMPARE(node->dmo.elementAttr, QString("component"));
    QCOMPARE(node->dmo.elementType, EndpointType::IREntity);
    QVERIFY(node->dmo.target.isDefined);
    QCOMPARE(m_engine->tree().definedClasses().entities.first().baseClass, QString("Core:ElementUniqueAspect"));
}

// ========== Error Tests ==========

void TestMappingDocument::testMissingConnector()
{
    QJsonObject doc = baseDocument();
    doc.remove("connector");

    QString error;
    QVERIFY(!MappingDocument::apply(doc, m_engine, &error));
    QCOMPARE(error, QString("connectorName is required"));
    QCOMPARE(m_engine->tree().size(), 0);
}

void TestMappingDocument::testUnknownGroupKind()
{
    QJsonObject group;
    group["key"] = "SpatialModel1";
    group["container"] = "Subject1";
    group["kind"] = "spatial";

    QJsonObject doc = baseDocument();
    doc["groups"] = QJsonArray() << group;

    QString error;
    QVERIFY(!MappingDocument::apply(doc, m_engine, &error));
    QCOMPARE(error, QString("Group SpatialModel1 has unknown kind \"spatial\""));
}

void TestMappingDocument::testUnknownLoaderFormat()
{
    QJsonObject doc = baseDocument();
    QJsonObject loader = doc.value("loader").toObject();
    loader["props"] = QJsonObject{{"format", "xlsx"}};
    doc["loader"] = loader;

    QString error;
    QVERIFY(!MappingDocument::apply(doc, m_engine, &error));
    QCOMPARE(error, QString("Unknown loader format \"xlsx\""));
}

void TestMappingDocument::testUnknownEndpointType()
{
    QJsonObject link;
    link["key"] = "Connection";
    link["container"] = "Subject1";
    link["irEntity"] = "Connection";
    link["class"] = "Core:ElementRefersToElements";
    link["source"] = "Component";
    link["fromType"] = "Guess";
    link["target"] = "Component";

    QJsonObject doc = baseDocument();
    doc["records"] = QJsonArray() << componentRecord();
    doc["links"] = QJsonArray() << link;

    QString error;
    QVERIFY(!MappingDocument::apply(doc, m_engine, &error));
    QCOMPARE(error, QString("Unknown endpoint type \"Guess\""));
}

void TestMappingDocument::testConstructionError()
{
    QJsonObject record = componentRecord();
    record["group"] = "MissingModel";

    QJsonObject doc = baseDocument();
    doc["records"] = QJsonArray() << record;

    QString error;
    QVERIFY(!MappingDocument::apply(doc, m_engine, &error));
    QVERIFY(error.contains("MissingModel"));
    QCOMPARE(m_engine->tree().constructionErrors().size(), 1);
}

// ========== File Tests ==========

void TestMappingDocument::testLoadFile()
{
    QJsonObject doc = baseDocument();
    doc["records"] = QJsonArray() << componentRecord();

    const QString path = m_tempDir->filePath("mapping.json");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(QJsonDocument(doc).toJson());
    file.close();

    QString error;
    QVERIFY2(MappingDocument::load(path, m_engine, &error), qPrintable(error));
    QCOMPARE(m_engine->tree().size(), 5);
}

void TestMappingDocument::testLoadResolvesSchemaPaths()
{
    QJsonObject doc = baseDocument();
    QJsonObject connector = doc.value("connector").toObject();
    connector["domainSchemaPaths"] = QJsonArray() << "schemas/process.json" << "/opt/schemas/core-ext.json";
    doc["connector"] = connector;

    const QString path = m_tempDir->filePath("mapping.json");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(QJsonDocument(doc).toJson());
    file.close();

    QString error;
    QVERIFY2(MappingDocument::load(path, m_engine, &error), qPrintable(error));
    QCOMPARE(m_engine->config().domainSchemaPaths, QStringList()
             << QDir::cleanPath(m_tempDir->filePath("schemas/process.json"))
             << "/opt/schemas/core-ext.json");
}

void TestMappingDocument::testLoadMissingFile()
{
    const QString path = m_tempDir->filePath("missing.json");
    QString error;
    QVERIFY(!MappingDocument::load(path, m_engine, &error));
    QCOMPARE(error, QString("Failed to open mapping file: %1").arg(path));
}

void TestMappingDocument::testLoadInvalidJson()
{
    const QString path = m_tempDir->filePath("broken.json");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ \"connector\": ");
    file.close();

    QString error;
    QVERIFY(!MappingDocument::load(path, m_engine, &error));
    QVERIFY(error.startsWith(QString("Failed to parse mapping file %1: ").arg(path)));

    // A top-level array is not a mapping
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("[]");
    file.close();
    QVERIFY(!MappingDocument::load(path, m_engine, &error));
    QVERIFY(error.startsWith("Failed to parse mapping file"));
}

QTEST_MAIN(TestMappingDocument)
#include "test_mappingdocument.moc"
