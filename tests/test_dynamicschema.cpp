/**
 * @file test_dynamicschema.cpp
 * @brief Unit tests for generated schema synchronization
 *
 * Tests creation, unchanged reruns and minor version bumps.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include "schema/dynamicschema.h"
#include "schema/schemaregistry.h"
#include "repo/localrepository.h"

using namespace Bridge;

class TestDynamicSchema : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Create Tests ==========
    void testCreateReferences();
    void testCreateUnknownBaseClass();
    void testCreateLocalBaseClass();
    void testCreateDuplicateClass();

    // ========== Synchronize Tests ==========
    void testSynchronizeNew();
    void testSynchronizeUnchanged();
    void testSynchronizeChangedBumpsMinor();
    void testSynchronizeWithDomainSchema();

private:
    DynamicSchemaProps plantProps() const;

    LocalRepository *m_repository;
    SchemaRegistry *m_registry;
};

void TestDynamicSchema::initTestCase()
{
    qDebug() << "Starting DynamicSchema tests";
}

void TestDynamicSchema::cleanupTestCase()
{
    qDebug() << "DynamicSchema tests complete";
}

void TestDynamicSchema::init()
{
    m_repository = new LocalRepository();
    m_registry = new SchemaRegistry();
    m_registry->registerSchema(coreSchema());
}

void TestDynamicSchema::cleanup()
{
    delete m_registry;
    delete m_repository;
    m_registry = nullptr;
    m_repository = nullptr;
}

DynamicSchemaProps TestDynamicSchema::plantProps() const
{
    DynamicSchemaProps props;
    props.schemaName = "Plant";
    props.schemaAlias = "plant";
    props.entities << ClassDefinition::entity("Component", "Core:PhysicalElement");

    RelationshipConstraint end;
    end.classes << "Plant:Component";
    props.relationships << ClassDefinition::relationship("ComponentConnectsComponent",
                                                         "Core:ElementRefersToElements", end, end);
    return props;
}

// ========== Create Tests ==========

void TestDynamicSchema::testCreateReferences()
{
    SchemaDef schema;
    QString error;
    QVERIFY2(DynamicSchema::create(SchemaVersion(1, 0, 3), QStringList() << "Process" << "core",
                                   plantProps(), *m_registry, &schema, &error),
             qPrintable(error));

    QCOMPARE(schema.name, QString("Plant"));
    QCOMPARE(schema.alias, QString("plant"));
    QCOMPARE(schema.version, SchemaVersion(1, 0, 3));
    QCOMPARE(schema.references, QStringList() << "Core" << "Process");
    QCOMPARE(schema.classes.size(), 2);
    QVERIFY(schema.classes.at(1).isRelationship());
}

void TestDynamicSchema::testCreateUnknownBaseClass()
{
    DynamicSchemaProps props = plantProps();
    props.entities << ClassDefinition::entity("Pipe", "Core:Missing");

    SchemaDef schema;
    QString error;
    QVERIFY(!DynamicSchema::create(SchemaVersion(), QStringList(), props, *m_registry, &schema, &error));
    QCOMPARE(error, QString("Failed to create class Pipe - base class Core:Missing not found"));
}

void TestDynamicSchema::testCreateLocalBaseClass()
{
    DynamicSchemaProps props = plantProps();
    props.entities << ClassDefinition::entity("Pump", "Component");

    SchemaDef schema;
    QString error;
    QVERIFY2(DynamicSchema::create(SchemaVersion(), QStringList(), props, *m_registry, &schema, &error),
             qPrintable(error));
    QCOMPARE(schema.classes.size(), 3);
}

void TestDynamicSchema::testCreateDuplicateClass()
{
    DynamicSchemaProps props = plantProps();
    props.entities << ClassDefinition::entity("COMPONENT", "Core:PhysicalElement");

    SchemaDef schema;
    QString error;
    QVERIFY(!DynamicSchema::create(SchemaVersion(), QStringList(), props, *m_registry, &schema, &error));
    QCOMPARE(error, QString("Schema Plant defines class COMPONENT more than once"));
}

// ========== Synchronize Tests ==========

void TestDynamicSchema::testSynchronizeNew()
{
    ItemState state = ItemState::Unchanged;
    QString error;
    QVERIFY2(DynamicSchema::synchronize(m_repository, QStringList(), plantProps(), m_registry, &state, &error),
             qPrintable(error));

    QCOMPARE(state, ItemState::New);

    SchemaVersion version;
    QVERIFY(m_repository->schemaVersion("Plant", &version));
    QCOMPARE(version, SchemaVersion(1, 0, 0));
    QVERIFY(m_registry->contains("Plant:Component"));
}

void TestDynamicSchema::testSynchronizeUnchanged()
{
    ItemState state;
    QVERIFY(DynamicSchema::synchronize(m_repository, QStringList(), plantProps(), m_registry, &state));
    QCOMPARE(state, ItemState::New);

    m_repository->resetWriteStats();
    m_registry->clear();
    m_registry->registerSchema(coreSchema());

    QVERIFY(DynamicSchema::synchronize(m_repository, QStringList(), plantProps(), m_registry, &state));
    QCOMPARE(state, ItemState::Unchanged);
    QCOMPARE(m_repository->writeStats().total(), 0);
    QVERIFY(m_registry->contains("Plant:ComponentConnectsComponent"));

    SchemaVersion version;
    QVERIFY(m_repository->schemaVersion("Plant", &version));
    QCOMPARE(version, SchemaVersion(1, 0, 0));
}

void TestDynamicSchema::testSynchronizeChangedBumpsMinor()
{
    ItemState state;
    QVERIFY(DynamicSchema::synchronize(m_repository, QStringList(), plantProps(), m_registry, &state));

    DynamicSchemaProps props = plantProps();
    PropertyDef rating;
    rating.name = "Rating";
    rating.type = "int";
    props.entities[0].properties << rating;

    QVERIFY(DynamicSchema::synchronize(m_repository, QStringList(), props, m_registry, &state));
    QCOMPARE(state, ItemState::Changed);

    SchemaDef stored;
    QVERIFY(m_repository->schema("Plant", &stored));
    QCOMPARE(stored.version, SchemaVersion(1, 0, 1));
    QVERIFY(stored.findClass("Component")->findProperty("Rating"));

    // Same mappings again leave the bumped version alone
    QVERIFY(DynamicSchema::synchronize(m_repository, QStringList(), props, m_registry, &state));
    QCOMPARE(state, ItemState::Unchanged);
    QVERIFY(m_repository->schema("Plant", &stored));
    QCOMPARE(stored.version, SchemaVersion(1, 0, 1));

    props.entities << ClassDefinition::entity("Pump", "Component");
    QVERIFY(DynamicSchema::synchronize(m_repository, QStringList(), props, m_registry, &state));
    QCOMPARE(state, ItemState::Changed);
    QVERIFY(m_repository->schema("Plant", &stored));
    QCOMPARE(stored.version, SchemaVersion(1, 0, 2));
}

void TestDynamicSchema::testSynchronizeWithDomainSchema()
{
    SchemaDef process;
    process.name = "Process";
    process.alias = "proc";
    process.version = SchemaVersion(2, 0, 0);
    process.references << "Core";
    process.classes << ClassDefinition::entity("Equipment", "Core:PhysicalElement");

    QVERIFY2(m_repository->importSchema(process.serialize()), qPrintable(m_repository->errorString()));
    m_registry->registerSchema(process);

    DynamicSchemaProps props = plantProps();
    props.entities << ClassDefinition::entity("Tank", "Process:Equipment");

    ItemState state;
    QString error;
    QVERIFY2(DynamicSchema::synchronize(m_repository, QStringList() << "Process", props, m_registry, &state, &error),
             qPrintable(error));
    QCOMPARE(state, ItemState::New);

    SchemaDef stored;
    QVERIFY(m_repository->schema("plant", &stored));
    QCOMPARE(stored.references, QStringList() << "Core" << "Process");
    QVERIFY(m_registry->isSubclassOf("Plant:Tank", "Core:PhysicalElement"));
}

QTEST_MAIN(TestDynamicSchema)
#include "test_dynamicschema.moc"
