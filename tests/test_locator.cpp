/**
 * @file test_locator.cpp
 * @brief Unit tests for Locator parsing and lookup
 */

#include <QtTest/QtTest>
#include <QDebug>
#include "sync/locator.h"
#include "repo/localrepository.h"

using namespace Bridge;

class TestLocator : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Parse Tests ==========
    void testParse();
    void testParseClassKeys();
    void testParseInvalid();
    void testParseWithoutConstraints();

    // ========== Lookup Tests ==========
    void testLocateUnique();
    void testLocateNone();
    void testLocateAmbiguous();
    void testLocateUnknownClass();

private:
    QString insertTagged(const QString &tag, const QString &label);

    LocalRepository *m_repository;
};

void TestLocator::initTestCase()
{
    qDebug() << "Starting Locator tests";
}

void TestLocator::cleanupTestCase()
{
    qDebug() << "Locator tests complete";
}

void TestLocator::init()
{
    m_repository = new LocalRepository();
}

void TestLocator::cleanup()
{
    delete m_repository;
    m_repository = nullptr;
}

QString TestLocator::insertTagged(const QString &tag, const QString &label)
{
    RecordProps props;
    props.classFullName = CoreClasses::PhysicalElement;
    props.modelId = m_repository->repositoryModelId();
    props.userLabel = label;
    props.jsonProperties["Tag"] = tag;
    return m_repository->insertRecord(props);
}

// ========== Parse Tests ==========

void TestLocator::testParse()
{
    LocatorQuery query;
    QVERIFY(Locator::parse("{\"CodeValue\": \"Pump-01\", \"Rating\": 5}", &query));
    QVERIFY(query.classFullName.isEmpty());
    QCOMPARE(query.constraints.size(), 2);
    QCOMPARE(query.constraints.at(0).first, QString("codevalue"));
    QCOMPARE(query.constraints.at(0).second.toString(), QString("Pump-01"));
    QCOMPARE(query.constraints.at(1).first, QString("rating"));
}

void TestLocator::testParseClassKeys()
{
    const QStringList keys = QStringList() << "ECClassId" << "classId" << "Class";
    for (const QString &key : keys) {
        LocatorQuery query;
        const QString text = QString("{\"%1\": \"Core:PhysicalElement\", \"UserLabel\": \"A\"}").arg(key);
        QVERIFY(Locator::parse(text, &query));
        QCOMPARE(query.classFullName, QString("Core:PhysicalElement"));
        QCOMPARE(query.constraints.size(), 1);
    }
}

void TestLocator::testParseInvalid()
{
    LocatorQuery query;
    QString error;
    QVERIFY(!Locator::parse("Pump-01", &query, &error));
    QCOMPARE(error, QString("Invalid locator Pump-01"));

    QVERIFY(!Locator::parse("[1, 2]", &query, &error));
    QCOMPARE(error, QString("Invalid locator [1, 2]"));
}

void TestLocator::testParseWithoutConstraints()
{
    LocatorQuery query;
    QString error;
    const QString text = "{\"ECClassId\": \"Core:PhysicalElement\"}";
    QVERIFY(!Locator::parse(text, &query, &error));
    QCOMPARE(error, QString("Locator %1 has no property constraints").arg(text));
}

// ========== Lookup Tests ==========

void TestLocator::testLocateUnique()
{
    const QString pump = insertTagged("P-101", "Pump");
    insertTagged("V-201", "Valve");

    QString error;
    QCOMPARE(Locator::locateUnique(m_repository, "{\"tag\": \"P-101\"}", &error), pump);
    QCOMPARE(Locator::locateUnique(m_repository, "{\"Class\": \"Core:GeometricElement\", \"UserLabel\": \"Pump\"}", &error),
             pump);
}

void TestLocator::testLocateNone()
{
    insertTagged("P-101", "Pump");

    QString error;
    const QString text = "{\"tag\": \"X-999\"}";
    QVERIFY(Locator::locateUnique(m_repository, text, &error).isEmpty());
    QCOMPARE(error, QString("No target entity found for %1").arg(text));
}

void TestLocator::testLocateAmbiguous()
{
    insertTagged("P-101", "Pump");
    insertTagged("P-101", "Pump copy");

    QString error;
    const QString text = "{\"tag\": \"P-101\"}";
    QVERIFY(Locator::locateUnique(m_repository, text, &error).isEmpty());
    QCOMPARE(error, QString("More than one entity found for %1").arg(text));
}

void TestLocator::testLocateUnknownClass()
{
    insertTagged("P-101", "Pump");

    QString error;
    QVERIFY(Locator::locateUnique(m_repository, "{\"Class\": \"Plant:Pump\", \"tag\": \"P-101\"}", &error).isEmpty());
    QCOMPARE(error, QString("Unknown class: Plant:Pump"));
}

QTEST_MAIN(TestLocator)
#include "test_locator.moc"
