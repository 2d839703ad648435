/**
 * @file test_loaders.cpp
 * @brief Unit tests for the JSON and SQLite loaders
 *
 * Tests connection handling, entity filtering, primary key overrides and
 * SQLite storage class conversion.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <QScopedPointer>
#include <sqlite3.h>
#include "loaders/loader.h"
#include "loaders/jsonloader.h"
#include "loaders/sqliteloader.h"

using namespace Bridge;

class TestLoaders : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Props Tests ==========
    void testLoaderPropsDefaults();
    void testLoaderPropsFromJson();
    void testDataConnectionFromJson();
    void testDataConnectionUnknownKind();
    void testCreateLoader();

    // ========== JSON Loader Tests ==========
    void testJsonOpenClose();
    void testJsonOpenTwice();
    void testJsonReadWhenClosed();
    void testJsonFiltersEntities();
    void testJsonPrimaryKeyMap();
    void testJsonMissingPrimaryKey();
    void testJsonEntityNotArray();
    void testJsonInvalidDocument();
    void testJsonRequiresFileConnection();

    // ========== SQLite Loader Tests ==========
    void testSqliteReadTables();
    void testSqliteColumnTypes();
    void testSqliteMissingFile();
    void testSqliteNotADatabase();
    void testSqliteMatchesJson();

private:
    QString writeJson(const QString &name, const QJsonObject &doc);
    QString writeDatabase(const QString &name, const QStringList &statements);

    QTemporaryDir *m_tempDir;
};

void TestLoaders::initTestCase()
{
    qDebug() << "Starting Loader tests";
}

void TestLoaders::cleanupTestCase()
{
    qDebug() << "Loader tests complete";
}

void TestLoaders::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
}

void TestLoaders::cleanup()
{
    delete m_tempDir;
    m_tempDir = nullptr;
}

QString TestLoaders::writeJson(const QString &name, const QJsonObject &doc)
{
    const QString path = m_tempDir->filePath(name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(QJsonDocument(doc).toJson());
        file.close();
    }
    return path;
}

QString TestLoaders::writeDatabase(const QString &name, const QStringList &statements)
{
    const QString path = m_tempDir->filePath(name);
    sqlite3 *db = nullptr;
    if (sqlite3_open(path.toUtf8().constData(), &db) != SQLITE_OK) {
        qWarning() << "Failed to create test database" << path;
        sqlite3_close(db);
        return path;
    }
    for (const QString &sql : statements) {
        char *message = nullptr;
        if (sqlite3_exec(db, sql.toUtf8().constData(), nullptr, nullptr, &message) != SQLITE_OK) {
            qWarning() << "Failed to run" << sql << ":" << message;
            sqlite3_free(message);
        }
    }
    sqlite3_close(db);
    return path;
}

// ========== Props Tests ==========

void TestLoaders::testLoaderPropsDefaults()
{
    LoaderProps props;
    QCOMPARE(props.defaultPrimaryKey, QString("id"));
    QCOMPARE(props.version, QString("0.0"));
    QVERIFY(props.entities.isEmpty());
}

void TestLoaders::testLoaderPropsFromJson()
{
    QJsonObject pkMap;
    pkMap["Component"] = "tag";

    QJsonObject obj;
    obj["format"] = "json";
    obj["entities"] = QJsonArray() << "Component" << "Area";
    obj["relationships"] = QJsonArray() << "Connection";
    obj["primaryKeyMap"] = pkMap;
    obj["version"] = "2.1";

    LoaderProps props = LoaderProps::fromJson(obj);
    QCOMPARE(props.format, QString("json"));
    QCOMPARE(props.entities, QStringList() << "Component" << "Area");
    QCOMPARE(props.relationships, QStringList() << "Connection");
    QCOMPARE(props.defaultPrimaryKey, QString("id"));
    QCOMPARE(props.primaryKeyMap.value("Component"), QString("tag"));
    QCOMPARE(props.version, QString("2.1"));

    QCOMPARE(LoaderProps::fromJson(props.toJson()).toJson(), props.toJson());
}

void TestLoaders::testDataConnectionFromJson()
{
    QJsonObject obj;
    obj["kind"] = "api";
    obj["loaderNodeKey"] = "loader";
    obj["baseUrl"] = "https://example.com/api";

    DataConnection con;
    QVERIFY(DataConnection::fromJson(obj, &con));
    QVERIFY(!con.isFile());
    QCOMPARE(con.baseUrl, QString("https://example.com/api"));
    QCOMPARE(con.loaderNodeKey, QString("loader"));
    QCOMPARE(con.toJson(), obj);
}

void TestLoaders::testDataConnectionUnknownKind()
{
    QJsonObject obj;
    obj["kind"] = "ftp";

    DataConnection con;
    QString error;
    QVERIFY(!DataConnection::fromJson(obj, &con, &error));
    QCOMPARE(error, QString("Unknown connection kind: ftp"));
}

void TestLoaders::testCreateLoader()
{
    LoaderProps props;
    props.format = "JSON";
    QScopedPointer<Loader> json(createLoader(props));
    QVERIFY(qobject_cast<JSONLoader *>(json.data()));

    props.format = "sqlite";
    QScopedPointer<Loader> sqlite(createLoader(props));
    QVERIFY(qobject_cast<SQLiteLoader *>(sqlite.data()));

    props.format = "xlsx";
    QScopedPointer<Loader> unknown(createLoader(props));
    QVERIFY(unknown.isNull());
}

// ========== JSON Loader Tests ==========

void TestLoaders::testJsonOpenClose()
{
    QJsonObject doc;
    doc["Component"] = QJsonArray();

    LoaderProps props;
    JSONLoader loader(props);
    QVERIFY(!loader.isOpen());

    QVERIFY(loader.open(DataConnection::file("loader", writeJson("source.json", doc))));
    QVERIFY(loader.isOpen());

    loader.close();
    QVERIFY(!loader.isOpen());

    // Closing again is reported but harmless
    loader.close();
    QVERIFY(!loader.isOpen());
}

void TestLoaders::testJsonOpenTwice()
{
    const DataConnection con = DataConnection::file("loader", writeJson("source.json", QJsonObject()));

    JSONLoader loader{LoaderProps()};
    QSignalSpy spy(&loader, &Loader::errorOccurred);

    QVERIFY(loader.open(con));
    QVERIFY(!loader.open(con));
    QCOMPARE(loader.errorString(), QString("Loader is already open"));
    QCOMPARE(spy.count(), 1);
    QVERIFY(loader.isOpen());
}

void TestLoaders::testJsonReadWhenClosed()
{
    JSONLoader loader{LoaderProps()};
    QList<IREntity> entities;
    QVERIFY(!loader.getEntities(&entities));
    QCOMPARE(loader.errorString(), QString("Loader is not open"));
}

void TestLoaders::testJsonFiltersEntities()
{
    QJsonObject row;
    row["id"] = "1";

    QJsonObject doc;
    doc["Component"] = QJsonArray() << row;
    doc["Area"] = QJsonArray() << row;
    doc["Connection"] = QJsonArray() << row;

    LoaderProps props;
    props.entities << "Component" << "Missing";
    props.relationships << "Connection";

    JSONLoader loader(props);
    QVERIFY(loader.open(DataConnection::file("loader", writeJson("source.json", doc))));

    QList<IREntity> entities;
    QVERIFY(loader.getEntities(&entities));
    QCOMPARE(entities.size(), 1);
    QCOMPARE(entities.at(0).key, QString("Component"));
    QCOMPARE(entities.at(0).instances.size(), 1);

    QList<IRRelationship> relationships;
    QVERIFY(loader.getRelationships(&relationships));
    QCOMPARE(relationships.size(), 1);
    QCOMPARE(relationships.at(0).key, QString("Connection"));

    loader.close();
}

void TestLoaders::testJsonPrimaryKeyMap()
{
    QJsonObject row;
    row["tag"] = "P-101";
    row["id"] = "ignored";

    QJsonObject doc;
    doc["Component"] = QJsonArray() << row;

    LoaderProps props;
    props.entities << "Component";
    props.primaryKeyMap.insert("Component", "tag");

    JSONLoader loader(props);
    QCOMPARE(loader.primaryKeyOf("Component"), QString("tag"));
    QCOMPARE(loader.primaryKeyOf("Area"), QString("id"));

    QVERIFY(loader.open(DataConnection::file("loader", writeJson("source.json", doc))));
    QList<IREntity> entities;
    QVERIFY(loader.getEntities(&entities));
    loader.close();

    QCOMPARE(entities.at(0).instances.at(0).pkey(), QString("tag"));
    QCOMPARE(entities.at(0).instances.at(0).key(), QString("Component-P-101"));
}

void TestLoaders::testJsonMissingPrimaryKey()
{
    QJsonObject row;
    row["name"] = "no id";

    QJsonObject doc;
    doc["Component"] = QJsonArray() << row;

    LoaderProps props;
    props.entities << "Component";

    JSONLoader loader(props);
    QVERIFY(loader.open(DataConnection::file("loader", writeJson("source.json", doc))));

    QList<IREntity> entities;
    QVERIFY(!loader.getEntities(&entities));
    QCOMPARE(loader.errorString(), QString("id does not exist on Component"));
    loader.close();
}

void TestLoaders::testJsonEntityNotArray()
{
    QJsonObject doc;
    doc["Component"] = QJsonObject();

    LoaderProps props;
    props.entities << "Component";

    JSONLoader loader(props);
    QVERIFY(loader.open(DataConnection::file("loader", writeJson("source.json", doc))));

    QList<IREntity> entities;
    QVERIFY(!loader.getEntities(&entities));
    QVERIFY(loader.errorString().contains("is not an array"));
    loader.close();
}

void TestLoaders::testJsonInvalidDocument()
{
    const QString path = m_tempDir->filePath("broken.json");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ \"Component\": [");
    file.close();

    JSONLoader loader{LoaderProps()};
    QVERIFY(!loader.open(DataConnection::file("loader", path)));
    QVERIFY(loader.errorString().startsWith("Failed to parse"));
    QVERIFY(!loader.isOpen());
}

void TestLoaders::testJsonRequiresFileConnection()
{
    JSONLoader loader{LoaderProps()};
    QVERIFY(!loader.open(DataConnection::api("loader", "https://example.com")));
    QCOMPARE(loader.errorString(), QString("JSONLoader requires a file connection"));
}

// ========== SQLite Loader Tests ==========

void TestLoaders::testSqliteReadTables()
{
    const QString path = writeDatabase("source.db", QStringList()
        << "CREATE TABLE Component (id TEXT, name TEXT);"
        << "INSERT INTO Component VALUES ('1', 'Pump');"
        << "INSERT INTO Component VALUES ('2', 'Valve');"
        << "CREATE TABLE Area (id TEXT);"
        << "INSERT INTO Area VALUES ('A1');");

    LoaderProps props;
    props.entities << "Component";

    SQLiteLoader loader(props);
    QVERIFY2(loader.open(DataConnection::file("loader", path)), qPrintable(loader.errorString()));

    QList<IREntity> entities;
    QVERIFY2(loader.getEntities(&entities), qPrintable(loader.errorString()));
    loader.close();

    QCOMPARE(entities.size(), 1);
    QCOMPARE(entities.at(0).instances.size(), 2);
    QCOMPARE(entities.at(0).instances.at(1).getString("name"), QString("Valve"));
    QCOMPARE(entities.at(0).instances.at(1).key(), QString("Component-2"));
}

void TestLoaders::testSqliteColumnTypes()
{
    const QString path = writeDatabase("types.db", QStringList()
        << "CREATE TABLE Sample (id INTEGER, ratio REAL, note TEXT, empty TEXT);"
        << "INSERT INTO Sample VALUES (5, 0.5, 'text', NULL);");

    LoaderProps props;
    props.entities << "Sample";

    SQLiteLoader loader(props);
    QVERIFY(loader.open(DataConnection::file("loader", path)));

    QList<IREntity> entities;
    QVERIFY(loader.getEntities(&entities));
    loader.close();

    const IRInstance instance = entities.at(0).instances.at(0);
    QVERIFY(instance.get("id").isDouble());
    QCOMPARE(instance.get("id").toInt(), 5);
    QCOMPARE(instance.get("ratio").toDouble(), 0.5);
    QCOMPARE(instance.get("note").toString(), QString("text"));
    QVERIFY(instance.get("empty").isNull());
    QCOMPARE(instance.key(), QString("Sample-5"));
}

void TestLoaders::testSqliteMissingFile()
{
    const QString path = m_tempDir->filePath("missing.db");

    SQLiteLoader loader{LoaderProps()};
    QVERIFY(!loader.open(DataConnection::file("loader", path)));
    QCOMPARE(loader.errorString(), QString("Source file not found: %1").arg(path));
    QVERIFY(!QFile::exists(path));
}

void TestLoaders::testSqliteNotADatabase()
{
    QJsonObject doc;
    doc["Component"] = QJsonArray();
    const QString path = writeJson("source.db", doc);

    LoaderProps props;
    props.entities << "Component";

    // sqlite3 only reads the header on the first statement
    SQLiteLoader loader(props);
    QVERIFY(loader.open(DataConnection::file("loader", path)));

    QList<IREntity> entities;
    QVERIFY(!loader.getEntities(&entities));
    QVERIFY(entities.isEmpty());
    QVERIFY(loader.errorString().startsWith(QString("Failed to list tables in %1: ").arg(path)));
    loader.close();

    IRModel model;
    QString error;
    QVERIFY(!IRModel::fromLoader(&loader, DataConnection::file("loader", path), &model, &error));
    QVERIFY(!error.isEmpty());
}

void TestLoaders::testSqliteMatchesJson()
{
    const QString dbPath = writeDatabase("source.db", QStringList()
        << "CREATE TABLE Component (id TEXT, name TEXT);"
        << "INSERT INTO Component VALUES ('1', 'Pump');");

    QJsonObject row;
    row["id"] = "1";
    row["name"] = "Pump";
    QJsonObject doc;
    doc["Component"] = QJsonArray() << row;
    const QString jsonPath = writeJson("source.json", doc);

    LoaderProps props;
    props.entities << "Component";

    SQLiteLoader sqlite(props);
    JSONLoader json(props);

    IRModel fromSqlite;
    IRModel fromJson;
    QVERIFY(IRModel::fromLoader(&sqlite, DataConnection::file("loader", dbPath), &fromSqlite));
    QVERIFY(IRModel::fromLoader(&json, DataConnection::file("loader", jsonPath), &fromJson));
    QVERIFY(IRModel::compare(fromSqlite, fromJson));
}

QTEST_MAIN(TestLoaders)
#include "test_loaders.moc"
