#include "loader.h"
#include "jsonloader.h"
#include "sqliteloader.h"

#include <QJsonArray>
#include <QDebug>

namespace Bridge {

// ========== DataConnection ==========

DataConnection DataConnection::file(const QString &loaderNodeKey, const QString &filepath)
{
    DataConnection con;
    con.kind = Kind::File;
    con.loaderNodeKey = loaderNodeKey;
    con.filepath = filepath;
    return con;
}

DataConnection DataConnection::api(const QString &loaderNodeKey, const QString &baseUrl)
{
    DataConnection con;
    con.kind = Kind::Api;
    con.loaderNodeKey = loaderNodeKey;
    con.baseUrl = baseUrl;
    return con;
}

QString DataConnection::kindName() const
{
    return kind == Kind::File ? QStringLiteral("file") : QStringLiteral("api");
}

QJsonObject DataConnection::toJson() const
{
    QJsonObject obj;
    obj["kind"] = kindName();
    obj["loaderNodeKey"] = loaderNodeKey;
    if (kind == Kind::File) {
        obj["filepath"] = filepath;
    } else {
        obj["baseUrl"] = baseUrl;
    }
    if (!data.isEmpty()) {
        obj["data"] = data;
    }
    return obj;
}

bool DataConnection::fromJson(const QJsonObject &obj, DataConnection *connection, QString *error)
{
    const QString kind = obj.value("kind").toString();
    DataConnection con;

    if (kind == "file") {
        con.kind = Kind::File;
        con.filepath = obj.value("filepath").toString();
    } else if (kind == "api") {
        con.kind = Kind::Api;
        con.baseUrl = obj.value("baseUrl").toString();
    } else {
        if (error) *error = QString("Unknown connection kind: %1").arg(kind);
        return false;
    }

    con.loaderNodeKey = obj.value("loaderNodeKey").toString();
    con.data = obj.value("data").toObject();
    *connection = con;
    return true;
}

// ========== LoaderProps ==========

QJsonObject LoaderProps::toJson() const
{
    QJsonObject obj;
    obj["format"] = format;
    obj["entities"] = QJsonArray::fromStringList(entities);
    obj["relationships"] = QJsonArray::fromStringList(relationships);
    obj["defaultPrimaryKey"] = defaultPrimaryKey;

    QJsonObject pkMap;
    for (auto it = primaryKeyMap.constBegin(); it != primaryKeyMap.constEnd(); ++it) {
        pkMap[it.key()] = it.value();
    }
    obj["primaryKeyMap"] = pkMap;
    obj["version"] = version;
    return obj;
}

LoaderProps LoaderProps::fromJson(const QJsonObject &obj)
{
    LoaderProps props;
    props.format = obj.value("format").toString();

    for (const QJsonValue &v : obj.value("entities").toArray()) {
        props.entities.append(v.toString());
    }
    for (const QJsonValue &v : obj.value("relationships").toArray()) {
        props.relationships.append(v.toString());
    }

    props.defaultPrimaryKey = obj.value("defaultPrimaryKey").toString(props.defaultPrimaryKey);

    const QJsonObject pkMap = obj.value("primaryKeyMap").toObject();
    for (auto it = pkMap.constBegin(); it != pkMap.constEnd(); ++it) {
        props.primaryKeyMap.insert(it.key(), it.value().toString());
    }

    props.version = obj.value("version").toString(props.version);
    return props;
}

// ========== Loader ==========

Loader::Loader(const LoaderProps &props, QObject *parent)
    : QObject(parent)
    , m_props(props)
{
}

bool Loader::open(const DataConnection &connection)
{
    if (m_open) {
        setError("Loader is already open");
        return false;
    }

    m_error.clear();
    if (!openConnection(connection)) {
        if (m_error.isEmpty()) {
            setError(QString("Failed to open %1 connection").arg(connection.kindName()));
        }
        return false;
    }

    m_open = true;
    return true;
}

void Loader::close()
{
    if (!m_open) {
        qWarning() << "[Loader] Loader is already closed";
        return;
    }

    closeConnection();
    m_open = false;
}

bool Loader::getEntities(QList<IREntity> *entities)
{
    return collect(m_props.entities, entities);
}

bool Loader::getRelationships(QList<IRRelationship> *relationships)
{
    return collect(m_props.relationships, relationships);
}

QString Loader::primaryKeyOf(const QString &entityKey) const
{
    return m_props.primaryKeyMap.value(entityKey, m_props.defaultPrimaryKey);
}

void Loader::setError(const QString &error)
{
    m_error = error;
    qWarning() << "[Loader]" << error;
    emit errorOccurred(error);
}

bool Loader::collect(const QStringList &wanted, QList<IREntity> *out)
{
    if (!m_open) {
        setError("Loader is not open");
        return false;
    }

    out->clear();
    QStringList keys;
    if (!sourceKeys(&keys)) {
        if (m_error.isEmpty()) {
            setError("Failed to list source entities");
        }
        return false;
    }

    for (const QString &key : keys) {
        if (!wanted.contains(key)) {
            continue;
        }

        IREntity entity(key);
        if (!readInstances(key, &entity.instances)) {
            return false;
        }

        for (const IRInstance &instance : entity.instances) {
            QString error;
            if (!instance.isValid(&error)) {
                setError(error);
                return false;
            }
        }

        out->append(entity);
    }
    return true;
}

Loader *createLoader(const LoaderProps &props, QObject *parent)
{
    const QString format = props.format.toLower();
    if (format == "json") {
        return new JSONLoader(props, parent);
    }
    if (format == "sqlite") {
        return new SQLiteLoader(props, parent);
    }

    qWarning() << "[Loader] Unsupported source format:" << props.format;
    return nullptr;
}

} // namespace Bridge
