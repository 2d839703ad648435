#include "irmodel.h"
#include "../loaders/loader.h"
#include "../sync/dmo.h"

#include <QCryptographicHash>
#include <QJsonDocument>
#include <QLocale>
#include <QHash>
#include <QDebug>

namespace Bridge {

QString irValueToString(const QJsonValue &value)
{
    switch (value.type()) {
    case QJsonValue::String:
        return value.toString();
    case QJsonValue::Double:
        return QString::number(value.toDouble(), 'g', QLocale::FloatingPointShortest);
    case QJsonValue::Bool:
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Object:
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    case QJsonValue::Array:
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    case QJsonValue::Null:
    case QJsonValue::Undefined:
        break;
    }
    return QString();
}

// ========== IRInstance ==========

IRInstance::IRInstance(const QString &pkey,
                       const QString &entityKey,
                       const QJsonObject &data,
                       const QString &version)
    : m_pkey(pkey)
    , m_entityKey(entityKey)
    , m_data(data)
    , m_version(version)
{
}

QString IRInstance::createKey(const QString &entityKey, const QString &primaryKeyValue)
{
    return entityKey + QLatin1Char('-') + primaryKeyValue;
}

QString IRInstance::key() const
{
    return createKey(m_entityKey, userLabel());
}

QString IRInstance::userLabel() const
{
    return irValueToString(m_data.value(m_pkey));
}

QString IRInstance::checksum() const
{
    QByteArray json = QJsonDocument(m_data).toJson(QJsonDocument::Compact);
    return QString::fromLatin1(QCryptographicHash::hash(json, QCryptographicHash::Md5).toHex());
}

bool IRInstance::isValid(QString *error) const
{
    if (m_pkey.isEmpty() || !m_data.contains(m_pkey)) {
        if (error) {
            *error = QString("%1 does not exist on %2").arg(m_pkey, m_entityKey);
        }
        return false;
    }
    return true;
}

QJsonObject IRInstance::toJson() const
{
    QJsonObject obj;
    obj["pkey"] = m_pkey;
    obj["entityKey"] = m_entityKey;
    obj["version"] = m_version;
    obj["data"] = m_data;
    return obj;
}

bool IRInstance::operator==(const IRInstance &other) const
{
    return m_pkey == other.m_pkey
        && m_entityKey == other.m_entityKey
        && m_version == other.m_version
        && m_data == other.m_data;
}

// ========== IRModel ==========

IRModel::IRModel(const QList<IREntity> &entities, const QList<IRRelationship> &relationships)
{
    for (const IREntity &entity : entities) {
        m_entities.insert(entity.key, normalized(entity));
    }
    for (const IRRelationship &rel : relationships) {
        m_relationships.insert(rel.key, normalized(rel));
    }
}

IREntity IRModel::normalized(const IREntity &entity)
{
    IREntity result(entity.key);
    QHash<QString, int> positions;

    for (const IRInstance &instance : entity.instances) {
        const QString folded = instance.key().toLower();
        auto it = positions.constFind(folded);
        if (it != positions.constEnd()) {
            qDebug() << "[IRModel] Duplicate instance key" << instance.key()
                     << "in" << entity.key << "- keeping the last one";
            result.instances[it.value()] = instance;
        } else {
            positions.insert(folded, result.instances.size());
            result.instances.append(instance);
        }
    }
    return result;
}

bool IRModel::fromLoader(Loader *loader, const DataConnection &connection,
                         IRModel *model, QString *error)
{
    if (!loader || !model) {
        if (error) *error = "No loader or model given";
        return false;
    }

    if (!loader->open(connection)) {
        if (error) *error = loader->errorString();
        return false;
    }

    QList<IREntity> entities;
    QList<IRRelationship> relationships;
    bool ok = loader->getEntities(&entities) && loader->getRelationships(&relationships);
    QString loaderError = loader->errorString();
    loader->close();

    if (!ok) {
        if (error) *error = loaderError;
        return false;
    }

    *model = IRModel(entities, relationships);
    qDebug() << "[IRModel] Loaded" << model->m_entities.size() << "entities and"
             << model->m_relationships.size() << "relationships";
    return true;
}

bool IRModel::compare(const IRModel &a, const IRModel &b)
{
    return a.m_entities == b.m_entities && a.m_relationships == b.m_relationships;
}

// ========== Lookup ==========

QList<IRInstance> IRModel::filtered(const QMap<QString, IREntity> &map,
                                    const QString &key,
                                    const InstanceFilter &filter)
{
    auto it = map.constFind(key);
    if (it == map.constEnd()) {
        return QList<IRInstance>();
    }
    if (!filter) {
        return it->instances;
    }

    QList<IRInstance> result;
    for (const IRInstance &instance : it->instances) {
        if (filter(instance)) {
            result.append(instance);
        }
    }
    return result;
}

QList<IRInstance> IRModel::entityInstances(const QString &entityKey, const InstanceFilter &filter) const
{
    return filtered(m_entities, entityKey, filter);
}

QList<IRInstance> IRModel::relationshipInstances(const QString &entityKey, const InstanceFilter &filter) const
{
    return filtered(m_relationships, entityKey, filter);
}

QList<IRInstance> IRModel::instancesFor(const RecordDMO &dmo) const
{
    return entityInstances(dmo.irEntity, dmo.doSyncInstance);
}

QList<IRInstance> IRModel::instancesFor(const LinkDMO &dmo) const
{
    return relationshipInstances(dmo.irEntity, dmo.doSyncInstance);
}

QList<IRInstance> IRModel::instancesFor(const ForeignKeyDMO &dmo) const
{
    return relationshipInstances(dmo.irEntity, dmo.doSyncInstance);
}

QList<IRInstance> IRModel::instancesFor(const AspectDMO &dmo) const
{
    return entityInstances(dmo.irEntity, dmo.doSyncInstance);
}

void IRModel::clear()
{
    m_entities.clear();
    m_relationships.clear();
}

} // namespace Bridge
