#ifndef IRMODEL_H
#define IRMODEL_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include <QJsonObject>
#include <QJsonValue>
#include <functional>

/**
 * @file irmodel.h
 * @brief Intermediate representation of external source data
 *
 * Loaders turn a data source into IR entities (one per sheet, table or JSON
 * array). Each IR instance has a stable key derived from its entity and
 * primary key value, and a checksum over its data used by change detection.
 */

namespace Bridge {

class Loader;
struct DataConnection;
struct RecordDMO;
struct LinkDMO;
struct ForeignKeyDMO;
struct AspectDMO;

/**
 * @brief String form of an IR attribute value
 *
 * Strings are returned as-is, numbers in their shortest form, booleans as
 * "true"/"false", null as an empty string and objects/arrays as compact JSON.
 */
QString irValueToString(const QJsonValue &value);

/**
 * @brief One external record
 */
class IRInstance
{
public:
    IRInstance() = default;
    IRInstance(const QString &pkey,
               const QString &entityKey,
               const QJsonObject &data,
               const QString &version = QString());

    /**
     * @brief Build an instance key from its parts
     *
     * The same (entityKey, primaryKeyValue) pair always yields the same key.
     */
    static QString createKey(const QString &entityKey, const QString &primaryKeyValue);

    QString pkey() const { return m_pkey; }
    QString entityKey() const { return m_entityKey; }
    QJsonObject data() const { return m_data; }
    QString version() const { return m_version; }

    /**
     * @brief Stable cross-run identity: entityKey + "-" + data[pkey]
     */
    QString key() const;

    /// Identity code value of the target record (same as key())
    QString codeValue() const { return key(); }

    /// Display label of the target record (the primary key value)
    QString userLabel() const;

    QJsonValue get(const QString &attr) const { return m_data.value(attr); }
    QString getString(const QString &attr) const { return irValueToString(m_data.value(attr)); }
    bool has(const QString &attr) const { return m_data.contains(attr); }

    /**
     * @brief MD5 hex digest of the compact JSON form of data
     *
     * QJsonObject keeps its keys sorted, so the digest does not depend on the
     * attribute order of the source row.
     */
    QString checksum() const;

    /**
     * @brief Check the primary key attribute exists in data
     * @param error Receives "<pkey> does not exist on <entityKey>" on failure
     */
    bool isValid(QString *error = nullptr) const;

    QJsonObject toJson() const;

    bool operator==(const IRInstance &other) const;
    bool operator!=(const IRInstance &other) const { return !(*this == other); }

private:
    QString m_pkey;
    QString m_entityKey;
    QJsonObject m_data;
    QString m_version;
};

/**
 * @brief A named external class and its instances
 */
struct IREntity {
    QString key;
    QList<IRInstance> instances;

    IREntity() = default;
    IREntity(const QString &k, const QList<IRInstance> &i = QList<IRInstance>())
        : key(k), instances(i) {}

    bool operator==(const IREntity &other) const {
        return key == other.key && instances == other.instances;
    }
};

/// Relationship entities share the entity representation
using IRRelationship = IREntity;

/**
 * @brief Normalized in-memory store of IR entities and relationships
 *
 * Built once per run from the loader and read-only afterwards.
 */
class IRModel
{
public:
    using InstanceFilter = std::function<bool(const IRInstance &)>;

    IRModel() = default;
    IRModel(const QList<IREntity> &entities, const QList<IRRelationship> &relationships);

    /**
     * @brief Collapse duplicate instance keys
     *
     * Keys are compared case-insensitively. The last-seen instance wins and
     * keeps the position of the first occurrence.
     */
    static IREntity normalized(const IREntity &entity);

    /**
     * @brief Populate a model from a loader
     *
     * Opens the loader on the connection, reads entities and relationships
     * and closes it again, also when reading fails.
     *
     * @return false with @p error set on open or read failure
     */
    static bool fromLoader(Loader *loader, const DataConnection &connection,
                           IRModel *model, QString *error = nullptr);

    /**
     * @brief Deep equality of entity and relationship maps
     *
     * Meant for comparing the output of two loaders over the same data.
     */
    static bool compare(const IRModel &a, const IRModel &b);

    // ========== Lookup ==========

    /**
     * @brief Instances of an entity that pass the filter
     *
     * An unknown entity yields an empty list.
     */
    QList<IRInstance> entityInstances(const QString &entityKey,
                                      const InstanceFilter &filter = InstanceFilter()) const;

    QList<IRInstance> relationshipInstances(const QString &entityKey,
                                            const InstanceFilter &filter = InstanceFilter()) const;

    QList<IRInstance> instancesFor(const RecordDMO &dmo) const;
    QList<IRInstance> instancesFor(const LinkDMO &dmo) const;
    QList<IRInstance> instancesFor(const ForeignKeyDMO &dmo) const;
    QList<IRInstance> instancesFor(const AspectDMO &dmo) const;

    bool hasEntity(const QString &key) const { return m_entities.contains(key); }
    bool hasRelationship(const QString &key) const { return m_relationships.contains(key); }
    QStringList entityKeys() const { return m_entities.keys(); }
    QStringList relationshipKeys() const { return m_relationships.keys(); }

    bool isEmpty() const { return m_entities.isEmpty() && m_relationships.isEmpty(); }
    void clear();

private:
    static QList<IRInstance> filtered(const QMap<QString, IREntity> &map,
                                      const QString &key,
                                      const InstanceFilter &filter);

    QMap<QString, IREntity> m_entities;
    QMap<QString, IRRelationship> m_relationships;
};

} // namespace Bridge

#endif // IRMODEL_H
