#ifndef REPOSITORY_H
#define REPOSITORY_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include <QPair>
#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include "../schema/schemadef.h"

namespace Bridge {

class ConcurrencyControl;

/// Code specs every repository provides
namespace CodeSpecs {
const char Subject[] = "Core:Subject";
const char InformationPartition[] = "Core:InformationPartitionElement";
const char LinkElement[] = "Core:LinkElement";
}

/**
 * @brief Identity code of a record
 *
 * A record is uniquely identified by (code spec, scope, value) within a
 * repository. Records without a code have an invalid (empty) code.
 */
struct Code {
    QString specId;
    QString scopeId;
    QString value;

    Code() = default;
    Code(const QString &spec, const QString &scope, const QString &v)
        : specId(spec), scopeId(scope), value(v) {}

    bool isValid() const { return !specId.isEmpty() && !scopeId.isEmpty() && !value.isEmpty(); }

    bool operator==(const Code &o) const {
        return specId == o.specId && scopeId == o.scopeId && value == o.value;
    }

    QJsonObject toJson() const;
    static Code fromJson(const QJsonObject &obj);
};

/**
 * @brief Reference from one record to another, typed by a relationship class
 */
struct RelatedRef {
    QString id;
    QString relClassName;

    RelatedRef() = default;
    RelatedRef(const QString &i, const QString &rel) : id(i), relClassName(rel) {}

    bool isValid() const { return !id.isEmpty(); }
    bool operator==(const RelatedRef &o) const { return id == o.id && relClassName == o.relClassName; }
    bool operator!=(const RelatedRef &o) const { return !(*this == o); }

    QJsonObject toJson() const;
    static RelatedRef fromJson(const QJsonObject &obj);
};

/**
 * @brief Properties of a record (insert or update)
 */
struct RecordProps {
    QString id;                 ///< Empty for inserts
    QString classFullName;      ///< "Schema:Class"
    QString modelId;            ///< Collection holding the record
    Code code;
    QString userLabel;
    QString federationGuid;
    RelatedRef parent;
    QString categoryId;
    QJsonObject jsonProperties;             ///< Free-form data (source row)
    QJsonObject properties;                 ///< Class properties
    QMap<QString, RelatedRef> references;   ///< Reference properties by name

    QJsonObject toJson() const;
    static RecordProps fromJson(const QJsonObject &obj);
};

/**
 * @brief Properties of a link-table relationship instance
 */
struct RelationshipProps {
    QString id;
    QString classFullName;
    QString sourceId;
    QString targetId;
    QJsonObject properties;

    QJsonObject toJson() const;
    static RelationshipProps fromJson(const QJsonObject &obj);
};

/**
 * @brief Properties of an aspect owned by a record
 *
 * A record holds at most one unique aspect per class.
 */
struct AspectProps {
    QString id;                 ///< Empty for inserts
    QString classFullName;      ///< Class derived from Core:ElementUniqueAspect
    QString elementId;          ///< Owning record
    QJsonObject properties;

    QJsonObject toJson() const;
    static AspectProps fromJson(const QJsonObject &obj);
};

/**
 * @brief External source marker attached to a synchronized record or aspect
 *
 * The only durable synchronization state: (scope, kind, identifier) names
 * the source instance, version and checksum fingerprint its content.
 */
struct ProvenanceRecord {
    QString id;
    QString elementId;      ///< Record or aspect the marker belongs to
    QString scopeId;
    QString kind;           ///< IR entity key, or the connection-descriptor kind
    QString identifier;     ///< Identity code value
    QString version;
    QString checksum;

    QJsonObject toJson() const;
    static ProvenanceRecord fromJson(const QJsonObject &obj);
};

/**
 * @brief Property constraints for locating existing records
 *
 * Property names are lower-case. An empty class name matches every class.
 */
struct LocatorQuery {
    QString classFullName;
    QList<QPair<QString, QJsonValue>> constraints;
};

/**
 * @brief Axis-aligned box covering all placed records
 */
struct Extents {
    bool isNull = true;
    double low[3] = {0, 0, 0};
    double high[3] = {0, 0, 0};

    void extend(double x, double y, double z);
};

/**
 * @brief Abstract target repository
 *
 * The repository stores typed records in collections, link-table
 * relationships between records, schemas and provenance markers. All
 * writes are staged until saveChanges() commits them.
 *
 * Failing operations return false or an empty id and leave the reason in
 * errorString().
 */
class Repository : public QObject
{
    Q_OBJECT

public:
    explicit Repository(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~Repository() = default;

    // ========== Identity ==========

    /**
     * @brief Id of the root record every container hangs off
     */
    virtual QString rootSubjectId() const = 0;

    /**
     * @brief Id of the collection holding containers and partitions
     */
    virtual QString repositoryModelId() const = 0;

    // ========== Code Specs ==========

    /**
     * @brief Id of a code spec, empty if it does not exist
     */
    virtual QString codeSpecId(const QString &name) const = 0;

    /**
     * @brief Create a code spec
     * @return New id, or empty on failure
     */
    virtual QString insertCodeSpec(const QString &name) = 0;

    // ========== Records ==========

    /**
     * @brief Find a record by identity code
     * @return Record id, or empty if none exists
     */
    virtual QString findRecordByCode(const Code &code) const = 0;

    /**
     * @brief Read a record
     * @return false if the id is unknown
     */
    virtual bool record(const QString &id, RecordProps *props) const = 0;

    /**
     * @brief Insert a record
     *
     * Fails for unknown classes and when another record has the same code.
     * @return New record id, or empty on failure
     */
    virtual QString insertRecord(const RecordProps &props) = 0;

    /**
     * @brief Replace the properties of an existing record (props.id must be set)
     */
    virtual bool updateRecord(const RecordProps &props) = 0;

    /**
     * @brief Delete a record with its provenance, relationships, aspects and sub-collection
     *
     * Category, parent and reference properties of other records that point
     * at a deleted record are cleared.
     */
    virtual bool deleteRecord(const QString &id) = 0;

    /**
     * @brief Delete definition records
     *
     * Definitions still referenced by other records are kept.
     * @return Number of records deleted, or -1 on failure
     */
    virtual int deleteDefinitionRecords(const QStringList &ids) = 0;

    /**
     * @brief Whether a record's class derives from Core:DefinitionElement
     */
    virtual bool isDefinitionRecord(const QString &id) const = 0;

    /**
     * @brief Set one reference property of a record and save it
     */
    bool updateReference(const QString &recordId, const QString &property, const RelatedRef &ref);

    // ========== Collections ==========

    /**
     * @brief Create the collection modelling a record
     *
     * The collection id equals the id of the modelled record.
     */
    virtual bool insertCollection(const QString &modeledRecordId,
                                  const QString &classFullName,
                                  const QString &parentCollectionId) = 0;

    virtual bool hasCollection(const QString &id) const = 0;

    // ========== Relationships ==========

    /**
     * @brief Find a relationship instance by its (class, source, target) triple
     * @return Relationship id, or empty if none exists
     */
    virtual QString findRelationship(const QString &classFullName,
                                     const QString &sourceId,
                                     const QString &targetId) const = 0;

    virtual QString insertRelationship(const RelationshipProps &props) = 0;

    // ========== Aspects ==========

    /**
     * @brief Find the aspect of a class owned by a record
     * @return Aspect id, or empty if none exists
     */
    virtual QString findUniqueAspect(const QString &elementId, const QString &classFullName) const = 0;

    /**
     * @brief Read an aspect
     * @return false if the id is unknown
     */
    virtual bool aspect(const QString &id, AspectProps *props) const = 0;

    /**
     * @brief Insert an aspect
     *
     * Fails for classes not derived from Core:ElementUniqueAspect, for a
     * missing owner and when the owner already has an aspect of the class.
     * @return New aspect id, or empty on failure
     */
    virtual QString insertAspect(const AspectProps &props) = 0;

    /**
     * @brief Replace an existing aspect (props.id must be set)
     */
    virtual bool updateAspect(const AspectProps &props) = 0;

    /**
     * @brief Delete an aspect with its provenance
     */
    virtual bool deleteAspect(const QString &id) = 0;

    // ========== Lookup ==========

    /**
     * @brief Ids of every record matching all constraints
     */
    virtual QStringList locate(const LocatorQuery &query, QString *error = nullptr) const = 0;

    // ========== Schemas ==========

    virtual bool schemaVersion(const QString &name, SchemaVersion *version) const = 0;
    virtual bool schema(const QString &name, SchemaDef *schema) const = 0;
    virtual QStringList schemaNames() const = 0;

    /**
     * @brief Import a serialized schema (see SchemaDef::serialize())
     *
     * Replaces an existing schema of the same name. Fails when a referenced
     * schema or base class is unknown.
     */
    virtual bool importSchema(const QByteArray &serialized) = 0;

    // ========== Provenance ==========

    /**
     * @brief Find the provenance marker of a source instance
     * @return Marker id, or empty if none exists
     */
    virtual QString findProvenance(const QString &scopeId,
                                   const QString &kind,
                                   const QString &identifier,
                                   ProvenanceRecord *record = nullptr) const = 0;

    virtual QString insertProvenance(const ProvenanceRecord &record) = 0;
    virtual bool updateProvenance(const ProvenanceRecord &record) = 0;

    /**
     * @brief Every provenance marker except those of one kind
     */
    virtual QList<ProvenanceRecord> provenanceRecords(const QString &excludedKind) const = 0;

    // ========== Extents ==========

    /**
     * @brief Recompute the repository extents from record placements
     */
    virtual bool updateExtents() = 0;
    virtual Extents extents() const = 0;

    // ========== Change Sets ==========

    /**
     * @brief Commit staged changes with a description
     */
    virtual bool saveChanges(const QString &comment) = 0;

    /**
     * @brief Discard staged changes
     */
    virtual void abandonChanges() = 0;

    /**
     * @brief Lock and push protocol of a multi-writer repository
     *
     * Single-writer repositories return nullptr.
     */
    virtual ConcurrencyControl *concurrencyControl() { return nullptr; }

    QString errorString() const { return m_error; }

signals:
    void recordInserted(const QString &id);
    void recordUpdated(const QString &id);
    void recordDeleted(const QString &id);
    void errorOccurred(const QString &error);

protected:
    void setError(const QString &error);

private:
    QString m_error;
};

} // namespace Bridge

#endif // REPOSITORY_H
