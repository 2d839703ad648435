#ifndef LOCALREPOSITORY_H
#define LOCALREPOSITORY_H

#include "repository.h"
#include "../schema/schemaregistry.h"

#include <QString>
#include <QStringList>
#include <QMap>
#include <QHash>

namespace Bridge {

/**
 * @brief Count of writes performed against a repository
 */
struct WriteStats {
    int inserts = 0;
    int updates = 0;
    int deletes = 0;

    int total() const { return inserts + updates + deletes; }
};

/**
 * @brief Single-writer repository held in memory
 *
 * Staged changes live in memory; saveChanges() commits them and, when a
 * file path is set, writes the whole repository as one JSON document:
 *   <file>.json
 *   ├── records, collections, relationships
 *   ├── aspects, provenance, codeSpecs, schemas
 *   └── extents, changesets
 *
 * Ids are hexadecimal strings ("0x1" is the root subject). The base Core
 * schema and the Core code specs always exist.
 */
class LocalRepository : public Repository
{
    Q_OBJECT

public:
    /**
     * @brief Create a repository
     * @param filePath JSON file for persistence, empty for memory only
     * @param parent Parent QObject
     */
    explicit LocalRepository(const QString &filePath = QString(), QObject *parent = nullptr);
    ~LocalRepository() override = default;

    /**
     * @brief Read the repository file
     *
     * A missing file leaves an empty repository and is not an error.
     */
    bool load();

    QString filePath() const { return m_filePath; }

    // ========== Identity ==========

    QString rootSubjectId() const override;
    QString repositoryModelId() const override;

    // ========== Code Specs ==========

    QString codeSpecId(const QString &name) const override;
    QString insertCodeSpec(const QString &name) override;

    // ========== Records ==========

    QString findRecordByCode(const Code &code) const override;
    bool record(const QString &id, RecordProps *props) const override;
    QString insertRecord(const RecordProps &props) override;
    bool updateRecord(const RecordProps &props) override;
    bool deleteRecord(const QString &id) override;
    int deleteDefinitionRecords(const QStringList &ids) override;
    bool isDefinitionRecord(const QString &id) const override;

    // ========== Collections ==========

    bool insertCollection(const QString &modeledRecordId,
                          const QString &classFullName,
                          const QString &parentCollectionId) override;
    bool hasCollection(const QString &id) const override;

    // ========== Relationships ==========

    QString findRelationship(const QString &classFullName,
                             const QString &sourceId,
                             const QString &targetId) const override;
    QString insertRelationship(const RelationshipProps &props) override;

    // ========== Aspects ==========

    QString findUniqueAspect(const QString &elementId, const QString &classFullName) const override;
    bool aspect(const QString &id, AspectProps *props) const override;
    QString insertAspect(const AspectProps &props) override;
    bool updateAspect(const AspectProps &props) override;
    bool deleteAspect(const QString &id) override;

    // ========== Lookup ==========

    QStringList locate(const LocatorQuery &query, QString *error = nullptr) const override;

    // ========== Schemas ==========

    bool schemaVersion(const QString &name, SchemaVersion *version) const override;
    bool schema(const QString &name, SchemaDef *schema) const override;
    QStringList schemaNames() const override;
    bool importSchema(const QByteArray &serialized) override;

    // ========== Provenance ==========

    QString findProvenance(const QString &scopeId,
                           const QString &kind,
                           const QString &identifier,
                           ProvenanceRecord *record = nullptr) const override;
    QString insertProvenance(const ProvenanceRecord &record) override;
    bool updateProvenance(const ProvenanceRecord &record) override;
    QList<ProvenanceRecord> provenanceRecords(const QString &excludedKind) const override;

    // ========== Extents ==========

    bool updateExtents() override;
    Extents extents() const override { return m_state.extents; }

    // ========== Change Sets ==========

    bool saveChanges(const QString &comment) override;
    void abandonChanges() override;

    /**
     * @brief Comments of all committed change sets, oldest first
     */
    QStringList changesets() const { return m_state.changesets; }

    // ========== Inspection ==========

    /**
     * @brief Ids of records of a class (exact match), or of all records
     */
    QStringList recordIds(const QString &classFullName = QString()) const;

    QList<RelationshipProps> relationships(const QString &classFullName = QString()) const;
    QList<ProvenanceRecord> allProvenance() const { return m_state.provenance.values(); }
    QList<AspectProps> aspects(const QString &classFullName = QString()) const;

    WriteStats writeStats() const { return m_writes; }
    void resetWriteStats() { m_writes = WriteStats(); }

private:
    struct Collection {
        QString id;
        QString classFullName;
        QString parentId;
    };

    struct State {
        QMap<QString, RecordProps> records;
        QMap<QString, Collection> collections;
        QMap<QString, RelationshipProps> relationships;
        QMap<QString, ProvenanceRecord> provenance;
        QMap<QString, AspectProps> aspects;
        QMap<QString, QString> codeSpecs;       // name -> id
        QMap<QString, SchemaDef> schemas;       // name -> schema
        Extents extents;
        QStringList changesets;
        quint64 nextId = 0x10;
    };

    void initialize();
    void rebuildIndexes();
    QString nextId();
    static QString codeKey(const Code &code);
    bool checkRecord(const RecordProps &props, QString *canonicalClass);
    bool checkAspect(const AspectProps &props, QString *canonicalClass);
    void removeAspect(const QString &id);
    bool removeRecord(const QString &id);
    void clearReferencesTo(const QString &id);
    bool isReferenced(const QString &id, const QStringList &ignored) const;
    bool matches(const RecordProps &record, const QPair<QString, QJsonValue> &constraint) const;

    QJsonObject toJson() const;
    bool fromJson(const QJsonObject &obj, QString *error);

    QString m_filePath;
    State m_state;
    State m_committed;
    SchemaRegistry m_classes;
    QHash<QString, QString> m_codeIndex;    // code key -> record id
    WriteStats m_writes;
};

} // namespace Bridge

#endif // LOCALREPOSITORY_H
