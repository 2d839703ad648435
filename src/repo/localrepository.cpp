#include "localrepository.h"
#include "../ir/irmodel.h"
#include "../schema/schemacomparer.h"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QDebug>

#include <iterator>

namespace Bridge {

static const char RootSubjectId[] = "0x1";

LocalRepository::LocalRepository(const QString &filePath, QObject *parent)
    : Repository(parent)
    , m_filePath(filePath)
{
    initialize();
}

void LocalRepository::initialize()
{
    m_state = State();
    m_state.schemas.insert(CoreClasses::Schema, coreSchema());

    RecordProps root;
    root.id = RootSubjectId;
    root.classFullName = CoreClasses::Subject;
    root.modelId = RootSubjectId;
    root.userLabel = "Root";
    m_state.records.insert(root.id, root);

    Collection repoModel;
    repoModel.id = RootSubjectId;
    repoModel.classFullName = "Core:RepositoryModel";
    m_state.collections.insert(repoModel.id, repoModel);

    m_state.codeSpecs.insert(CodeSpecs::Subject, "0x2");
    m_state.codeSpecs.insert(CodeSpecs::InformationPartition, "0x3");
    m_state.codeSpecs.insert(CodeSpecs::LinkElement, "0x4");

    m_committed = m_state;
    rebuildIndexes();
}

void LocalRepository::rebuildIndexes()
{
    m_classes.clear();
    for (const SchemaDef &s : m_state.schemas) {
        m_classes.registerSchema(s);
    }

    m_codeIndex.clear();
    for (const RecordProps &r : m_state.records) {
        if (r.code.isValid()) {
            m_codeIndex.insert(codeKey(r.code), r.id);
        }
    }
}

QString LocalRepository::nextId()
{
    return QString("0x%1").arg(m_state.nextId++, 0, 16);
}

QString LocalRepository::codeKey(const Code &code)
{
    return code.specId + QChar(0x1f) + code.scopeId + QChar(0x1f) + code.value;
}

bool LocalRepository::load()
{
    if (m_filePath.isEmpty() || !QFileInfo::exists(m_filePath)) {
        return true;
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(QString("Failed to open repository file: %1").arg(m_filePath));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setError(QString("Failed to parse repository file %1: %2").arg(m_filePath, parseError.errorString()));
        return false;
    }

    QString error;
    if (!fromJson(doc.object(), &error)) {
        setError(QString("%1: %2").arg(m_filePath, error));
        return false;
    }

    qDebug() << "[LocalRepository] Loaded" << m_state.records.size() << "records from" << m_filePath;
    return true;
}

// ========== Identity ==========

QString LocalRepository::rootSubjectId() const
{
    return RootSubjectId;
}

QString LocalRepository::repositoryModelId() const
{
    return RootSubjectId;
}

// ========== Code Specs ==========

QString LocalRepository::codeSpecId(const QString &name) const
{
    return m_state.codeSpecs.value(name);
}

QString LocalRepository::insertCodeSpec(const QString &name)
{
    if (name.isEmpty()) {
        setError("Code spec name is empty");
        return QString();
    }
    if (m_state.codeSpecs.contains(name)) {
        setError(QString("Code spec %1 already exists").arg(name));
        return QString();
    }

    const QString id = nextId();
    m_state.codeSpecs.insert(name, id);
    m_writes.inserts++;
    return id;
}

// ========== Records ==========

QString LocalRepository::findRecordByCode(const Code &code) const
{
    if (!code.isValid()) {
        return QString();
    }
    return m_codeIndex.value(codeKey(code));
}

bool LocalRepository::record(const QString &id, RecordProps *props) const
{
    auto it = m_state.records.constFind(id);
    if (it == m_state.records.constEnd()) {
        return false;
    }
    if (props) {
        *props = it.value();
    }
    return true;
}

bool LocalRepository::checkRecord(const RecordProps &props, QString *canonicalClass)
{
    const ClassDefinition *def = m_classes.resolve(props.classFullName);
    if (!def || def->isRelationship()) {
        setError(QString("Unknown entity class: %1").arg(props.classFullName));
        return false;
    }
    if (!m_state.collections.contains(props.modelId)) {
        setError(QString("Collection %1 does not exist").arg(props.modelId));
        return false;
    }
    if (props.code.isValid()) {
        const QString existing = m_codeIndex.value(codeKey(props.code));
        if (!existing.isEmpty() && existing != props.id) {
            setError(QString("Duplicate code %1 in scope %2").arg(props.code.value, props.code.scopeId));
            return false;
        }
    }

    *canonicalClass = m_classes.canonicalName(props.classFullName);
    return true;
}

QString LocalRepository::insertRecord(const RecordProps &props)
{
    RecordProps stored = props;
    stored.id.clear();

    QString canonical;
    if (!checkRecord(stored, &canonical)) {
        return QString();
    }

    stored.id = nextId();
    stored.classFullName = canonical;
    m_state.records.insert(stored.id, stored);
    if (stored.code.isValid()) {
        m_codeIndex.insert(codeKey(stored.code), stored.id);
    }

    m_writes.inserts++;
    emit recordInserted(stored.id);
    return stored.id;
}

bool LocalRepository::updateRecord(const RecordProps &props)
{
    auto it = m_state.records.find(props.id);
    if (it == m_state.records.end()) {
        setError(QString("Record %1 not found").arg(props.id));
        return false;
    }

    QString canonical;
    if (!checkRecord(props, &canonical)) {
        return false;
    }

    if (it->code.isValid()) {
        m_codeIndex.remove(codeKey(it->code));
    }

    RecordProps stored = props;
    stored.classFullName = canonical;
    *it = stored;
    if (stored.code.isValid()) {
        m_codeIndex.insert(codeKey(stored.code), stored.id);
    }

    m_writes.updates++;
    emit recordUpdated(stored.id);
    return true;
}

bool LocalRepository::removeRecord(const QString &id)
{
    auto it = m_state.records.find(id);
    if (it == m_state.records.end()) {
        return false;
    }

    // Records in the sub-collection go with their modelled record
    if (m_state.collections.contains(id)) {
        QStringList contained;
        for (const RecordProps &r : m_state.records) {
            if (r.modelId == id && r.id != id) {
                contained.append(r.id);
            }
        }
        for (const QString &childId : contained) {
            removeRecord(childId);
        }
        m_state.collections.remove(id);
    }

    it = m_state.records.find(id);
    if (it->code.isValid()) {
        m_codeIndex.remove(codeKey(it->code));
    }
    m_state.records.erase(it);

    for (auto p = m_state.provenance.begin(); p != m_state.provenance.end(); ) {
        p = (p->elementId == id) ? m_state.provenance.erase(p) : std::next(p);
    }
    for (auto r = m_state.relationships.begin(); r != m_state.relationships.end(); ) {
        r = (r->sourceId == id || r->targetId == id) ? m_state.relationships.erase(r) : std::next(r);
    }
    QStringList owned;
    for (const AspectProps &a : m_state.aspects) {
        if (a.elementId == id) {
            owned.append(a.id);
        }
    }
    for (const QString &aspectId : owned) {
        removeAspect(aspectId);
    }
    clearReferencesTo(id);

    m_writes.deletes++;
    emit recordDeleted(id);
    return true;
}

void LocalRepository::clearReferencesTo(const QString &id)
{
    for (auto it = m_state.records.begin(); it != m_state.records.end(); ++it) {
        bool changed = false;
        if (it->categoryId == id) {
            it->categoryId.clear();
            changed = true;
        }
        if (it->parent.id == id) {
            it->parent = RelatedRef();
            changed = true;
        }
        for (auto ref = it->references.begin(); ref != it->references.end(); ) {
            if (ref->id == id) {
                ref = it->references.erase(ref);
                changed = true;
            } else {
                ++ref;
            }
        }

        if (changed) {
            qDebug() << "[LocalRepository] Cleared references to" << id << "in" << it->id;
            m_writes.updates++;
            emit recordUpdated(it->id);
        }
    }
}

bool LocalRepository::deleteRecord(const QString &id)
{
    if (id == RootSubjectId) {
        setError("The root subject cannot be deleted");
        return false;
    }
    if (!removeRecord(id)) {
        setError(QString("Record %1 not found").arg(id));
        return false;
    }
    return true;
}

bool LocalRepository::isReferenced(const QString &id, const QStringList &ignored) const
{
    for (const RecordProps &r : m_state.records) {
        if (r.id == id || ignored.contains(r.id)) {
            continue;
        }
        if (r.categoryId == id || r.parent.id == id) {
            return true;
        }
        for (const RelatedRef &ref : r.references) {
            if (ref.id == id) {
                return true;
            }
        }
    }
    return false;
}

int LocalRepository::deleteDefinitionRecords(const QStringList &ids)
{
    int deleted = 0;
    for (const QString &id : ids) {
        if (!m_state.records.contains(id)) {
            continue;
        }
        if (!isDefinitionRecord(id)) {
            setError(QString("Record %1 is not a definition").arg(id));
            return -1;
        }
        if (isReferenced(id, ids)) {
            qDebug() << "[LocalRepository] Definition" << id << "is still in use, kept";
            continue;
        }
        if (removeRecord(id)) {
            ++deleted;
        }
    }
    return deleted;
}

bool LocalRepository::isDefinitionRecord(const QString &id) const
{
    auto it = m_state.records.constFind(id);
    if (it == m_state.records.constEnd()) {
        return false;
    }
    return m_classes.isSubclassOf(it->classFullName, CoreClasses::DefinitionElement);
}

// ========== Collections ==========

bool LocalRepository::insertCollection(const QString &modeledRecordId,
                                       const QString &classFullName,
                                       const QString &parentCollectionId)
{
    if (!m_state.records.contains(modeledRecordId)) {
        setError(QString("Cannot model missing record %1").arg(modeledRecordId));
        return false;
    }
    if (m_state.collections.contains(modeledRecordId)) {
        setError(QString("Record %1 is already modelled").arg(modeledRecordId));
        return false;
    }

    const QString canonical = m_classes.canonicalName(classFullName);
    if (canonical.isEmpty()) {
        setError(QString("Unknown collection class: %1").arg(classFullName));
        return false;
    }

    Collection c;
    c.id = modeledRecordId;
    c.classFullName = canonical;
    c.parentId = parentCollectionId;
    m_state.collections.insert(c.id, c);
    m_writes.inserts++;
    return true;
}

bool LocalRepository::hasCollection(const QString &id) const
{
    return m_state.collections.contains(id);
}

// ========== Relationships ==========

QString LocalRepository::findRelationship(const QString &classFullName,
                                          const QString &sourceId,
                                          const QString &targetId) const
{
    const QString canonical = m_classes.canonicalName(classFullName);
    for (const RelationshipProps &r : m_state.relationships) {
        if (r.classFullName == canonical && r.sourceId == sourceId && r.targetId == targetId) {
            return r.id;
        }
    }
    return QString();
}

QString LocalRepository::insertRelationship(const RelationshipProps &props)
{
    const ClassDefinition *def = m_classes.resolve(props.classFullName);
    if (!def || !def->isRelationship()) {
        setError(QString("Unknown relationship class: %1").arg(props.classFullName));
        return QString();
    }
    if (!m_state.records.contains(props.sourceId) || !m_state.records.contains(props.targetId)) {
        setError(QString("Relationship %1 has a missing endpoint (%2 -> %3)")
                 .arg(props.classFullName, props.sourceId, props.targetId));
        return QString();
    }
    if (!findRelationship(props.classFullName, props.sourceId, props.targetId).isEmpty()) {
        setError(QString("Relationship %1 (%2 -> %3) already exists")
                 .arg(props.classFullName, props.sourceId, props.targetId));
        return QString();
    }

    RelationshipProps stored = props;
    stored.id = nextId();
    stored.classFullName = m_classes.canonicalName(props.classFullName);
    m_state.relationships.insert(stored.id, stored);
    m_writes.inserts++;
    return stored.id;
}

// ========== Aspects ==========

QString LocalRepository::findUniqueAspect(const QString &elementId, const QString &classFullName) const
{
    const QString canonical = m_classes.canonicalName(classFullName);
    for (const AspectProps &a : m_state.aspects) {
        if (a.elementId == elementId && a.classFullName == canonical) {
            return a.id;
        }
    }
    return QString();
}

bool LocalRepository::aspect(const QString &id, AspectProps *props) const
{
    auto it = m_state.aspects.constFind(id);
    if (it == m_state.aspects.constEnd()) {
        return false;
    }
    if (props) {
        *props = it.value();
    }
    return true;
}

bool LocalRepository::checkAspect(const AspectProps &props, QString *canonicalClass)
{
    if (!m_classes.isSubclassOf(props.classFullName, CoreClasses::ElementUniqueAspect)) {
        setError(QString("Not a unique aspect class: %1").arg(props.classFullName));
        return false;
    }
    if (!m_state.records.contains(props.elementId)) {
        setError(QString("Cannot attach aspect to missing record %1").arg(props.elementId));
        return false;
    }

    const QString existing = findUniqueAspect(props.elementId, props.classFullName);
    if (!existing.isEmpty() && existing != props.id) {
        setError(QString("Record %1 already has an aspect of class %2").arg(props.elementId, props.classFullName));
        return false;
    }

    *canonicalClass = m_classes.canonicalName(props.classFullName);
    return true;
}

QString LocalRepository::insertAspect(const AspectProps &props)
{
    AspectProps stored = props;
    stored.id.clear();

    QString canonical;
    if (!checkAspect(stored, &canonical)) {
        return QString();
    }

    stored.id = nextId();
    stored.classFullName = canonical;
    m_state.aspects.insert(stored.id, stored);
    m_writes.inserts++;
    return stored.id;
}

bool LocalRepository::updateAspect(const AspectProps &props)
{
    auto it = m_state.aspects.find(props.id);
    if (it == m_state.aspects.end()) {
        setError(QString("Aspect %1 not found").arg(props.id));
        return false;
    }

    QString canonical;
    if (!checkAspect(props, &canonical)) {
        return false;
    }

    AspectProps stored = props;
    stored.classFullName = canonical;
    *it = stored;
    m_writes.updates++;
    return true;
}

void LocalRepository::removeAspect(const QString &id)
{
    m_state.aspects.remove(id);
    for (auto p = m_state.provenance.begin(); p != m_state.provenance.end(); ) {
        p = (p->elementId == id) ? m_state.provenance.erase(p) : std::next(p);
    }
    m_writes.deletes++;
}

bool LocalRepository::deleteAspect(const QString &id)
{
    if (!m_state.aspects.contains(id)) {
        setError(QString("Aspect %1 not found").arg(id));
        return false;
    }
    removeAspect(id);
    return true;
}

// ========== Lookup ==========

bool LocalRepository::matches(const RecordProps &r, const QPair<QString, QJsonValue> &constraint) const
{
    const QString &name = constraint.first;
    const QString wanted = irValueToString(constraint.second);

    if (name == "id" || name == "ecinstanceid") return r.id == wanted;
    if (name == "codevalue") return r.code.value == wanted;
    if (name == "userlabel") return r.userLabel == wanted;
    if (name == "federationguid") return r.federationGuid == wanted;
    if (name == "model") return r.modelId == wanted;
    if (name == "category") return r.categoryId == wanted;

    for (const QJsonObject *obj : { &r.properties, &r.jsonProperties }) {
        for (auto it = obj->constBegin(); it != obj->constEnd(); ++it) {
            if (it.key().toLower() == name) {
                return irValueToString(it.value()) == wanted;
            }
        }
    }
    return false;
}

QStringList LocalRepository::locate(const LocatorQuery &query, QString *error) const
{
    QString classFilter;
    if (!query.classFullName.isEmpty()) {
        classFilter = m_classes.canonicalName(query.classFullName);
        if (classFilter.isEmpty()) {
            if (error) *error = QString("Unknown class: %1").arg(query.classFullName);
            return QStringList();
        }
    }

    QStringList result;
    for (const RecordProps &r : m_state.records) {
        if (!classFilter.isEmpty() && !m_classes.isSubclassOf(r.classFullName, classFilter)) {
            continue;
        }

        bool ok = true;
        for (const auto &constraint : query.constraints) {
            if (!matches(r, constraint)) {
                ok = false;
                break;
            }
        }
        if (ok) {
            result.append(r.id);
        }
    }
    return result;
}

// ========== Schemas ==========

bool LocalRepository::schemaVersion(const QString &name, SchemaVersion *version) const
{
    SchemaDef s;
    if (!schema(name, &s)) {
        return false;
    }
    *version = s.version;
    return true;
}

bool LocalRepository::schema(const QString &name, SchemaDef *schema) const
{
    for (const SchemaDef &s : m_state.schemas) {
        if (s.name.compare(name, Qt::CaseInsensitive) == 0) {
            if (schema) {
                *schema = s;
            }
            return true;
        }
    }
    return false;
}

QStringList LocalRepository::schemaNames() const
{
    return m_state.schemas.keys();
}

bool LocalRepository::importSchema(const QByteArray &serialized)
{
    SchemaDef s;
    QString error;
    if (!SchemaDef::deserialize(serialized, &s, &error)
        || !SchemaComparer::checkUniqueClasses(s, &error)) {
        setError(QString("Schema import failed: %1").arg(error));
        return false;
    }
    if (s.name.compare(CoreClasses::Schema, Qt::CaseInsensitive) == 0) {
        setError("Schema import failed: the Core schema cannot be replaced");
        return false;
    }

    SchemaRegistry candidate = m_classes;
    for (const QString &ref : s.references) {
        if (!candidate.hasSchema(ref)) {
            setError(QString("Schema import failed: %1 references unknown schema %2").arg(s.name, ref));
            return false;
        }
    }

    candidate.registerSchema(s);
    for (const ClassDefinition &c : s.classes) {
        if (c.baseClass.isEmpty()) {
            continue;
        }
        const QString base = qualifiedClassName(s.name, c.baseClass);
        const ClassDefinition *baseDef = candidate.resolve(base);
        if (!baseDef) {
            setError(QString("Schema import failed: base class %1 of %2 not found").arg(base, c.name));
            return false;
        }
        if (baseDef->kind != c.kind) {
            setError(QString("Schema import failed: %1 and its base class %2 differ in kind").arg(c.name, base));
            return false;
        }
    }

    for (auto it = m_state.schemas.begin(); it != m_state.schemas.end(); ++it) {
        if (it.key().compare(s.name, Qt::CaseInsensitive) == 0) {
            m_state.schemas.erase(it);
            break;
        }
    }
    m_state.schemas.insert(s.name, s);
    m_classes = candidate;
    m_writes.inserts++;

    qDebug() << "[LocalRepository] Imported schema" << s.name << s.version.toString();
    return true;
}

// ========== Provenance ==========

QString LocalRepository::findProvenance(const QString &scopeId,
                                        const QString &kind,
                                        const QString &identifier,
                                        ProvenanceRecord *record) const
{
    for (const ProvenanceRecord &p : m_state.provenance) {
        if (p.scopeId == scopeId && p.kind == kind && p.identifier == identifier) {
            if (record) {
                *record = p;
            }
            return p.id;
        }
    }
    return QString();
}

QString LocalRepository::insertProvenance(const ProvenanceRecord &record)
{
    if (!m_state.records.contains(record.elementId) && !m_state.aspects.contains(record.elementId)) {
        setError(QString("Cannot attach provenance to missing element %1").arg(record.elementId));
        return QString();
    }

    ProvenanceRecord stored = record;
    stored.id = nextId();
    m_state.provenance.insert(stored.id, stored);
    m_writes.inserts++;
    return stored.id;
}

bool LocalRepository::updateProvenance(const ProvenanceRecord &record)
{
    auto it = m_state.provenance.find(record.id);
    if (it == m_state.provenance.end()) {
        setError(QString("Provenance %1 not found").arg(record.id));
        return false;
    }
    if (!m_state.records.contains(record.elementId) && !m_state.aspects.contains(record.elementId)) {
        setError(QString("Cannot attach provenance to missing element %1").arg(record.elementId));
        return false;
    }

    *it = record;
    m_writes.updates++;
    return true;
}

QList<ProvenanceRecord> LocalRepository::provenanceRecords(const QString &excludedKind) const
{
    QList<ProvenanceRecord> result;
    for (const ProvenanceRecord &p : m_state.provenance) {
        if (p.kind != excludedKind) {
            result.append(p);
        }
    }
    return result;
}

// ========== Extents ==========

bool LocalRepository::updateExtents()
{
    Extents extents;
    for (const RecordProps &r : m_state.records) {
        QJsonValue origin = r.properties.value("origin");
        if (!origin.isObject()) {
            origin = r.jsonProperties.value("origin");
        }
        if (!origin.isObject()) {
            continue;
        }
        const QJsonObject o = origin.toObject();
        extents.extend(o.value("x").toDouble(), o.value("y").toDouble(), o.value("z").toDouble());
    }

    const Extents &old = m_state.extents;
    bool changed = old.isNull != extents.isNull;
    for (int i = 0; i < 3 && !changed; ++i) {
        changed = old.low[i] != extents.low[i] || old.high[i] != extents.high[i];
    }

    if (changed) {
        m_state.extents = extents;
        m_writes.updates++;
    }
    return true;
}

// ========== Change Sets ==========

bool LocalRepository::saveChanges(const QString &comment)
{
    m_state.changesets.append(comment);

    if (!m_filePath.isEmpty()) {
        QDir().mkpath(QFileInfo(m_filePath).absolutePath());

        QSaveFile file(m_filePath);
        if (!file.open(QIODevice::WriteOnly)) {
            m_state.changesets.removeLast();
            setError(QString("Failed to write repository file: %1").arg(m_filePath));
            return false;
        }
        file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
        if (!file.commit()) {
            m_state.changesets.removeLast();
            setError(QString("Failed to write repository file: %1").arg(m_filePath));
            return false;
        }
    }

    m_committed = m_state;
    qDebug() << "[LocalRepository] Saved changes:" << comment;
    return true;
}

void LocalRepository::abandonChanges()
{
    m_state = m_committed;
    rebuildIndexes();
}

// ========== Inspection ==========

QStringList LocalRepository::recordIds(const QString &classFullName) const
{
    const QString canonical = classFullName.isEmpty() ? QString() : m_classes.canonicalName(classFullName);
    QStringList ids;
    for (const RecordProps &r : m_state.records) {
        if (classFullName.isEmpty() || r.classFullName == canonical) {
            ids.append(r.id);
        }
    }
    return ids;
}

QList<AspectProps> LocalRepository::aspects(const QString &classFullName) const
{
    const QString canonical = classFullName.isEmpty() ? QString() : m_classes.canonicalName(classFullName);
    QList<AspectProps> result;
    for (const AspectProps &a : m_state.aspects) {
        if (classFullName.isEmpty() || a.classFullName == canonical) {
            result.append(a);
        }
    }
    return result;
}

QList<RelationshipProps> LocalRepository::relationships(const QString &classFullName) const
{
    const QString canonical = classFullName.isEmpty() ? QString() : m_classes.canonicalName(classFullName);
    QList<RelationshipProps> result;
    for (const RelationshipProps &r : m_state.relationships) {
        if (classFullName.isEmpty() || r.classFullName == canonical) {
            result.append(r);
        }
    }
    return result;
}

// ========== Persistence ==========

QJsonObject LocalRepository::toJson() const
{
    QJsonObject obj;
    obj["version"] = 1;
    obj["nextId"] = QString::number(m_state.nextId, 16);

    QJsonArray records;
    for (const RecordProps &r : m_state.records) {
        records.append(r.toJson());
    }
    obj["records"] = records;

    QJsonArray collections;
    for (const Collection &c : m_state.collections) {
        QJsonObject co;
        co["id"] = c.id;
        co["classFullName"] = c.classFullName;
        co["parent"] = c.parentId;
        collections.append(co);
    }
    obj["collections"] = collections;

    QJsonArray relationships;
    for (const RelationshipProps &r : m_state.relationships) {
        relationships.append(r.toJson());
    }
    obj["relationships"] = relationships;

    QJsonArray aspects;
    for (const AspectProps &a : m_state.aspects) {
        aspects.append(a.toJson());
    }
    obj["aspects"] = aspects;

    QJsonArray provenance;
    for (const ProvenanceRecord &p : m_state.provenance) {
        provenance.append(p.toJson());
    }
    obj["provenance"] = provenance;

    QJsonObject codeSpecs;
    for (auto it = m_state.codeSpecs.constBegin(); it != m_state.codeSpecs.constEnd(); ++it) {
        codeSpecs[it.key()] = it.value();
    }
    obj["codeSpecs"] = codeSpecs;

    QJsonArray schemas;
    for (const SchemaDef &s : m_state.schemas) {
        schemas.append(s.toJson());
    }
    obj["schemas"] = schemas;

    if (!m_state.extents.isNull) {
        QJsonObject ext;
        ext["low"] = QJsonArray{m_state.extents.low[0], m_state.extents.low[1], m_state.extents.low[2]};
        ext["high"] = QJsonArray{m_state.extents.high[0], m_state.extents.high[1], m_state.extents.high[2]};
        obj["extents"] = ext;
    }

    obj["changesets"] = QJsonArray::fromStringList(m_state.changesets);
    return obj;
}

bool LocalRepository::fromJson(const QJsonObject &obj, QString *error)
{
    State state;

    bool ok = false;
    state.nextId = obj.value("nextId").toString().toULongLong(&ok, 16);
    if (!ok) {
        *error = "Missing or invalid nextId";
        return false;
    }

    for (const QJsonValue &v : obj.value("records").toArray()) {
        RecordProps r = RecordProps::fromJson(v.toObject());
        state.records.insert(r.id, r);
    }
    for (const QJsonValue &v : obj.value("collections").toArray()) {
        const QJsonObject co = v.toObject();
        Collection c;
        c.id = co.value("id").toString();
        c.classFullName = co.value("classFullName").toString();
        c.parentId = co.value("parent").toString();
        state.collections.insert(c.id, c);
    }
    for (const QJsonValue &v : obj.value("relationships").toArray()) {
        RelationshipProps r = RelationshipProps::fromJson(v.toObject());
        state.relationships.insert(r.id, r);
    }
    for (const QJsonValue &v : obj.value("aspects").toArray()) {
        AspectProps a = AspectProps::fromJson(v.toObject());
        state.aspects.insert(a.id, a);
    }
    for (const QJsonValue &v : obj.value("provenance").toArray()) {
        ProvenanceRecord p = ProvenanceRecord::fromJson(v.toObject());
        state.provenance.insert(p.id, p);
    }

    const QJsonObject codeSpecs = obj.value("codeSpecs").toObject();
    for (auto it = codeSpecs.constBegin(); it != codeSpecs.constEnd(); ++it) {
        state.codeSpecs.insert(it.key(), it.value().toString());
    }

    for (const QJsonValue &v : obj.value("schemas").toArray()) {
        SchemaDef s;
        if (!SchemaDef::fromJson(v.toObject(), &s, error)) {
            return false;
        }
        state.schemas.insert(s.name, s);
    }
    if (!state.schemas.contains(CoreClasses::Schema)) {
        state.schemas.insert(CoreClasses::Schema, coreSchema());
    }

    const QJsonObject ext = obj.value("extents").toObject();
    if (!ext.isEmpty()) {
        const QJsonArray low = ext.value("low").toArray();
        const QJsonArray high = ext.value("high").toArray();
        state.extents.extend(low.at(0).toDouble(), low.at(1).toDouble(), low.at(2).toDouble());
        state.extents.extend(high.at(0).toDouble(), high.at(1).toDouble(), high.at(2).toDouble());
    }

    for (const QJsonValue &v : obj.value("changesets").toArray()) {
        state.changesets.append(v.toString());
    }

    if (!state.records.contains(RootSubjectId)) {
        *error = "Root subject is missing";
        return false;
    }

    m_state = state;
    m_committed = state;
    rebuildIndexes();
    return true;
}

} // namespace Bridge
