#include "syncengine.h"
#include "nodesync.h"
#include "../schema/dynamicschema.h"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QPair>
#include <QJsonDocument>
#include <QDebug>

namespace Bridge {

SyncEngine::SyncEngine(QObject *parent)
    : QObject(parent)
{
}

SyncEngine::~SyncEngine()
{
    delete m_repository;
}

void SyncEngine::setRepository(Repository *repository)
{
    if (m_repository == repository) {
        return;
    }
    delete m_repository;
    m_repository = repository;

    if (m_repository) {
        m_repository->setParent(this);
    }
}

// ========== Sync Operations ==========

bool SyncEngine::checkJob(const JobConfig &job, QString *error) const
{
    if (!m_repository) {
        *error = "No repository configured";
        return false;
    }
    if (!m_tree.constructionErrors().isEmpty()) {
        *error = QString("Node tree construction failed: %1").arg(m_tree.constructionErrors().join("; "));
        return false;
    }
    if (!m_tree.validate(job.connection.loaderNodeKey, job.containerNodeKey, error)) {
        return false;
    }
    if (!m_tree.definedClasses().isEmpty() && !m_config.hasDynamicSchema()) {
        *error = "Mappings define classes but no dynamic schema is configured";
        return false;
    }
    return job.validate(error);
}

SyncResult SyncEngine::run(const JobConfig &job)
{
    SyncResult result;
    result.startTime = QDateTime::currentDateTime();

    QString error;
    if (m_running) {
        error = "A run is already in progress";
    } else {
        checkJob(job, &error);
    }
    if (!error.isEmpty()) {
        result.success = false;
        result.errorMessage = error;
        result.endTime = QDateTime::currentDateTime();
        qWarning() << "[SyncEngine]" << error;
        emit errorOccurred(error);
        return result;
    }

    m_running = true;
    emit syncStarted();
    emit logMessage(QString("Starting %1 job for %2")
        .arg(m_config.connectorName, job.connection.loaderNodeKey));

    if (runPhases(job, &result, &error)) {
        result.success = true;
        m_phase = RunPhase::Done;
        emit phaseChanged(m_phase);
    } else {
        m_repository->abandonChanges();
        result.success = false;
        result.errorMessage = error;
        m_phase = RunPhase::Failed;
        emit phaseChanged(m_phase);
        qWarning() << "[SyncEngine] Run failed in" << runPhaseName(result.phase) << ":" << error;
        emit errorOccurred(error);
    }

    result.stats = m_context.stats;
    result.endTime = QDateTime::currentDateTime();
    m_running = false;

    emit syncFinished(result);
    emit logMessage(QString("Sync %1. %2. Duration: %3ms")
        .arg(result.success ? "complete" : "failed")
        .arg(result.stats.summary())
        .arg(result.durationMs()));

    return result;
}

void SyncEngine::enterPhase(RunPhase phase, SyncResult *result)
{
    m_phase = phase;
    result->phase = phase;
    qDebug() << "[SyncEngine] Phase" << runPhaseName(phase);
    emit phaseChanged(phase);
}

void SyncEngine::seedRegistry()
{
    m_registry.clear();
    for (const QString &name : m_repository->schemaNames()) {
        SchemaDef schema;
        if (m_repository->schema(name, &schema)) {
            m_registry.registerSchema(schema);
        }
    }
}

bool SyncEngine::persist(const JobConfig &job, const QString &description, ChangesType type, QString *error)
{
    return persistChanges(m_repository, job.revisionHeader, description, type, m_retryPolicy, error);
}

bool SyncEngine::runPhases(const JobConfig &job, SyncResult *result, QString *error)
{
    m_cache.clear();
    m_irModel.clear();
    m_domainSchemaNames.clear();
    seedRegistry();

    m_containerKey = m_tree.containerOf(job.connection.loaderNodeKey);
    const LoaderNode *loaderNode = m_tree.find(job.connection.loaderNodeKey)->asLoader();

    m_context = SyncContext();
    m_context.repository = m_repository;
    m_context.tree = &m_tree;
    m_context.irModel = &m_irModel;
    m_context.config = &m_config;
    m_context.job = &job;
    m_context.cache = &m_cache;
    m_context.sourceVersion = loaderNode->loader->version();
    m_context.dynamicSchemaName = m_config.dynamicSchemaName;

    NodeSynchronizer sync(&m_context);
    connect(&sync, &NodeSynchronizer::logMessage, this, &SyncEngine::logMessage);
    connect(&sync, &NodeSynchronizer::progressUpdated, this, &SyncEngine::progressUpdated);

    // Loader
    enterPhase(RunPhase::LoaderSync, result);
    if (!syncLoader(&sync, job, &result->sourceState, error)) {
        return false;
    }
    if (result->sourceState == ItemState::Unchanged) {
        emit logMessage("Source data unchanged, nothing to synchronize");
        return true;
    }

    // Schemas
    enterPhase(RunPhase::DomainSchemaSync, result);
    if (!syncDomainSchemas(job, error)) {
        return false;
    }

    enterPhase(RunPhase::DynamicSchemaSync, result);
    if (!syncDynamicSchema(job, &result->schemaState, error)) {
        return false;
    }

    // Data
    enterPhase(RunPhase::DataSync, result);
    if (!syncData(&sync, job, error)) {
        return false;
    }

    enterPhase(RunPhase::OrphanSync, result);
    if (!syncOrphans(job, error)) {
        return false;
    }

    enterPhase(RunPhase::ExtentsSync, result);
    return syncExtents(&sync, job, error);
}

// ========== Phases ==========

bool SyncEngine::syncLoader(NodeSynchronizer *sync, const JobConfig &job, ItemState *state, QString *error)
{
    if (!enterChannel(m_repository, m_repository->repositoryModelId(), m_retryPolicy, error)) {
        return false;
    }

    const Node *loaderNode = m_tree.find(job.connection.loaderNodeKey);
    const Node *groupNode = m_tree.find(loaderNode->asLoader()->groupKey);
    const Node *containerNode = m_tree.find(m_containerKey);

    if (!sync->syncNode(*containerNode, error)
        || !sync->syncNode(*groupNode, error)
        || !sync->syncNode(*loaderNode, error)) {
        return false;
    }
    *state = sync->lastLoaderState();

    return persist(job, "Loader Update", ChangesType::Regular, error);
}

bool SyncEngine::syncDomainSchemas(const JobConfig &job, QString *error)
{
    QList<QPair<QString, SchemaDef>> pending;

    for (const QString &path : m_config.domainSchemaPaths) {
        SchemaDef schema;
        if (!SchemaDef::fromFile(path, &schema, error)) {
            return false;
        }
        m_domainSchemaNames.append(schema.name);

        SchemaVersion existing;
        if (m_repository->schemaVersion(schema.name, &existing) && !(existing < schema.version)) {
            qDebug() << "[SyncEngine] Domain schema" << schema.name << existing.toString() << "is current";
            continue;
        }
        pending.append(qMakePair(path, schema));
    }

    if (pending.isEmpty()) {
        return true;
    }
    if (!enterChannel(m_repository, m_repository->repositoryModelId(), m_retryPolicy, error)) {
        return false;
    }

    for (const auto &entry : pending) {
        const SchemaDef &schema = entry.second;
        if (!m_repository->importSchema(schema.serialize())) {
            *error = QString("Failed to import domain schema %1: %2").arg(entry.first, m_repository->errorString());
            return false;
        }
        m_registry.registerSchema(schema);
        emit logMessage(QString("Imported domain schema %1 %2").arg(schema.name, schema.version.toString()));
    }

    return persist(job, "Domain Schema Update", ChangesType::Schema, error);
}

bool SyncEngine::syncDynamicSchema(const JobConfig &job, ItemState *state, QString *error)
{
    if (!m_config.hasDynamicSchema()) {
        return true;
    }

    DynamicSchemaProps props;
    props.schemaName = m_config.dynamicSchemaName;
    props.schemaAlias = m_config.dynamicSchemaAlias;
    props.entities = m_tree.definedClasses().entities;
    props.relationships = m_tree.definedClasses().relationships;

    SchemaDef schema;
    if (!DynamicSchema::prepare(m_repository, m_domainSchemaNames, props, m_registry, &schema, state, error)) {
        return false;
    }

    emit logMessage(QString("Dynamic schema %1 is %2").arg(props.schemaName, itemStateName(*state)));
    if (*state == ItemState::Unchanged) {
        m_registry.registerSchema(schema);
        return true;
    }

    if (!enterChannel(m_repository, m_repository->repositoryModelId(), m_retryPolicy, error)
        || !DynamicSchema::import(m_repository, schema, &m_registry, error)) {
        return false;
    }
    return persist(job, "Dynamic Schema Update", ChangesType::Schema, error);
}

bool SyncEngine::syncData(NodeSynchronizer *sync, const JobConfig &job, QString *error)
{
    if (!enterChannel(m_repository, m_cache.containerId, m_retryPolicy, error)) {
        return false;
    }

    QString codeSpecId = m_repository->codeSpecId(InstanceCodeSpec);
    if (codeSpecId.isEmpty()) {
        codeSpecId = m_repository->insertCodeSpec(InstanceCodeSpec);
        if (codeSpecId.isEmpty()) {
            *error = QString("Failed to create code spec %1: %2").arg(InstanceCodeSpec, m_repository->errorString());
            return false;
        }
    }
    m_context.codeSpecId = codeSpecId;

    Loader *loader = m_tree.find(job.connection.loaderNodeKey)->asLoader()->loader.data();
    if (!IRModel::fromLoader(loader, job.connection, &m_irModel, error)) {
        return false;
    }

    const QList<const Node *> order = m_tree.executionOrder(m_containerKey);
    for (int i = 0; i < order.size(); ++i) {
        emit progressUpdated(i + 1, order.size(), QString("Syncing %1...").arg(order.at(i)->key()));
        if (!sync->syncNode(*order.at(i), error)) {
            return false;
        }
    }

    return persist(job, "Data Update", ChangesType::Regular, error);
}

bool SyncEngine::syncOrphans(const JobConfig &job, QString *error)
{
    if (!enterChannel(m_repository, m_cache.containerId, m_retryPolicy, error)) {
        return false;
    }

    if (!job.enableDelete) {
        qWarning() << "[SyncEngine] Deletion is disabled, orphaned records are kept";
        return persist(job, "Orphan Deletion", ChangesType::Regular, error);
    }

    ConcurrencyControl *cc = m_repository->concurrencyControl();
    QStringList records;
    QStringList definitions;
    QStringList aspects;

    for (const ProvenanceRecord &marker : m_repository->provenanceRecords(ConnectionDescriptorKind)) {
        const QString &id = marker.elementId;
        if (m_cache.seenIds.contains(id)) {
            continue;
        }
        // Aspect markers are scoped to the container
        if (marker.scopeId == m_cache.containerId && m_repository->aspect(id, nullptr)) {
            if (!aspects.contains(id)) {
                aspects.append(id);
            }
            continue;
        }
        if (!m_cache.collectionIds.contains(marker.scopeId)) {
            continue;
        }
        if (cc && cc->channelRootOf(id) != cc->channelRoot()) {
            continue;
        }
        if (records.contains(id) || definitions.contains(id)) {
            continue;
        }
        if (m_repository->isDefinitionRecord(id)) {
            definitions.append(id);
        } else {
            records.append(id);
        }
    }

    for (const QString &id : aspects) {
        if (!m_repository->deleteAspect(id)) {
            *error = QString("Failed to delete orphaned aspect %1: %2").arg(id, m_repository->errorString());
            return false;
        }
        m_context.stats.deleted++;
    }

    for (const QString &id : records) {
        // Already gone with a deleted parent's sub-collection
        if (!m_repository->record(id, nullptr)) {
            continue;
        }
        if (!m_repository->deleteRecord(id)) {
            *error = QString("Failed to delete orphan %1: %2").arg(id, m_repository->errorString());
            return false;
        }
        m_context.stats.deleted++;
    }

    if (!definitions.isEmpty()) {
        const int deleted = m_repository->deleteDefinitionRecords(definitions);
        if (deleted < 0) {
            *error = QString("Failed to delete orphaned definitions: %1").arg(m_repository->errorString());
            return false;
        }
        m_context.stats.deleted += deleted;
    }

    emit logMessage(QString("Deleted %1 orphaned records").arg(m_context.stats.deleted));
    return persist(job, "Orphan Deletion", ChangesType::Regular, error);
}

bool SyncEngine::syncExtents(NodeSynchronizer *sync, const JobConfig &job, QString *error)
{
    if (!enterChannel(m_repository, m_cache.containerId, m_retryPolicy, error)) {
        return false;
    }

    // The source fingerprint goes in last, so a run that stops earlier is repeated
    if (!sync->writeLoader(error)) {
        return false;
    }

    if (!m_repository->updateExtents()) {
        *error = QString("Failed to update extents: %1").arg(m_repository->errorString());
        return false;
    }
    return persist(job, "Extents Update", ChangesType::Regular, error);
}

// ========== Snapshot ==========

bool SyncEngine::save(const QString &path, QString *error) const
{
    QJsonObject obj;
    obj["tree"] = m_tree.toJson();
    obj["config"] = m_config.toJson();

    QDir().mkpath(QFileInfo(path).absolutePath());

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error) *error = QString("Failed to write snapshot: %1").arg(path);
        return false;
    }
    file.write(QJsonDocument(obj).toJson(QJsonDocument::Indented));
    file.close();
    return true;
}

} // namespace Bridge
