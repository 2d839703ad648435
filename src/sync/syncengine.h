#ifndef SYNCENGINE_H
#define SYNCENGINE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include "synctypes.h"
#include "synccontext.h"
#include "nodetree.h"
#include "channel.h"
#include "../schema/schemaregistry.h"
#include "../connectorconfig.h"
#include "../jobconfig.h"

namespace Bridge {

class NodeSynchronizer;

/**
 * @brief Main sync orchestrator
 *
 * The SyncEngine owns the node tree of a connector and runs jobs against
 * a repository. A run goes through fixed phases:
 *   - LoaderSync: container and loader group, source fingerprint check
 *   - DomainSchemaSync / DynamicSchemaSync: schemas (only when the source changed)
 *   - DataSync: every node of the container, in execution order
 *   - OrphanSync: records and aspects whose source instance disappeared
 *   - ExtentsSync: loader-config record and repository extents
 *
 * Each phase writes inside its channel (the repository root for loader
 * and schema phases, the container for the others) and ends with a
 * persisted change set. A failing phase discards the staged changes and
 * ends the run with success = false. The loader-config record is only
 * written in the last phase, so the next run repeats a failed one.
 *
 * Usage:
 * @code
 * SyncEngine engine;
 * engine.setConfig(config);
 * engine.setRepository(new LocalRepository("/data/plant-repo.json"));
 *
 * NodeTree &tree = engine.tree();
 * tree.addContainer("Subject1");
 * ...
 *
 * JobConfig job;
 * job.connection = DataConnection::file("loader", "/data/plant.json");
 * SyncResult result = engine.run(job);
 * @endcode
 */
class SyncEngine : public QObject
{
    Q_OBJECT

public:
    explicit SyncEngine(QObject *parent = nullptr);
    ~SyncEngine();

    // ========== Configuration ==========

    void setConfig(const ConnectorConfig &config) { m_config = config; }
    const ConnectorConfig &config() const { return m_config; }

    /**
     * @brief Node tree built by the integrator before running
     */
    NodeTree &tree() { return m_tree; }
    const NodeTree &tree() const { return m_tree; }

    /**
     * @brief Set the target repository
     *
     * The engine takes ownership of the repository.
     */
    void setRepository(Repository *repository);
    Repository *repository() const { return m_repository; }

    /**
     * @brief Retry behaviour for rate-limited hub requests
     */
    void setRetryPolicy(const RetryPolicy &policy) { m_retryPolicy = policy; }

    // ========== Sync Operations ==========

    /**
     * @brief Run one job
     *
     * Construction errors of the tree, an invalid job and classes defined
     * without a dynamic schema are reported before any repository access.
     */
    SyncResult run(const JobConfig &job);

    bool isRunning() const { return m_running; }
    RunPhase phase() const { return m_phase; }

    // ========== Run State ==========

    const SyncCache &cache() const { return m_cache; }
    const IRModel &irModel() const { return m_irModel; }
    const SchemaRegistry &schemaRegistry() const { return m_registry; }

    /**
     * @brief Write a debug snapshot of the tree and configuration
     *
     * File layout: {"tree": ..., "config": ...}
     */
    bool save(const QString &path, QString *error = nullptr) const;

signals:
    void syncStarted();
    void syncFinished(const SyncResult &result);
    void phaseChanged(RunPhase phase);
    void progressUpdated(int current, int total, const QString &message);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    bool checkJob(const JobConfig &job, QString *error) const;
    bool runPhases(const JobConfig &job, SyncResult *result, QString *error);
    void enterPhase(RunPhase phase, SyncResult *result);
    void seedRegistry();
    bool persist(const JobConfig &job, const QString &description, ChangesType type, QString *error);

    bool syncLoader(NodeSynchronizer *sync, const JobConfig &job, ItemState *state, QString *error);
    bool syncDomainSchemas(const JobConfig &job, QString *error);
    bool syncDynamicSchema(const JobConfig &job, ItemState *state, QString *error);
    bool syncData(NodeSynchronizer *sync, const JobConfig &job, QString *error);
    bool syncOrphans(const JobConfig &job, QString *error);
    bool syncExtents(NodeSynchronizer *sync, const JobConfig &job, QString *error);

    ConnectorConfig m_config;
    NodeTree m_tree;
    Repository *m_repository = nullptr;
    RetryPolicy m_retryPolicy;

    SyncContext m_context;
    SyncCache m_cache;
    IRModel m_irModel;
    SchemaRegistry m_registry;
    QStringList m_domainSchemaNames;
    QString m_containerKey;

    RunPhase m_phase = RunPhase::Idle;
    bool m_running = false;
};

} // namespace Bridge

#endif // SYNCENGINE_H
