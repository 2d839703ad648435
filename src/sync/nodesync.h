#ifndef NODESYNC_H
#define NODESYNC_H

#include <QObject>
#include <QString>
#include "synccontext.h"
#include "node.h"
#include "changedetector.h"

namespace Bridge {

/**
 * @brief Synchronizes single nodes against the repository
 *
 * One instance serves one run. Each node kind has its own routine; all of
 * them read the IR model and node tree from the context, write through the
 * context's repository and record ids and statistics in the context's
 * cache. Unresolvable link endpoints are skipped with a warning; repository
 * write failures abort the node with an error.
 */
class NodeSynchronizer : public QObject
{
    Q_OBJECT

public:
    explicit NodeSynchronizer(SyncContext *context, QObject *parent = nullptr);

    /**
     * @brief Synchronize one node, dispatching on its kind
     *
     * Nodes already synchronized during this run are not visited twice.
     */
    bool syncNode(const Node &node, QString *error = nullptr);

    // ========== Per-Kind Synchronization ==========

    bool syncContainer(const Node &node, QString *error = nullptr);
    bool syncGroup(const Node &node, QString *error = nullptr);

    /**
     * @brief Fingerprint the connection and compare it with the loader-config record
     *
     * Nothing is written: the record is staged until writeLoader(), so a
     * run that fails before then finds the source changed again.
     *
     * @param state Receives whether the source changed since the last run
     */
    bool syncLoader(const Node &node, ItemState *state, QString *error = nullptr);

    /**
     * @brief Write the loader-config record staged by syncLoader()
     *
     * Does nothing when the source was unchanged.
     */
    bool writeLoader(QString *error = nullptr);

    bool syncRecords(const Node &node, QString *error = nullptr);
    bool syncLinks(const Node &node, QString *error = nullptr);
    bool syncForeignKeys(const Node &node, QString *error = nullptr);

    /**
     * @brief Attach one unique aspect per instance to its owning record
     *
     * Markers are scoped to the container; instances whose owner cannot be
     * resolved are skipped.
     */
    bool syncAspects(const Node &node, QString *error = nullptr);

    // ========== Resolution ==========

    /**
     * @brief Id of the record an instance attribute points at
     *
     * IREntity endpoints resolve to records of the given Record node that
     * were synchronized from the instance named by the attribute.
     * TargetEntity endpoints read the attribute as a locator.
     *
     * @return Record id, or empty with @p reason set
     */
    QString resolveEndpoint(const QString &nodeKey, EndpointType type, const QString &attr,
                            const IRInstance &instance, QString *reason) const;

    /**
     * @brief Record id synchronized from an instance of a Record node
     */
    QString cachedRecordId(const QString &nodeKey, const QString &primaryKeyValue) const;

    ItemState lastLoaderState() const { return m_loaderState; }

signals:
    void logMessage(const QString &message);
    void progressUpdated(int current, int total, const QString &message);

private:
    /**
     * @brief Insert or refresh a record identified by its code only
     *
     * Used for structural records (containers, partitions) that carry no
     * provenance marker.
     */
    bool upsertByCode(const RecordProps &props, QString *id, ItemState *state, QString *error);

    QString collectionFor(const Node &node, const IRInstance &instance, QString *reason) const;
    /**
     * @brief Synchronize a node another one depends on, if it belongs to the same container
     */
    bool syncDependency(const Node &node, const QString &dependencyKey, QString *error);
    void skip(const QString &nodeKey, const IRInstance &instance, const QString &reason);

    SyncContext *m_ctx;
    ItemState m_loaderState = ItemState::Unchanged;
    UpsertArgs m_pendingLoader;
    bool m_hasPendingLoader = false;
};

} // namespace Bridge

#endif // NODESYNC_H
