#ifndef SYNCCONTEXT_H
#define SYNCCONTEXT_H

#include <QString>
#include <QMap>
#include <QHash>
#include <QSet>
#include "synctypes.h"
#include "../ir/irmodel.h"
#include "../repo/repository.h"
#include "../connectorconfig.h"
#include "../jobconfig.h"

namespace Bridge {

class NodeTree;

/// Provenance kind of the loader-config record
const char ConnectionDescriptorKind[] = "ConnectionDescriptor";

/// Code spec of the records the engine creates from IR instances
const char InstanceCodeSpec[] = "IRInstanceKey";

/**
 * @brief Ids produced while a run walks the node tree
 *
 * Cleared at the start of every run.
 */
struct SyncCache {
    QString containerId;
    QMap<QString, QString> groupIds;                    ///< Group node key -> collection id
    QMap<QString, QHash<QString, QString>> recordIds;   ///< Record node key -> (instance key -> record id)
    QSet<QString> seenIds;                              ///< Records written or confirmed this run
    QSet<QString> collectionIds;                        ///< Collections belonging to the container
    QSet<QString> syncedNodes;                          ///< Node keys already synchronized this run

    void clear() {
        containerId.clear();
        groupIds.clear();
        recordIds.clear();
        seenIds.clear();
        collectionIds.clear();
        syncedNodes.clear();
    }
};

/**
 * @brief Everything node synchronization needs during a run
 */
class SyncContext
{
public:
    Repository *repository = nullptr;
    const NodeTree *tree = nullptr;
    const IRModel *irModel = nullptr;
    const ConnectorConfig *config = nullptr;
    const JobConfig *job = nullptr;
    SyncCache *cache = nullptr;

    QString codeSpecId;         ///< Id of the InstanceCodeSpec code spec
    QString sourceVersion;      ///< Loader version, used when instances carry none
    QString dynamicSchemaName;

    SyncStats stats;
};

} // namespace Bridge

#endif // SYNCCONTEXT_H
