#include "nodesync.h"
#include "nodetree.h"
#include "changedetector.h"
#include "locator.h"

#include <QFile>
#include <QFileInfo>
#include <QDateTime>
#include <QJsonDocument>
#include <QCryptographicHash>
#include <QDebug>

namespace Bridge {

NodeSynchronizer::NodeSynchronizer(SyncContext *context, QObject *parent)
    : QObject(parent)
    , m_ctx(context)
{
}

bool NodeSynchronizer::syncNode(const Node &node, QString *error)
{
    if (m_ctx->cache->syncedNodes.contains(node.key())) {
        return true;
    }

    bool ok = false;
    switch (node.kind()) {
    case NodeKind::Container:
        ok = syncContainer(node, error);
        break;
    case NodeKind::Group:
        ok = syncGroup(node, error);
        break;
    case NodeKind::LoaderConfig:
        ok = syncLoader(node, &m_loaderState, error);
        break;
    case NodeKind::Record:
        ok = syncRecords(node, error);
        break;
    case NodeKind::Link:
        ok = syncLinks(node, error);
        break;
    case NodeKind::ForeignKey:
        ok = syncForeignKeys(node, error);
        break;
    case NodeKind::Aspect:
        ok = syncAspects(node, error);
        break;
    }

    if (ok) {
        m_ctx->cache->syncedNodes.insert(node.key());
    }
    return ok;
}

// ========== Structural Records ==========

bool NodeSynchronizer::upsertByCode(const RecordProps &props, QString *id, ItemState *state, QString *error)
{
    Repository *repo = m_ctx->repository;
    const QString existingId = repo->findRecordByCode(props.code);

    if (existingId.isEmpty()) {
        *id = repo->insertRecord(props);
        if (id->isEmpty()) {
            if (error) *error = QString("Failed to insert %1: %2").arg(props.code.value, repo->errorString());
            return false;
        }
        *state = ItemState::New;
        return true;
    }

    RecordProps existing;
    repo->record(existingId, &existing);
    *id = existingId;

    if (existing.userLabel == props.userLabel
        && existing.jsonProperties == props.jsonProperties
        && existing.parent == props.parent
        && existing.modelId == props.modelId) {
        *state = ItemState::Unchanged;
        return true;
    }

    RecordProps updated = props;
    updated.id = existingId;
    if (!repo->updateRecord(updated)) {
        if (error) *error = QString("Failed to update %1: %2").arg(props.code.value, repo->errorString());
        return false;
    }
    *state = ItemState::Changed;
    return true;
}

bool NodeSynchronizer::syncContainer(const Node &node, QString *error)
{
    Repository *repo = m_ctx->repository;

    QJsonObject description;
    description["connector"] = m_ctx->config->connectorName;
    description["appId"] = m_ctx->config->appId;
    description["appVersion"] = m_ctx->config->appVersion;

    RecordProps props;
    props.classFullName = CoreClasses::Subject;
    props.modelId = repo->repositoryModelId();
    props.code = Code(repo->codeSpecId(CodeSpecs::Subject), repo->rootSubjectId(), node.key());
    props.userLabel = node.key();
    props.parent = RelatedRef(repo->rootSubjectId(), CoreClasses::SubjectOwnsSubjects);
    props.jsonProperties["connector"] = description;

    QString id;
    ItemState state;
    if (!upsertByCode(props, &id, &state, error)) {
        return false;
    }

    m_ctx->cache->containerId = id;
    qDebug() << "[NodeSync] Container" << node.key() << itemStateName(state) << id;
    return true;
}

bool NodeSynchronizer::syncGroup(const Node &node, QString *error)
{
    Repository *repo = m_ctx->repository;
    const GroupNode *group = node.asGroup();
    const QString containerId = m_ctx->cache->containerId;

    if (containerId.isEmpty()) {
        if (error) *error = QString("Group %1 synchronized before its container").arg(node.key());
        return false;
    }

    RecordProps props;
    props.classFullName = group->partitionClass();
    props.modelId = repo->repositoryModelId();
    props.code = Code(repo->codeSpecId(CodeSpecs::InformationPartition), containerId, node.key());
    props.userLabel = node.key();
    props.parent = RelatedRef(containerId, CoreClasses::SubjectOwnsPartitionElements);
    props.jsonProperties["groupKind"] = groupKindName(group->groupKind);

    QString id;
    ItemState state;
    if (!upsertByCode(props, &id, &state, error)) {
        return false;
    }

    if (!repo->hasCollection(id)
        && !repo->insertCollection(id, group->collectionClass(), repo->repositoryModelId())) {
        if (error) *error = QString("Failed to create collection of %1: %2").arg(node.key(), repo->errorString());
        return false;
    }

    m_ctx->cache->groupIds.insert(node.key(), id);
    m_ctx->cache->collectionIds.insert(id);
    qDebug() << "[NodeSync] Group" << node.key() << itemStateName(state) << id;
    return true;
}

// ========== Loader Record ==========

bool NodeSynchronizer::syncLoader(const Node &node, ItemState *state, QString *error)
{
    Repository *repo = m_ctx->repository;
    const LoaderNode *loaderNode = node.asLoader();
    const DataConnection &connection = m_ctx->job->connection;

    const QString groupId = m_ctx->cache->groupIds.value(loaderNode->groupKey);
    if (groupId.isEmpty()) {
        if (error) *error = QString("Loader node %1 synchronized before its group").arg(node.key());
        return false;
    }

    QJsonObject descriptor;
    descriptor["nodeKey"] = node.key();
    descriptor["connection"] = connection.toJson();
    descriptor["loader"] = loaderNode->loader->toJson();

    QString label = connection.baseUrl;
    if (connection.isFile()) {
        QFileInfo info(connection.filepath);
        if (!info.isFile()) {
            if (error) *error = QString("FileConnection.filepath not found - %1").arg(connection.filepath);
            return false;
        }

        QFile file(connection.filepath);
        if (!file.open(QIODevice::ReadOnly)) {
            if (error) *error = QString("Failed to read %1").arg(connection.filepath);
            return false;
        }
        QCryptographicHash hash(QCryptographicHash::Md5);
        hash.addData(&file);
        file.close();

        descriptor["mtimeMs"] = info.lastModified().toMSecsSinceEpoch();
        descriptor["digest"] = QString::fromLatin1(hash.result().toHex());
        label = info.fileName();
    }

    RecordProps props;
    props.classFullName = CoreClasses::RepositoryLink;
    props.modelId = groupId;
    props.code = Code(repo->codeSpecId(CodeSpecs::LinkElement), groupId, node.key());
    props.userLabel = label;
    props.jsonProperties = descriptor;

    UpsertArgs args;
    args.props = props;
    args.version = loaderNode->loader->version();
    args.checksum = QString::fromLatin1(
        QCryptographicHash::hash(QJsonDocument(descriptor).toJson(QJsonDocument::Compact),
                                 QCryptographicHash::Md5).toHex());
    args.scope = groupId;
    args.kind = ConnectionDescriptorKind;
    args.identifier = node.key();

    ChangeDetector detector(repo);
    ItemState sourceState = detector.detect(args.scope, args.kind, args.identifier, args.version, args.checksum);

    // Remote sources cannot be fingerprinted
    if (!connection.isFile() && sourceState == ItemState::Unchanged) {
        sourceState = ItemState::Changed;
    }

    m_pendingLoader = args;
    m_hasPendingLoader = sourceState != ItemState::Unchanged;
    *state = sourceState;
    m_loaderState = sourceState;

    emit logMessage(QString("Source %1 is %2").arg(label, itemStateName(sourceState)));
    return true;
}

bool NodeSynchronizer::writeLoader(QString *error)
{
    if (!m_hasPendingLoader) {
        return true;
    }

    ChangeResult result;
    ChangeDetector detector(m_ctx->repository);
    if (!detector.upsertRecord(m_pendingLoader, &result, error)) {
        return false;
    }

    m_ctx->cache->seenIds.insert(result.entityId);
    m_hasPendingLoader = false;
    qDebug() << "[NodeSync] Loader record" << m_pendingLoader.identifier << itemStateName(result.state);
    return true;
}

// ========== Resolution ==========

QString NodeSynchronizer::cachedRecordId(const QString &nodeKey, const QString &primaryKeyValue) const
{
    const Node *node = m_ctx->tree->find(nodeKey, NodeKind::Record);
    if (!node) {
        return QString();
    }
    const RecordNode *record = node->asRecord();
    const QString key = IRInstance::createKey(record->dmo.irEntity, primaryKeyValue);

    QString id = m_ctx->cache->recordIds.value(nodeKey).value(key);
    if (id.isEmpty() && record->owner.isGroup()) {
        const QString groupId = m_ctx->cache->groupIds.value(record->owner.key());
        if (!groupId.isEmpty()) {
            id = m_ctx->repository->findRecordByCode(Code(m_ctx->codeSpecId, groupId, key));
        }
    }
    return id;
}

QString NodeSynchronizer::resolveEndpoint(const QString &nodeKey, EndpointType type, const QString &attr,
                                          const IRInstance &instance, QString *reason) const
{
    const QString value = instance.getString(attr);
    if (attr.isEmpty() || value.isEmpty()) {
        *reason = QString("attribute \"%1\" is empty").arg(attr);
        return QString();
    }

    if (type == EndpointType::TargetEntity) {
        return Locator::locateUnique(m_ctx->repository, value, reason);
    }

    const QString id = cachedRecordId(nodeKey, value);
    if (id.isEmpty()) {
        *reason = QString("no record of node %1 for %2").arg(nodeKey, value);
    }
    return id;
}

QString NodeSynchronizer::collectionFor(const Node &node, const IRInstance &instance, QString *reason) const
{
    const RecordNode *record = node.asRecord();
    if (record->owner.isGroup()) {
        const QString id = m_ctx->cache->groupIds.value(record->owner.key());
        if (id.isEmpty()) {
            *reason = QString("group %1 has not been synchronized").arg(record->owner.key());
        }
        return id;
    }

    const QString parentValue = instance.getString(record->dmo.parentAttr);
    const QString id = cachedRecordId(record->owner.key(), parentValue);
    if (id.isEmpty()) {
        *reason = QString("parent \"%1\" not found").arg(parentValue);
    }
    return id;
}

bool NodeSynchronizer::syncDependency(const Node &node, const QString &dependencyKey, QString *error)
{
    const NodeTree *tree = m_ctx->tree;
    const Node *dependency = tree->find(dependencyKey);
    if (!dependency || tree->containerOf(dependencyKey) != tree->containerOf(node.key())) {
        return true;
    }
    return syncNode(*dependency, error);
}

void NodeSynchronizer::skip(const QString &nodeKey, const IRInstance &instance, const QString &reason)
{
    qWarning() << "[NodeSync]" << nodeKey << "skipped" << instance.key() << "-" << reason;
    m_ctx->stats.skipped++;
}

// ========== Records ==========

bool NodeSynchronizer::syncRecords(const Node &node, QString *error)
{
    const RecordNode *record = node.asRecord();
    const RecordDMO &dmo = record->dmo;

    // Owner and category can sit in a group that runs later
    if (!syncDependency(node, record->owner.key(), error)
        || (!record->categoryKey.isEmpty() && !syncDependency(node, record->categoryKey, error))) {
        return false;
    }

    const QString className = dmo.target.fullName(m_ctx->dynamicSchemaName);
    const QList<IRInstance> instances = m_ctx->irModel->instancesFor(dmo);

    ChangeDetector detector(m_ctx->repository);
    QHash<QString, QString> &ids = m_ctx->cache->recordIds[node.key()];
    SyncStats nodeStats;

    for (int i = 0; i < instances.size(); ++i) {
        const IRInstance &instance = instances.at(i);
        emit progressUpdated(i + 1, instances.size(), node.key());

        QString reason;
        const QString collectionId = collectionFor(node, instance, &reason);
        if (collectionId.isEmpty()) {
            skip(node.key(), instance, reason);
            continue;
        }

        RecordProps props;
        props.classFullName = className;
        props.modelId = collectionId;
        props.code = Code(m_ctx->codeSpecId, collectionId, instance.codeValue());
        props.userLabel = instance.userLabel();
        props.federationGuid = instance.key();
        props.jsonProperties = instance.data();

        if (!dmo.categoryAttr.isEmpty() && !record->categoryKey.isEmpty()) {
            const QString categoryValue = instance.getString(dmo.categoryAttr);
            const QString categoryId = cachedRecordId(record->categoryKey, categoryValue);
            if (categoryId.isEmpty()) {
                qWarning() << "[NodeSync]" << node.key() << "category" << categoryValue
                           << "not found for" << instance.key();
            } else {
                props.categoryId = categoryId;
            }
        }

        if (dmo.modifyProps) {
            dmo.modifyProps(props, instance);
        }

        UpsertArgs args;
        args.props = props;
        args.version = instance.version().isEmpty() ? m_ctx->sourceVersion : instance.version();
        args.checksum = instance.checksum();
        args.scope = collectionId;
        args.kind = instance.entityKey();
        args.identifier = instance.codeValue();

        ChangeResult result;
        if (!detector.upsertRecord(args, &result, error)) {
            return false;
        }

        nodeStats.record(result.state);
        ids.insert(instance.key(), result.entityId);
        m_ctx->cache->seenIds.insert(result.entityId);

        if (!record->subCollectionClass.isEmpty()) {
            Repository *repo = m_ctx->repository;
            if (!repo->hasCollection(result.entityId)
                && !repo->insertCollection(result.entityId, record->subCollectionClass, collectionId)) {
                if (error) {
                    *error = QString("Failed to create sub-collection of %1: %2")
                             .arg(instance.key(), repo->errorString());
                }
                return false;
            }
            m_ctx->cache->collectionIds.insert(result.entityId);
        }
    }

    m_ctx->stats += nodeStats;
    emit logMessage(QString("%1: %2").arg(node.key(), nodeStats.summary()));
    return true;
}

// ========== Aspects ==========

bool NodeSynchronizer::syncAspects(const Node &node, QString *error)
{
    const AspectNode *aspect = node.asAspect();
    const AspectDMO &dmo = aspect->dmo;

    if (dmo.elementType == EndpointType::IREntity && !syncDependency(node, aspect->elementKey, error)) {
        return false;
    }

    const QString containerId = m_ctx->cache->containerId;
    const QString className = dmo.target.fullName(m_ctx->dynamicSchemaName);
    const QList<IRInstance> instances = m_ctx->irModel->instancesFor(dmo);

    ChangeDetector detector(m_ctx->repository);
    SyncStats nodeStats;

    for (int i = 0; i < instances.size(); ++i) {
        const IRInstance &instance = instances.at(i);
        emit progressUpdated(i + 1, instances.size(), node.key());

        QString reason;
        const QString elementId = resolveEndpoint(aspect->elementKey, dmo.elementType, dmo.elementAttr,
                                                  instance, &reason);
        if (elementId.isEmpty()) {
            skip(node.key(), instance, QString("element: %1").arg(reason));
            continue;
        }

        AspectProps props;
        props.classFullName = className;
        props.elementId = elementId;
        props.properties = instance.data();
        if (dmo.modifyProps) {
            dmo.modifyProps(props, instance);
        }

        AspectUpsertArgs args;
        args.props = props;
        args.version = instance.version().isEmpty() ? m_ctx->sourceVersion : instance.version();
        args.checksum = instance.checksum();
        args.scope = containerId;
        args.kind = instance.entityKey();
        args.identifier = instance.key();

        ChangeResult result;
        if (!detector.upsertAspect(args, &result, error)) {
            return false;
        }

        nodeStats.record(result.state);
        m_ctx->cache->seenIds.insert(result.entityId);
    }

    m_ctx->stats += nodeStats;
    emit logMessage(QString("%1: %2").arg(node.key(), nodeStats.summary()));
    return true;
}

// ========== Relationships ==========

bool NodeSynchronizer::syncLinks(const Node &node, QString *error)
{
    Repository *repo = m_ctx->repository;
    const LinkNode *link = node.asLink();
    const LinkDMO &dmo = link->dmo;
    const QString className = dmo.relationship.fullName(m_ctx->dynamicSchemaName);
    const QList<IRInstance> instances = m_ctx->irModel->instancesFor(dmo);

    SyncStats nodeStats;
    for (int i = 0; i < instances.size(); ++i) {
        const IRInstance &instance = instances.at(i);
        emit progressUpdated(i + 1, instances.size(), node.key());

        QString reason;
        const QString sourceId = resolveEndpoint(link->sourceKey, dmo.fromType, dmo.fromAttr, instance, &reason);
        if (sourceId.isEmpty()) {
            skip(node.key(), instance, QString("source: %1").arg(reason));
            continue;
        }
        const QString targetId = resolveEndpoint(link->targetKey, dmo.toType, dmo.toAttr, instance, &reason);
        if (targetId.isEmpty()) {
            skip(node.key(), instance, QString("target: %1").arg(reason));
            continue;
        }

        if (!repo->findRelationship(className, sourceId, targetId).isEmpty()) {
            nodeStats.record(ItemState::Unchanged);
            continue;
        }

        RelationshipProps props;
        props.classFullName = className;
        props.sourceId = sourceId;
        props.targetId = targetId;
        if (dmo.modifyProps) {
            dmo.modifyProps(props, instance);
        }

        if (repo->insertRelationship(props).isEmpty()) {
            if (error) {
                *error = QString("Failed to insert %1 for %2: %3")
                         .arg(className, instance.key(), repo->errorString());
            }
            return false;
        }
        nodeStats.record(ItemState::New);
    }

    m_ctx->stats += nodeStats;
    emit logMessage(QString("%1: %2").arg(node.key(), nodeStats.summary()));
    return true;
}

bool NodeSynchronizer::syncForeignKeys(const Node &node, QString *error)
{
    Repository *repo = m_ctx->repository;
    const ForeignKeyNode *fk = node.asForeignKey();
    const ForeignKeyDMO &dmo = fk->dmo;
    const QString className = dmo.relationship.fullName(m_ctx->dynamicSchemaName);
    const QList<IRInstance> instances = m_ctx->irModel->instancesFor(dmo);

    SyncStats nodeStats;
    for (int i = 0; i < instances.size(); ++i) {
        const IRInstance &instance = instances.at(i);
        emit progressUpdated(i + 1, instances.size(), node.key());

        QString reason;
        const QString sourceId = resolveEndpoint(fk->sourceKey, dmo.fromType, dmo.fromAttr, instance, &reason);
        if (sourceId.isEmpty()) {
            skip(node.key(), instance, QString("source: %1").arg(reason));
            continue;
        }
        const QString targetId = resolveEndpoint(fk->targetKey, dmo.toType, dmo.toAttr, instance, &reason);
        if (targetId.isEmpty()) {
            skip(node.key(), instance, QString("target: %1").arg(reason));
            continue;
        }

        RecordProps target;
        if (!repo->record(targetId, &target)) {
            skip(node.key(), instance, QString("target record %1 is gone").arg(targetId));
            continue;
        }

        RelatedRef ref(sourceId, className);
        if (dmo.modifyProps) {
            dmo.modifyProps(ref, instance);
        }

        const bool present = target.references.contains(dmo.refProperty);
        if (present && target.references.value(dmo.refProperty) == ref) {
            nodeStats.record(ItemState::Unchanged);
            continue;
        }

        if (!repo->updateReference(targetId, dmo.refProperty, ref)) {
            if (error) {
                *error = QString("Failed to set %1 on %2: %3")
                         .arg(dmo.refProperty, targetId, repo->errorString());
            }
            return false;
        }
        nodeStats.record(present ? ItemState::Changed : ItemState::New);
    }

    m_ctx->stats += nodeStats;
    emit logMessage(QString("%1: %2").arg(node.key(), nodeStats.summary()));
    return true;
}

} // namespace Bridge
