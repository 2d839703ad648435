#include "nodetree.h"

#include <QJsonArray>
#include <QDebug>

namespace Bridge {

// ========== Construction ==========

bool NodeTree::fail(const QString &message, QString *error)
{
    m_errors.append(message);
    qWarning() << "[NodeTree]" << message;
    if (error) {
        *error = message;
    }
    return false;
}

bool NodeTree::checkReference(const QString &ownerKey, const QString &refKey, NodeKind kind,
                              const QString &role, QString *error)
{
    const Node *ref = find(refKey);
    if (!ref) {
        return fail(QString("Node %1: %2 node \"%3\" does not exist")
                    .arg(ownerKey, role, refKey), error);
    }
    if (ref->kind() != kind) {
        return fail(QString("Node %1: %2 node \"%3\" is a %4 node, expected %5")
                    .arg(ownerKey, role, refKey, nodeKindName(ref->kind()), nodeKindName(kind)), error);
    }
    return true;
}

bool NodeTree::checkEndpoint(const QString &ownerKey, EndpointType type, const QString &nodeKey,
                             const QString &role, QString *error)
{
    if (type == EndpointType::TargetEntity) {
        return true;
    }
    return checkReference(ownerKey, nodeKey, NodeKind::Record, role, error);
}

bool NodeTree::defineClass(const ClassRef &ref, bool relationship, QString *error)
{
    if (!ref.isDefined) {
        return true;
    }

    const ClassDefinition &def = ref.definition;
    if (def.isRelationship() != relationship) {
        return fail(QString("Class %1 is defined as %2 but mapped as %3")
                    .arg(def.name,
                         def.isRelationship() ? "a relationship" : "an entity",
                         relationship ? "a relationship" : "an entity"), error);
    }

    QList<ClassDefinition> &list = relationship ? m_defined.relationships : m_defined.entities;
    for (const ClassDefinition &existing : list) {
        if (existing.name.compare(def.name, Qt::CaseInsensitive) == 0) {
            if (existing == def) {
                return true;
            }
            return fail(QString("Conflicting definitions for class %1").arg(def.name), error);
        }
    }

    list.append(def);
    return true;
}

bool NodeTree::insert(const Node &node, QString *error)
{
    const QString key = node.key();
    if (key.isEmpty()) {
        return fail("Node key must not be empty", error);
    }
    if (m_index.contains(key)) {
        return fail(QString("Node with key \"%1\" already exists. Each Node must have a unique key.").arg(key), error);
    }

    QString dmoError;
    switch (node.kind()) {
    case NodeKind::Container:
        break;

    case NodeKind::Group:
        if (!checkReference(key, node.asGroup()->containerKey, NodeKind::Container, "container", error)) {
            return false;
        }
        break;

    case NodeKind::LoaderConfig: {
        const LoaderNode *l = node.asLoader();
        if (!l->loader) {
            return fail(QString("Node %1: no loader given").arg(key), error);
        }
        if (!checkReference(key, l->groupKey, NodeKind::Group, "group", error)) {
            return false;
        }
        if (find(l->groupKey)->asGroup()->groupKind != GroupKind::Link) {
            return fail(QString("Node %1: group \"%2\" must be a link group").arg(key, l->groupKey), error);
        }
        const QString container = containerOf(l->groupKey);
        if (loaderOf(container)) {
            return fail(QString("Node %1: container \"%2\" already has a loader node")
                        .arg(key, container), error);
        }
        break;
    }

    case NodeKind::Record: {
        const RecordNode *r = node.asRecord();
        if (!validateRecordDMO(r->dmo, &dmoError)) {
            return fail(QString("Node %1: %2").arg(key, dmoError), error);
        }
        if (r->owner.isGroup()) {
            if (!checkReference(key, r->owner.key(), NodeKind::Group, "group", error)) {
                return false;
            }
        } else {
            if (!checkReference(key, r->owner.key(), NodeKind::Record, "parent", error)) {
                return false;
            }
            if (find(r->owner.key())->asRecord()->subCollectionClass.isEmpty()) {
                return fail(QString("Node %1: parent node \"%2\" declares no sub-collection class")
                            .arg(key, r->owner.key()), error);
            }
            if (r->dmo.parentAttr.isEmpty()) {
                return fail(QString("Node %1: a node with a parent record needs a parentAttr").arg(key), error);
            }
        }
        if (!r->categoryKey.isEmpty()
            && !checkReference(key, r->categoryKey, NodeKind::Record, "category", error)) {
            return false;
        }
        if (!defineClass(r->dmo.target, false, error)) {
            return false;
        }
        break;
    }

    case NodeKind::Link: {
        const LinkNode *l = node.asLink();
        if (!validateLinkDMO(l->dmo, &dmoError)) {
            return fail(QString("Node %1: %2").arg(key, dmoError), error);
        }
        if (!checkReference(key, l->containerKey, NodeKind::Container, "container", error)
            || !checkEndpoint(key, l->dmo.fromType, l->sourceKey, "source", error)
            || !checkEndpoint(key, l->dmo.toType, l->targetKey, "target", error)
            || !defineClass(l->dmo.relationship, true, error)) {
            return false;
        }
        break;
    }

    case NodeKind::ForeignKey: {
        const ForeignKeyNode *f = node.asForeignKey();
        if (!validateForeignKeyDMO(f->dmo, &dmoError)) {
            return fail(QString("Node %1: %2").arg(key, dmoError), error);
        }
        if (!checkReference(key, f->containerKey, NodeKind::Container, "container", error)
            || !checkEndpoint(key, f->dmo.fromType, f->sourceKey, "source", error)
            || !checkEndpoint(key, f->dmo.toType, f->targetKey, "target", error)
            || !defineClass(f->dmo.relationship, true, error)) {
            return false;
        }
        break;
    }

    case NodeKind::Aspect: {
        const AspectNode *a = node.asAspect();
        if (!validateAspectDMO(a->dmo, &dmoError)) {
            return fail(QString("Node %1: %2").arg(key, dmoError), error);
        }
        if (!checkReference(key, a->containerKey, NodeKind::Container, "container", error)
            || !checkEndpoint(key, a->dmo.elementType, a->elementKey, "element", error)
            || !defineClass(a->dmo.target, false, error)) {
            return false;
        }
        break;
    }
    }

    m_index.insert(key, m_nodes.size());
    m_nodes.append(node);
    return true;
}

bool NodeTree::addContainer(const QString &key, QString *error)
{
    return insert(Node(key, ContainerNode()), error);
}

bool NodeTree::addGroup(const QString &key, const QString &containerKey, GroupKind kind,
                        QString *error)
{
    GroupNode group;
    group.containerKey = containerKey;
    group.groupKind = kind;
    return insert(Node(key, group), error);
}

bool NodeTree::addLoader(const QString &key, const QString &groupKey,
                         const QSharedPointer<Loader> &loader, QString *error)
{
    LoaderNode node;
    node.groupKey = groupKey;
    node.loader = loader;
    return insert(Node(key, node), error);
}

bool NodeTree::addRecord(const QString &key, const RecordNode &record, QString *error)
{
    return insert(Node(key, record), error);
}

bool NodeTree::addLink(const QString &key, const LinkNode &link, QString *error)
{
    return insert(Node(key, link), error);
}

bool NodeTree::addForeignKey(const QString &key, const ForeignKeyNode &foreignKey, QString *error)
{
    return insert(Node(key, foreignKey), error);
}

bool NodeTree::addAspect(const QString &key, const AspectNode &aspect, QString *error)
{
    return insert(Node(key, aspect), error);
}

// ========== Lookup ==========

const Node *NodeTree::find(const QString &key) const
{
    auto it = m_index.constFind(key);
    return it == m_index.constEnd() ? nullptr : &m_nodes.at(it.value());
}

const Node *NodeTree::find(const QString &key, NodeKind kind) const
{
    const Node *node = find(key);
    return (node && node->kind() == kind) ? node : nullptr;
}

QList<const Node *> NodeTree::nodes() const
{
    QList<const Node *> result;
    for (const Node &node : m_nodes) {
        result.append(&node);
    }
    return result;
}

QString NodeTree::containerOf(const QString &key) const
{
    const Node *node = find(key);
    if (!node) {
        return QString();
    }

    switch (node->kind()) {
    case NodeKind::Container:
        return key;
    case NodeKind::Group:
        return node->asGroup()->containerKey;
    case NodeKind::LoaderConfig:
        return containerOf(node->asLoader()->groupKey);
    case NodeKind::Record:
        return containerOf(node->asRecord()->owner.key());
    case NodeKind::Link:
        return node->asLink()->containerKey;
    case NodeKind::ForeignKey:
        return node->asForeignKey()->containerKey;
    case NodeKind::Aspect:
        return node->asAspect()->containerKey;
    }
    return QString();
}

QString NodeTree::groupOf(const QString &recordKey) const
{
    const Node *node = find(recordKey, NodeKind::Record);
    if (!node) {
        return QString();
    }
    const RecordOwner &owner = node->asRecord()->owner;
    return owner.isGroup() ? owner.key() : groupOf(owner.key());
}

const Node *NodeTree::loaderOf(const QString &containerKey) const
{
    for (const Node &node : m_nodes) {
        if (node.kind() == NodeKind::LoaderConfig && containerOf(node.key()) == containerKey) {
            return &node;
        }
    }
    return nullptr;
}

// ========== Execution Order ==========

void NodeTree::appendRecords(const QString &ownerKey, RecordOwner::Kind ownerKind,
                             QList<const Node *> *order) const
{
    for (const Node &node : m_nodes) {
        const RecordNode *r = node.asRecord();
        if (r && r->owner.kind() == ownerKind && r->owner.key() == ownerKey) {
            order->append(&node);
            appendRecords(node.key(), RecordOwner::Kind::ParentRecord, order);
        }
    }
}

QList<const Node *> NodeTree::executionOrder(const QString &containerKey) const
{
    QList<const Node *> order;
    const Node *container = find(containerKey, NodeKind::Container);
    if (!container) {
        return order;
    }
    order.append(container);

    for (bool definitionPass : {true, false}) {
        for (const Node &node : m_nodes) {
            const GroupNode *g = node.asGroup();
            if (!g || g->containerKey != containerKey || g->isDefinitionLike() != definitionPass) {
                continue;
            }
            order.append(&node);
            for (const Node &other : m_nodes) {
                const LoaderNode *l = other.asLoader();
                if (l && l->groupKey == node.key()) {
                    order.append(&other);
                }
            }
            appendRecords(node.key(), RecordOwner::Kind::Group, &order);
        }
    }

    for (const Node &node : m_nodes) {
        const AspectNode *a = node.asAspect();
        if (a && a->containerKey == containerKey) {
            order.append(&node);
        }
    }
    for (const Node &node : m_nodes) {
        const LinkNode *l = node.asLink();
        if (l && l->containerKey == containerKey) {
            order.append(&node);
        }
    }
    for (const Node &node : m_nodes) {
        const ForeignKeyNode *f = node.asForeignKey();
        if (f && f->containerKey == containerKey) {
            order.append(&node);
        }
    }
    return order;
}

bool NodeTree::validate(const QString &loaderNodeKey, const QString &containerNodeKey,
                        QString *error) const
{
    if (!m_errors.isEmpty()) {
        if (error) *error = QString("Node tree has construction errors: %1").arg(m_errors.join("; "));
        return false;
    }

    if (!find(loaderNodeKey, NodeKind::LoaderConfig)) {
        if (error) *error = QString("Loader node \"%1\" does not exist").arg(loaderNodeKey);
        return false;
    }

    const QString container = containerOf(loaderNodeKey);
    if (!containerNodeKey.isEmpty() && containerNodeKey != container) {
        if (error) {
            *error = QString("Loader node \"%1\" belongs to container \"%2\", not \"%3\"")
                     .arg(loaderNodeKey, container, containerNodeKey);
        }
        return false;
    }
    return true;
}

QJsonObject NodeTree::toJson() const
{
    QJsonArray nodes;
    for (const Node &node : m_nodes) {
        nodes.append(node.toJson());
    }

    QJsonArray entities;
    for (const ClassDefinition &c : m_defined.entities) {
        entities.append(c.toJson());
    }
    QJsonArray relationships;
    for (const ClassDefinition &c : m_defined.relationships) {
        relationships.append(c.toJson());
    }

    QJsonObject defined;
    defined["entities"] = entities;
    defined["relationships"] = relationships;

    QJsonObject obj;
    obj["nodes"] = nodes;
    obj["definedClasses"] = defined;
    return obj;
}

} // namespace Bridge
