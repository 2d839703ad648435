#ifndef NODETREE_H
#define NODETREE_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QHash>
#include <QJsonObject>
#include "node.h"

namespace Bridge {

/**
 * @brief Class definitions declared inline by mappings
 *
 * Feeds the dynamic schema.
 */
struct DefinedClasses {
    QList<ClassDefinition> entities;
    QList<ClassDefinition> relationships;

    bool isEmpty() const { return entities.isEmpty() && relationships.isEmpty(); }
};

/**
 * @brief All synchronization nodes of a connector
 *
 * Built once by integrator code, before any run. Every insertion is
 * validated: keys are unique, mappings are consistent and referenced nodes
 * exist with the right kind. A rejected insertion returns false, reports
 * the reason through @p error and is recorded in constructionErrors(); the
 * engine refuses to run a tree with construction errors.
 *
 * Usage:
 * @code
 * NodeTree &tree = engine.tree();
 * tree.addContainer("Subject1");
 * tree.addGroup("LinkModel1", "Subject1", GroupKind::Link);
 * tree.addLoader("loader", "LinkModel1", QSharedPointer<Loader>(new JSONLoader(props)));
 * tree.addGroup("PhysicalModel1", "Subject1", GroupKind::Physical);
 * tree.addRecord("Component", RecordNode(RecordOwner::group("PhysicalModel1"), dmo));
 * @endcode
 */
class NodeTree
{
public:
    NodeTree() = default;

    // ========== Construction ==========

    /**
     * @brief Validate and add a node
     */
    bool insert(const Node &node, QString *error = nullptr);

    bool addContainer(const QString &key, QString *error = nullptr);
    bool addGroup(const QString &key, const QString &containerKey, GroupKind kind,
                  QString *error = nullptr);
    bool addLoader(const QString &key, const QString &groupKey,
                   const QSharedPointer<Loader> &loader, QString *error = nullptr);
    bool addRecord(const QString &key, const RecordNode &record, QString *error = nullptr);
    bool addLink(const QString &key, const LinkNode &link, QString *error = nullptr);
    bool addForeignKey(const QString &key, const ForeignKeyNode &foreignKey, QString *error = nullptr);
    bool addAspect(const QString &key, const AspectNode &aspect, QString *error = nullptr);

    QStringList constructionErrors() const { return m_errors; }
    const DefinedClasses &definedClasses() const { return m_defined; }

    // ========== Lookup ==========

    const Node *find(const QString &key) const;

    /**
     * @brief Find a node of a given kind
     * @return nullptr if missing or of another kind
     */
    const Node *find(const QString &key, NodeKind kind) const;

    bool contains(const QString &key) const { return m_index.contains(key); }
    int size() const { return m_nodes.size(); }
    QList<const Node *> nodes() const;

    /**
     * @brief Key of the container a node belongs to
     */
    QString containerOf(const QString &key) const;

    /**
     * @brief Key of the group whose collection (directly or through parents) holds a record node
     */
    QString groupOf(const QString &recordKey) const;

    /**
     * @brief Loader-config node of a container, or nullptr
     */
    const Node *loaderOf(const QString &containerKey) const;

    // ========== Execution Order ==========

    /**
     * @brief Nodes of a container in the order they synchronize
     *
     * Container, definition groups with their records, the other groups
     * with their records (parents before children, loader nodes right after
     * their group), then aspects, then links, then foreign keys.
     */
    QList<const Node *> executionOrder(const QString &containerKey) const;

    /**
     * @brief Check a job can run against this tree
     *
     * The loader node must exist and belong to an existing container; an
     * explicit container key must match it.
     */
    bool validate(const QString &loaderNodeKey, const QString &containerNodeKey,
                  QString *error = nullptr) const;

    /**
     * @brief Debug snapshot of every node
     */
    QJsonObject toJson() const;

private:
    bool fail(const QString &message, QString *error);
    bool checkReference(const QString &ownerKey, const QString &refKey, NodeKind kind,
                        const QString &role, QString *error);
    bool checkEndpoint(const QString &ownerKey, EndpointType type, const QString &nodeKey,
                       const QString &role, QString *error);
    bool defineClass(const ClassRef &ref, bool relationship, QString *error);
    void appendRecords(const QString &ownerKey, RecordOwner::Kind ownerKind,
                       QList<const Node *> *order) const;

    QList<Node> m_nodes;
    QHash<QString, int> m_index;
    QStringList m_errors;
    DefinedClasses m_defined;
};

} // namespace Bridge

#endif // NODETREE_H
