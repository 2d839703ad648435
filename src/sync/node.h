#ifndef NODE_H
#define NODE_H

#include <QString>
#include <QSharedPointer>
#include <QJsonObject>
#include <variant>
#include "dmo.h"
#include "../loaders/loader.h"

namespace Bridge {

/**
 * @brief The kinds of node a tree can hold
 */
enum class NodeKind {
    Container,      ///< Named scope backed by a subject record
    Group,          ///< Partition record plus the collection it models
    LoaderConfig,   ///< Repository record describing the source connection
    Record,         ///< Records produced from an IR entity
    Link,           ///< Link-table relationships between records
    ForeignKey,     ///< Reference properties between records
    Aspect          ///< Unique aspects attached to records
};

QString nodeKindName(NodeKind kind);

/**
 * @brief Classification of a group
 *
 * Decides the partition and collection classes backing the group and the
 * order in which groups run: definition groups first.
 */
enum class GroupKind {
    Definition,
    Physical,
    Information,
    Link
};

QString groupKindName(GroupKind kind);
bool groupKindFromName(const QString &name, GroupKind *kind);

struct ContainerNode {
};

struct GroupNode {
    QString containerKey;
    GroupKind groupKind = GroupKind::Physical;

    bool isDefinitionLike() const { return groupKind == GroupKind::Definition; }
    QString partitionClass() const;
    QString collectionClass() const;
};

struct LoaderNode {
    QString groupKey;
    QSharedPointer<Loader> loader;
};

/**
 * @brief Where the records of a Record node live
 *
 * Exactly one of: a group, or the sub-collection of a parent Record node.
 */
class RecordOwner
{
public:
    enum class Kind {
        Group,
        ParentRecord
    };

    static RecordOwner group(const QString &groupKey) { return RecordOwner(Kind::Group, groupKey); }
    static RecordOwner parentRecord(const QString &recordKey) { return RecordOwner(Kind::ParentRecord, recordKey); }

    Kind kind() const { return m_kind; }
    QString key() const { return m_key; }
    bool isGroup() const { return m_kind == Kind::Group; }

    QJsonObject toJson() const;

private:
    RecordOwner(Kind kind, const QString &key) : m_kind(kind), m_key(key) {}

    Kind m_kind;
    QString m_key;
};

struct RecordNode {
    RecordOwner owner;
    RecordDMO dmo;
    QString categoryKey;            ///< Record node holding the categories, optional
    QString subCollectionClass;     ///< Collection class for child Record nodes, optional

    RecordNode(const RecordOwner &o, const RecordDMO &d) : owner(o), dmo(d) {}
};

struct LinkNode {
    QString containerKey;
    LinkDMO dmo;
    QString sourceKey;      ///< Record node of the source side (IREntity endpoints)
    QString targetKey;      ///< Record node of the target side (IREntity endpoints)
};

struct ForeignKeyNode {
    QString containerKey;
    ForeignKeyDMO dmo;
    QString sourceKey;
    QString targetKey;
};

struct AspectNode {
    QString containerKey;
    AspectDMO dmo;
    QString elementKey;     ///< Record node of the owners (IREntity owners)
};

/**
 * @brief A unit of synchronization
 *
 * A node is a key plus one of the node variants. Traversal and insertion
 * switch on kind() and read the variant through the typed accessors.
 */
class Node
{
public:
    using Data = std::variant<ContainerNode, GroupNode, LoaderNode, RecordNode, LinkNode, ForeignKeyNode, AspectNode>;

    Node(const QString &key, const Data &data) : m_key(key), m_data(data) {}

    QString key() const { return m_key; }
    NodeKind kind() const;

    const ContainerNode *asContainer() const { return std::get_if<ContainerNode>(&m_data); }
    const GroupNode *asGroup() const { return std::get_if<GroupNode>(&m_data); }
    const LoaderNode *asLoader() const { return std::get_if<LoaderNode>(&m_data); }
    const RecordNode *asRecord() const { return std::get_if<RecordNode>(&m_data); }
    const LinkNode *asLink() const { return std::get_if<LinkNode>(&m_data); }
    const ForeignKeyNode *asForeignKey() const { return std::get_if<ForeignKeyNode>(&m_data); }
    const AspectNode *asAspect() const { return std::get_if<AspectNode>(&m_data); }

    QJsonObject toJson() const;

private:
    QString m_key;
    Data m_data;
};

} // namespace Bridge

#endif // NODE_H
