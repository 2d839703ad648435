#include "node.h"

namespace Bridge {

QString nodeKindName(NodeKind kind)
{
    switch (kind) {
    case NodeKind::Container:    return QStringLiteral("Container");
    case NodeKind::Group:        return QStringLiteral("Group");
    case NodeKind::LoaderConfig: return QStringLiteral("LoaderConfig");
    case NodeKind::Record:       return QStringLiteral("Record");
    case NodeKind::Link:         return QStringLiteral("Link");
    case NodeKind::ForeignKey:   return QStringLiteral("ForeignKey");
    case NodeKind::Aspect:       return QStringLiteral("Aspect");
    }
    return QString();
}

QString groupKindName(GroupKind kind)
{
    switch (kind) {
    case GroupKind::Definition:  return QStringLiteral("definition");
    case GroupKind::Physical:    return QStringLiteral("physical");
    case GroupKind::Information: return QStringLiteral("information");
    case GroupKind::Link:        return QStringLiteral("link");
    }
    return QString();
}

bool groupKindFromName(const QString &name, GroupKind *kind)
{
    const QString lower = name.toLower();
    if (lower == "definition") {
        *kind = GroupKind::Definition;
    } else if (lower == "physical") {
        *kind = GroupKind::Physical;
    } else if (lower == "information") {
        *kind = GroupKind::Information;
    } else if (lower == "link") {
        *kind = GroupKind::Link;
    } else {
        return false;
    }
    return true;
}

// ========== GroupNode ==========

QString GroupNode::partitionClass() const
{
    switch (groupKind) {
    case GroupKind::Definition:  return CoreClasses::DefinitionPartition;
    case GroupKind::Physical:    return CoreClasses::PhysicalPartition;
    case GroupKind::Information: return CoreClasses::InformationRecordPartition;
    case GroupKind::Link:        return CoreClasses::LinkPartition;
    }
    return QString();
}

QString GroupNode::collectionClass() const
{
    switch (groupKind) {
    case GroupKind::Definition:  return CoreClasses::DefinitionModel;
    case GroupKind::Physical:    return CoreClasses::PhysicalModel;
    case GroupKind::Information: return CoreClasses::InformationRecordModel;
    case GroupKind::Link:        return CoreClasses::LinkModel;
    }
    return QString();
}

// ========== RecordOwner ==========

QJsonObject RecordOwner::toJson() const
{
    QJsonObject obj;
    obj[m_kind == Kind::Group ? "group" : "parentRecord"] = m_key;
    return obj;
}

// ========== Node ==========

NodeKind Node::kind() const
{
    switch (m_data.index()) {
    case 0: return NodeKind::Container;
    case 1: return NodeKind::Group;
    case 2: return NodeKind::LoaderConfig;
    case 3: return NodeKind::Record;
    case 4: return NodeKind::Link;
    case 5: return NodeKind::ForeignKey;
    default: return NodeKind::Aspect;
    }
}

QJsonObject Node::toJson() const
{
    QJsonObject obj;
    obj["key"] = m_key;
    obj["kind"] = nodeKindName(kind());

    switch (kind()) {
    case NodeKind::Container:
        break;
    case NodeKind::Group: {
        const GroupNode *g = asGroup();
        obj["container"] = g->containerKey;
        obj["groupKind"] = groupKindName(g->groupKind);
        break;
    }
    case NodeKind::LoaderConfig: {
        const LoaderNode *l = asLoader();
        obj["group"] = l->groupKey;
        obj["loader"] = l->loader ? l->loader->toJson() : QJsonObject();
        break;
    }
    case NodeKind::Record: {
        const RecordNode *r = asRecord();
        obj["owner"] = r->owner.toJson();
        obj["dmo"] = r->dmo.toJson();
        if (!r->categoryKey.isEmpty()) obj["category"] = r->categoryKey;
        if (!r->subCollectionClass.isEmpty()) obj["subCollectionClass"] = r->subCollectionClass;
        break;
    }
    case NodeKind::Link: {
        const LinkNode *l = asLink();
        obj["container"] = l->containerKey;
        obj["dmo"] = l->dmo.toJson();
        obj["source"] = l->sourceKey;
        obj["target"] = l->targetKey;
        break;
    }
    case NodeKind::ForeignKey: {
        const ForeignKeyNode *f = asForeignKey();
        obj["container"] = f->containerKey;
        obj["dmo"] = f->dmo.toJson();
        obj["source"] = f->sourceKey;
        obj["target"] = f->targetKey;
        break;
    }
    case NodeKind::Aspect: {
        const AspectNode *a = asAspect();
        obj["container"] = a->containerKey;
        obj["dmo"] = a->dmo.toJson();
        if (!a->elementKey.isEmpty()) obj["element"] = a->elementKey;
        break;
    }
    }
    return obj;
}

} // namespace Bridge
