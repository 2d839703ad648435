#include "repository.h"

#include <QDebug>

namespace Bridge {

// ========== Value Types ==========

QJsonObject Code::toJson() const
{
    QJsonObject obj;
    obj["spec"] = specId;
    obj["scope"] = scopeId;
    obj["value"] = value;
    return obj;
}

Code Code::fromJson(const QJsonObject &obj)
{
    return Code(obj.value("spec").toString(),
                obj.value("scope").toString(),
                obj.value("value").toString());
}

QJsonObject RelatedRef::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["relClassName"] = relClassName;
    return obj;
}

RelatedRef RelatedRef::fromJson(const QJsonObject &obj)
{
    return RelatedRef(obj.value("id").toString(), obj.value("relClassName").toString());
}

QJsonObject RecordProps::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["classFullName"] = classFullName;
    obj["model"] = modelId;
    obj["code"] = code.toJson();
    obj["userLabel"] = userLabel;
    obj["federationGuid"] = federationGuid;
    if (parent.isValid()) {
        obj["parent"] = parent.toJson();
    }
    if (!categoryId.isEmpty()) {
        obj["category"] = categoryId;
    }
    obj["jsonProperties"] = jsonProperties;
    obj["properties"] = properties;

    QJsonObject refs;
    for (auto it = references.constBegin(); it != references.constEnd(); ++it) {
        refs[it.key()] = it.value().toJson();
    }
    obj["references"] = refs;
    return obj;
}

RecordProps RecordProps::fromJson(const QJsonObject &obj)
{
    RecordProps p;
    p.id = obj.value("id").toString();
    p.classFullName = obj.value("classFullName").toString();
    p.modelId = obj.value("model").toString();
    p.code = Code::fromJson(obj.value("code").toObject());
    p.userLabel = obj.value("userLabel").toString();
    p.federationGuid = obj.value("federationGuid").toString();
    p.parent = RelatedRef::fromJson(obj.value("parent").toObject());
    p.categoryId = obj.value("category").toString();
    p.jsonProperties = obj.value("jsonProperties").toObject();
    p.properties = obj.value("properties").toObject();

    const QJsonObject refs = obj.value("references").toObject();
    for (auto it = refs.constBegin(); it != refs.constEnd(); ++it) {
        p.references.insert(it.key(), RelatedRef::fromJson(it.value().toObject()));
    }
    return p;
}

QJsonObject RelationshipProps::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["classFullName"] = classFullName;
    obj["sourceId"] = sourceId;
    obj["targetId"] = targetId;
    obj["properties"] = properties;
    return obj;
}

RelationshipProps RelationshipProps::fromJson(const QJsonObject &obj)
{
    RelationshipProps p;
    p.id = obj.value("id").toString();
    p.classFullName = obj.value("classFullName").toString();
    p.sourceId = obj.value("sourceId").toString();
    p.targetId = obj.value("targetId").toString();
    p.properties = obj.value("properties").toObject();
    return p;
}

QJsonObject AspectProps::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["classFullName"] = classFullName;
    obj["element"] = elementId;
    obj["properties"] = properties;
    return obj;
}

AspectProps AspectProps::fromJson(const QJsonObject &obj)
{
    AspectProps p;
    p.id = obj.value("id").toString();
    p.classFullName = obj.value("classFullName").toString();
    p.elementId = obj.value("element").toString();
    p.properties = obj.value("properties").toObject();
    return p;
}

QJsonObject ProvenanceRecord::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["element"] = elementId;
    obj["scope"] = scopeId;
    obj["kind"] = kind;
    obj["identifier"] = identifier;
    obj["version"] = version;
    obj["checksum"] = checksum;
    return obj;
}

ProvenanceRecord ProvenanceRecord::fromJson(const QJsonObject &obj)
{
    ProvenanceRecord r;
    r.id = obj.value("id").toString();
    r.elementId = obj.value("element").toString();
    r.scopeId = obj.value("scope").toString();
    r.kind = obj.value("kind").toString();
    r.identifier = obj.value("identifier").toString();
    r.version = obj.value("version").toString();
    r.checksum = obj.value("checksum").toString();
    return r;
}

void Extents::extend(double x, double y, double z)
{
    const double p[3] = {x, y, z};
    for (int i = 0; i < 3; ++i) {
        if (isNull || p[i] < low[i]) low[i] = p[i];
        if (isNull || p[i] > high[i]) high[i] = p[i];
    }
    isNull = false;
}

// ========== Repository ==========

bool Repository::updateReference(const QString &recordId, const QString &property, const RelatedRef &ref)
{
    RecordProps props;
    if (!record(recordId, &props)) {
        setError(QString("Record %1 not found").arg(recordId));
        return false;
    }

    props.references.insert(property, ref);
    return updateRecord(props);
}

void Repository::setError(const QString &error)
{
    m_error = error;
    qWarning() << "[Repository]" << error;
    emit errorOccurred(error);
}

} // namespace Bridge
