#include "mappingdocument.h"
#include "sync/syncengine.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSharedPointer>

namespace Bridge {

static bool readClassRef(const QJsonObject &obj, ClassRef *ref, QString *error)
{
    const QString className = obj.value("class").toString();
    if (!obj.contains("definition")) {
        *ref = ClassRef::existing(className);
        return true;
    }

    ClassDefinition def;
    if (!ClassDefinition::fromJson(obj.value("definition").toObject(), &def, error)) {
        return false;
    }
    *ref = ClassRef::defined(className, def);
    return true;
}

static bool readEndpointType(const QJsonObject &obj, const QString &name, EndpointType *type, QString *error)
{
    const QString value = obj.value(name).toString("IREntity");
    if (value.compare("IREntity", Qt::CaseInsensitive) == 0) {
        *type = EndpointType::IREntity;
    } else if (value.compare("TargetEntity", Qt::CaseInsensitive) == 0) {
        *type = EndpointType::TargetEntity;
    } else {
        if (error) *error = QString("Unknown endpoint type \"%1\"").arg(value);
        return false;
    }
    return true;
}

bool MappingDocument::load(const QString &path, SyncEngine *engine, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = QString("Failed to open mapping file: %1").arg(path);
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) *error = QString("Failed to parse mapping file %1: %2").arg(path, parseError.errorString());
        return false;
    }

    // Domain schema paths are relative to the mapping file
    QJsonObject root = doc.object();
    QJsonObject connector = root.value("connector").toObject();
    if (connector.contains("domainSchemaPaths")) {
        const QDir dir = QFileInfo(path).dir();
        QJsonArray paths;
        for (const QJsonValue &v : connector.value("domainSchemaPaths").toArray()) {
            paths.append(QDir::cleanPath(dir.absoluteFilePath(v.toString())));
        }
        connector["domainSchemaPaths"] = paths;
        root["connector"] = connector;
    }
    return apply(root, engine, error);
}

bool MappingDocument::apply(const QJsonObject &doc, SyncEngine *engine, QString *error)
{
    ConnectorConfig config;
    if (!ConnectorConfig::fromJson(doc.value("connector").toObject(), &config, error)) {
        return false;
    }
    engine->setConfig(config);

    NodeTree &tree = engine->tree();

    for (const QJsonValue &v : doc.value("containers").toArray()) {
        if (!tree.addContainer(v.toString(), error)) {
            return false;
        }
    }

    for (const QJsonValue &v : doc.value("groups").toArray()) {
        const QJsonObject g = v.toObject();
        GroupKind kind;
        if (!groupKindFromName(g.value("kind").toString(), &kind)) {
            if (error) *error = QString("Group %1 has unknown kind \"%2\"")
                                .arg(g.value("key").toString(), g.value("kind").toString());
            return false;
        }
        if (!tree.addGroup(g.value("key").toString(), g.value("container").toString(), kind, error)) {
            return false;
        }
    }

    if (doc.contains("loader")) {
        const QJsonObject l = doc.value("loader").toObject();
        const LoaderProps props = LoaderProps::fromJson(l.value("props").toObject());
        QSharedPointer<Loader> loader(createLoader(props));
        if (!loader) {
            if (error) *error = QString("Unknown loader format \"%1\"").arg(props.format);
            return false;
        }
        if (!tree.addLoader(l.value("key").toString(), l.value("group").toString(), loader, error)) {
            return false;
        }
    }

    for (const QJsonValue &v : doc.value("records").toArray()) {
        const QJsonObject r = v.toObject();

        RecordDMO dmo;
        dmo.irEntity = r.value("irEntity").toString();
        dmo.categoryAttr = r.value("categoryAttr").toString();
        dmo.parentAttr = r.value("parentAttr").toString();
        if (!readClassRef(r, &dmo.target, error)) {
            return false;
        }

        const RecordOwner owner = r.contains("parentRecord")
            ? RecordOwner::parentRecord(r.value("parentRecord").toString())
            : RecordOwner::group(r.value("group").toString());

        RecordNode node(owner, dmo);
        node.categoryKey = r.value("category").toString();
        node.subCollectionClass = r.value("subCollectionClass").toString();

        if (!tree.addRecord(r.value("key").toString(), node, error)) {
            return false;
        }
    }

    for (const QJsonValue &v : doc.value("links").toArray()) {
        const QJsonObject l = v.toObject();

        LinkNode node;
        node.containerKey = l.value("container").toString();
        node.sourceKey = l.value("source").toString();
        node.targetKey = l.value("target").toString();
        node.dmo.irEntity = l.value("irEntity").toString();
        node.dmo.fromAttr = l.value("fromAttr").toString();
        node.dmo.toAttr = l.value("toAttr").toString();
        if (!readClassRef(l, &node.dmo.relationship, error)
            || !readEndpointType(l, "fromType", &node.dmo.fromType, error)
            || !readEndpointType(l, "toType", &node.dmo.toType, error)
            || !tree.addLink(l.value("key").toString(), node, error)) {
            return false;
        }
    }

    for (const QJsonValue &v : doc.value("foreignKeys").toArray()) {
        const QJsonObject f = v.toObject();

        ForeignKeyNode node;
        node.containerKey = f.value("container").toString();
        node.sourceKey = f.value("source").toString();
        node.targetKey = f.value("target").toString();
        node.dmo.irEntity = f.value("irEntity").toString();
        node.dmo.fromAttr = f.value("fromAttr").toString();
        node.dmo.toAttr = f.value("toAttr").toString();
        node.dmo.refProperty = f.value("refProperty").toString();
        if (!readClassRef(f, &node.dmo.relationship, error)
            || !readEndpointType(f, "fromType", &node.dmo.fromType, error)
            || !readEndpointType(f, "toType", &node.dmo.toType, error)
            || !tree.addForeignKey(f.value("key").toString(), node, error)) {
            return false;
        }
    }

    for (const QJsonValue &v : doc.value("aspects").toArray()) {
        const QJsonObject a = v.toObject();

        AspectNode node;
        node.containerKey = a.value("container").toString();
        node.elementKey = a.value("element").toString();
        node.dmo.irEntity = a.value("irEntity").toString();
        node.dmo.elementAttr = a.value("elementAttr").toString();
        if (!readClassRef(a, &node.dmo.target, error)
            || !readEndpointType(a, "elementType", &node.dmo.elementType, error)
            || !tree.addAspect(a.value("key").toString(), node, error)) {
            return false;
        }
    }

    return true;
}

} // namespace Bridge
