#include "schemadef.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace Bridge {

// ========== SchemaVersion ==========

QString SchemaVersion::toString() const
{
    return QString("%1.%2.%3")
        .arg(read, 2, 10, QLatin1Char('0'))
        .arg(write, 2, 10, QLatin1Char('0'))
        .arg(minor, 2, 10, QLatin1Char('0'));
}

bool SchemaVersion::fromString(const QString &text, SchemaVersion *version)
{
    const QStringList parts = text.split('.');
    if (parts.size() != 3) {
        return false;
    }

    bool ok1 = false, ok2 = false, ok3 = false;
    SchemaVersion v(parts[0].toInt(&ok1), parts[1].toInt(&ok2), parts[2].toInt(&ok3));
    if (!ok1 || !ok2 || !ok3) {
        return false;
    }
    *version = v;
    return true;
}

bool SchemaVersion::operator<(const SchemaVersion &o) const
{
    if (read != o.read) return read < o.read;
    if (write != o.write) return write < o.write;
    return minor < o.minor;
}

// ========== RelationshipConstraint ==========

QJsonObject RelationshipConstraint::toJson() const
{
    QJsonObject obj;
    obj["multiplicity"] = multiplicity;
    obj["classes"] = QJsonArray::fromStringList(classes);
    obj["polymorphic"] = polymorphic;
    obj["roleLabel"] = roleLabel;
    return obj;
}

RelationshipConstraint RelationshipConstraint::fromJson(const QJsonObject &obj)
{
    RelationshipConstraint c;
    c.multiplicity = obj.value("multiplicity").toString(c.multiplicity);
    for (const QJsonValue &v : obj.value("classes").toArray()) {
        c.classes.append(v.toString());
    }
    c.polymorphic = obj.value("polymorphic").toBool(true);
    c.roleLabel = obj.value("roleLabel").toString();
    return c;
}

bool RelationshipConstraint::operator==(const RelationshipConstraint &o) const
{
    return multiplicity == o.multiplicity
        && classes == o.classes
        && polymorphic == o.polymorphic
        && roleLabel == o.roleLabel;
}

// ========== ClassDefinition ==========

ClassDefinition ClassDefinition::entity(const QString &name, const QString &baseClass,
                                        const QList<PropertyDef> &properties)
{
    ClassDefinition def;
    def.name = name;
    def.kind = Kind::Entity;
    def.baseClass = baseClass;
    def.properties = properties;
    return def;
}

ClassDefinition ClassDefinition::relationship(const QString &name, const QString &baseClass,
                                              const RelationshipConstraint &source,
                                              const RelationshipConstraint &target,
                                              const QString &strength)
{
    ClassDefinition def;
    def.name = name;
    def.kind = Kind::Relationship;
    def.baseClass = baseClass;
    def.source = source;
    def.target = target;
    def.strength = strength;
    return def;
}

const PropertyDef *ClassDefinition::findProperty(const QString &propName) const
{
    for (const PropertyDef &p : properties) {
        if (p.name.compare(propName, Qt::CaseInsensitive) == 0) {
            return &p;
        }
    }
    return nullptr;
}

QJsonObject ClassDefinition::toJson() const
{
    QJsonObject obj;
    obj["name"] = name;
    obj["kind"] = isRelationship() ? "relationship" : "entity";
    obj["baseClass"] = baseClass;
    if (!label.isEmpty()) {
        obj["label"] = label;
    }

    QJsonArray props;
    for (const PropertyDef &p : properties) {
        QJsonObject po;
        po["name"] = p.name;
        po["type"] = p.type;
        props.append(po);
    }
    obj["properties"] = props;

    if (isRelationship()) {
        obj["strength"] = strength;
        obj["strengthDirection"] = strengthDirection;
        obj["source"] = source.toJson();
        obj["target"] = target.toJson();
    }
    return obj;
}

bool ClassDefinition::fromJson(const QJsonObject &obj, ClassDefinition *def, QString *error)
{
    ClassDefinition d;
    d.name = obj.value("name").toString();
    if (d.name.isEmpty()) {
        if (error) *error = "Class definition without a name";
        return false;
    }

    const QString kind = obj.value("kind").toString("entity");
    if (kind == "entity") {
        d.kind = Kind::Entity;
    } else if (kind == "relationship") {
        d.kind = Kind::Relationship;
    } else {
        if (error) *error = QString("Class %1 has unknown kind: %2").arg(d.name, kind);
        return false;
    }

    d.baseClass = obj.value("baseClass").toString();
    d.label = obj.value("label").toString();

    for (const QJsonValue &v : obj.value("properties").toArray()) {
        const QJsonObject po = v.toObject();
        PropertyDef p;
        p.name = po.value("name").toString();
        p.type = po.value("type").toString(p.type);
        if (p.name.isEmpty()) {
            if (error) *error = QString("Class %1 has a property without a name").arg(d.name);
            return false;
        }
        d.properties.append(p);
    }

    if (d.isRelationship()) {
        d.strength = obj.value("strength").toString(d.strength);
        d.strengthDirection = obj.value("strengthDirection").toString(d.strengthDirection);
        d.source = RelationshipConstraint::fromJson(obj.value("source").toObject());
        d.target = RelationshipConstraint::fromJson(obj.value("target").toObject());
    }

    *def = d;
    return true;
}

bool ClassDefinition::operator==(const ClassDefinition &o) const
{
    if (name != o.name || kind != o.kind || baseClass != o.baseClass
        || label != o.label || properties != o.properties) {
        return false;
    }
    if (isRelationship()) {
        return strength == o.strength
            && strengthDirection == o.strengthDirection
            && source == o.source
            && target == o.target;
    }
    return true;
}

// ========== SchemaDef ==========

const ClassDefinition *SchemaDef::findClass(const QString &className) const
{
    const QString bare = classNameOf(className);
    for (const ClassDefinition &c : classes) {
        if (c.name.compare(bare, Qt::CaseInsensitive) == 0) {
            return &c;
        }
    }
    return nullptr;
}

QJsonObject SchemaDef::toJson() const
{
    QJsonObject obj;
    obj["name"] = name;
    obj["alias"] = alias;
    obj["version"] = version.toString();
    obj["references"] = QJsonArray::fromStringList(references);

    QJsonArray arr;
    for (const ClassDefinition &c : classes) {
        arr.append(c.toJson());
    }
    obj["classes"] = arr;
    return obj;
}

QByteArray SchemaDef::serialize() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
}

bool SchemaDef::fromJson(const QJsonObject &obj, SchemaDef *schema, QString *error)
{
    SchemaDef s;
    s.name = obj.value("name").toString();
    if (s.name.isEmpty()) {
        if (error) *error = "Schema without a name";
        return false;
    }

    s.alias = obj.value("alias").toString(s.name.toLower());
    const QString version = obj.value("version").toString("01.00.00");
    if (!SchemaVersion::fromString(version, &s.version)) {
        if (error) *error = QString("Schema %1 has an invalid version: %2").arg(s.name, version);
        return false;
    }

    for (const QJsonValue &v : obj.value("references").toArray()) {
        s.references.append(v.toString());
    }

    for (const QJsonValue &v : obj.value("classes").toArray()) {
        ClassDefinition def;
        if (!ClassDefinition::fromJson(v.toObject(), &def, error)) {
            return false;
        }
        s.classes.append(def);
    }

    *schema = s;
    return true;
}

bool SchemaDef::deserialize(const QByteArray &data, SchemaDef *schema, QString *error)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) *error = QString("Invalid schema document: %1").arg(parseError.errorString());
        return false;
    }
    return fromJson(doc.object(), schema, error);
}

bool SchemaDef::fromFile(const QString &path, SchemaDef *schema, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = QString("Failed to open schema file: %1").arg(path);
        return false;
    }

    QString parseError;
    if (!deserialize(file.readAll(), schema, &parseError)) {
        if (error) *error = QString("%1: %2").arg(path, parseError);
        return false;
    }
    return true;
}

// ========== Class Names ==========

static int separatorIndex(const QString &fullName)
{
    int idx = fullName.indexOf(':');
    if (idx < 0) {
        idx = fullName.indexOf('.');
    }
    return idx;
}

QString schemaNameOf(const QString &fullName)
{
    const int idx = separatorIndex(fullName);
    return idx < 0 ? QString() : fullName.left(idx);
}

QString classNameOf(const QString &fullName)
{
    const int idx = separatorIndex(fullName);
    return idx < 0 ? fullName : fullName.mid(idx + 1);
}

QString qualifiedClassName(const QString &schemaName, const QString &className)
{
    if (className.isEmpty() || separatorIndex(className) >= 0) {
        return className;
    }
    return schemaName + QLatin1Char(':') + className;
}

// ========== Base Schema ==========

SchemaDef coreSchema()
{
    SchemaDef s;
    s.name = CoreClasses::Schema;
    s.alias = "core";
    s.version = SchemaVersion(1, 0, 0);

    auto entity = [&s](const QString &name, const QString &base) {
        s.classes.append(ClassDefinition::entity(name, base));
    };

    entity("Element", QString());
    entity("InformationContentElement", "Element");
    entity("DefinitionElement", "InformationContentElement");
    entity("Category", "DefinitionElement");
    entity("InformationReferenceElement", "InformationContentElement");
    entity("Subject", "InformationReferenceElement");
    entity("LinkElement", "InformationReferenceElement");
    entity("UrlLink", "LinkElement");
    entity("RepositoryLink", "UrlLink");
    entity("InformationRecordElement", "InformationContentElement");
    entity("GeometricElement", "Element");
    entity("PhysicalElement", "GeometricElement");
    entity("SpatialLocationElement", "GeometricElement");
    entity("InformationPartitionElement", "InformationContentElement");
    entity("DefinitionPartition", "InformationPartitionElement");
    entity("PhysicalPartition", "InformationPartitionElement");
    entity("InformationRecordPartition", "InformationPartitionElement");
    entity("LinkPartition", "InformationPartitionElement");

    entity("ElementAspect", QString());
    entity("ElementUniqueAspect", "ElementAspect");

    entity("Model", QString());
    entity("RepositoryModel", "Model");
    entity("DefinitionModel", "Model");
    entity("PhysicalModel", "Model");
    entity("InformationRecordModel", "Model");
    entity("LinkModel", "Model");

    RelationshipConstraint anyElement;
    anyElement.classes << CoreClasses::Element;

    RelationshipConstraint parentEnd;
    parentEnd.multiplicity = "(0..1)";
    parentEnd.classes << CoreClasses::Element;

    s.classes.append(ClassDefinition::relationship("ElementRefersToElements", QString(),
                                                   anyElement, anyElement));
    s.classes.append(ClassDefinition::relationship("ElementGroupsMembers", "ElementRefersToElements",
                                                   anyElement, anyElement));
    s.classes.append(ClassDefinition::relationship("ElementOwnsChildElements", QString(),
                                                   parentEnd, anyElement, "embedding"));
    s.classes.append(ClassDefinition::relationship("SubjectOwnsSubjects", "ElementOwnsChildElements",
                                                   parentEnd, anyElement, "embedding"));
    s.classes.append(ClassDefinition::relationship("SubjectOwnsPartitionElements", "ElementOwnsChildElements",
                                                   parentEnd, anyElement, "embedding"));
    s.classes.append(ClassDefinition::relationship("PhysicalElementAssemblesElements", "ElementOwnsChildElements",
                                                   parentEnd, anyElement, "embedding"));
    return s;
}

} // namespace Bridge
