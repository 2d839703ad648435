#include "dmo.h"

namespace Bridge {

// ========== ClassRef ==========

ClassRef ClassRef::existing(const QString &className)
{
    ClassRef ref;
    ref.className = className;
    return ref;
}

ClassRef ClassRef::defined(const QString &className, const ClassDefinition &definition)
{
    ClassRef ref;
    ref.className = className;
    ref.isDefined = true;
    ref.definition = definition;
    return ref;
}

QString ClassRef::fullName(const QString &dynamicSchemaName) const
{
    if (isDefined) {
        return dynamicSchemaName + QLatin1Char(':') + definition.name;
    }
    return className;
}

QJsonObject ClassRef::toJson() const
{
    QJsonObject obj;
    obj["class"] = className;
    if (isDefined) {
        obj["definition"] = definition.toJson();
    }
    return obj;
}

QString endpointTypeName(EndpointType type)
{
    return type == EndpointType::IREntity ? QStringLiteral("IREntity") : QStringLiteral("TargetEntity");
}

// ========== Serialization ==========

QJsonObject RecordDMO::toJson() const
{
    QJsonObject obj;
    obj["irEntity"] = irEntity;
    obj["target"] = target.toJson();
    if (!categoryAttr.isEmpty()) obj["categoryAttr"] = categoryAttr;
    if (!parentAttr.isEmpty()) obj["parentAttr"] = parentAttr;
    obj["hasFilter"] = static_cast<bool>(doSyncInstance);
    obj["hasTransform"] = static_cast<bool>(modifyProps);
    return obj;
}

QJsonObject LinkDMO::toJson() const
{
    QJsonObject obj;
    obj["irEntity"] = irEntity;
    obj["relationship"] = relationship.toJson();
    obj["fromAttr"] = fromAttr;
    obj["fromType"] = endpointTypeName(fromType);
    obj["toAttr"] = toAttr;
    obj["toType"] = endpointTypeName(toType);
    obj["hasFilter"] = static_cast<bool>(doSyncInstance);
    obj["hasTransform"] = static_cast<bool>(modifyProps);
    return obj;
}

QJsonObject ForeignKeyDMO::toJson() const
{
    QJsonObject obj;
    obj["irEntity"] = irEntity;
    obj["relationship"] = relationship.toJson();
    obj["fromAttr"] = fromAttr;
    obj["fromType"] = endpointTypeName(fromType);
    obj["toAttr"] = toAttr;
    obj["toType"] = endpointTypeName(toType);
    obj["refProperty"] = refProperty;
    obj["hasFilter"] = static_cast<bool>(doSyncInstance);
    obj["hasTransform"] = static_cast<bool>(modifyProps);
    return obj;
}

QJsonObject AspectDMO::toJson() const
{
    QJsonObject obj;
    obj["irEntity"] = irEntity;
    obj["target"] = target.toJson();
    obj["elementAttr"] = elementAttr;
    obj["elementType"] = endpointTypeName(elementType);
    obj["hasFilter"] = static_cast<bool>(doSyncInstance);
    obj["hasTransform"] = static_cast<bool>(modifyProps);
    return obj;
}

// ========== Validation ==========

static bool validateClassRef(const ClassRef &ref, QString *error)
{
    if (!ref.isDefined) {
        return true;
    }

    const QString className = classNameOf(ref.className);
    if (className != ref.definition.name) {
        if (error) {
            *error = QString("class name / ClassProps.name mismatch (%1 vs %2)")
                     .arg(className, ref.definition.name);
        }
        return false;
    }
    return true;
}

bool validateRecordDMO(const RecordDMO &dmo, QString *error)
{
    return validateClassRef(dmo.target, error);
}

bool validateAspectDMO(const AspectDMO &dmo, QString *error)
{
    if (dmo.elementAttr.isEmpty()) {
        if (error) {
            *error = "elementAttr is required";
        }
        return false;
    }
    return validateClassRef(dmo.target, error);
}

bool validateLinkDMO(const LinkDMO &dmo, QString *error)
{
    return validateClassRef(dmo.relationship, error);
}

bool validateForeignKeyDMO(const ForeignKeyDMO &dmo, QString *error)
{
    return validateClassRef(dmo.relationship, error);
}

} // namespace Bridge
