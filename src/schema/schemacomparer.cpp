#include "schemacomparer.h"

#include <QSet>

namespace Bridge {

bool SchemaComparer::checkUniqueClasses(const SchemaDef &schema, QString *error)
{
    QSet<QString> names;
    for (const ClassDefinition &c : schema.classes) {
        const QString lower = c.name.toLower();
        if (names.contains(lower)) {
            if (error) {
                *error = QString("Schema %1 defines class %2 more than once").arg(schema.name, c.name);
            }
            return false;
        }
        names.insert(lower);
    }
    return true;
}

bool SchemaComparer::compare(const SchemaDef &candidate,
                             const SchemaDef &persisted,
                             QStringList *diagnostics,
                             QString *error)
{
    if (!checkUniqueClasses(candidate, error) || !checkUniqueClasses(persisted, error)) {
        return false;
    }

    QStringList diffs;

    if (candidate.name.compare(persisted.name, Qt::CaseInsensitive) != 0) {
        diffs << QString("Schema name changed from %1 to %2").arg(persisted.name, candidate.name);
    }
    if (candidate.alias != persisted.alias) {
        diffs << QString("Schema alias changed from %1 to %2").arg(persisted.alias, candidate.alias);
    }

    for (const QString &ref : candidate.references) {
        if (!persisted.references.contains(ref, Qt::CaseInsensitive)) {
            diffs << QString("Schema reference %1 added").arg(ref);
        }
    }
    for (const QString &ref : persisted.references) {
        if (!candidate.references.contains(ref, Qt::CaseInsensitive)) {
            diffs << QString("Schema reference %1 removed").arg(ref);
        }
    }

    for (const ClassDefinition &c : candidate.classes) {
        const ClassDefinition *old = persisted.findClass(c.name);
        if (!old) {
            diffs << QString("Class %1 added").arg(c.name);
        } else {
            compareClass(c, *old, &diffs);
        }
    }
    for (const ClassDefinition &c : persisted.classes) {
        if (!candidate.findClass(c.name)) {
            diffs << QString("Class %1 removed").arg(c.name);
        }
    }

    if (diagnostics) {
        *diagnostics = diffs;
    }
    return true;
}

void SchemaComparer::compareClass(const ClassDefinition &candidate,
                                  const ClassDefinition &persisted,
                                  QStringList *diagnostics)
{
    const QString &name = candidate.name;

    if (candidate.kind != persisted.kind) {
        *diagnostics << QString("Class %1: kind changed").arg(name);
        return;
    }
    if (candidate.baseClass != persisted.baseClass) {
        *diagnostics << QString("Class %1: base class changed from %2 to %3")
                        .arg(name, persisted.baseClass, candidate.baseClass);
    }
    if (candidate.label != persisted.label) {
        *diagnostics << QString("Class %1: label changed").arg(name);
    }

    for (const PropertyDef &p : candidate.properties) {
        const PropertyDef *old = persisted.findProperty(p.name);
        if (!old) {
            *diagnostics << QString("Class %1: property %2 added").arg(name, p.name);
        } else if (old->type != p.type) {
            *diagnostics << QString("Class %1: property %2 type changed from %3 to %4")
                            .arg(name, p.name, old->type, p.type);
        }
    }
    for (const PropertyDef &p : persisted.properties) {
        if (!candidate.findProperty(p.name)) {
            *diagnostics << QString("Class %1: property %2 removed").arg(name, p.name);
        }
    }

    if (candidate.isRelationship()) {
        if (candidate.strength != persisted.strength) {
            *diagnostics << QString("Class %1: strength changed from %2 to %3")
                            .arg(name, persisted.strength, candidate.strength);
        }
        if (candidate.strengthDirection != persisted.strengthDirection) {
            *diagnostics << QString("Class %1: strength direction changed").arg(name);
        }
        compareConstraint(name, "source", candidate.source, persisted.source, diagnostics);
        compareConstraint(name, "target", candidate.target, persisted.target, diagnostics);
    }
}

void SchemaComparer::compareConstraint(const QString &className,
                                       const QString &end,
                                       const RelationshipConstraint &candidate,
                                       const RelationshipConstraint &persisted,
                                       QStringList *diagnostics)
{
    if (candidate.multiplicity != persisted.multiplicity) {
        *diagnostics << QString("Class %1: %2 multiplicity changed from %3 to %4")
                        .arg(className, end, persisted.multiplicity, candidate.multiplicity);
    }
    if (candidate.polymorphic != persisted.polymorphic) {
        *diagnostics << QString("Class %1: %2 polymorphism changed").arg(className, end);
    }
    if (candidate.roleLabel != persisted.roleLabel) {
        *diagnostics << QString("Class %1: %2 role label changed").arg(className, end);
    }
    for (const QString &c : candidate.classes) {
        if (!persisted.classes.contains(c, Qt::CaseInsensitive)) {
            *diagnostics << QString("Class %1: %2 constraint class %3 added").arg(className, end, c);
        }
    }
    for (const QString &c : persisted.classes) {
        if (!candidate.classes.contains(c, Qt::CaseInsensitive)) {
            *diagnostics << QString("Class %1: %2 constraint class %3 removed").arg(className, end, c);
        }
    }
}

} // namespace Bridge
