#include "dynamicschema.h"
#include "schemacomparer.h"
#include "schemaregistry.h"
#include "../repo/repository.h"

#include <QDebug>

namespace Bridge {

bool DynamicSchema::create(const SchemaVersion &version,
                           const QStringList &domainSchemaNames,
                           const DynamicSchemaProps &props,
                           const SchemaRegistry &known,
                           SchemaDef *schema,
                           QString *error)
{
    SchemaDef s;
    s.name = props.schemaName;
    s.alias = props.schemaAlias;
    s.version = version;
    s.references << CoreClasses::Schema;
    for (const QString &name : domainSchemaNames) {
        if (!s.references.contains(name, Qt::CaseInsensitive)) {
            s.references << name;
        }
    }

    s.classes = props.entities;
    s.classes.append(props.relationships);

    if (!SchemaComparer::checkUniqueClasses(s, error)) {
        return false;
    }

    SchemaRegistry scope = known;
    scope.registerSchema(s);
    for (const ClassDefinition &c : s.classes) {
        if (c.baseClass.isEmpty()) {
            continue;
        }
        const QString base = qualifiedClassName(s.name, c.baseClass);
        if (!scope.contains(base)) {
            if (error) {
                *error = QString("Failed to create class %1 - base class %2 not found").arg(c.name, base);
            }
            return false;
        }
    }

    *schema = s;
    return true;
}

bool DynamicSchema::prepare(const Repository *repository,
                          const QStringList &domainSchemaNames,
                          const DynamicSchemaProps &props,
                          const SchemaRegistry &registry,
                          SchemaDef *schema,
                          ItemState *state,
                          QString *error)
{
    SchemaVersion version(1, 0, 0);
    SchemaDef existing;
    const bool exists = repository->schema(props.schemaName, &existing);
    if (exists) {
        version = existing.version;
    }

    SchemaDef latest;
    if (!create(version, domainSchemaNames, props, registry, &latest, error)) {
        return false;
    }

    if (!exists) {
        *schema = latest;
        *state = ItemState::New;
        return true;
    }

    QStringList diagnostics;
    QString compareError;
    if (!SchemaComparer::compare(latest, existing, &diagnostics, &compareError)) {
        if (error) *error = QString("Failed to compare schema %1: %2").arg(props.schemaName, compareError);
        return false;
    }

    if (diagnostics.isEmpty()) {
        *schema = existing;
        *state = ItemState::Unchanged;
        return true;
    }

    for (const QString &d : diagnostics) {
        qDebug() << "[DynamicSchema]" << d;
    }
    version.minor = existing.version.minor + 1;
    if (!create(version, domainSchemaNames, props, registry, schema, error)) {
        return false;
    }
    *state = ItemState::Changed;
    return true;
}

bool DynamicSchema::import(Repository *repository, const SchemaDef &schema,
                           SchemaRegistry *registry, QString *error)
{
    if (!repository->importSchema(schema.serialize())) {
        if (error) *error = QString("Failed to import schema %1: %2").arg(schema.name, repository->errorString());
        return false;
    }
    qDebug() << "[DynamicSchema] Imported" << schema.name << schema.version.toString();
    registry->registerSchema(schema);
    return true;
}

bool DynamicSchema::synchronize(Repository *repository,
                                const QStringList &domainSchemaNames,
                                const DynamicSchemaProps &props,
                                SchemaRegistry *registry,
                                ItemState *state,
                                QString *error)
{
    SchemaDef dynamic;
    ItemState schemaState;
    if (!prepare(repository, domainSchemaNames, props, *registry, &dynamic, &schemaState, error)) {
        return false;
    }

    if (schemaState == ItemState::Unchanged) {
        registry->registerSchema(dynamic);
    } else if (!import(repository, dynamic, registry, error)) {
        return false;
    }

    *state = schemaState;
    return true;
}

} // namespace Bridge
