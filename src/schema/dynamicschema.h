#ifndef DYNAMICSCHEMA_H
#define DYNAMICSCHEMA_H

#include <QString>
#include <QStringList>
#include <QList>
#include "schemadef.h"
#include "../sync/synctypes.h"

namespace Bridge {

class Repository;
class SchemaRegistry;

/**
 * @brief Settings and classes of the generated schema
 */
struct DynamicSchemaProps {
    QString schemaName;
    QString schemaAlias;
    QList<ClassDefinition> entities;        ///< Classes defined by record mappings
    QList<ClassDefinition> relationships;   ///< Classes defined by link and foreign-key mappings
};

/**
 * @brief Keeps the generated schema of a repository in step with the mappings
 *
 * The schema is rebuilt in memory on every run, diffed against the
 * persisted copy and only imported when it differs. Each change bumps the
 * minor version.
 */
class DynamicSchema
{
public:
    /**
     * @brief Build the schema in memory
     * @param known Registry holding the Core and domain schemas
     * @return false when a class is defined twice or has an unknown base class
     */
    static bool create(const SchemaVersion &version,
                       const QStringList &domainSchemaNames,
                       const DynamicSchemaProps &props,
                       const SchemaRegistry &known,
                       SchemaDef *schema,
                       QString *error = nullptr);

    /**
     * @brief Decide what the generated schema should look like, without importing
     *
     * Starts at the persisted version, or 01.00.00 when none exists. For an
     * Unchanged state @p schema is the persisted schema.
     *
     * @param state Receives New, Changed or Unchanged
     * @return false when the schema cannot be built or compared
     */
    static bool prepare(const Repository *repository,
                        const QStringList &domainSchemaNames,
                        const DynamicSchemaProps &props,
                        const SchemaRegistry &registry,
                        SchemaDef *schema,
                        ItemState *state,
                        QString *error = nullptr);

    /**
     * @brief Import a prepared schema and register it
     */
    static bool import(Repository *repository, const SchemaDef &schema,
                       SchemaRegistry *registry, QString *error = nullptr);

    /**
     * @brief Synchronize the generated schema with the repository
     *
     * Starts at the persisted version, or 01.00.00 when none exists. The
     * resulting schema (new, changed or the persisted one) is registered in
     * @p registry.
     *
     * @param state Receives New, Changed or Unchanged
     * @return false on diff or import failure
     */
    static bool synchronize(Repository *repository,
                            const QStringList &domainSchemaNames,
                            const DynamicSchemaProps &props,
                            SchemaRegistry *registry,
                            ItemState *state,
                            QString *error = nullptr);
};

} // namespace Bridge

#endif // DYNAMICSCHEMA_H
