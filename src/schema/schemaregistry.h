#ifndef SCHEMAREGISTRY_H
#define SCHEMAREGISTRY_H

#include <QString>
#include <QStringList>
#include <QMap>
#include "schemadef.h"

namespace Bridge {

/**
 * @brief Class bindings known during one run
 *
 * Resolves class names given as "Schema:Class", "Schema.Class" or
 * "alias:Class" (case-insensitive) to their definitions. The engine owns
 * one registry, clears it at the start of each run and registers the base,
 * domain and dynamic schemas into it as they are synchronized.
 */
class SchemaRegistry
{
public:
    SchemaRegistry() = default;

    /**
     * @brief Register a schema, replacing one of the same name
     */
    void registerSchema(const SchemaDef &schema);

    void clear();

    bool hasSchema(const QString &nameOrAlias) const;
    const SchemaDef *schema(const QString &nameOrAlias) const;
    QStringList schemaNames() const;

    /**
     * @brief Look up a class definition
     * @return nullptr when the schema or class is unknown
     */
    const ClassDefinition *resolve(const QString &fullName) const;

    bool contains(const QString &fullName) const { return resolve(fullName) != nullptr; }

    /**
     * @brief Canonical "Schema:Class" spelling of a class name
     * @return empty string for unknown classes
     */
    QString canonicalName(const QString &fullName) const;

    /**
     * @brief Whether a class equals or derives from a base class
     */
    bool isSubclassOf(const QString &fullName, const QString &baseFullName) const;

    /**
     * @brief Qualified name of a class's base class, or empty for roots
     */
    QString baseClassOf(const QString &fullName) const;

private:
    QString schemaKey(const QString &nameOrAlias) const;

    QMap<QString, SchemaDef> m_schemas;     // lower-case name -> schema
    QMap<QString, QString> m_aliases;       // lower-case alias -> lower-case name
};

} // namespace Bridge

#endif // SCHEMAREGISTRY_H
