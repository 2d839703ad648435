#include "schemaregistry.h"

namespace Bridge {

void SchemaRegistry::registerSchema(const SchemaDef &schema)
{
    const QString key = schema.name.toLower();
    m_schemas.insert(key, schema);
    if (!schema.alias.isEmpty()) {
        m_aliases.insert(schema.alias.toLower(), key);
    }
}

void SchemaRegistry::clear()
{
    m_schemas.clear();
    m_aliases.clear();
}

QString SchemaRegistry::schemaKey(const QString &nameOrAlias) const
{
    const QString lower = nameOrAlias.toLower();
    if (m_schemas.contains(lower)) {
        return lower;
    }
    return m_aliases.value(lower);
}

bool SchemaRegistry::hasSchema(const QString &nameOrAlias) const
{
    return !schemaKey(nameOrAlias).isEmpty();
}

const SchemaDef *SchemaRegistry::schema(const QString &nameOrAlias) const
{
    auto it = m_schemas.constFind(schemaKey(nameOrAlias));
    return it == m_schemas.constEnd() ? nullptr : &it.value();
}

QStringList SchemaRegistry::schemaNames() const
{
    QStringList names;
    for (const SchemaDef &s : m_schemas) {
        names.append(s.name);
    }
    return names;
}

const ClassDefinition *SchemaRegistry::resolve(const QString &fullName) const
{
    const QString schemaName = schemaNameOf(fullName);
    if (schemaName.isEmpty()) {
        return nullptr;
    }
    const SchemaDef *s = schema(schemaName);
    return s ? s->findClass(classNameOf(fullName)) : nullptr;
}

QString SchemaRegistry::canonicalName(const QString &fullName) const
{
    const SchemaDef *s = schema(schemaNameOf(fullName));
    if (!s) {
        return QString();
    }
    const ClassDefinition *def = s->findClass(classNameOf(fullName));
    return def ? s->name + QLatin1Char(':') + def->name : QString();
}

QString SchemaRegistry::baseClassOf(const QString &fullName) const
{
    const ClassDefinition *def = resolve(fullName);
    if (!def || def->baseClass.isEmpty()) {
        return QString();
    }
    return canonicalName(qualifiedClassName(schemaNameOf(fullName), def->baseClass));
}

bool SchemaRegistry::isSubclassOf(const QString &fullName, const QString &baseFullName) const
{
    const QString base = canonicalName(baseFullName);
    if (base.isEmpty()) {
        return false;
    }

    QString current = canonicalName(fullName);
    // Bounded walk, a malformed schema may contain a base class cycle
    for (int depth = 0; !current.isEmpty() && depth < 64; ++depth) {
        if (current == base) {
            return true;
        }
        current = baseClassOf(current);
    }
    return false;
}

} // namespace Bridge
